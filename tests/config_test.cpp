#include <gtest/gtest.h>
#include "config.hpp"
#include "errors.hpp"
#include "test_util.hpp"

using test_util::TempDir;
using test_util::write_file;

TEST(ConfigTest, DefaultsWithoutFile) {
    config::Settings settings;
    EXPECT_EQ(settings.bind_address, "127.0.0.1");
    EXPECT_EQ(settings.listen_port, 50001);
    EXPECT_EQ(settings.server, "127.0.0.1:50001");
    EXPECT_EQ(settings.output_dir, ".");
    EXPECT_FALSE(settings.debug);
    EXPECT_FALSE(settings.keep_archive);
}

TEST(ConfigTest, LoadOverridesOnlyGivenKeys) {
    TempDir dir;
    write_file(dir / "archdrop.json", R"({"listen_port": 6000, "output_dir": "/tmp/in", "debug": true})");

    config::Settings settings = config::load((dir / "archdrop.json").string());
    EXPECT_EQ(settings.listen_port, 6000);
    EXPECT_EQ(settings.output_dir, "/tmp/in");
    EXPECT_TRUE(settings.debug);
    EXPECT_EQ(settings.bind_address, "127.0.0.1");
    EXPECT_EQ(settings.server, "127.0.0.1:50001");
}

TEST(ConfigTest, MissingFileIsConfigError) {
    TempDir dir;
    EXPECT_THROW(config::load((dir / "absent.json").string()), errors::ConfigError);
}

TEST(ConfigTest, MalformedJsonIsConfigError) {
    TempDir dir;
    write_file(dir / "bad.json", "{ listen_port: ");
    EXPECT_THROW(config::load((dir / "bad.json").string()), errors::ConfigError);
}

TEST(ConfigTest, WrongTypeIsConfigError) {
    TempDir dir;
    write_file(dir / "bad.json", R"({"listen_port": "six thousand"})");
    EXPECT_THROW(config::load((dir / "bad.json").string()), errors::ConfigError);
}

TEST(ConfigTest, ParseEndpoint) {
    auto [host, port] = config::parse_endpoint("127.0.0.1:50001");
    EXPECT_EQ(host, "127.0.0.1");
    EXPECT_EQ(port, 50001);

    auto named = config::parse_endpoint("files.example.org:8080");
    EXPECT_EQ(named.first, "files.example.org");
    EXPECT_EQ(named.second, 8080);
}

TEST(ConfigTest, BadEndpointsAreRejected) {
    EXPECT_THROW(config::parse_endpoint("localhost"), errors::ConfigError);
    EXPECT_THROW(config::parse_endpoint(":50001"), errors::ConfigError);
    EXPECT_THROW(config::parse_endpoint("localhost:"), errors::ConfigError);
    EXPECT_THROW(config::parse_endpoint("localhost:http"), errors::ConfigError);
    EXPECT_THROW(config::parse_endpoint("localhost:70000"), errors::ConfigError);
    EXPECT_THROW(config::parse_endpoint("localhost:0"), errors::ConfigError);
}
