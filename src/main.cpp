#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <csignal>
#include <thread>
#include <boost/asio.hpp>
#include "archive.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "networking.hpp"

namespace {

void print_usage() {
    std::cout << "Usage:\n"
              << "  archdrop serve [-l port] [-b address] [-o dir] [-c config.json] [-d]\n"
              << "  archdrop send [-s host:port] [-c config.json] [-d] [-k] [-f file]... [file...]\n"
              << "  archdrop list <archive>\n"
              << "  archdrop extract <archive> [-o dir]\n"
              << "  archdrop -?\n";
}

std::string require_value(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw errors::ConfigError("Missing value for " + args[i]);
    }
    return args[++i];
}

// Config file first, then every other flag on top of it
config::Settings load_settings(const std::vector<std::string>& args) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-c" || args[i] == "--config") {
            return config::load(require_value(args, i));
        }
    }
    return config::Settings{};
}

int run_serve(const std::vector<std::string>& args) {
    config::Settings settings = load_settings(args);
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-l" || arg == "--listenPort") {
            settings.listen_port = config::parse_port(require_value(args, i));
        } else if (arg == "-b" || arg == "--bind") {
            settings.bind_address = require_value(args, i);
        } else if (arg == "-o" || arg == "--output") {
            settings.output_dir = require_value(args, i);
        } else if (arg == "-d" || arg == "--debug") {
            settings.debug = true;
        } else if (arg == "-c" || arg == "--config") {
            ++i;
        } else {
            throw errors::ConfigError("Unknown option for serve: " + arg);
        }
    }

    networking::ServerOptions options;
    options.bind_address = settings.bind_address;
    options.port = settings.listen_port;
    options.output_dir = settings.output_dir;
    options.debug = settings.debug;

    networking::Server server(options);
    server.start();

    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            std::cout << "\nReceived signal " << signal_number << ", shutting down...\n";
            server.stop();
        }
    });
    std::thread signal_thread([&signal_context]() { signal_context.run(); });

    server.wait();
    signal_context.stop();
    signal_thread.join();
    server.stop();
    return 0;
}

int run_send(const std::vector<std::string>& args) {
    config::Settings settings = load_settings(args);
    std::vector<std::string> files;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-s" || arg == "--server") {
            settings.server = require_value(args, i);
        } else if (arg == "-f" || arg == "--files") {
            files.push_back(require_value(args, i));
        } else if (arg == "-d" || arg == "--debug") {
            settings.debug = true;
        } else if (arg == "-k" || arg == "--keep") {
            settings.keep_archive = true;
        } else if (arg == "-c" || arg == "--config") {
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            throw errors::ConfigError("Unknown option for send: " + arg);
        } else {
            files.push_back(arg);
        }
    }
    if (files.empty()) {
        print_usage();
        return 1;
    }

    auto [host, port] = config::parse_endpoint(settings.server);
    networking::Client client({settings.debug, settings.keep_archive});
    std::string ack = client.send_files(host, port, files);
    std::cout << "Server says: " << ack;
    return 0;
}

int run_list(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        print_usage();
        return 1;
    }
    std::ifstream in(args[0], std::ios::binary);
    if (!in.is_open()) {
        throw errors::DecodeError("Failed to open archive file: " + args[0]);
    }
    for (const auto& entry : archive::list_archive(in)) {
        std::cout << entry.size << "\t" << entry.name << "\n";
    }
    return 0;
}

int run_extract(const std::vector<std::string>& args) {
    std::string archive_path;
    std::string output_dir = ".";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-o" || args[i] == "--output") {
            output_dir = require_value(args, i);
        } else if (archive_path.empty()) {
            archive_path = args[i];
        } else {
            throw errors::ConfigError("Unexpected argument: " + args[i]);
        }
    }
    if (archive_path.empty()) {
        print_usage();
        return 1;
    }
    for (const auto& path : archive::extract_archive(archive_path, output_dir)) {
        std::cout << "Extracted " << path.string() << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);
    try {
        if (command == "serve") {
            return run_serve(args);
        } else if (command == "send") {
            return run_send(args);
        } else if (command == "list") {
            return run_list(args);
        } else if (command == "extract") {
            return run_extract(args);
        } else if (command == "-?" || command == "--usage" || command == "--help") {
            print_usage();
            return 0;
        }
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
