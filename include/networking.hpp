#pragma once

#include <string>
#include <cstdint>
#include <vector>
#include <list>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <filesystem>
#include <boost/asio.hpp>
#include "config.hpp"

namespace networking {

struct ServerOptions {
    std::string bind_address = "127.0.0.1";
    unsigned short port = config::DEFAULT_PORT; // 0 picks an ephemeral port
    std::filesystem::path output_dir = ".";
    bool debug = false;
};

struct ClientOptions {
    bool debug = false;
    bool keep_archive = false;
};

// Listening endpoint. Each accepted connection is served on its own thread
// with its own session; nothing is shared between connections.
class Server {
public:
    explicit Server(ServerOptions options);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds, listens and starts accepting in the background. Returns the
    // bound port. A stopped server can be started again.
    unsigned short start();

    // Blocks until the server stops, through stop() or a failed accept loop
    void wait();

    // Stops accepting and joins every connection worker. A worker blocked
    // on a silent peer holds this up: reads have no timeout.
    // Not to be called from two threads at once.
    void stop();

    bool is_running() const { return running_; }
    unsigned short port() const { return port_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void do_accept();
    void reap_finished_workers();
    void mark_stopped();

    ServerOptions options_;
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    unsigned short port_ = 0;

    std::mutex state_mutex_;
    std::condition_variable stopped_cv_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
};

// Runs one receiver session to completion. Failures are logged and only
// end this connection.
void handle_connection(boost::asio::ip::tcp::socket socket, const ServerOptions& options);

class Client {
public:
    explicit Client(ClientOptions options = {});

    // Archives `files`, streams the archive to host:port and returns the
    // server's acknowledgement text. Throws on any failure.
    std::string send_files(const std::string& host, unsigned short port, const std::vector<std::string>& files);

private:
    ClientOptions options_;
};

} // namespace networking
