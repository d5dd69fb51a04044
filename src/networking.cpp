#include "networking.hpp"
#include "archive.hpp"
#include "errors.hpp"
#include "naming.hpp"
#include "session.hpp"
#include "transfer.hpp"
#include "protocol/transfer_header.hpp"
#include <iostream>
#include <cstdio>

using boost::asio::ip::tcp;
namespace fs = std::filesystem;

namespace networking {

namespace {

std::string format_size(uint64_t bytes) {
    double size = bytes;
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int i = 0;
    while (size >= 1024 && i < 4) {
        size /= 1024;
        i++;
    }
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f%s", size, units[i]);
    return std::string(buf);
}

std::string endpoint_name(const tcp::endpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

// Removes the sender's temporary archive on every exit path
class TempArchive {
public:
    TempArchive(fs::path path, bool keep) : path_(std::move(path)), keep_(keep) {}
    ~TempArchive() {
        if (keep_) {
            std::cout << "[client] Kept archive at " << path_.string() << "\n";
            return;
        }
        std::error_code ec;
        fs::remove(path_, ec);
        if (ec) {
            std::cerr << "[client] Could not remove " << path_.string() << ": " << ec.message() << "\n";
        }
    }

    TempArchive(const TempArchive&) = delete;
    TempArchive& operator=(const TempArchive&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
    bool keep_;
};

} // namespace

Server::Server(ServerOptions options)
    : options_(std::move(options)), acceptor_(io_context_) {}

Server::~Server() {
    stop();
}

unsigned short Server::start() {
    if (running_) {
        return port_;
    }

    // Collect what a previous run left behind
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    boost::system::error_code ignored;
    acceptor_.close(ignored);

    tcp::endpoint endpoint(boost::asio::ip::make_address(options_.bind_address), options_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    // run() returned when the last run stopped; the context must be reset first
    io_context_.restart();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_ = true;
    }
    do_accept();
    accept_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        } catch (std::exception& e) {
            std::cerr << "[server] Accept loop exception: " << e.what() << "\n";
            mark_stopped();
        }
    });

    std::cout << "Listening on: " << options_.bind_address << ":" << port_ << std::endl;
    return port_;
}

void Server::wait() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    stopped_cv_.wait(lock, [this]() { return !running_; });
}

void Server::mark_stopped() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        running_ = false;
    }
    stopped_cv_.notify_all();
}

void Server::stop() {
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        was_running = running_.exchange(false);
    }
    stopped_cv_.notify_all();

    if (was_running) {
        boost::asio::post(io_context_, [this]() {
            boost::system::error_code ec;
            acceptor_.close(ec);
        });
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    // The accept thread is gone, so the acceptor can be touched directly
    boost::system::error_code ec;
    acceptor_.close(ec);

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    if (was_running) {
        std::cout << "[server] Stopped.\n";
    }
}

void Server::do_accept() {
    acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            std::cerr << "[server] Accept failed: " << ec.message() << "\n";
            do_accept();
            return;
        }

        reap_finished_workers();

        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread worker([socket = std::move(socket), done, options = options_]() mutable {
            handle_connection(std::move(socket), options);
            *done = true;
        });
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.push_back({std::move(worker), done});
        }
        do_accept();
    });
}

void Server::reap_finished_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (*it->done) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void handle_connection(tcp::socket socket, const ServerOptions& options) {
    std::string peer = "unknown";
    boost::system::error_code ec;
    tcp::endpoint remote = socket.remote_endpoint(ec);
    if (!ec) {
        peer = endpoint_name(remote);
    }
    std::cout << "New thread handling connection from " << peer << "\n";

    transfer::FramedSocket fsock(std::move(socket), peer, options.debug);
    try {
        std::vector<fs::path> extracted;
        transfer::TransferSession session(options.output_dir, [&](const fs::path& archive_path) {
            std::cout << "[" << peer << "] Archive '" << archive_path.filename().string()
                      << "' saved. Extracting...\n";
            extracted = archive::extract_archive(archive_path, options.output_dir);
        });

        // Read to end of stream: the sender half-closes once it is done, and
        // anything after the declared size must reach the session to be rejected.
        while (auto payload = fsock.receive()) {
            auto previous = session.state();
            auto state = session.consume(*payload);
            if (options.debug && previous == transfer::TransferSession::State::AWAITING_HEADER &&
                state != previous) {
                std::cout << "[" << peer << "] Header => archive_name=" << session.archive_name()
                          << ", file_size=" << session.declared_size() << "\n";
            }
            if (state == transfer::TransferSession::State::COMPLETE &&
                previous != transfer::TransferSession::State::COMPLETE) {
                std::cout << "[" << peer << "] Extraction complete: " << extracted.size() << " file(s) from '"
                          << session.archive_name() << "' (" << format_size(session.declared_size()) << ")\n";
            }
        }

        switch (session.state()) {
        case transfer::TransferSession::State::COMPLETE:
            fsock.send(protocol::ack_message(session.archive_name()));
            break;
        case transfer::TransferSession::State::AWAITING_HEADER:
            std::cout << "[" << peer << "] No more data, connection closed.\n";
            break;
        case transfer::TransferSession::State::RECEIVING_DATA:
            std::cerr << "[" << peer << "] Connection closed mid-transfer: received "
                      << session.bytes_received() << " of " << session.declared_size()
                      << " bytes of '" << session.archive_name() << "'\n";
            break;
        }
    } catch (std::exception& e) {
        std::cerr << "[" << peer << "] Transfer aborted: " << e.what() << "\n";
    }
    fsock.close();
}

Client::Client(ClientOptions options) : options_(options) {}

std::string Client::send_files(const std::string& host, unsigned short port, const std::vector<std::string>& files) {
    TempArchive archive_file(naming::temp_archive_path(), options_.keep_archive);
    archive::write_archive(archive_file.path(), files);
    uint64_t archive_size = fs::file_size(archive_file.path());
    std::string archive_name = archive_file.path().filename().string();
    if (options_.debug) {
        std::cout << "[build_archive] Created '" << archive_name << "' with size=" << archive_size << " bytes\n";
    }

    boost::asio::io_context io_context;
    tcp::socket socket(io_context);
    tcp::resolver resolver(io_context);
    boost::asio::connect(socket, resolver.resolve(host, std::to_string(port)));
    std::string local = endpoint_name(socket.local_endpoint());
    std::cout << "[client] Connected to " << host << ":" << port << "\n";

    transfer::FramedSocket fsock(std::move(socket), local, options_.debug);
    transfer::TransferProgressCallback progress_cb;
    if (options_.debug) {
        progress_cb = [](const std::string& name, uint64_t sent, uint64_t total) {
            std::cout << "[send_data] " << name << ": sent " << sent << "/" << total << " bytes\n";
        };
    }
    transfer::send_archive(fsock, archive_file.path(), progress_cb);
    std::cout << "[client] Sent '" << archive_name << "' (" << format_size(archive_size) << ")\n";

    // Server reads EOF, then answers with one acknowledgement frame
    fsock.shutdown_send();
    auto ack = fsock.receive();
    fsock.close();
    if (!ack) {
        throw errors::TransferError("Server closed the connection without acknowledging " + archive_name);
    }
    return *ack;
}

} // namespace networking
