#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include <boost/asio.hpp>
#include "protocol/frame.hpp"

namespace transfer {

// Progress callback: filename, bytes_transferred, bytes_total
using TransferProgressCallback = std::function<void(const std::string&, uint64_t, uint64_t)>;

// Bytes per data frame on the sending side
constexpr std::size_t DATA_FRAME_SIZE = 4096;
// Upper bound for a single socket read on the receiving side
constexpr std::size_t RECEIVE_CHUNK_SIZE = 100;

// A connected TCP socket plus the receive buffer that turns its byte
// stream back into frames. One per connection, never shared.
class FramedSocket {
public:
    FramedSocket(boost::asio::ip::tcp::socket socket, std::string name, bool debug = false);

    // Blocks until the whole frame is written
    void send(const std::string& payload);

    // Blocks until one whole payload is buffered. Returns nullopt when the
    // peer closes first; a half-received frame at that point is logged as
    // an errors::IncompleteMessageError and dropped.
    std::optional<std::string> receive();

    // Half-close: the peer reads EOF, we can still receive
    void shutdown_send();
    void close();

    const std::string& name() const { return name_; }

private:
    boost::asio::ip::tcp::socket socket_;
    std::string name_;
    bool debug_;
    protocol::FrameDecoder decoder_;
};

// Sends the header frame for archive_path followed by its content in
// DATA_FRAME_SIZE frames. The archive name on the wire is the file name.
void send_archive(FramedSocket& socket, const std::filesystem::path& archive_path,
                  TransferProgressCallback progress_cb = nullptr);

} // namespace transfer
