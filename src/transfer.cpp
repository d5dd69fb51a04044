#include "transfer.hpp"
#include "errors.hpp"
#include "protocol/transfer_header.hpp"
#include <array>
#include <fstream>
#include <iostream>
#include <vector>

namespace transfer {

FramedSocket::FramedSocket(boost::asio::ip::tcp::socket socket, std::string name, bool debug)
    : socket_(std::move(socket)), name_(std::move(name)), debug_(debug) {
    if (debug_) {
        std::cout << "new framed sock: name=" << name_ << "\n";
    }
}

void FramedSocket::send(const std::string& payload) {
    if (debug_) {
        std::cout << "framedSend: sending " << payload.size() << " byte message\n";
    }
    std::string prefix = std::to_string(payload.size());
    prefix += protocol::FRAME_DELIMITER;
    std::array<boost::asio::const_buffer, 2> buffers{
        boost::asio::buffer(prefix),
        boost::asio::buffer(payload)
    };
    boost::asio::write(socket_, buffers);
}

std::optional<std::string> FramedSocket::receive() {
    std::array<char, RECEIVE_CHUNK_SIZE> chunk;
    while (true) {
        if (auto payload = decoder_.next()) {
            return payload;
        }

        boost::system::error_code ec;
        std::size_t n = socket_.read_some(boost::asio::buffer(chunk), ec);
        if (ec == boost::asio::error::eof) {
            if (decoder_.buffered() != 0) {
                errors::IncompleteMessageError err(
                    "FramedReceive: incomplete message. state=" +
                    std::string(decoder_.state() == protocol::FrameDecoder::State::AWAITING_LENGTH
                                    ? "getLength" : "getPayload") +
                    ", length=" + std::to_string(decoder_.expected_length()) +
                    ", buffered=" + std::to_string(decoder_.buffered()));
                std::cerr << "[" << name_ << "] " << err.what() << "\n";
            }
            return std::nullopt;
        }
        if (ec) {
            throw boost::system::system_error(ec);
        }
        decoder_.feed(chunk.data(), n);

        if (debug_) {
            std::cout << "FramedReceive: read " << n << " bytes, buffered=" << decoder_.buffered() << "\n";
        }
    }
}

void FramedSocket::shutdown_send() {
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send);
}

void FramedSocket::close() {
    boost::system::error_code ec;
    socket_.close(ec);
    if (ec) {
        std::cerr << "[" << name_ << "] close failed: " << ec.message() << "\n";
    }
}

void send_archive(FramedSocket& socket, const std::filesystem::path& archive_path,
                  TransferProgressCallback progress_cb) {
    std::ifstream file(archive_path, std::ios::binary);
    if (!file.is_open()) {
        throw errors::NotFoundError("Could not open file for reading: " + archive_path.string());
    }

    uint64_t file_size = std::filesystem::file_size(archive_path);
    std::string filename = archive_path.filename().string();
    socket.send(protocol::serialize_header({filename, file_size}));

    uint64_t total_sent = 0;
    std::vector<char> buffer(DATA_FRAME_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        std::streamsize bytes_read = file.gcount();
        socket.send(std::string(buffer.data(), static_cast<std::size_t>(bytes_read)));
        total_sent += static_cast<uint64_t>(bytes_read);
        if (progress_cb) {
            progress_cb(filename, total_sent, file_size);
        }
    }
    if (file.bad()) {
        throw errors::EncodeError("Error reading " + archive_path.string());
    }
    if (total_sent != file_size) {
        throw errors::EncodeError(filename + " changed size while sending: sent " + std::to_string(total_sent) +
                                  " of " + std::to_string(file_size) + " bytes");
    }
}

} // namespace transfer
