#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include "protocol/transfer_header.hpp"

namespace transfer {

// Invoked once the whole archive is on disk and its sink is closed
using ArchiveCompleteCallback = std::function<void(const std::filesystem::path& archive_path)>;

// Receiver side of one transfer: a header frame, then raw archive bytes
// streamed straight into the sink file.
class TransferSession {
public:
    enum class State {
        AWAITING_HEADER,
        RECEIVING_DATA,
        COMPLETE
    };

    TransferSession(std::filesystem::path output_dir, ArchiveCompleteCallback on_complete);

    // Feeds one frame payload. Throws errors::MalformedHeaderError,
    // errors::OverlongTransferError, or errors::DecodeError when the sink
    // cannot be written.
    State consume(const std::string& payload);

    State state() const { return state_; }
    const std::string& archive_name() const { return header_.archive_name; }
    uint64_t declared_size() const { return header_.size; }
    uint64_t bytes_received() const { return bytes_received_; }
    const std::filesystem::path& archive_path() const { return archive_path_; }

private:
    void handle_header(const std::string& payload);
    void handle_data(const std::string& data);
    void finish();

    std::filesystem::path output_dir_;
    ArchiveCompleteCallback on_complete_;

    State state_ = State::AWAITING_HEADER;
    std::string header_buffer_;
    protocol::TransferHeader header_{"", 0};
    uint64_t bytes_received_ = 0;
    std::filesystem::path archive_path_;
    std::ofstream sink_;
};

} // namespace transfer
