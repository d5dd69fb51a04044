#include "session.hpp"
#include "errors.hpp"
#include "naming.hpp"
#include <utility>

namespace transfer {

TransferSession::TransferSession(std::filesystem::path output_dir, ArchiveCompleteCallback on_complete)
    : output_dir_(std::move(output_dir)), on_complete_(std::move(on_complete)) {}

TransferSession::State TransferSession::consume(const std::string& payload) {
    switch (state_) {
    case State::AWAITING_HEADER:
        handle_header(payload);
        break;
    case State::RECEIVING_DATA:
        handle_data(payload);
        break;
    case State::COMPLETE:
        if (!payload.empty()) {
            throw errors::OverlongTransferError("received " + std::to_string(payload.size()) +
                                                " bytes after '" + header_.archive_name + "' was complete");
        }
        break;
    }
    return state_;
}

void TransferSession::handle_header(const std::string& payload) {
    header_buffer_ += payload;
    auto parsed = protocol::parse_header(header_buffer_);
    if (!parsed) {
        return; // wait for the rest of the header
    }
    header_buffer_.clear();
    header_ = parsed->header;

    archive_path_ = naming::received_path(output_dir_, header_.archive_name);
    sink_.open(archive_path_, std::ios::binary | std::ios::trunc);
    if (!sink_.is_open()) {
        throw errors::DecodeError("Could not open file for writing: " + archive_path_.string());
    }
    state_ = State::RECEIVING_DATA;

    // The header frame may already carry the start (or all) of the archive
    handle_data(parsed->remainder);
}

void TransferSession::handle_data(const std::string& data) {
    uint64_t remaining = header_.size - bytes_received_;
    if (data.size() > remaining) {
        throw errors::OverlongTransferError("'" + header_.archive_name + "' declared " +
                                            std::to_string(header_.size) + " bytes but " +
                                            std::to_string(bytes_received_ + data.size()) + " arrived");
    }

    if (!data.empty()) {
        sink_.write(data.data(), static_cast<std::streamsize>(data.size()));
        if (!sink_) {
            throw errors::DecodeError("Failed writing to " + archive_path_.string());
        }
        bytes_received_ += data.size();
    }

    if (bytes_received_ == header_.size) {
        finish();
    }
}

void TransferSession::finish() {
    sink_.close();
    if (!sink_) {
        throw errors::DecodeError("Failed to close " + archive_path_.string());
    }
    state_ = State::COMPLETE;
    if (on_complete_) {
        on_complete_(archive_path_);
    }
}

} // namespace transfer
