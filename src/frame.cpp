#include "protocol/frame.hpp"
#include "errors.hpp"
#include <limits>

namespace protocol {

namespace {

uint64_t parse_length(const std::string& field) {
    if (field.empty()) {
        throw errors::MalformedFrameError("badly formed message length: empty length field");
    }
    uint64_t value = 0;
    for (char c : field) {
        if (c < '0' || c > '9') {
            throw errors::MalformedFrameError("badly formed message length: '" + field + "'");
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            throw errors::MalformedFrameError("message length out of range: '" + field + "'");
        }
        value = value * 10 + digit;
    }
    return value;
}

} // namespace

std::string encode_frame(const std::string& payload) {
    std::string frame = std::to_string(payload.size());
    frame += FRAME_DELIMITER;
    frame += payload;
    return frame;
}

void FrameDecoder::feed(const char* data, std::size_t size) {
    buffer_.append(data, size);
}

std::optional<std::string> FrameDecoder::next() {
    if (state_ == State::AWAITING_LENGTH) {
        std::size_t colon = buffer_.find(FRAME_DELIMITER, scanned_);
        if (colon == std::string::npos) {
            // Nothing before this point can hold the delimiter
            scanned_ = buffer_.size();
            return std::nullopt;
        }
        expected_length_ = parse_length(buffer_.substr(0, colon));
        buffer_.erase(0, colon + 1);
        scanned_ = 0;
        state_ = State::AWAITING_PAYLOAD;
    }

    if (buffer_.size() < expected_length_) {
        return std::nullopt;
    }

    std::size_t length = static_cast<std::size_t>(expected_length_);
    std::string payload = buffer_.substr(0, length);
    buffer_.erase(0, length);
    state_ = State::AWAITING_LENGTH;
    expected_length_ = 0;
    return payload;
}

} // namespace protocol
