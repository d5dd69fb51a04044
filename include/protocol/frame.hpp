#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace protocol {

// Wire format: <ascii decimal length> ':' <payload bytes>
constexpr char FRAME_DELIMITER = ':';

std::string encode_frame(const std::string& payload);

// Rebuilds whole payloads from bytes that arrive in arbitrary pieces.
// Bytes handed out by next() are dropped from the buffer and never rescanned.
class FrameDecoder {
public:
    enum class State {
        AWAITING_LENGTH,
        AWAITING_PAYLOAD
    };

    void feed(const char* data, std::size_t size);
    void feed(const std::string& data) { feed(data.data(), data.size()); }

    // Returns the next complete payload, or nullopt if more bytes are needed.
    // Throws errors::MalformedFrameError on a bad length field.
    std::optional<std::string> next();

    State state() const { return state_; }
    std::size_t buffered() const { return buffer_.size(); }
    uint64_t expected_length() const { return expected_length_; }

private:
    std::string buffer_;
    std::size_t scanned_ = 0;
    State state_ = State::AWAITING_LENGTH;
    uint64_t expected_length_ = 0;
};

} // namespace protocol
