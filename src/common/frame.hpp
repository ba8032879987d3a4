#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Length-prefixed framing shared by daemon and client.
// Wire layout: [u8 kind][u32 little-endian payload length][payload].
namespace frame {

enum class Kind : uint8_t {
    Text = 0x01,   // UTF-8 JSON message
    Binary = 0x02, // raw PCM16 audio
};

constexpr size_t HEADER_SIZE = 5;
constexpr size_t MAX_PAYLOAD = 1 << 20;

struct Frame {
    Kind kind = Kind::Text;
    std::string payload;
};

inline std::string encode(Kind kind, std::string_view payload) {
    auto len = static_cast<uint32_t>(payload.size());
    std::string out;
    out.reserve(HEADER_SIZE + payload.size());
    out.push_back(static_cast<char>(kind));
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<char>((len >> shift) & 0xff));
    }
    out.append(payload);
    return out;
}

// Reassembles frames from a byte stream that may split or coalesce them.
class Decoder {
public:
    // Appends complete frames to `out`. Returns false on an unknown kind or an
    // oversized payload; the stream cannot be resynchronised after that.
    bool feed(const char* data, size_t len, std::vector<Frame>& out) {
        buf_.append(data, len);

        size_t pos = 0;
        while (buf_.size() - pos >= HEADER_SIZE) {
            auto kind = static_cast<uint8_t>(buf_[pos]);
            if (kind != static_cast<uint8_t>(Kind::Text) &&
                kind != static_cast<uint8_t>(Kind::Binary)) {
                return false;
            }

            uint32_t payload_len = 0;
            for (int i = 0; i < 4; i++) {
                payload_len |= static_cast<uint32_t>(
                    static_cast<uint8_t>(buf_[pos + 1 + i])) << (8 * i);
            }
            if (payload_len > MAX_PAYLOAD) return false;
            if (buf_.size() - pos - HEADER_SIZE < payload_len) break;

            out.push_back(Frame{
                .kind = static_cast<Kind>(kind),
                .payload = buf_.substr(pos + HEADER_SIZE, payload_len),
            });
            pos += HEADER_SIZE + payload_len;
        }

        buf_.erase(0, pos);
        return true;
    }

    size_t buffered() const { return buf_.size(); }

private:
    std::string buf_;
};

} // namespace frame
