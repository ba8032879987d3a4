#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// In-memory WAV helpers for mono PCM16 audio.
namespace wav {

constexpr size_t HEADER_SIZE = 44;

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out(HEADER_SIZE + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size > 0) {
        std::memcpy(out.data() + HEADER_SIZE, samples.data(), data_size);
    }

    return out;
}

inline bool has_riff_header(std::span<const uint8_t> bytes) {
    return bytes.size() >= HEADER_SIZE &&
           std::memcmp(bytes.data(), "RIFF", 4) == 0 &&
           std::memcmp(bytes.data() + 8, "WAVE", 4) == 0;
}

// Raw PCM payload of a canonical 44-byte-header WAV file; other input is
// assumed to already be headerless PCM and is returned unchanged.
inline std::span<const uint8_t> pcm_payload(std::span<const uint8_t> bytes) {
    if (has_riff_header(bytes)) return bytes.subspan(HEADER_SIZE);
    return bytes;
}

} // namespace wav
