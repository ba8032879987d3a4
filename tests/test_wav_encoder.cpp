#include <catch2/catch_test_macros.hpp>

#include "wav_encoder.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<int16_t> samples = {0, 100, -100, 32767, -32768};

    SECTION("CanonicalHeader") {
        auto wav = wav::encode(samples, sample_rate);
        uint32_t data_size = static_cast<uint32_t>(samples.size() * 2);

        REQUIRE(wav.size() == wav::HEADER_SIZE + data_size);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_u32(wav.data() + 4) == 36 + data_size);
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_u16(wav.data() + 20) == 1);  // PCM
        REQUIRE(read_u16(wav.data() + 22) == 1);  // mono
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 2);
        REQUIRE(read_u16(wav.data() + 34) == 16);
        REQUIRE(read_tag(wav.data() + 36) == "data");
        REQUIRE(read_u32(wav.data() + 40) == data_size);
    }

    SECTION("SamplesFollowHeader") {
        auto wav = wav::encode(samples, sample_rate);
        std::vector<int16_t> decoded(samples.size());
        std::memcpy(decoded.data(), wav.data() + wav::HEADER_SIZE, samples.size() * 2);
        REQUIRE(decoded == samples);
    }

    SECTION("EmptySamples") {
        std::vector<int16_t> empty;
        auto wav = wav::encode(empty, sample_rate);
        REQUIRE(wav.size() == wav::HEADER_SIZE);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav::pcm_payload", "[wav]") {

    SECTION("StripsRiffHeader") {
        std::vector<int16_t> samples = {1, 2, 3};
        auto wav = wav::encode(samples, 16000);
        REQUIRE(wav::has_riff_header(wav));

        auto pcm = wav::pcm_payload(wav);
        REQUIRE(pcm.size() == samples.size() * 2);
        REQUIRE(pcm.data() == wav.data() + wav::HEADER_SIZE);
    }

    SECTION("RawPcmPassesThrough") {
        std::vector<uint8_t> raw(100, 0x42);
        REQUIRE_FALSE(wav::has_riff_header(raw));

        auto pcm = wav::pcm_payload(raw);
        REQUIRE(pcm.size() == raw.size());
        REQUIRE(pcm.data() == raw.data());
    }

    SECTION("ShortInputIsNotAHeader") {
        std::vector<uint8_t> tiny = {'R', 'I', 'F', 'F'};
        REQUIRE_FALSE(wav::has_riff_header(tiny));
        REQUIRE(wav::pcm_payload(tiny).size() == 4);
    }
}
