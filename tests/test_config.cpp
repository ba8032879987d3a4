#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "ls_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.server.socket.empty());
        REQUIRE(cfg.engine.url == "http://localhost:8080");
        REQUIRE(cfg.engine.api_format == "whisper.cpp");
        REQUIRE(cfg.engine.sample_rate == 16000);
        REQUIRE(cfg.engine.ring_buffer_bytes() == 30 * 16000 * sizeof(int16_t));
        REQUIRE(cfg.engine.segment_samples() == 48000);
        REQUIRE(cfg.llm.endpoint == "http://localhost:11434/api/chat");
        REQUIRE(cfg.llm.api_format == "ollama");
        REQUIRE(cfg.llm.timeout_ms == 15000);
        REQUIRE(cfg.session.language == "zh");
        REQUIRE(cfg.session.model_type == "tiny");
        REQUIRE(cfg.session.target_language == "en");
        REQUIRE_FALSE(cfg.session.debug_mode);
        REQUIRE(cfg.session.history_size == 5);
        REQUIRE(cfg.session.slow_feed_ms == 100);
        REQUIRE(cfg.session.workers == 4);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "server": { "socket": "/run/user/1000/ls-test.sock" },
            "engine": {
                "url": "http://10.0.0.1:9090",
                "api_format": "openai",
                "sample_rate": 8000,
                "segment_seconds": 1.5,
                "buffer_seconds": 10,
                "device": "cuda"
            },
            "llm": {
                "endpoint": "http://10.0.0.2:8000/v1/chat/completions",
                "api_format": "openai",
                "model": "gpt-4o-mini",
                "api_key_env": "MY_KEY",
                "timeout_ms": 5000
            },
            "session": {
                "language": "ja",
                "model_type": "small",
                "target_language": "de",
                "debug_mode": true,
                "history_size": 8,
                "slow_feed_ms": 50,
                "workers": 2
            }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.server.socket == "/run/user/1000/ls-test.sock");
        REQUIRE(cfg.engine.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.engine.api_format == "openai");
        REQUIRE(cfg.engine.sample_rate == 8000);
        REQUIRE(cfg.engine.segment_samples() == 12000);
        REQUIRE(cfg.engine.ring_buffer_bytes() == 10 * 8000 * sizeof(int16_t));
        REQUIRE(cfg.engine.device == "cuda");
        REQUIRE(cfg.llm.endpoint == "http://10.0.0.2:8000/v1/chat/completions");
        REQUIRE(cfg.llm.api_format == "openai");
        REQUIRE(cfg.llm.model == "gpt-4o-mini");
        REQUIRE(cfg.llm.api_key_env == "MY_KEY");
        REQUIRE(cfg.llm.timeout_ms == 5000);
        REQUIRE(cfg.session.language == "ja");
        REQUIRE(cfg.session.model_type == "small");
        REQUIRE(cfg.session.target_language == "de");
        REQUIRE(cfg.session.debug_mode);
        REQUIRE(cfg.session.history_size == 8);
        REQUIRE(cfg.session.slow_feed_ms == 50);
        REQUIRE(cfg.session.workers == 2);
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "session": { "target_language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.session.target_language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.session.language == "zh");
        REQUIRE(cfg.engine.url == "http://localhost:8080");
        REQUIRE(cfg.llm.model == "qwen2.5:7b");
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.session.language == "zh");
        REQUIRE(cfg.engine.sample_rate == 16000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/ls_test_nonexistent_config_file.json");
        REQUIRE(cfg.session.language == "zh");
        REQUIRE(cfg.engine.sample_rate == 16000);
    }
}
