#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("socket")) cfg.server.socket = s["socket"].get<std::string>();
        }

        if (j.contains("engine")) {
            auto& e = j["engine"];
            if (e.contains("url")) cfg.engine.url = e["url"].get<std::string>();
            if (e.contains("api_format")) cfg.engine.api_format = e["api_format"].get<std::string>();
            if (e.contains("sample_rate")) cfg.engine.sample_rate = e["sample_rate"].get<uint32_t>();
            if (e.contains("segment_seconds")) cfg.engine.segment_seconds = e["segment_seconds"].get<double>();
            if (e.contains("buffer_seconds")) cfg.engine.buffer_seconds = e["buffer_seconds"].get<uint32_t>();
            if (e.contains("device")) cfg.engine.device = e["device"].get<std::string>();
        }

        if (j.contains("llm")) {
            auto& l = j["llm"];
            if (l.contains("endpoint")) cfg.llm.endpoint = l["endpoint"].get<std::string>();
            if (l.contains("api_format")) cfg.llm.api_format = l["api_format"].get<std::string>();
            if (l.contains("model")) cfg.llm.model = l["model"].get<std::string>();
            if (l.contains("api_key_env")) cfg.llm.api_key_env = l["api_key_env"].get<std::string>();
            if (l.contains("timeout_ms")) cfg.llm.timeout_ms = l["timeout_ms"].get<int>();
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            if (s.contains("language")) cfg.session.language = s["language"].get<std::string>();
            if (s.contains("model_type")) cfg.session.model_type = s["model_type"].get<std::string>();
            if (s.contains("target_language")) cfg.session.target_language = s["target_language"].get<std::string>();
            if (s.contains("debug_mode")) cfg.session.debug_mode = s["debug_mode"].get<bool>();
            if (s.contains("history_size")) cfg.session.history_size = s["history_size"].get<size_t>();
            if (s.contains("slow_feed_ms")) cfg.session.slow_feed_ms = s["slow_feed_ms"].get<int>();
            if (s.contains("workers")) cfg.session.workers = s["workers"].get<int>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
