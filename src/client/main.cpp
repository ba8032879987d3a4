#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"
#include "wav_encoder.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  stream FILE [--language L] [--model M] [--target T]");
    std::println(stderr, "              [--keywords a,b] [--chunk BYTES] [--linger SECONDS]");
    std::println(stderr, "                                Stream a PCM16 mono file (WAV header skipped)");
    std::println(stderr, "  status                        Show daemon sessions");
    std::println(stderr, "  summary FILE                  Summarize a JSON list of {{text, timestamp}}");
    std::println(stderr, "  context set FILE | get | clear");
    std::println(stderr, "                                Manage the summary context");
    std::println(stderr, "Options:");
    std::println(stderr, "  --socket PATH                 Daemon socket path");
}

static std::vector<std::string> split(const std::string& list, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= list.size()) {
        auto end = list.find(sep, start);
        if (end == std::string::npos) end = list.size();
        if (end > start) out.push_back(list.substr(start, end - start));
        start = end + 1;
    }
    return out;
}

static bool read_file(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return false;
    out.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return true;
}

static bool read_json_file(const std::string& path, json& out) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "Cannot open {}", path);
        return false;
    }
    try {
        out = json::parse(f);
        return true;
    } catch (const json::exception& e) {
        std::println(stderr, "Invalid JSON in {}: {}", path, e.what());
        return false;
    }
}

// Reads messages until one with the given event arrives. Errors end the wait.
static bool wait_for(IpcClient& client, const std::string& event, json& out, int timeout_ms = 30000) {
    while (client.recv(out, timeout_ms)) {
        auto got = out.value("event", "");
        if (got == event) return true;
        if (got == "error") {
            std::println(stderr, "Error: {}", out.value("message", "unknown error"));
            return false;
        }
    }
    std::println(stderr, "No {} reply from daemon (timeout)", event);
    return false;
}

static void print_transcription(const json& msg) {
    std::println("{}", msg.value("refined_text", msg.value("text", "")));
    auto translation = msg.value("translation", "");
    if (!translation.empty()) {
        std::println("  -> {}", translation);
    }
    if (msg.value("is_keyword_match", false)) {
        std::println("  keywords: {}", msg.value("matched_keywords", json::array()).dump());
    }
    if (msg.value("is_continuation", false)) {
        std::println("  (continues previous line)");
    }
}

// Prints whatever arrived; returns the number of transcriptions.
static int drain_events(IpcClient& client, int timeout_ms) {
    int count = 0;
    json msg;
    while (client.recv(msg, timeout_ms)) {
        auto event = msg.value("event", "");
        if (event == "transcription") {
            print_transcription(msg);
            count++;
        } else if (event == "error") {
            std::println(stderr, "Error: {}", msg.value("message", "unknown error"));
        }
    }
    return count;
}

static int cmd_stream(IpcClient& client, int argc, char* argv[]) {
    if (argc < 3) {
        std::println(stderr, "stream needs a FILE");
        return 1;
    }
    std::string path = argv[2];
    json config = json::object();
    size_t chunk = 3200; // 100ms of 16kHz PCM16
    double linger = 5.0;

    for (int i = 3; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--language" && i + 1 < argc) {
            config["language"] = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            config["model_type"] = argv[++i];
        } else if (arg == "--target" && i + 1 < argc) {
            config["target_language"] = argv[++i];
        } else if (arg == "--keywords" && i + 1 < argc) {
            config["keywords"] = split(argv[++i], ',');
        } else if (arg == "--chunk" && i + 1 < argc) {
            chunk = static_cast<size_t>(std::atol(argv[++i]));
        } else if (arg == "--linger" && i + 1 < argc) {
            linger = std::atof(argv[++i]);
        }
    }
    if (chunk == 0) chunk = 3200;

    std::vector<uint8_t> data;
    if (!read_file(path, data)) {
        std::println(stderr, "Cannot read {}", path);
        return 1;
    }
    auto pcm = wav::pcm_payload(data);

    if (!config.empty()) {
        if (!client.send_json({{"event", "config"}, {"config", config}})) {
            std::println(stderr, "Failed to send config");
            return 1;
        }
        json reply;
        if (!wait_for(client, "config_updated", reply)) return 1;
        if (reply.value("status", "") != "success") {
            std::println(stderr, "Config rejected: {}", reply.value("message", "unknown error"));
            return 1;
        }
    }

    // Paced at real time for 16kHz mono PCM16 so the daemon's buffer keeps up.
    auto chunk_duration = std::chrono::microseconds(chunk * 1000000 / (16000 * 2));
    int count = 0;
    for (size_t off = 0; off < pcm.size(); off += chunk) {
        auto piece = pcm.subspan(off, std::min(chunk, pcm.size() - off));
        if (!client.send_audio(piece)) {
            std::println(stderr, "Connection lost while streaming");
            return 1;
        }
        count += drain_events(client, 0);
        std::this_thread::sleep_for(chunk_duration);
    }

    count += drain_events(client, static_cast<int>(linger * 1000));
    std::println(stderr, "{} transcription(s)", count);
    return 0;
}

static int cmd_status(IpcClient& client) {
    if (!client.send_json({{"event", "status"}})) {
        std::println(stderr, "Failed to send command");
        return 1;
    }
    json reply;
    if (!wait_for(client, "status", reply)) return 1;

    auto sessions = reply.value("sessions", json::array());
    std::println("Sessions: {}", sessions.size());
    for (auto& s : sessions) {
        auto config = s.value("config", json::object());
        auto stats = s.value("audio_stats", json::object());
        std::println("  {} [{}] {} -> {} ({}), chunks={}, bytes={}",
                     s.value("client_id", ""), s.value("state", ""),
                     config.value("language", ""), config.value("target_language", ""),
                     config.value("model_type", ""),
                     stats.value("total_chunks", 0), stats.value("total_bytes", 0));
    }
    return 0;
}

static void print_summary(const json& s) {
    std::println("Scene:   {}", s.value("scene", ""));
    std::println("Topic:   {}", s.value("topic", ""));
    std::println("Key points:");
    for (auto& point : s.value("keyPoints", json::array())) {
        std::println("  - {}", point.is_string() ? point.get<std::string>() : point.dump());
    }
    std::println("Summary: {}", s.value("summary", ""));
}

static int cmd_summary(IpcClient& client, int argc, char* argv[]) {
    if (argc < 3) {
        std::println(stderr, "summary needs a FILE");
        return 1;
    }
    json items;
    if (!read_json_file(argv[2], items)) return 1;
    if (items.is_object() && items.contains("transcriptions")) items = items["transcriptions"];

    if (!client.send_json({{"event", "summary"}, {"transcriptions", items}})) {
        std::println(stderr, "Failed to send command");
        return 1;
    }
    json reply;
    if (!wait_for(client, "summary", reply, 120000)) return 1;
    print_summary(reply);
    return 0;
}

static int cmd_context(IpcClient& client, int argc, char* argv[]) {
    std::string action = argc >= 3 ? argv[2] : "get";

    json request;
    if (action == "set") {
        if (argc < 4) {
            std::println(stderr, "context set needs a FILE");
            return 1;
        }
        if (!read_json_file(argv[3], request)) return 1;
        if (!request.is_object()) {
            std::println(stderr, "Context file must hold a JSON object");
            return 1;
        }
        request["event"] = "summary_context";
    } else if (action == "get") {
        request = {{"event", "summary_context_get"}};
    } else if (action == "clear") {
        request = {{"event", "summary_context_clear"}};
    } else {
        std::println(stderr, "Unknown context action: {}", action);
        return 1;
    }

    if (!client.send_json(request)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }
    json reply;
    if (!wait_for(client, "summary_context", reply)) return 1;

    if (action == "get") {
        if (!reply.value("has_context", false)) {
            std::println("No summary context set");
            return 0;
        }
        print_summary(reply.value("context", json::object()));
        return 0;
    }

    if (reply.value("status", "") != "success") {
        std::println(stderr, "Error: {}", reply.value("message", "unknown error"));
        return 1;
    }
    std::println("{}", reply.value("message", "OK"));
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string sock_path = platform::ipc_endpoint();

    // --socket may appear anywhere; strip it before command parsing.
    std::vector<char*> args;
    for (int i = 0; i < argc; i++) {
        if (std::string(argv[i]) == "--socket" && i + 1 < argc) {
            sock_path = argv[++i];
            continue;
        }
        args.push_back(argv[i]);
    }
    int nargs = static_cast<int>(args.size());

    if (command != "stream" && command != "status" && command != "summary" && command != "context") {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is livescribed running?");
        return 1;
    }

    json hello;
    if (!wait_for(client, "connected", hello, 5000)) return 1;

    if (command == "stream") return cmd_stream(client, nargs, args.data());
    if (command == "status") return cmd_status(client);
    if (command == "summary") return cmd_summary(client, nargs, args.data());
    return cmd_context(client, nargs, args.data());
}
