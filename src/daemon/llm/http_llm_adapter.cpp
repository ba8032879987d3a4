#include "llm/http_llm_adapter.hpp"

#include <cstdlib>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace {

constexpr const char* ENRICH_SYSTEM_PROMPT =
    "You post-process live speech recognition output. "
    "Answer with a single JSON object and nothing else.";

constexpr const char* SUMMARY_SYSTEM_PROMPT =
    "You summarize conversation transcripts. "
    "Answer with a single JSON object and nothing else.";

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

std::unexpected<LlmError> parse_error(std::string message) {
    return std::unexpected(LlmError{LlmErrorKind::ParseError, std::move(message)});
}

// Missing or null keys keep `out` untouched; any other type mismatch is an error.
bool read_string(const json& j, const char* key, std::string& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_string()) return false;
    out = j[key].get<std::string>();
    return true;
}

bool read_bool(const json& j, const char* key, bool& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_boolean()) return false;
    out = j[key].get<bool>();
    return true;
}

bool read_strings(const json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_array()) return false;
    for (const auto& item : j[key]) {
        if (!item.is_string()) return false;
        out.push_back(item.get<std::string>());
    }
    return true;
}

std::expected<json, LlmError> parse_object(std::string_view content) {
    auto body = llm::strip_code_fences(content);
    if (body.empty()) return parse_error("empty reply");

    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return parse_error(std::string("reply is not JSON: ") + e.what());
    }
    if (!j.is_object()) return parse_error("reply is not a JSON object");
    return j;
}

} // namespace

namespace llm {

std::string strip_code_fences(std::string_view content) {
    auto trim = [](std::string_view s) {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string_view::npos) return std::string_view{};
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    };

    auto text = trim(content);
    if (!text.starts_with("```")) return std::string(text);

    // Drop the opening fence line, including an optional language tag.
    auto newline = text.find('\n');
    if (newline == std::string_view::npos) return {};
    text.remove_prefix(newline + 1);

    auto closing = text.rfind("```");
    if (closing != std::string_view::npos) text = text.substr(0, closing);
    return std::string(trim(text));
}

std::expected<std::string, LlmError> extract_content(std::string_view api_format,
                                                     const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const json::exception& e) {
        return parse_error(std::string("response is not JSON: ") + e.what());
    }

    const json* message = nullptr;
    if (api_format == "openai") {
        if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty() &&
            j["choices"][0].contains("message")) {
            message = &j["choices"][0]["message"];
        }
    } else if (j.contains("message")) {
        message = &j["message"];
    }

    if (!message || !message->is_object() || !message->contains("content") ||
        !(*message)["content"].is_string()) {
        if (j.contains("error")) return parse_error("server error: " + j["error"].dump());
        return parse_error("no message content in response");
    }
    return (*message)["content"].get<std::string>();
}

std::expected<LlmEnrichment, LlmError> parse_enrichment(std::string_view content) {
    auto j = parse_object(content);
    if (!j) return std::unexpected(j.error());

    LlmEnrichment out;
    if (!read_string(*j, "refined_text", out.refined_text)) return parse_error("refined_text is not a string");
    if (!read_string(*j, "translation", out.translation)) return parse_error("translation is not a string");
    if (!read_bool(*j, "is_keyword_match", out.is_keyword_match)) return parse_error("is_keyword_match is not a boolean");
    if (!read_strings(*j, "matched_keywords", out.matched_keywords)) return parse_error("matched_keywords is not a list of strings");
    if (!read_string(*j, "match_reason", out.match_reason)) return parse_error("match_reason is not a string");
    if (!read_bool(*j, "is_continuation", out.is_continuation)) return parse_error("is_continuation is not a boolean");
    if (!read_string(*j, "continuation_reason", out.continuation_reason)) return parse_error("continuation_reason is not a string");
    return out;
}

std::expected<SessionSummary, LlmError> parse_summary(std::string_view content) {
    auto j = parse_object(content);
    if (!j) return std::unexpected(j.error());

    SessionSummary out;
    if (!read_string(*j, "scene", out.scene)) return parse_error("scene is not a string");
    if (!read_string(*j, "topic", out.topic)) return parse_error("topic is not a string");
    if (!read_strings(*j, "keyPoints", out.key_points)) return parse_error("keyPoints is not a list of strings");
    if (!read_string(*j, "summary", out.summary)) return parse_error("summary is not a string");
    return out;
}

} // namespace llm

HttpLlmAdapter::HttpLlmAdapter(Config::Llm config, bool verbose)
    : config_(std::move(config)), verbose_(verbose) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    if (!config_.api_key_env.empty()) {
        if (const char* key = std::getenv(config_.api_key_env.c_str())) {
            api_key_ = key;
        }
    }
}

HttpLlmAdapter::~HttpLlmAdapter() {
    curl_global_cleanup();
}

bool HttpLlmAdapter::available() const {
    if (config_.endpoint.empty()) return false;
    // Ollama runs locally without a key.
    return config_.api_format != "openai" || !api_key_.empty();
}

std::expected<LlmEnrichment, LlmError> HttpLlmAdapter::enrich(const std::string& prompt) {
    auto content = chat(ENRICH_SYSTEM_PROMPT, prompt);
    if (!content) return std::unexpected(content.error());
    return llm::parse_enrichment(*content);
}

std::expected<SessionSummary, LlmError> HttpLlmAdapter::summarize(const std::string& prompt) {
    auto content = chat(SUMMARY_SYSTEM_PROMPT, prompt);
    if (!content) return std::unexpected(content.error());
    return llm::parse_summary(*content);
}

std::expected<std::string, LlmError> HttpLlmAdapter::chat(const std::string& system_prompt,
                                                          const std::string& prompt) {
    if (config_.endpoint.empty()) {
        return std::unexpected(LlmError{LlmErrorKind::Unavailable, "no LLM endpoint configured"});
    }
    if (config_.api_format == "openai" && api_key_.empty()) {
        return std::unexpected(LlmError{LlmErrorKind::Unavailable,
                                        "API key not set (" + config_.api_key_env + ")"});
    }

    json request = {
        {"model", config_.model},
        {"messages", json::array({
            {{"role", "system"}, {"content", system_prompt}},
            {{"role", "user"}, {"content", prompt}},
        })},
        {"stream", false},
        {"temperature", 0.2},
    };
    if (config_.api_format == "openai") {
        request["response_format"] = {{"type", "json_object"}};
    } else {
        request["format"] = "json";
    }
    std::string request_body = request.dump();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(LlmError{LlmErrorKind::Transport, "curl_easy_init failed"});
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string auth;
    if (!api_key_.empty()) {
        auth = "Authorization: Bearer " + api_key_;
        headers = curl_slist_append(headers, auth.c_str());
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, config_.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request_body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 2000L);

    log("POST " + config_.endpoint + " (" + std::to_string(request_body.size()) + " bytes)");
    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(LlmError{LlmErrorKind::Timeout,
                                        "no reply within " + std::to_string(config_.timeout_ms) + "ms"});
    }
    if (res != CURLE_OK) {
        return std::unexpected(LlmError{LlmErrorKind::Transport,
                                        std::string("curl error: ") + curl_easy_strerror(res)});
    }
    if (http_status < 200 || http_status >= 300) {
        return std::unexpected(LlmError{LlmErrorKind::Http,
                                        "server returned HTTP " + std::to_string(http_status)});
    }

    return llm::extract_content(config_.api_format, response_body);
}

void HttpLlmAdapter::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[livescribe] llm: {}", msg);
    }
}
