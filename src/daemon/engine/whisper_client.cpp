#include "engine/whisper_client.hpp"

#include "wav_encoder.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

// Returning non-zero from the progress callback aborts the transfer.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

void add_text_part(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

std::string trim(const std::string& text) {
    auto start_pos = text.find_first_not_of(" \t\n\r");
    if (start_pos == std::string::npos) return {};
    auto end_pos = text.find_last_not_of(" \t\n\r");
    return text.substr(start_pos, end_pos - start_pos + 1);
}

} // namespace

WhisperClient::WhisperClient(std::string url, std::string api_format, std::string language,
                             std::string model_type)
    : url_(std::move(url)), api_format_(std::move(api_format)),
      language_(std::move(language)), model_type_(std::move(model_type)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

WhisperClient::~WhisperClient() {
    curl_global_cleanup();
}

bool WhisperClient::is_known_format(const std::string& api_format) {
    return api_format == "whisper.cpp" || api_format == "openai";
}

std::expected<TranscriptResult, std::string>
WhisperClient::transcribe(std::span<const int16_t> audio, uint32_t sample_rate,
                          std::stop_token stop) {
    if (audio.empty()) {
        return std::unexpected("empty audio");
    }

    double duration_s = static_cast<double>(audio.size()) / sample_rate;
    auto wav_data = wav::encode(audio, sample_rate);

    auto start = std::chrono::steady_clock::now();

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);

    curl_mimepart* file = curl_mime_addpart(mime);
    curl_mime_name(file, "file");
    curl_mime_data(file, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(file, "audio.wav");
    curl_mime_type(file, "audio/wav");

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";
        // OpenAI-compatible local servers select the checkpoint by name.
        add_text_part(mime, "model", model_type_);
        add_text_part(mime, "language", language_);
        add_text_part(mime, "response_format", "json");
    } else {
        endpoint = url_ + "/inference";
        add_text_part(mime, "temperature", "0.0");
        add_text_part(mime, "response_format", "json");
        if (!language_.empty()) {
            add_text_part(mime, "language", language_);
        }
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    long http_status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    auto end = std::chrono::steady_clock::now();
    double processing_s = std::chrono::duration<double>(end - start).count();

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("cancelled");
    }
    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    if (http_status >= 400) {
        return std::unexpected("server returned HTTP " + std::to_string(http_status));
    }

    try {
        auto j = json::parse(response_body);

        if (j.contains("text")) {
            return TranscriptResult{
                .text = trim(j["text"].get<std::string>()),
                .duration_s = duration_s,
                .processing_s = processing_s,
            };
        }
        if (j.contains("error")) {
            return std::unexpected("server error: " + j["error"].dump());
        }
        return std::unexpected("unexpected response: " + response_body);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
