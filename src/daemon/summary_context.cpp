#include "summary_context.hpp"

#include <format>

using json = nlohmann::json;

json SummaryContext::to_json() const {
    return json{
        {"scene", scene},
        {"topic", topic},
        {"keyPoints", key_points},
        {"summary", summary},
    };
}

SummaryContextStore::SummaryContextStore()
    : current_(std::make_shared<const SummaryContext>()) {}

bool SummaryContextStore::set(const json& payload) {
    if (!payload.is_object()) return false;

    auto is_string = [&](const char* key) {
        return payload.contains(key) && payload[key].is_string();
    };
    if (!is_string("scene") || !is_string("topic") || !is_string("summary")) return false;
    if (!payload.contains("keyPoints") || !payload["keyPoints"].is_array()) return false;

    auto next = std::make_shared<SummaryContext>();
    next->scene = payload["scene"].get<std::string>();
    next->topic = payload["topic"].get<std::string>();
    next->summary = payload["summary"].get<std::string>();
    for (const auto& point : payload["keyPoints"]) {
        if (!point.is_string()) return false;
        next->key_points.push_back(point.get<std::string>());
    }
    next->has_context = true;

    std::lock_guard lock(mutex_);
    current_ = std::move(next);
    return true;
}

SummaryContext SummaryContextStore::get() const {
    return *snapshot();
}

std::shared_ptr<const SummaryContext> SummaryContextStore::snapshot() const {
    std::lock_guard lock(mutex_);
    return current_;
}

bool SummaryContextStore::has_context() const {
    return snapshot()->has_context;
}

void SummaryContextStore::clear() {
    auto empty = std::make_shared<const SummaryContext>();
    std::lock_guard lock(mutex_);
    current_ = std::move(empty);
}

std::optional<std::string> SummaryContextStore::context_prompt() const {
    auto context = snapshot();
    if (!context->has_context) return std::nullopt;
    return render_prompt(*context);
}

std::string SummaryContextStore::render_prompt(const SummaryContext& context) {
    std::string points;
    for (const auto& point : context.key_points) {
        points += std::format("- {}\n", point);
    }
    return std::format("Conversation context:\n"
                       "Scene: {}\n"
                       "Topic: {}\n"
                       "Key points:\n"
                       "{}"
                       "Overall summary: {}",
                       context.scene, context.topic, points, context.summary);
}
