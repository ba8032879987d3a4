#pragma once

#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct SummaryContext {
    std::string scene;
    std::string topic;
    std::vector<std::string> key_points;
    std::string summary;
    bool has_context = false;

    nlohmann::json to_json() const;
};

// Process-wide summary context used to bias enrichment. One instance is owned
// by the daemon and shared by reference.
//
// The slot is replaced as a whole on set/clear, so a reader holding a
// snapshot never sees a half-written context.
class SummaryContextStore {
public:
    SummaryContextStore();

    // Requires "scene", "topic", "keyPoints" and "summary" with the right
    // types. On failure the previous context is kept.
    bool set(const nlohmann::json& payload);

    SummaryContext get() const;
    std::shared_ptr<const SummaryContext> snapshot() const;
    bool has_context() const;
    void clear();

    // Prompt fragment for the current context, empty when none is set.
    std::optional<std::string> context_prompt() const;

    static std::string render_prompt(const SummaryContext& context);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const SummaryContext> current_;
};
