#include "enrichment/pipeline.hpp"

#include "languages.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <format>
#include <print>

namespace {

std::string ascii_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_blank(std::string_view s) {
    return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

} // namespace

EnrichmentResult EnrichmentResult::degraded(const std::string& text, std::string error) {
    EnrichmentResult result;
    result.refined_text = text;
    result.error = std::move(error);
    return result;
}

EnrichmentPipeline::EnrichmentPipeline(LlmAdapter& llm, const SummaryContextStore& context,
                                       bool verbose)
    : llm_(llm), context_(context), verbose_(verbose) {}

EnrichmentResult EnrichmentPipeline::enrich(const EnrichmentRequest& request) const {
    try {
        return run(request);
    } catch (const std::exception& e) {
        std::println(stderr, "enrichment: unexpected failure: {}", e.what());
        return EnrichmentResult::degraded(request.text, e.what());
    }
}

EnrichmentResult EnrichmentPipeline::run(const EnrichmentRequest& request) const {
    if (is_blank(request.text)) {
        return EnrichmentResult::degraded(request.text, "empty utterance");
    }

    // One read of the shared context per call; later updates apply to later calls.
    auto context = context_.snapshot();
    std::optional<std::string> context_prompt;
    if (context->has_context) {
        context_prompt = SummaryContextStore::render_prompt(*context);
    }

    auto prompt = build_prompt(request, context_prompt);
    auto reply = llm_.enrich(prompt);
    if (!reply) {
        std::println(stderr, "enrichment: llm {}: {}",
                     llm_error_kind_name(reply.error().kind), reply.error().message);
        return EnrichmentResult::degraded(request.text, reply.error().message);
    }

    EnrichmentResult result;
    result.refined_text = reply->refined_text.empty() ? request.text : reply->refined_text;
    result.translation = reply->translation;
    result.is_keyword_match = reply->is_keyword_match;
    result.matched_keywords = reply->matched_keywords;
    result.match_reason = reply->match_reason;
    result.is_continuation = reply->is_continuation && !request.history.empty();
    result.continuation_reason = result.is_continuation ? reply->continuation_reason : "";
    result.context_enhanced = context->has_context;
    result.success = true;

    auto direct = direct_keyword_matches(request.text, request.keywords);
    if (!direct.empty() && !result.is_keyword_match) {
        log(std::format("keyword override, model missed {} direct match(es)", direct.size()));
        result.is_keyword_match = true;
        result.matched_keywords = std::move(direct);
        result.match_reason = "direct substring match";
    }

    if (result.is_keyword_match) {
        log(std::format("keyword match: {} ({})", result.matched_keywords.size(), result.match_reason));
    }
    if (result.is_continuation) {
        log("continuation of previous utterance: " + result.continuation_reason);
    }
    return result;
}

std::string EnrichmentPipeline::build_prompt(const EnrichmentRequest& request,
                                             const std::optional<std::string>& context_prompt) {
    auto source = language_name(request.source_language);
    auto target = language_name(request.target_language);

    std::string prompt;
    if (context_prompt) {
        prompt += *context_prompt;
        prompt += "\n\nUse the conversation context above to interpret the text. Keep "
                  "corrections and translation consistent with its scene, topic and key points.\n\n";
    }

    if (!request.history.empty()) {
        prompt += "Previous sentences:\n";
        for (size_t i = 0; i < request.history.size(); i++) {
            prompt += std::format("{}. {}\n", i + 1, request.history[i]);
        }
        prompt += "\n";
    }

    if (!request.keywords.empty()) {
        prompt += "Keywords the user cares about:\n";
        for (size_t i = 0; i < request.keywords.size(); i++) {
            if (i > 0) prompt += ", ";
            prompt += request.keywords[i];
        }
        prompt += "\n\n";
    }

    prompt += std::format("Current text ({}): {}\n\n", source, request.text);

    std::string last = request.history.empty() ? "" : request.history.back();
    prompt += "Tasks:\n";
    prompt += "1. Keyword match: decide whether the current text mentions any keyword, "
              "including inflections and closely related expressions. One match is enough.\n";
    if (last.empty()) {
        prompt += "2. Continuation: there is no previous sentence, answer false.\n";
        prompt += "3. Refinement: fix recognition errors in the current text and keep its meaning.\n";
        prompt += std::format("4. Translation: translate the refined text into {}.\n", target);
    } else {
        prompt += std::format("2. Continuation: decide whether the current text continues the last "
                              "previous sentence \"{}\" because recognition split one sentence "
                              "in two. Ignore any other relation.\n", last);
        prompt += "3. Refinement: fix recognition errors in the current text and keep its meaning. "
                  "If it is a continuation, return the last previous sentence and the current "
                  "text merged into one sentence.\n";
        prompt += std::format("4. Translation: translate the refined text into {}. If it is a "
                              "continuation, translate the merged sentence.\n", target);
    }

    prompt += "\nReply with this JSON object only:\n"
              "{\n"
              "  \"refined_text\": \"corrected text\",\n"
              "  \"translation\": \"translated text\",\n"
              "  \"is_keyword_match\": true or false,\n"
              "  \"matched_keywords\": [\"keyword\"],\n"
              "  \"match_reason\": \"short reason\",\n"
              "  \"is_continuation\": true or false,\n"
              "  \"continuation_reason\": \"short reason\"\n"
              "}\n";
    return prompt;
}

std::vector<std::string>
EnrichmentPipeline::direct_keyword_matches(std::string_view text,
                                           const std::vector<std::string>& keywords) {
    std::vector<std::string> matches;
    auto haystack = ascii_lower(text);
    for (const auto& keyword : keywords) {
        if (keyword.empty()) continue;
        if (haystack.find(ascii_lower(keyword)) != std::string::npos) {
            matches.push_back(keyword);
        }
    }
    return matches;
}

void EnrichmentPipeline::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[livescribe] enrichment: {}", msg);
    }
}
