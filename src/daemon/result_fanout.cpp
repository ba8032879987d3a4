#include "result_fanout.hpp"

#include <format>
#include <print>

using json = nlohmann::json;

ResultFanout::ResultFanout(SessionManager& sessions, const EnrichmentPipeline& pipeline,
                           Dispatcher& dispatcher, bool verbose)
    : sessions_(sessions), pipeline_(pipeline), dispatcher_(dispatcher), verbose_(verbose) {}

void ResultFanout::on_utterance(Utterance utterance) {
    if (utterance.text.empty()) return;

    auto context = sessions_.utterance_context(utterance.session_id, utterance.epoch);
    if (!context) {
        counters_.dropped++;
        log(std::format("{}: session gone, dropping utterance", utterance.session_id));
        return;
    }

    log(std::format("{}: recognized \"{}\"", utterance.session_id, utterance.text));

    dispatcher_.run_async([this, utterance = std::move(utterance), context = std::move(*context)] {
        EnrichmentRequest request{
            .text = utterance.text,
            .source_language = context.source_language,
            .target_language = context.target_language,
            .history = context.history,
            .keywords = context.keywords,
        };
        auto result = pipeline_.enrich(request);
        dispatcher_.post([this, utterance, context, result = std::move(result)] {
            deliver(utterance, context, result);
        });
    });
}

void ResultFanout::deliver(const Utterance& utterance, const UtteranceContext& context,
                           const EnrichmentResult& result) {
    if (!sessions_.record_utterance(utterance.session_id, utterance.epoch, result.refined_text,
                                    result.is_continuation)) {
        counters_.dropped++;
        log(std::format("{}: session gone before delivery, dropping result", utterance.session_id));
        return;
    }

    auto sink = utterance.sink.lock();
    if (!sink || !sink->is_open()) {
        counters_.skipped++;
        log(std::format("{}: connection not open, skipping delivery", utterance.session_id));
        return;
    }

    auto sent = sink->send(transcription_message(utterance, context, result));
    if (sent) {
        counters_.delivered++;
        return;
    }

    std::println(stderr, "ipc: {}: transcription send failed: {}", utterance.session_id,
                 sent.error().message);
    if (sent.error().partial) {
        // Connection is being torn down; a fallback would land mid-frame.
        counters_.failed++;
        return;
    }

    auto raw = sink->send(raw_message(utterance));
    if (!raw) {
        std::println(stderr, "ipc: {}: raw fallback send failed: {}", utterance.session_id,
                     raw.error().message);
        counters_.failed++;
        return;
    }
    counters_.fallback++;
}

json ResultFanout::transcription_message(const Utterance& utterance,
                                         const UtteranceContext& context,
                                         const EnrichmentResult& result) {
    json msg = {
        {"event", "transcription"},
        {"text", utterance.text},
        {"refined_text", result.refined_text},
        {"translation", result.translation},
        {"timestamp", utterance.timestamp},
        {"source_language", context.source_language},
        {"target_language", context.target_language},
        {"is_keyword_match", result.is_keyword_match},
        {"matched_keywords", result.matched_keywords},
        {"match_reason", result.match_reason},
        {"is_continuation", result.is_continuation},
        {"continuation_reason", result.continuation_reason},
        {"context_enhanced", result.context_enhanced},
        {"enrichment_success", result.success},
    };
    if (result.error) msg["enrichment_error"] = *result.error;
    return msg;
}

json ResultFanout::raw_message(const Utterance& utterance) {
    return {
        {"event", "transcription"},
        {"text", utterance.text},
        {"timestamp", utterance.timestamp},
    };
}

void ResultFanout::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[livescribe] fanout: {}", msg);
    }
}
