#pragma once

#include "dispatcher.hpp"
#include "enrichment/pipeline.hpp"
#include "session_manager.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

// Routes recognized utterances through enrichment and back to the session
// that produced them. Enrichment runs on the dispatcher's workers; delivery
// and history updates happen on the loop thread.
class ResultFanout {
public:
    struct Counters {
        uint64_t delivered = 0;
        uint64_t fallback = 0; // delivered as raw text after a failed send
        uint64_t skipped = 0;  // sink closed
        uint64_t dropped = 0;  // session gone or re-registered
        uint64_t failed = 0;   // not delivered in any form
    };

    ResultFanout(SessionManager& sessions, const EnrichmentPipeline& pipeline,
                 Dispatcher& dispatcher, bool verbose = false);

    // Loop thread.
    void on_utterance(Utterance utterance);

    const Counters& counters() const { return counters_; }

    static nlohmann::json transcription_message(const Utterance& utterance,
                                                const UtteranceContext& context,
                                                const EnrichmentResult& result);
    static nlohmann::json raw_message(const Utterance& utterance);

private:
    void deliver(const Utterance& utterance, const UtteranceContext& context,
                 const EnrichmentResult& result);
    void log(const std::string& msg) const;

    SessionManager& sessions_;
    const EnrichmentPipeline& pipeline_;
    Dispatcher& dispatcher_;
    bool verbose_;
    Counters counters_;
};
