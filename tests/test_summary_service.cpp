#include <catch2/catch_test_macros.hpp>

#include "enrichment/summary_service.hpp"
#include "fakes.hpp"

#include <limits>
#include <string>
#include <vector>

TEST_CASE("SummaryService", "[summary]") {
    ScriptedLlm llm;
    SummaryService service(llm);

    std::vector<TranscriptItem> items = {
        {.text = "Let's go over the budget.", .timestamp = "2024-05-01T09:15:30.123Z"},
        {.text = "Travel is over by ten percent.", .timestamp = "2024-05-01T09:16:02+08:00"},
    };

    SECTION("TooFewItemsSkipsTheModel") {
        auto summary = service.generate({items[0]});
        REQUIRE(summary.scene == SummaryService::insufficient_content().scene);
        REQUIRE(summary.key_points.size() == 1);
        REQUIRE(llm.summarize_calls == 0);

        REQUIRE(service.generate({}).scene == SummaryService::insufficient_content().scene);
    }

    SECTION("ModelReplyIsReturned") {
        llm.summary_reply = SessionSummary{
            .scene = "finance meeting",
            .topic = "budget",
            .key_points = {"travel overspend"},
            .summary = "Travel is over budget.",
        };
        auto summary = service.generate(items);
        REQUIRE(llm.summarize_calls == 1);
        REQUIRE(summary.topic == "budget");
        REQUIRE(summary.key_points == std::vector<std::string>{"travel overspend"});

        auto& prompt = llm.prompts.back();
        REQUIRE(prompt.find("[09:15:30] Let's go over the budget.") != std::string::npos);
        REQUIRE(prompt.find("[09:16:02] Travel is over by ten percent.") != std::string::npos);
    }

    SECTION("ModelFailureYieldsErrorSummary") {
        llm.summary_error = LlmError{LlmErrorKind::Timeout, "no reply within 15000ms"};
        auto summary = service.generate(items);
        REQUIRE(summary.scene == "Processing error");
        REQUIRE(summary.summary.find("no reply within 15000ms") != std::string::npos);
    }
}

TEST_CASE("SummaryService timestamps", "[summary]") {

    SECTION("IsoTimestamps") {
        REQUIRE(SummaryService::format_timestamp("2024-05-01T09:15:30") == "09:15:30");
        REQUIRE(SummaryService::format_timestamp("2024-05-01 23:59:59.5Z") == "23:59:59");
    }

    SECTION("OtherStringsPassThrough") {
        REQUIRE(SummaryService::format_timestamp("yesterday") == "yesterday");
        REQUIRE(SummaryService::format_timestamp("2024-05-01") == "2024-05-01");
        REQUIRE(SummaryService::format_timestamp("2024-05-01Tnoon") == "2024-05-01Tnoon");
        REQUIRE(SummaryService::format_timestamp("").empty());
    }

    SECTION("EpochSeconds") {
        // 2023-11-14T22:13:20Z
        REQUIRE(SummaryService::format_epoch_seconds(1700000000.75) == "22:13:20");
        REQUIRE(SummaryService::format_epoch_seconds(-1.0) == "23:59:59");
    }

    SECTION("EpochSecondsOutOfRange") {
        REQUIRE_FALSE(SummaryService::format_epoch_seconds(1e300).has_value());
        REQUIRE_FALSE(SummaryService::format_epoch_seconds(-1e300).has_value());
        REQUIRE_FALSE(SummaryService::format_epoch_seconds(std::numeric_limits<double>::infinity()).has_value());
        REQUIRE_FALSE(SummaryService::format_epoch_seconds(std::numeric_limits<double>::quiet_NaN()).has_value());
        REQUIRE(SummaryService::format_epoch_seconds(253402300799.0) == "23:59:59");
    }
}
