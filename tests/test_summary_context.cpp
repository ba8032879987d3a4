#include <catch2/catch_test_macros.hpp>

#include "summary_context.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

json meeting_context() {
    return {
        {"scene", "weekly sync"},
        {"topic", "release planning"},
        {"keyPoints", {"freeze on Friday", "QA owns the checklist"}},
        {"summary", "The team agreed on the release date."},
    };
}

} // namespace

TEST_CASE("SummaryContextStore", "[summary_context]") {
    SummaryContextStore store;

    SECTION("DefaultsBeforeSet") {
        REQUIRE_FALSE(store.has_context());
        auto ctx = store.get();
        REQUIRE(ctx.scene.empty());
        REQUIRE(ctx.key_points.empty());
        REQUIRE_FALSE(store.context_prompt().has_value());
    }

    SECTION("SetReplacesWholeContext") {
        REQUIRE(store.set(meeting_context()));
        REQUIRE(store.has_context());

        auto ctx = store.get();
        REQUIRE(ctx.scene == "weekly sync");
        REQUIRE(ctx.topic == "release planning");
        REQUIRE(ctx.key_points == std::vector<std::string>{"freeze on Friday", "QA owns the checklist"});
        REQUIRE(ctx.summary == "The team agreed on the release date.");
        REQUIRE(ctx.to_json() == meeting_context());
    }

    SECTION("MissingFieldKeepsPriorContext") {
        REQUIRE(store.set(meeting_context()));

        auto partial = meeting_context();
        partial["scene"] = "something else";
        partial.erase("topic");
        REQUIRE_FALSE(store.set(partial));

        REQUIRE(store.has_context());
        REQUIRE(store.get().scene == "weekly sync");
        REQUIRE(store.get().topic == "release planning");
    }

    SECTION("WrongTypesAreRejected") {
        auto bad = meeting_context();
        bad["keyPoints"] = "not a list";
        REQUIRE_FALSE(store.set(bad));

        bad = meeting_context();
        bad["keyPoints"] = {"ok", 3};
        REQUIRE_FALSE(store.set(bad));

        REQUIRE_FALSE(store.set(json::array()));
        REQUIRE_FALSE(store.has_context());
    }

    SECTION("ClearResetsAndHasContextFollowsOnlySet") {
        REQUIRE(store.set(meeting_context()));
        store.clear();
        REQUIRE_FALSE(store.has_context());
        REQUIRE(store.get().scene.empty());
        REQUIRE_FALSE(store.context_prompt().has_value());

        // A failed set after clear does not bring the context back.
        auto partial = meeting_context();
        partial.erase("summary");
        REQUIRE_FALSE(store.set(partial));
        REQUIRE_FALSE(store.has_context());
    }

    SECTION("SnapshotIsUnaffectedByLaterUpdates") {
        REQUIRE(store.set(meeting_context()));
        auto snap = store.snapshot();

        store.clear();
        REQUIRE(snap->has_context);
        REQUIRE(snap->scene == "weekly sync");
    }

    SECTION("PromptRendering") {
        REQUIRE(store.set(meeting_context()));
        auto prompt = store.context_prompt();
        REQUIRE(prompt.has_value());
        REQUIRE(*prompt ==
                "Conversation context:\n"
                "Scene: weekly sync\n"
                "Topic: release planning\n"
                "Key points:\n"
                "- freeze on Friday\n"
                "- QA owns the checklist\n"
                "Overall summary: The team agreed on the release date.");
    }
}
