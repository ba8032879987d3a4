#include <catch2/catch_test_macros.hpp>

#include "llm/http_llm_adapter.hpp"

#include <string>
#include <vector>

TEST_CASE("llm::strip_code_fences", "[llm]") {

    SECTION("JsonFence") {
        REQUIRE(llm::strip_code_fences("```json\n{\"a\": 1}\n```") == "{\"a\": 1}");
    }

    SECTION("BareFenceWithWhitespace") {
        REQUIRE(llm::strip_code_fences("  \n```\n{}\n```  \n") == "{}");
    }

    SECTION("UnfencedIsTrimmed") {
        REQUIRE(llm::strip_code_fences("\n {\"a\": 1} \n") == "{\"a\": 1}");
    }

    SECTION("UnterminatedFence") {
        REQUIRE(llm::strip_code_fences("```json\n{\"a\": 1}") == "{\"a\": 1}");
    }
}

TEST_CASE("llm::extract_content", "[llm]") {

    SECTION("Ollama") {
        auto content = llm::extract_content(
            "ollama", R"({"model":"qwen","message":{"role":"assistant","content":"{\"x\":1}"},"done":true})");
        REQUIRE(content.has_value());
        REQUIRE(*content == R"({"x":1})");
    }

    SECTION("OpenAi") {
        auto content = llm::extract_content(
            "openai", R"({"choices":[{"index":0,"message":{"role":"assistant","content":"hi"}}]})");
        REQUIRE(content.has_value());
        REQUIRE(*content == "hi");
    }

    SECTION("ServerErrorBody") {
        auto content = llm::extract_content("ollama", R"({"error":"model not found"})");
        REQUIRE_FALSE(content.has_value());
        REQUIRE(content.error().kind == LlmErrorKind::ParseError);
        REQUIRE(content.error().message.find("model not found") != std::string::npos);
    }

    SECTION("NotJson") {
        auto content = llm::extract_content("openai", "<html>bad gateway</html>");
        REQUIRE(content.error().kind == LlmErrorKind::ParseError);
    }
}

TEST_CASE("llm::parse_enrichment", "[llm]") {

    SECTION("FullReplyInFence") {
        auto reply = llm::parse_enrichment(R"(```json
{
  "refined_text": "你好。",
  "translation": "Hello.",
  "is_keyword_match": true,
  "matched_keywords": ["你好"],
  "match_reason": "greeting",
  "is_continuation": false,
  "continuation_reason": ""
}
```)");
        REQUIRE(reply.has_value());
        REQUIRE(reply->refined_text == "你好。");
        REQUIRE(reply->translation == "Hello.");
        REQUIRE(reply->is_keyword_match);
        REQUIRE(reply->matched_keywords == std::vector<std::string>{"你好"});
        REQUIRE(reply->match_reason == "greeting");
        REQUIRE_FALSE(reply->is_continuation);
    }

    SECTION("MissingFieldsDefault") {
        auto reply = llm::parse_enrichment(R"({"translation": "Hello."})");
        REQUIRE(reply.has_value());
        REQUIRE(reply->refined_text.empty());
        REQUIRE(reply->translation == "Hello.");
        REQUIRE_FALSE(reply->is_keyword_match);
        REQUIRE(reply->matched_keywords.empty());
        REQUIRE_FALSE(reply->is_continuation);
    }

    SECTION("NullCountsAsMissing") {
        auto reply = llm::parse_enrichment(R"({"refined_text": null, "matched_keywords": null})");
        REQUIRE(reply.has_value());
        REQUIRE(reply->refined_text.empty());
    }

    SECTION("WrongTypesAreParseErrors") {
        REQUIRE(llm::parse_enrichment(R"({"is_keyword_match": "yes"})").error().kind == LlmErrorKind::ParseError);
        REQUIRE(llm::parse_enrichment(R"({"matched_keywords": "refund"})").error().kind == LlmErrorKind::ParseError);
        REQUIRE(llm::parse_enrichment(R"({"matched_keywords": [1]})").error().kind == LlmErrorKind::ParseError);
        REQUIRE(llm::parse_enrichment(R"({"translation": 42})").error().kind == LlmErrorKind::ParseError);
    }

    SECTION("NonObjectReplies") {
        REQUIRE_FALSE(llm::parse_enrichment("Sure! Here is the translation.").has_value());
        REQUIRE_FALSE(llm::parse_enrichment("[1, 2]").has_value());
        REQUIRE_FALSE(llm::parse_enrichment("").has_value());
    }
}

TEST_CASE("llm::parse_summary", "[llm]") {

    SECTION("FullReply") {
        auto summary = llm::parse_summary(
            R"({"scene":"office","topic":"budget","keyPoints":["cut travel","hire one"],"summary":"Budget agreed."})");
        REQUIRE(summary.has_value());
        REQUIRE(summary->scene == "office");
        REQUIRE(summary->key_points == std::vector<std::string>{"cut travel", "hire one"});
        REQUIRE(summary->summary == "Budget agreed.");
    }

    SECTION("WrongKeyPointsType") {
        auto summary = llm::parse_summary(R"({"keyPoints": "one point"})");
        REQUIRE(summary.error().kind == LlmErrorKind::ParseError);
    }
}

TEST_CASE("HttpLlmAdapter configuration", "[llm]") {

    SECTION("OllamaNeedsNoKey") {
        Config::Llm cfg;
        cfg.api_key_env = "LIVESCRIBE_TEST_UNSET_KEY_VARIABLE";
        HttpLlmAdapter adapter(cfg);
        REQUIRE(adapter.available());
    }

    SECTION("OpenAiWithoutKeyIsUnavailable") {
        Config::Llm cfg;
        cfg.api_format = "openai";
        cfg.api_key_env = "LIVESCRIBE_TEST_UNSET_KEY_VARIABLE";
        HttpLlmAdapter adapter(cfg);
        REQUIRE_FALSE(adapter.available());

        auto reply = adapter.enrich("prompt");
        REQUIRE(reply.error().kind == LlmErrorKind::Unavailable);
    }

    SECTION("EmptyEndpointIsUnavailable") {
        Config::Llm cfg;
        cfg.endpoint.clear();
        HttpLlmAdapter adapter(cfg);
        REQUIRE_FALSE(adapter.available());
        REQUIRE(adapter.summarize("prompt").error().kind == LlmErrorKind::Unavailable);
    }
}
