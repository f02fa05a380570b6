#include <catch2/catch_test_macros.hpp>

#include "text/post_processor.hpp"

#include <string>
#include <vector>

TEST_CASE("Sentence repetition", "[postproc]") {

    SECTION("CollapsesRepeatedFinalSentence") {
        REQUIRE(postproc::collapse_repeated_sentences("Thank you. Thank you. Thank you.") == "Thank you.");
    }

    SECTION("KeepsLeadingText") {
        REQUIRE(postproc::collapse_repeated_sentences("I went home. It rained. It rained. It rained.") ==
                "I went home. It rained.");
    }

    SECTION("CaseInsensitive") {
        REQUIRE(postproc::collapse_repeated_sentences("We are done here. we are done here.") ==
                "We are done here.");
    }

    SECTION("ShortTextUntouched") {
        REQUIRE(postproc::collapse_repeated_sentences("Hi. Hi.") == "Hi. Hi.");
    }

    SECTION("NoRepetitionUntouched") {
        std::string text = "First sentence here. Second one is different.";
        REQUIRE(postproc::collapse_repeated_sentences(text) == text);
    }
}

TEST_CASE("Trailing phrase repetition", "[postproc]") {

    SECTION("CollapsesThreeWordPhrase") {
        REQUIRE(postproc::collapse_trailing_phrases("the quick fox the quick fox") == "the quick fox");
    }

    SECTION("CollapsesManyRepeats") {
        REQUIRE(postproc::collapse_trailing_phrases("and then I said go on go on go on go on") ==
                "and then I said go on");
    }

    SECTION("TooFewWordsUntouched") {
        REQUIRE(postproc::collapse_trailing_phrases("go on go") == "go on go");
    }

    SECTION("NoRepetitionUntouched") {
        std::string text = "please send the report before noon";
        REQUIRE(postproc::collapse_trailing_phrases(text) == text);
    }
}

TEST_CASE("Hallucination strip", "[postproc]") {

    SECTION("FullTextHallucinationsBecomeEmpty") {
        for (const char* text : {"Thank you.", "thanks for watching!", "  You  ", "...", "The end."}) {
            INFO(text);
            REQUIRE(postproc::strip_hallucinations(text).empty());
        }
    }

    SECTION("TrailingBoilerplateStripped") {
        REQUIRE(postproc::strip_hallucinations("Send the invoice today. Thank you.") == "Send the invoice today.");
        REQUIRE(postproc::strip_hallucinations("That covers it. Thanks for watching") == "That covers it.");
    }

    SECTION("RealTextEndingInThanksKeepsContent") {
        auto out = postproc::strip_hallucinations("Oh, thank you.");
        REQUIRE_FALSE(out.empty());
        REQUIRE(out == "Oh,");
    }

    SECTION("WordBoundaryRespected") {
        REQUIRE(postproc::strip_hallucinations("We said goodbye.") == "We said goodbye.");
    }

    SECTION("UnchangedTextKeepsWhitespace") {
        REQUIRE(postproc::strip_hallucinations("  hello world ") == "  hello world ");
    }
}

TEST_CASE("Clean pipeline", "[postproc]") {

    SECTION("RepeatedThanksCollapsesThenStrips") {
        REQUIRE(postproc::clean("Thank you. Thank you. Thank you.").empty());
    }

    SECTION("PlainTextUntouched") {
        REQUIRE(postproc::clean("Schedule the meeting for Tuesday.") == "Schedule the meeting for Tuesday.");
    }

    SECTION("EmptyStaysEmpty") {
        REQUIRE(postproc::clean("").empty());
    }

    SECTION("Idempotent") {
        std::vector<std::string> inputs = {
            "Thank you. Thank you. Thank you.",
            "the quick fox the quick fox",
            "Oh, thank you.",
            "It works. It works. Thanks for watching. Bye.",
            "hello hello hello hello world world world world",
            "Reply to Sam... ... ...",
            "",
        };
        for (const auto& in : inputs) {
            INFO(in);
            auto once = postproc::clean(in);
            REQUIRE(postproc::clean(once) == once);
        }
    }
}
