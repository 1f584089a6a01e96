// SPDX-License-Identifier: Apache-2.0
#include <text/TextPostProcessor.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace talktype;

TEST_CASE("TextPostProcessor cleans up dictated text", "[text]")
{
    auto const processor = TextPostProcessor {};

    CHECK(processor.process("um so i am going to the the store") == "So I am going to the store.");
    CHECK(processor.process("Um, hello there") == "Hello there.");
    CHECK(processor.process("hello, uh, world") == "Hello, world.");
    CHECK(processor.process("It actually works") == "It works.");
    CHECK(processor.process("hello, um") == "Hello.");
}

TEST_CASE("TextPostProcessor repairs common recognition slips", "[text]")
{
    auto const processor = TextPostProcessor {};

    CHECK(processor.process("dont worry") == "Don't worry.");
    CHECK(processor.process("well i'm here") == "Well I'm here.");
    CHECK(processor.process("cant go and wont stay") == "Can't go and won't stay.");
}

TEST_CASE("TextPostProcessor keeps words that only start like fillers", "[text]")
{
    auto const processor = TextPostProcessor {};

    CHECK(processor.process("umbrella") == "Umbrella.");
    CHECK(processor.process("I like cats") == "I like cats.");
    CHECK(processor.process("errand") == "Errand.");
}

TEST_CASE("TextPostProcessor punctuation handling", "[text]")
{
    auto const processor = TextPostProcessor {};

    CHECK(processor.process("really?") == "Really?");
    CHECK(processor.process("stop!") == "Stop!");
    CHECK(processor.process("hello , world") == "Hello, world.");
    CHECK(processor.process("  spaced   out  ") == "Spaced out.");
}

TEST_CASE("TextPostProcessor returns nothing for filler-only text", "[text]")
{
    auto const processor = TextPostProcessor {};

    CHECK(processor.process("um uh").empty());
    CHECK(processor.process("   ").empty());
    CHECK(processor.process("").empty());
}

TEST_CASE("TextPostProcessor honours disabled steps", "[text]")
{
    auto const processor = TextPostProcessor(TextConfig {
        .removeFillers = false,
        .fixCommonErrors = false,
        .collapseRepeats = false,
        .capitalize = false,
        .terminalPunctuation = false,
    });

    CHECK(processor.process("um  hello") == "um hello");
    CHECK(processor.process("dont the the") == "dont the the");
    CHECK(processor.config().removeFillers == false);
}
