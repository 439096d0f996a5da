#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include "stream/stream_decoder.hpp"

namespace {

using chatflow::core::errors::ErrorCategory;
using chatflow::core::errors::FlowError;
using chatflow::core::errors::get_error;
using chatflow::core::errors::get_value;
using chatflow::core::errors::is_error;
using chatflow::protocol::ProviderError;
using chatflow::protocol::StreamEvent;
using chatflow::protocol::TextDelta;
using chatflow::protocol::ToolCallArgumentsDelta;
using chatflow::protocol::ToolCallCompleted;
using chatflow::protocol::ToolCallStarted;
using chatflow::protocol::TurnCompleted;
using chatflow::protocol::UsageDelta;
using chatflow::protocol::UsageUpdate;
using chatflow::stream::DecodedItem;
using chatflow::stream::DecodedText;
using chatflow::stream::DecodedToolCall;
using chatflow::stream::DecodedTurnEnd;
using chatflow::stream::DecodedUsage;
using chatflow::stream::DecoderState;
using chatflow::stream::StreamDecoder;
using nlohmann::json;

// Feeds every event and collects the items; fails the test on an error.
std::vector<DecodedItem> feed_all(StreamDecoder& decoder, const std::vector<StreamEvent>& events) {
    std::vector<DecodedItem> items;
    for (const auto& event : events) {
        auto result = decoder.feed(event);
        if (is_error(result)) {
            ADD_FAILURE() << "unexpected decoder error: " << get_error(result).message;
            return items;
        }
        for (const auto& item : get_value(result)) {
            items.push_back(item);
        }
    }
    return items;
}

std::vector<chatflow::stream::CompletedToolCall> completed_calls(const std::vector<DecodedItem>& items) {
    std::vector<chatflow::stream::CompletedToolCall> calls;
    for (const auto& item : items) {
        if (const auto* call = std::get_if<DecodedToolCall>(&item)) {
            calls.push_back(call->completed);
        }
    }
    return calls;
}

TEST(StreamDecoderTest, StartsIdleAndStreamsText) {
    StreamDecoder decoder;
    EXPECT_EQ(decoder.state(), DecoderState::Idle);

    auto items = feed_all(decoder, {TextDelta{"Hel"}, TextDelta{"lo"}});
    EXPECT_EQ(decoder.state(), DecoderState::Streaming);
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(std::get<DecodedText>(items[0]).delta, "Hel");
    EXPECT_EQ(std::get<DecodedText>(items[1]).delta, "lo");
}

TEST(StreamDecoderTest, ReassemblesInterleavedCalls) {
    StreamDecoder decoder;
    auto items = feed_all(decoder, {
        ToolCallStarted{"call_a", "add"},
        ToolCallStarted{"call_b", "say_hello"},
        ToolCallArgumentsDelta{"call_a", "{\"a\":"},
        ToolCallArgumentsDelta{"call_b", "{\"name\""},
        ToolCallArgumentsDelta{"call_a", "2,\"b\":3}"},
        ToolCallArgumentsDelta{"call_b", ":\"Ada\"}"},
        ToolCallCompleted{"call_b"},
        ToolCallCompleted{"call_a"},
    });

    const auto calls = completed_calls(items);
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].call.id, "call_b");
    EXPECT_EQ(calls[0].call.name, "say_hello");
    EXPECT_EQ(calls[0].call.args, json({{"name", "Ada"}}));
    EXPECT_EQ(calls[1].call.id, "call_a");
    EXPECT_EQ(calls[1].call.arguments, "{\"a\":2,\"b\":3}");
    EXPECT_EQ(calls[1].call.args, json({{"a", 2}, {"b", 3}}));
    EXPECT_EQ(decoder.open_call_count(), 0u);
    EXPECT_EQ(decoder.completed_call_count(), 2u);
}

TEST(StreamDecoderTest, RepairsOncePerCompletedCall) {
    int repairs = 0;
    StreamDecoder decoder([&repairs](std::string_view text) {
        ++repairs;
        return chatflow::tools::repair_json(text);
    });

    std::vector<StreamEvent> events{ToolCallStarted{"c1", "add"}, ToolCallStarted{"c2", "add"}};
    const std::string args = "{\"a\":12,\"b\":30}";
    for (const char c : args) {
        events.push_back(ToolCallArgumentsDelta{"c1", std::string(1, c)});
        events.push_back(ToolCallArgumentsDelta{"c2", std::string(1, c)});
    }
    events.push_back(ToolCallCompleted{"c1"});
    events.push_back(ToolCallCompleted{"c2"});
    events.push_back(TurnCompleted{});

    feed_all(decoder, events);
    EXPECT_EQ(repairs, 2);
}

TEST(StreamDecoderTest, TruncatedArgumentsAreRepaired) {
    StreamDecoder decoder;
    auto items = feed_all(decoder, {
        ToolCallStarted{"c1", "add"},
        ToolCallArgumentsDelta{"c1", "{\"a\":2,\"b\":"},
        ToolCallCompleted{"c1"},
    });
    const auto calls = completed_calls(items);
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_FALSE(calls[0].decode_error.has_value());
    EXPECT_EQ(calls[0].call.args, json({{"a", 2}, {"b", nullptr}}));
}

TEST(StreamDecoderTest, UnrepairableArgumentsCarryDecodeError) {
    StreamDecoder decoder;
    auto items = feed_all(decoder, {
        ToolCallStarted{"c1", "add"},
        ToolCallArgumentsDelta{"c1", "}}{{"},
        ToolCallCompleted{"c1"},
    });
    const auto calls = completed_calls(items);
    ASSERT_EQ(calls.size(), 1u);
    ASSERT_TRUE(calls[0].decode_error.has_value());
    EXPECT_EQ(calls[0].decode_error->code, "unrepairable_json");
    EXPECT_TRUE(calls[0].call.args.is_null());
}

TEST(StreamDecoderTest, TurnEndCarriesTextCallsAndResponseId) {
    StreamDecoder decoder;
    auto items = feed_all(decoder, {
        TextDelta{"Let me add. "},
        ToolCallStarted{"c1", "add"},
        ToolCallArgumentsDelta{"c1", "{\"a\":1,\"b\":1}"},
        ToolCallCompleted{"c1"},
        UsageUpdate{UsageDelta{10, 2, 5}},
        TurnCompleted{std::string("resp_1")},
    });

    ASSERT_FALSE(items.empty());
    ASSERT_TRUE(std::holds_alternative<DecodedUsage>(items[items.size() - 2]));
    const auto& turn_end = std::get<DecodedTurnEnd>(items.back());
    EXPECT_EQ(turn_end.assistant_text, "Let me add. ");
    ASSERT_EQ(turn_end.tool_calls.size(), 1u);
    EXPECT_EQ(turn_end.tool_calls[0].call.id, "c1");
    EXPECT_EQ(turn_end.response_id.value(), "resp_1");
    EXPECT_EQ(decoder.state(), DecoderState::Done);
}

TEST(StreamDecoderTest, OpenCallsAreFinalizedAtTurnEnd) {
    StreamDecoder decoder;
    auto items = feed_all(decoder, {
        ToolCallStarted{"c1", "add"},
        ToolCallArgumentsDelta{"c1", "{\"a\":4"},
        TurnCompleted{},
    });

    ASSERT_EQ(items.size(), 2u);
    const auto& call = std::get<DecodedToolCall>(items[0]).completed;
    EXPECT_EQ(call.call.args, json({{"a", 4}}));
    EXPECT_EQ(std::get<DecodedTurnEnd>(items[1]).tool_calls.size(), 1u);
}

TEST(StreamDecoderTest, RejectsDuplicateCallId) {
    StreamDecoder decoder;
    ASSERT_FALSE(is_error(decoder.feed(ToolCallStarted{"c1", "add"})));
    auto result = decoder.feed(ToolCallStarted{"c1", "add"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Protocol);
    EXPECT_EQ(get_error(result).code, "duplicate_tool_call");
    EXPECT_EQ(decoder.state(), DecoderState::Errored);

    auto after = decoder.feed(TextDelta{"more"});
    ASSERT_TRUE(is_error(after));
    EXPECT_EQ(get_error(after).code, "decoder_errored");
}

TEST(StreamDecoderTest, RejectsDeltaForUnknownCall) {
    StreamDecoder decoder;
    auto result = decoder.feed(ToolCallArgumentsDelta{"ghost", "{}"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_tool_call");
}

TEST(StreamDecoderTest, RejectsDeltaAfterCompletion) {
    StreamDecoder decoder;
    feed_all(decoder, {ToolCallStarted{"c1", "add"}, ToolCallCompleted{"c1"}});
    auto result = decoder.feed(ToolCallArgumentsDelta{"c1", "{}"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "tool_call_already_completed");
}

TEST(StreamDecoderTest, RejectsEventsAfterTurnEnd) {
    StreamDecoder decoder;
    feed_all(decoder, {TextDelta{"done"}, TurnCompleted{}});
    auto result = decoder.feed(TextDelta{"late"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "event_after_done");
}

TEST(StreamDecoderTest, ProviderErrorIsFatal) {
    StreamDecoder decoder;
    auto result = decoder.feed(ProviderError{"rate limited", "rate_limit_exceeded"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(result).code, "rate_limit_exceeded");
    EXPECT_EQ(decoder.state(), DecoderState::Errored);
}

}  // namespace
