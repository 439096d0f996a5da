#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <gtest/gtest.h>
#include "core/config/ids.hpp"
#include "provider/replay_transport.hpp"

namespace {

using chatflow::core::errors::get_error;
using chatflow::core::errors::get_value;
using chatflow::core::errors::is_error;
using chatflow::core::errors::take_value;
using chatflow::protocol::StreamEvent;
using chatflow::protocol::TextDelta;
using chatflow::protocol::TurnCompleted;
using chatflow::provider::EventSource;
using chatflow::provider::ProviderRequest;
using chatflow::provider::ReplayTransport;

const char* const kTwoTurns =
    "data: {\"id\":\"r1\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"one\"}}]}\n\n"
    "data: [DONE]\n\n"
    "data: {\"id\":\"r2\",\"choices\":[{\"index\":0,\"delta\":{\"content\":\"two\"}}]}\n\n"
    "data: [DONE]\n\n";

std::unique_ptr<EventSource> open_next(ReplayTransport& transport) {
    auto opened = transport.open(ProviderRequest{});
    if (is_error(opened)) {
        ADD_FAILURE() << get_error(opened).message;
        return nullptr;
    }
    return take_value(opened);
}

std::optional<StreamEvent> pull(EventSource& source) {
    auto next = source.next();
    if (is_error(next)) {
        ADD_FAILURE() << get_error(next).message;
        return std::nullopt;
    }
    return get_value(next);
}

TEST(ReplayTransportTest, ServesOneResponsePerDone) {
    auto loaded = ReplayTransport::from_sse(kTwoTurns);
    ASSERT_FALSE(is_error(loaded));
    auto transport = take_value(loaded);
    EXPECT_EQ(transport->turn_count(), 2u);

    auto first = open_next(*transport);
    ASSERT_TRUE(first != nullptr);
    auto text = pull(*first);
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(std::get<TextDelta>(*text).text, "one");
    auto done = pull(*first);
    ASSERT_TRUE(done.has_value());
    EXPECT_EQ(std::get<TurnCompleted>(*done).response_id.value(), "r1");
    EXPECT_FALSE(pull(*first).has_value());

    auto second = open_next(*transport);
    ASSERT_TRUE(second != nullptr);
    EXPECT_EQ(std::get<TextDelta>(*pull(*second)).text, "two");
    EXPECT_EQ(transport->requests_served(), 2u);
    EXPECT_EQ(transport->requests().size(), 2u);

    auto exhausted = transport->open(ProviderRequest{});
    ASSERT_TRUE(is_error(exhausted));
    EXPECT_EQ(get_error(exhausted).code, "replay_exhausted");
}

TEST(ReplayTransportTest, CancelEndsTheSource) {
    auto loaded = ReplayTransport::from_sse(kTwoTurns);
    ASSERT_FALSE(is_error(loaded));
    auto transport = take_value(loaded);
    auto source = open_next(*transport);
    ASSERT_TRUE(source != nullptr);
    source->cancel();
    EXPECT_FALSE(pull(*source).has_value());
}

TEST(ReplayTransportTest, EmptyRecordingIsRejected) {
    auto loaded = ReplayTransport::from_sse(": nothing here\n\n");
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "empty_replay");
}

TEST(ReplayTransportTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() /
                      (chatflow::core::config::generate_id("replay") + ".sse");
    {
        std::ofstream out(path, std::ios::binary);
        out << kTwoTurns;
    }
    auto loaded = ReplayTransport::from_file(path.string());
    std::filesystem::remove(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded)->turn_count(), 2u);

    auto missing = ReplayTransport::from_file(path.string());
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "replay_open_failed");
}

}  // namespace
