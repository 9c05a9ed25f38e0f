#include <gtest/gtest.h>
#include "stream/sse_decoder.hpp"
#include <string>
#include <vector>

using namespace af;

class SseDecoderTest : public ::testing::Test {
protected:
    SseDecoder decoder;
};

TEST_F(SseDecoderTest, AnthropicContentDelta) {
    auto events = decoder.feed(
        "data: {\"type\":\"content_block_delta\",\"delta\":{\"type\":\"text_delta\",\"text\":\"{\\\"nodes\\\"\"}}\n\n"
    );
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, SseEvent::Type::Content);
    EXPECT_EQ(events[0].text, "{\"nodes\"");
}

TEST_F(SseDecoderTest, OpenAIContentDelta) {
    auto events = decoder.feed("data: {\"choices\":[{\"delta\":{\"content\":\"abc\"}}]}\n");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, SseEvent::Type::Content);
    EXPECT_EQ(events[0].text, "abc");
}

TEST_F(SseDecoderTest, LegacyCompletion) {
    auto events = decoder.feed("data: {\"completion\":\"xyz\"}\n");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, SseEvent::Type::Content);
    EXPECT_EQ(events[0].text, "xyz");
}

TEST_F(SseDecoderTest, DoneMarker) {
    auto events = decoder.feed("data: [DONE]\n");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, SseEvent::Type::Done);
    EXPECT_EQ(events[0].type_string(), "done");
}

TEST_F(SseDecoderTest, ErrorEvents) {
    auto events = decoder.feed(
        "data: {\"type\":\"error\",\"error\":\"overloaded\"}\n"
        "data: {\"error\":{\"message\":\"invalid key\"}}\n"
    );
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].type, SseEvent::Type::Error);
    EXPECT_EQ(events[0].text, "overloaded");
    EXPECT_EQ(events[1].type, SseEvent::Type::Error);
    EXPECT_EQ(events[1].text, "invalid key");
}

TEST_F(SseDecoderTest, ProgressAndIocAnalysis) {
    auto events = decoder.feed(
        "data: {\"type\":\"progress\",\"stage\":\"fetch\",\"message\":\"Downloading article\"}\n"
        "data: {\"type\":\"ioc_analysis\",\"data\":{\"indicators\":[]}}\n"
    );
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].type, SseEvent::Type::Progress);
    EXPECT_EQ(events[0].stage, "fetch");
    EXPECT_EQ(events[0].text, "Downloading article");
    EXPECT_EQ(events[1].type, SseEvent::Type::IocAnalysis);
    EXPECT_TRUE(events[1].data.contains("indicators"));
}

TEST_F(SseDecoderTest, CommentsAndBlankLinesAreIgnored) {
    auto events = decoder.feed(": keep-alive\n\n\nevent: message_start\nid: 7\n");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, SseEvent::Type::Event);
    EXPECT_EQ(events[0].text, "message_start");
}

TEST_F(SseDecoderTest, NonJsonDataIsRawText) {
    auto events = decoder.feed("data: hello there\n");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, SseEvent::Type::Text);
    EXPECT_EQ(events[0].text, "hello there");
}

TEST_F(SseDecoderTest, UnrecognisedPayload) {
    auto events = decoder.feed("data: {\"type\":\"message_stop\"}\n");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, SseEvent::Type::Unknown);
    EXPECT_EQ(events[0].data["type"], "message_stop");
}

TEST_F(SseDecoderTest, LinesSplitAcrossFeeds) {
    EXPECT_TRUE(decoder.feed("data: {\"completion\":").empty());
    EXPECT_GT(decoder.buffer_size(), 0);

    auto events = decoder.feed("\"part\"}\ndata: [DO");
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].text, "part");

    auto tail = decoder.flush();
    ASSERT_EQ(tail.size(), 1);
    EXPECT_EQ(tail[0].type, SseEvent::Type::Text);
    EXPECT_EQ(decoder.buffer_size(), 0);
}

TEST_F(SseDecoderTest, DeeplyNestedPayloadIsNotParsed) {
    std::string deep = "data: {\"completion\":" + std::string(100000, '[') +
                       std::string(100000, ']') + "}\n";

    auto events = decoder.feed(deep + "data: {\"completion\":\"after\"}\n");

    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].type, SseEvent::Type::Text);
    EXPECT_EQ(events[1].type, SseEvent::Type::Content);
    EXPECT_EQ(events[1].text, "after");
}

TEST_F(SseDecoderTest, LongLineFedByteAtATime) {
    std::string text(300 * 1024, 'y');
    std::string line = "data: {\"completion\":\"" + text + "\"}\n";

    std::vector<SseEvent> events;
    for (char c : line) {
        for (auto& event : decoder.feed(std::string(1, c))) {
            events.push_back(std::move(event));
        }
    }

    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].type, SseEvent::Type::Content);
    EXPECT_EQ(events[0].text.size(), text.size());
    EXPECT_EQ(decoder.buffer_size(), 0);
}

TEST(SseDecoderLimitTest, OverflowThrows) {
    SseDecoder decoder(8);
    EXPECT_THROW(decoder.feed("data: 123456"), BufferOverflowError);
}

TEST(SseDecoderLimitTest, ResetClearsBuffer) {
    SseDecoder decoder;
    decoder.feed("data: {\"completion\":");
    decoder.reset();
    EXPECT_EQ(decoder.buffer_size(), 0);
    EXPECT_TRUE(decoder.flush().empty());
}
