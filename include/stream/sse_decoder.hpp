#pragma once

#include "stream/stream_parser.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace af {

/**
 * @brief One decoded Server-Sent-Events line
 */
struct SseEvent {
    enum class Type {
        Content,       // Text delta produced by the model
        Error,         // Provider or relay error
        Progress,      // Relay progress notification
        IocAnalysis,   // Indicator analysis block from the relay
        Done,          // End-of-stream marker
        Event,         // "event:" line
        Text,          // "data:" line that is not JSON
        Unknown        // JSON payload of an unrecognised shape
    };

    Type type = Type::Unknown;
    std::string text;                          ///< Content delta, error message, event name or raw text
    std::string stage;                         ///< Progress stage
    nlohmann::json data;                       ///< Decoded payload where available

    std::string type_string() const;
};

/**
 * @brief Strips SSE framing and unwraps provider delta envelopes
 *
 * Recognises Anthropic (content_block_delta / delta.text), OpenAI
 * (choices[0].delta.content) and legacy completion payloads. The text it
 * yields is what StreamParser expects. Buffering follows the same rules as
 * the parser: partial lines are kept, the buffer is bounded.
 */
class SseDecoder {
public:
    explicit SseDecoder(size_t max_buffer_size = 1024 * 1024,
                        size_t max_depth = StreamParserOptions().max_depth);

    /**
     * @brief Append raw bytes and decode every completed line
     * @throws BufferOverflowError when the buffered bytes exceed the limit
     */
    std::vector<SseEvent> feed(const std::string& bytes);

    /**
     * @brief Decode whatever remains buffered as a final line
     */
    std::vector<SseEvent> flush();

    void reset();

    size_t buffer_size() const { return buffer_.size(); }

    /**
     * @brief Decode one SSE line
     *
     * A data payload nested deeper than max_depth is not parsed and comes
     * back as Type::Text.
     * @return false for blank and comment lines
     */
    static bool decode_line(const std::string& line, SseEvent& event,
                            size_t max_depth = StreamParserOptions().max_depth);

private:
    size_t max_buffer_size_;
    size_t max_depth_;
    std::string buffer_;
};

} // namespace af
