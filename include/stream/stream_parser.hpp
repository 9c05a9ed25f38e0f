#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace af {

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Raised when a stream's pending text would exceed its size limit
 *
 * Fatal to the session: an upstream that never produces a record boundary
 * cannot be recovered by waiting for more input.
 */
class BufferOverflowError : public std::runtime_error {
public:
    BufferOverflowError(size_t limit, size_t attempted_size);

    size_t limit() const { return limit_; }
    size_t attempted_size() const { return attempted_size_; }

private:
    size_t limit_;
    size_t attempted_size_;
};

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Error descriptor carried by a record
 */
struct RecordError {
    std::string code;
    std::string message;
    std::string details;

    nlohmann::json to_json() const;

    /**
     * @brief Decode from either a plain string or a {code, message, details} object
     */
    static RecordError from_json(const nlohmann::json& j);
};

/**
 * @brief One self-contained JSON object extracted from the stream
 */
struct ParsedRecord {
    std::vector<nlohmann::json> nodes;         ///< Raw node descriptors
    std::vector<nlohmann::json> edges;         ///< Raw edge descriptors
    std::optional<RecordError> error;          ///< Error reported by the producer
    std::optional<nlohmann::json> ioc_analysis; ///< Indicator analysis block

    bool has_nodes = false;                    ///< "nodes" array was present
    bool has_edges = false;                    ///< "edges" array was present

    bool has_graph_content() const { return has_nodes || has_edges; }

    /**
     * @brief Build a record from a decoded JSON value
     * @return Empty when the value carries nothing routable
     */
    static std::optional<ParsedRecord> from_json(const nlohmann::json& j);
};

/**
 * @brief Outcome of a single feed() or flush() call
 */
struct ParseResult {
    std::vector<ParsedRecord> records;         ///< Complete records, in stream order
    bool has_more = false;                     ///< Partial text is still buffered
    size_t buffer_size = 0;                    ///< Bytes left in the buffer
    size_t lines_seen = 0;                     ///< Non-empty lines examined
    size_t lines_skipped = 0;                  ///< Lines that produced no record
};

/**
 * @brief Options for the stream parser
 */
struct StreamParserOptions {
    size_t max_buffer_size = 1024 * 1024;      ///< 1 MiB
    size_t max_depth = 128;                    ///< Deepest array/object nesting accepted
    bool verbose = false;                      ///< Trace skipped lines to stderr
};

/**
 * @brief Check whether JSON text nests arrays and objects deeper than max_depth
 *
 * Brackets inside string literals are ignored. The text does not have to be
 * valid JSON; the scan stops at the first bracket past the limit.
 */
bool exceeds_nesting_depth(const std::string& text, size_t max_depth);

// ============================================================================
// Stream Parser
// ============================================================================

/**
 * @brief Splits an unbounded text stream into newline-delimited JSON records
 *
 * Fragments may cut through a record at any byte. Complete lines are parsed
 * as soon as their newline arrives; the trailing partial line stays buffered
 * for the next call. Lines that are not JSON (prose, markdown fences) are
 * skipped without failing the call.
 */
class StreamParser {
public:
    explicit StreamParser(const StreamParserOptions& options = StreamParserOptions());

    /**
     * @brief Append a fragment and return every record it completes
     *
     * @throws BufferOverflowError if the buffered text would exceed
     *         max_buffer_size. The buffer is left untouched.
     */
    ParseResult feed(const std::string& fragment);

    /**
     * @brief Treat the buffered partial line as complete and parse it
     *
     * Called once the upstream has finished; the buffer is empty afterwards.
     */
    ParseResult flush();

    /**
     * @brief Discard any buffered text
     */
    void reset();

    size_t buffer_size() const { return buffer_.size(); }
    const std::string& buffered_text() const { return buffer_; }
    const StreamParserOptions& options() const { return options_; }

    /**
     * @brief Parse one line into a record
     *
     * Surrounding whitespace and a trailing carriage return are ignored.
     * @return Empty for blank lines, non-JSON text, JSON nested deeper than
     *         max_depth and JSON without routable content
     */
    static std::optional<ParsedRecord> parse_line(const std::string& line,
                                                  size_t max_depth = StreamParserOptions().max_depth);

private:
    StreamParserOptions options_;
    std::string buffer_;

    void consume_line(const std::string& line, ParseResult& result) const;
};

} // namespace af
