#include "stream/stream_parser.hpp"
#include <iostream>

using json = nlohmann::json;

namespace af {

namespace {

std::string trim(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string string_or_dump(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return "";
    }
    return value.dump();
}

std::string member_text(const json& object, const char* key) {
    auto it = object.find(key);
    return it == object.end() ? "" : string_or_dump(*it);
}

} // anonymous namespace

bool exceeds_nesting_depth(const std::string& text, size_t max_depth) {
    size_t depth = 0;
    bool in_string = false;
    bool escaped = false;

    for (char c : text) {
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_string = true;
                break;
            case '{':
            case '[':
                if (++depth > max_depth) {
                    return true;
                }
                break;
            case '}':
            case ']':
                if (depth > 0) {
                    depth--;
                }
                break;
            default:
                break;
        }
    }
    return false;
}

// ============================================================================
// BufferOverflowError
// ============================================================================

BufferOverflowError::BufferOverflowError(size_t limit, size_t attempted_size)
    : std::runtime_error(
          "Stream buffer exceeded maximum size: " + std::to_string(limit) +
          " bytes (attempted " + std::to_string(attempted_size) + ")"),
      limit_(limit),
      attempted_size_(attempted_size) {}

// ============================================================================
// RecordError
// ============================================================================

json RecordError::to_json() const {
    json j;
    j["code"] = code;
    j["message"] = message;
    if (!details.empty()) {
        j["details"] = details;
    }
    return j;
}

RecordError RecordError::from_json(const json& j) {
    RecordError error;
    if (j.is_object()) {
        error.code = member_text(j, "code");
        error.message = member_text(j, "message");
        error.details = member_text(j, "details");
        if (error.message.empty()) {
            error.message = j.dump();
        }
    } else {
        error.message = string_or_dump(j);
    }
    if (error.code.empty()) {
        error.code = "stream_error";
    }
    return error;
}

// ============================================================================
// ParsedRecord
// ============================================================================

std::optional<ParsedRecord> ParsedRecord::from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    ParsedRecord record;

    auto nodes = j.find("nodes");
    if (nodes != j.end() && nodes->is_array()) {
        record.has_nodes = true;
        record.nodes.assign(nodes->begin(), nodes->end());
    }

    auto edges = j.find("edges");
    if (edges != j.end() && edges->is_array()) {
        record.has_edges = true;
        record.edges.assign(edges->begin(), edges->end());
    }

    auto error = j.find("error");
    if (error != j.end() && !error->is_null() && !(error->is_boolean() && !error->get<bool>())) {
        record.error = RecordError::from_json(*error);
    }

    auto ioc = j.find("ioc_analysis");
    if (ioc != j.end() && ioc->is_object()) {
        record.ioc_analysis = *ioc;
    }

    if (!record.has_graph_content() && !record.error && !record.ioc_analysis) {
        return std::nullopt;
    }
    return record;
}

// ============================================================================
// StreamParser
// ============================================================================

StreamParser::StreamParser(const StreamParserOptions& options)
    : options_(options) {}

ParseResult StreamParser::feed(const std::string& fragment) {
    // Prevent unbounded buffer growth
    if (buffer_.size() + fragment.size() > options_.max_buffer_size) {
        throw BufferOverflowError(options_.max_buffer_size, buffer_.size() + fragment.size());
    }

    // The retained partial line never holds a newline, so only new bytes are scanned
    size_t scan_from = buffer_.size();
    buffer_ += fragment;

    ParseResult result;
    size_t line_start = 0;
    size_t newline = buffer_.find('\n', scan_from);

    while (newline != std::string::npos) {
        consume_line(buffer_.substr(line_start, newline - line_start), result);
        line_start = newline + 1;
        newline = buffer_.find('\n', line_start);
    }

    // Keep the last incomplete line in the buffer
    if (line_start > 0) {
        buffer_.erase(0, line_start);
    }

    result.has_more = !buffer_.empty();
    result.buffer_size = buffer_.size();
    return result;
}

ParseResult StreamParser::flush() {
    ParseResult result;
    if (!buffer_.empty()) {
        consume_line(buffer_, result);
        buffer_.clear();
    }
    result.has_more = false;
    result.buffer_size = 0;
    return result;
}

void StreamParser::reset() {
    buffer_.clear();
}

std::optional<ParsedRecord> StreamParser::parse_line(const std::string& line, size_t max_depth) {
    std::string trimmed = trim(line);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    // Cheap rejection of prose before invoking the JSON parser
    if (trimmed.front() != '{') {
        return std::nullopt;
    }

    if (exceeds_nesting_depth(trimmed, max_depth)) {
        return std::nullopt;
    }

    json j = json::parse(trimmed, nullptr, false);
    if (j.is_discarded()) {
        return std::nullopt;
    }
    return ParsedRecord::from_json(j);
}

void StreamParser::consume_line(const std::string& line, ParseResult& result) const {
    if (trim(line).empty()) {
        return;
    }

    result.lines_seen++;

    auto record = parse_line(line, options_.max_depth);
    if (record) {
        result.records.push_back(std::move(*record));
        return;
    }

    result.lines_skipped++;
    if (options_.verbose) {
        std::cerr << "[StreamParser] Skipping non-record line: "
                  << (line.size() > 80 ? line.substr(0, 80) + "..." : line) << std::endl;
    }
}

} // namespace af
