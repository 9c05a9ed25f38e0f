#include "stream/sse_decoder.hpp"

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

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

std::string string_member(const json& object, const char* key) {
    auto it = object.find(key);
    if (it != object.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

std::string error_text(const json& error) {
    if (error.is_string()) {
        return error.get<std::string>();
    }
    if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        return error["message"].get<std::string>();
    }
    return error.dump();
}

// Normalise the provider-specific payload shapes into one event
SseEvent classify_payload(const json& payload) {
    SseEvent event;
    event.data = payload;

    if (!payload.is_object()) {
        event.type = SseEvent::Type::Unknown;
        return event;
    }

    std::string type = string_member(payload, "type");

    if (type == "error" || (payload.contains("error") && !payload["error"].is_null())) {
        event.type = SseEvent::Type::Error;
        event.text = payload.contains("error") ? error_text(payload["error"]) : "Server error occurred";
        return event;
    }

    if (type == "progress") {
        event.type = SseEvent::Type::Progress;
        event.stage = string_member(payload, "stage");
        event.text = string_member(payload, "message");
        return event;
    }

    if (type == "ioc_analysis" && payload.contains("data")) {
        event.type = SseEvent::Type::IocAnalysis;
        event.data = payload["data"];
        return event;
    }

    // Anthropic: {"type":"content_block_delta","delta":{"text":"..."}}
    if (payload.contains("delta") && payload["delta"].is_object()) {
        const auto& delta = payload["delta"];
        if (delta.contains("text") && delta["text"].is_string()) {
            event.type = SseEvent::Type::Content;
            event.text = delta["text"].get<std::string>();
            return event;
        }
    }

    // OpenAI: {"choices":[{"delta":{"content":"..."}}]}
    if (payload.contains("choices") && payload["choices"].is_array() && !payload["choices"].empty()) {
        const auto& choice = payload["choices"][0];
        if (choice.is_object() && choice.contains("delta") && choice["delta"].is_object()) {
            const auto& delta = choice["delta"];
            if (delta.contains("content") && delta["content"].is_string()) {
                event.type = SseEvent::Type::Content;
                event.text = delta["content"].get<std::string>();
                return event;
            }
        }
    }

    if (payload.contains("completion") && payload["completion"].is_string()) {
        event.type = SseEvent::Type::Content;
        event.text = payload["completion"].get<std::string>();
        return event;
    }

    event.type = SseEvent::Type::Unknown;
    return event;
}

} // anonymous namespace

std::string SseEvent::type_string() const {
    switch (type) {
        case Type::Content: return "content";
        case Type::Error: return "error";
        case Type::Progress: return "progress";
        case Type::IocAnalysis: return "ioc_analysis";
        case Type::Done: return "done";
        case Type::Event: return "event";
        case Type::Text: return "text";
        default: return "unknown";
    }
}

SseDecoder::SseDecoder(size_t max_buffer_size, size_t max_depth)
    : max_buffer_size_(max_buffer_size),
      max_depth_(max_depth) {}

std::vector<SseEvent> SseDecoder::feed(const std::string& bytes) {
    if (buffer_.size() + bytes.size() > max_buffer_size_) {
        throw BufferOverflowError(max_buffer_size_, buffer_.size() + bytes.size());
    }

    size_t scan_from = buffer_.size();
    buffer_ += bytes;

    std::vector<SseEvent> events;
    size_t line_start = 0;
    size_t newline = buffer_.find('\n', scan_from);

    while (newline != std::string::npos) {
        SseEvent event;
        if (decode_line(buffer_.substr(line_start, newline - line_start), event, max_depth_)) {
            events.push_back(std::move(event));
        }
        line_start = newline + 1;
        newline = buffer_.find('\n', line_start);
    }

    if (line_start > 0) {
        buffer_.erase(0, line_start);
    }
    return events;
}

std::vector<SseEvent> SseDecoder::flush() {
    std::vector<SseEvent> events;
    SseEvent event;
    if (!buffer_.empty() && decode_line(buffer_, event, max_depth_)) {
        events.push_back(std::move(event));
    }
    buffer_.clear();
    return events;
}

void SseDecoder::reset() {
    buffer_.clear();
}

bool SseDecoder::decode_line(const std::string& line, SseEvent& event, size_t max_depth) {
    std::string trimmed = trim(line);

    // Blank separator or comment
    if (trimmed.empty() || trimmed.front() == ':') {
        return false;
    }

    if (starts_with(trimmed, "event:")) {
        event = SseEvent();
        event.type = SseEvent::Type::Event;
        event.text = trim(trimmed.substr(6));
        return true;
    }

    if (!starts_with(trimmed, "data:")) {
        return false;
    }

    std::string data = trim(trimmed.substr(5));

    if (data == "[DONE]") {
        event = SseEvent();
        event.type = SseEvent::Type::Done;
        return true;
    }

    json payload = exceeds_nesting_depth(data, max_depth)
        ? json(json::value_t::discarded)
        : json::parse(data, nullptr, false);
    if (payload.is_discarded()) {
        event = SseEvent();
        event.type = SseEvent::Type::Text;
        event.text = data;
        return true;
    }

    event = classify_payload(payload);
    return true;
}

} // namespace af
