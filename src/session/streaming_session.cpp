#include "session/streaming_session.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <cstdlib>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace af {

namespace {

bool env_size(const char* name, size_t& out, size_t max_value = std::numeric_limits<size_t>::max()) {
    const char* value = std::getenv(name);
    if (!value) return false;

    // stoull accepts a sign and wraps negatives, so only plain digits are allowed
    std::string text = value;
    bool digits = !text.empty() &&
                  text.find_first_not_of("0123456789") == std::string::npos;
    if (digits) {
        try {
            unsigned long long parsed = std::stoull(text);
            if (parsed <= max_value) {
                out = static_cast<size_t>(parsed);
                return true;
            }
        } catch (const std::out_of_range&) {
            // Reported below like any other rejected value
        }
    }
    std::cerr << "Ignoring invalid value for " << name << ": " << value << std::endl;
    return false;
}

[[noreturn]] void invalid_config_value(const std::string& path, const char* key, const json& value) {
    throw std::runtime_error(
        "Invalid value for " + std::string(key) + " in " + path + ": " + value.dump());
}

void read_size(const json& j, const std::string& path, const char* key, size_t& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_unsigned()) {
        invalid_config_value(path, key, *it);
    }
    out = it->get<size_t>();
}

void read_seconds(const json& j, const std::string& path, const char* key, int& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number_integer()) {
        invalid_config_value(path, key, *it);
    }
    // Sign is checked by validate(); only the int range is enforced here
    bool in_range = it->is_number_unsigned()
        ? it->get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<int>::max())
        : it->get<long long>() >= std::numeric_limits<int>::min();
    if (!in_range) {
        invalid_config_value(path, key, *it);
    }
    out = it->get<int>();
}

void read_fraction(const json& j, const std::string& path, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_number()) {
        invalid_config_value(path, key, *it);
    }
    out = it->get<double>();
}

void read_flag(const json& j, const std::string& path, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if (!it->is_boolean()) {
        invalid_config_value(path, key, *it);
    }
    out = it->get<bool>();
}

} // anonymous namespace

// ============================================================================
// SessionConfig
// ============================================================================

SessionConfig SessionConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    file >> j;

    SessionConfig config;

    if (!j.is_object()) {
        throw std::runtime_error("Config file does not hold a JSON object: " + path);
    }

    // Stream parser
    read_size(j, path, "max_buffer_size", config.max_buffer_size);
    read_flag(j, path, "sse_input", config.sse_input);

    // Graph state
    read_size(j, path, "max_cache_size", config.max_cache_size);
    read_size(j, path, "max_pending_edges", config.max_pending_edges);
    read_seconds(j, path, "pending_edge_max_age_seconds", config.pending_edge_max_age_seconds);
    read_fraction(j, path, "retention_fraction", config.retention_fraction);

    // Assembly
    read_flag(j, path, "require_node_type", config.require_node_type);

    read_flag(j, path, "verbose", config.verbose);

    return config;
}

json SessionConfig::to_json() const {
    json j;
    j["max_buffer_size"] = max_buffer_size;
    j["sse_input"] = sse_input;
    j["max_cache_size"] = max_cache_size;
    j["max_pending_edges"] = max_pending_edges;
    j["pending_edge_max_age_seconds"] = pending_edge_max_age_seconds;
    j["retention_fraction"] = retention_fraction;
    j["require_node_type"] = require_node_type;
    j["verbose"] = verbose;
    return j;
}

void SessionConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file for writing: " + path);
    }
    file << to_json().dump(2);
}

SessionConfig SessionConfig::from_environment() {
    SessionConfig config;

    env_size("AF_MAX_BUFFER_SIZE", config.max_buffer_size);
    env_size("AF_MAX_CACHE_SIZE", config.max_cache_size);
    env_size("AF_MAX_PENDING_EDGES", config.max_pending_edges);

    size_t max_age = 0;
    if (env_size("AF_PENDING_EDGE_MAX_AGE", max_age,
                 static_cast<size_t>(std::numeric_limits<int>::max()))) {
        config.pending_edge_max_age_seconds = static_cast<int>(max_age);
    }

    const char* verbose = std::getenv("AF_VERBOSE");
    if (verbose) {
        std::string v = verbose;
        config.verbose = (v == "1" || v == "true" || v == "yes");
    }

    return config;
}

bool SessionConfig::validate(std::string& error_message) const {
    if (max_buffer_size == 0) {
        error_message = "max_buffer_size must be positive";
        return false;
    }

    if (max_cache_size == 0) {
        error_message = "max_cache_size must be positive";
        return false;
    }

    if (max_pending_edges == 0) {
        error_message = "max_pending_edges must be positive";
        return false;
    }

    if (pending_edge_max_age_seconds <= 0) {
        error_message = "pending_edge_max_age_seconds must be positive";
        return false;
    }

    if (retention_fraction <= 0.0 || retention_fraction >= 1.0) {
        error_message = "retention_fraction must be between 0.0 and 1.0 (exclusive)";
        return false;
    }

    return true;
}

StateLimits SessionConfig::state_limits() const {
    StateLimits limits;
    limits.max_cache_size = max_cache_size;
    limits.max_pending_edges = max_pending_edges;
    limits.pending_edge_max_age = std::chrono::seconds(pending_edge_max_age_seconds);
    limits.retention_fraction = retention_fraction;
    limits.verbose = verbose;
    return limits;
}

SessionConfig load_config_with_fallback(const std::string& config_path) {
    if (!config_path.empty() && std::filesystem::exists(config_path)) {
        return SessionConfig::from_json_file(config_path);
    }
    return SessionConfig::from_environment();
}

// ============================================================================
// SessionStatistics
// ============================================================================

void SessionStatistics::add(const AssemblyResult& result) {
    nodes_emitted += result.nodes_emitted;
    edges_emitted += result.edges_emitted;
    edges_deferred += result.edges_deferred;
    nodes_rejected += result.nodes_rejected;
    edges_rejected += result.edges_rejected;
    duplicates_suppressed += result.duplicates_suppressed;
}

void SessionStatistics::print_summary() const {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Streaming Session Summary\n";
    std::cout << std::string(70, '=') << "\n\n";

    std::cout << "Input:\n";
    std::cout << "  Fragments: " << fragments_fed << "\n";
    std::cout << "  Bytes: " << bytes_fed << "\n";
    std::cout << "  Records parsed: " << records_parsed << "\n";
    std::cout << "  Lines skipped: " << lines_skipped << "\n\n";

    std::cout << "Assembly:\n";
    std::cout << "  Nodes emitted: " << nodes_emitted << "\n";
    std::cout << "  Edges emitted: " << edges_emitted << "\n";
    std::cout << "  Edges deferred: " << edges_deferred << "\n";
    std::cout << "  Nodes rejected: " << nodes_rejected << "\n";
    std::cout << "  Edges rejected: " << edges_rejected << "\n";
    std::cout << "  Duplicates suppressed: " << duplicates_suppressed << "\n";
    std::cout << "  Errors reported: " << errors_reported << "\n\n";

    std::cout << "End of stream:\n";
    std::cout << "  Unresolved pending edges: " << pending_edges_at_finish << "\n";
    std::cout << "  Elapsed: " << elapsed_seconds << " seconds\n";

    std::cout << "\n" << std::string(70, '=') << "\n\n";
}

json SessionStatistics::to_json() const {
    json j;

    j["fragments_fed"] = fragments_fed;
    j["bytes_fed"] = bytes_fed;
    j["records_parsed"] = records_parsed;
    j["lines_skipped"] = lines_skipped;

    j["nodes_emitted"] = nodes_emitted;
    j["edges_emitted"] = edges_emitted;
    j["edges_deferred"] = edges_deferred;
    j["nodes_rejected"] = nodes_rejected;
    j["edges_rejected"] = edges_rejected;
    j["duplicates_suppressed"] = duplicates_suppressed;
    j["errors_reported"] = errors_reported;

    j["pending_edges_at_finish"] = pending_edges_at_finish;
    j["elapsed_seconds"] = elapsed_seconds;

    return j;
}

// ============================================================================
// StreamingSession
// ============================================================================

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Streaming: return "streaming";
        case SessionState::Complete: return "complete";
        case SessionState::Failed: return "failed";
        case SessionState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

namespace {

SessionConfig validated(const SessionConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("Invalid session configuration: " + error);
    }
    return config;
}

StreamParserOptions parser_options(const SessionConfig& config) {
    StreamParserOptions options;
    options.max_buffer_size = config.max_buffer_size;
    options.verbose = config.verbose;
    return options;
}

AssemblyOptions assembly_options(const SessionConfig& config) {
    AssemblyOptions options;
    options.require_node_type = config.require_node_type;
    options.verbose = config.verbose;
    return options;
}

} // anonymous namespace

StreamingSession::StreamingSession(
    const SessionConfig& config,
    FlowCallbacks callbacks,
    StreamStateManager::Clock clock
)
    : config_(validated(config)),
      callbacks_(std::move(callbacks)),
      graph_state_(config_.state_limits(), std::move(clock)),
      parser_(parser_options(config_)),
      decoder_(config_.max_buffer_size),
      assembler_(graph_state_, assembly_options(config_)) {}

void StreamingSession::feed(const std::string& fragment) {
    if (state_ == SessionState::Complete || state_ == SessionState::Failed ||
        state_ == SessionState::Cancelled) {
        throw std::logic_error(
            std::string("Cannot feed a session in state '") + to_string(state_) + "'"
        );
    }

    if (state_ == SessionState::Idle) {
        state_ = SessionState::Streaming;
        started_at_ = std::chrono::steady_clock::now();
    }

    stats_.fragments_fed++;
    stats_.bytes_fed += fragment.size();

    if (!config_.sse_input) {
        feed_text(fragment);
        return;
    }

    std::vector<SseEvent> events;
    try {
        events = decoder_.feed(fragment);
    } catch (const BufferOverflowError& e) {
        state_ = SessionState::Failed;
        std::cerr << "[StreamingSession] " << e.what() << std::endl;
        throw;
    }

    for (const auto& event : events) {
        if (event.type == SseEvent::Type::Done) {
            finish();
            return;
        }
        handle_event(event);
    }
}

void StreamingSession::finish() {
    if (state_ == SessionState::Complete || state_ == SessionState::Failed ||
        state_ == SessionState::Cancelled) {
        return;
    }

    if (state_ == SessionState::Idle) {
        started_at_ = std::chrono::steady_clock::now();
    }

    if (config_.sse_input) {
        for (const auto& event : decoder_.flush()) {
            if (event.type != SseEvent::Type::Done) {
                handle_event(event);
            }
        }
    }

    route(parser_.flush());
    stats_.edges_emitted += assembler_.drain_pending(callbacks_);

    stats_.pending_edges_at_finish = graph_state_.get_stats().pending_edge_count;
    stats_.elapsed_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_at_
    ).count();
    state_ = SessionState::Complete;

    if (config_.verbose) {
        std::cout << "[StreamingSession] Stream complete: " << stats_.nodes_emitted
                  << " nodes, " << stats_.edges_emitted << " edges, "
                  << stats_.pending_edges_at_finish << " unresolved edges" << std::endl;
    }
}

void StreamingSession::cancel() {
    clear_components();
    state_ = SessionState::Cancelled;
}

void StreamingSession::reset() {
    clear_components();
    stats_ = SessionStatistics();
    state_ = SessionState::Idle;
}

void StreamingSession::clear_components() {
    parser_.reset();
    decoder_.reset();
    graph_state_.reset();
    assembler_.reset();
}

void StreamingSession::feed_text(const std::string& text) {
    ParseResult result;
    try {
        result = parser_.feed(text);
    } catch (const BufferOverflowError& e) {
        state_ = SessionState::Failed;
        std::cerr << "[StreamingSession] " << e.what() << std::endl;
        throw;
    }
    route(result);
}

void StreamingSession::route(const ParseResult& result) {
    stats_.records_parsed += result.records.size();
    stats_.lines_skipped += result.lines_skipped;

    for (const auto& record : result.records) {
        if (record.error) {
            stats_.errors_reported++;
        }
        stats_.add(assembler_.process_record(record, callbacks_));
    }
}

void StreamingSession::handle_event(const SseEvent& event) {
    switch (event.type) {
        case SseEvent::Type::Content:
            feed_text(event.text);
            break;

        case SseEvent::Type::Error: {
            stats_.errors_reported++;
            if (callbacks_.on_error) {
                RecordError error;
                error.code = "provider_error";
                error.message = event.text;
                callbacks_.on_error(error);
            }
            break;
        }

        case SseEvent::Type::Progress:
            if (config_.verbose) {
                std::cout << "[StreamingSession] " << event.stage << ": " << event.text << std::endl;
            }
            if (callbacks_.on_progress) {
                callbacks_.on_progress(event.stage, event.text);
            }
            break;

        case SseEvent::Type::IocAnalysis:
            if (callbacks_.on_ioc_analysis) {
                callbacks_.on_ioc_analysis(event.data);
            }
            break;

        default:
            // Event names, raw text and unrecognised payloads carry no graph content
            break;
    }
}

} // namespace af
