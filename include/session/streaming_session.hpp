#pragma once

#include "assembler/flow_assembler.hpp"
#include "graph/stream_state_manager.hpp"
#include "stream/stream_parser.hpp"
#include "stream/sse_decoder.hpp"
#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>

namespace af {

// ============================================================================
// Session Configuration
// ============================================================================

/**
 * @brief Limits and switches for one streaming analysis
 */
struct SessionConfig {
    // Stream parser
    size_t max_buffer_size = 1024 * 1024;       ///< Pending text limit (bytes)
    bool sse_input = false;                     ///< Input carries "data:" SSE framing

    // Graph state
    size_t max_cache_size = 500;                ///< Node identities / processed edge ids
    size_t max_pending_edges = 1000;            ///< Edges waiting for endpoints
    int pending_edge_max_age_seconds = 300;     ///< Age bound for pending edges
    double retention_fraction = 0.75;           ///< Share kept when trimming

    // Assembly
    bool require_node_type = false;             ///< Reject nodes without "type"

    bool verbose = false;                       ///< Verbose logging

    /**
     * @brief Load configuration from JSON file
     */
    static SessionConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;

    /**
     * @brief Load from environment variables
     *
     * Looks for:
     * - AF_MAX_BUFFER_SIZE
     * - AF_MAX_CACHE_SIZE
     * - AF_MAX_PENDING_EDGES
     * - AF_PENDING_EDGE_MAX_AGE (seconds)
     * - AF_VERBOSE (1/true)
     */
    static SessionConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;

    StateLimits state_limits() const;
};

/**
 * @brief Load configuration from file with fallback to environment
 */
SessionConfig load_config_with_fallback(const std::string& config_path = "");

// ============================================================================
// Session Statistics
// ============================================================================

/**
 * @brief Statistics from one streaming session
 */
struct SessionStatistics {
    // Input
    size_t fragments_fed = 0;
    size_t bytes_fed = 0;
    size_t records_parsed = 0;
    size_t lines_skipped = 0;

    // Assembly
    size_t nodes_emitted = 0;
    size_t edges_emitted = 0;
    size_t edges_deferred = 0;
    size_t nodes_rejected = 0;
    size_t edges_rejected = 0;
    size_t duplicates_suppressed = 0;
    size_t errors_reported = 0;

    // End of stream
    size_t pending_edges_at_finish = 0;
    double elapsed_seconds = 0.0;

    void add(const AssemblyResult& result);

    /**
     * @brief Print summary to stdout
     */
    void print_summary() const;

    nlohmann::json to_json() const;
};

// ============================================================================
// Streaming Session
// ============================================================================

enum class SessionState {
    Idle,
    Streaming,
    Complete,
    Failed,
    Cancelled
};

const char* to_string(SessionState state);

/**
 * @brief One analysis request: parser, state manager and assembler together
 *
 * Fragments must be fed sequentially. Each feed() completes every emission
 * it enables before returning. A buffer overflow fails the session and is
 * rethrown to the caller; no further input is accepted until reset().
 */
class StreamingSession {
public:
    /**
     * @brief Constructor
     *
     * @param config Session configuration
     * @param callbacks Emission targets
     * @param clock Time source for pending-edge ages (default: steady_clock)
     * @throws std::invalid_argument if the configuration does not validate
     */
    StreamingSession(
        const SessionConfig& config,
        FlowCallbacks callbacks,
        StreamStateManager::Clock clock = nullptr
    );

    /**
     * @brief Feed the next fragment of the model output
     *
     * @throws BufferOverflowError when the stream buffer limit is exceeded
     * @throws std::logic_error when the session is no longer accepting input
     */
    void feed(const std::string& fragment);

    /**
     * @brief Parse any trailing partial record and settle pending edges
     *
     * Safe to call more than once.
     */
    void finish();

    /**
     * @brief Abandon in-flight state; the session stops accepting input
     */
    void cancel();

    /**
     * @brief Clear all state so the session can serve a new analysis
     */
    void reset();

    SessionState state() const { return state_; }
    const SessionStatistics& statistics() const { return stats_; }
    StateStats state_stats() const { return graph_state_.get_stats(); }
    std::vector<PendingEdge> pending_edges() const { return graph_state_.get_pending_edges(); }
    const SessionConfig& config() const { return config_; }

private:
    SessionConfig config_;
    FlowCallbacks callbacks_;

    StreamStateManager graph_state_;
    StreamParser parser_;
    SseDecoder decoder_;
    FlowAssembler assembler_;

    SessionState state_ = SessionState::Idle;
    SessionStatistics stats_;
    std::chrono::steady_clock::time_point started_at_;

    void feed_text(const std::string& text);
    void route(const ParseResult& result);
    void handle_event(const SseEvent& event);
    void clear_components();
};

} // namespace af
