#pragma once

#include "core/engine_config.hpp"
#include "core/clock.hpp"
#include "graph/graph_types.hpp"
#include "graph/cycle_resolver.hpp"
#include "index/spatial_index.hpp"
#include "render/viewport_virtualizer.hpp"
#include "pipeline/data_source.hpp"
#include "pipeline/chunk_streamer.hpp"
#include "net/http_transport.hpp"
#include "net/network_retry.hpp"
#include "ops/operation_tracker.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace gv {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Point-in-time performance snapshot
 */
struct PerformanceMetrics {
    size_t node_count = 0;                  ///< Nodes in the spatial index
    size_t edge_count = 0;                  ///< Explicit edges registered
    double render_time_ms = 0.0;            ///< Mean visibility recomputation time
    double cache_hit_ratio = 0.0;           ///< Loaded / registered chunks
    double data_streaming_rate = 0.0;       ///< Chunks loaded per second (10 s window)
    size_t visible_node_count = 0;
    size_t visible_edge_count = 0;
    size_t loading_chunks = 0;
    size_t cached_chunks = 0;

    nlohmann::json to_json() const;
};

/**
 * @brief Outcome of GraphSession::navigate_to
 */
struct NavigationResult {
    enum class Outcome {
        Navigated,
        Rejected,                           ///< Same navigation already pending
        Cancelled                           ///< Preempted by a higher-priority navigation
    };

    Outcome outcome = Outcome::Navigated;
    std::string node_id;
    bool centered = false;                  ///< Viewport moved onto the node
    std::optional<CircularReference> cycle;
    std::optional<std::vector<std::string>> alternate_path;
    std::vector<std::string> trail;         ///< Navigation trail after this step

    std::string outcome_string() const;
    nlohmann::json to_json() const;
};

// ============================================================================
// GraphSession
// ============================================================================

/**
 * @brief One interactive view of a large graph
 *
 * Owns a component of each kind and wires them together: loaded chunks feed
 * the spatial index and the edge registry, evicted chunks are withdrawn from
 * both, and viewport changes drive chunk streaming. The thread that calls
 * update_viewport/pump is the owner thread; everything except the data
 * source and the transport is confined to it.
 *
 * The data source and transport are borrowed and must outlive the session.
 */
class GraphSession {
public:
    /**
     * @throws std::invalid_argument if config does not validate
     */
    GraphSession(
        const EngineConfig& config,
        DataSource& source,
        HttpTransport& transport,
        const Clock& clock = SteadyClock::instance()
    );

    GraphSession(const GraphSession&) = delete;
    GraphSession& operator=(const GraphSession&) = delete;

    // ==========================================
    // Viewport / streaming
    // ==========================================

    /**
     * @brief Move the viewport and start streaming the chunks it needs
     */
    void update_viewport(double x, double y, double width, double height, double zoom);

    /**
     * @brief Integrate finished chunk loads and refresh visibility if needed
     *
     * @param wait How long to block for a completion when none is queued
     * @return Number of chunks whose data entered or left the graph
     */
    size_t pump(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    // ==========================================
    // Direct data injection
    // ==========================================

    /**
     * @brief Insert nodes that did not come from a chunk
     * @return Number of nodes accepted (inside the world bounds)
     */
    size_t add_nodes(const std::vector<GraphNode>& nodes);

    void add_edges(const std::vector<GraphEdge>& edges);

    /**
     * @return Number of nodes that were present
     */
    size_t remove_nodes(const std::vector<std::string>& node_ids);

    // ==========================================
    // Navigation
    // ==========================================

    /**
     * @brief Follow the user to node_id, guarding against races and cycles
     */
    NavigationResult navigate_to(const std::string& node_id);

    const std::vector<std::string>& trail() const { return trail_; }

    // ==========================================
    // Metrics / lifecycle
    // ==========================================

    PerformanceMetrics get_performance_metrics() const;

    nlohmann::json get_statistics();

    /**
     * @brief Drop all graph data, chunks, operations and failure records
     */
    void reset();

    // ==========================================
    // Components
    // ==========================================

    const EngineConfig& config() const { return config_; }
    SpatialIndex& index() { return index_; }
    ViewportVirtualizer& virtualizer() { return virtualizer_; }
    ChunkStreamer& streamer() { return streamer_; }
    NetworkRetry& network() { return retry_; }
    OperationTracker& operations() { return operations_; }
    CycleResolver& cycles() { return cycles_; }
    const Adjacency& adjacency() const { return adjacency_; }

private:
    // Declaration order is construction order: the streamer comes last so
    // its workers are joined before the retry wrapper they use goes away.
    EngineConfig config_;
    NetworkRetry retry_;
    SpatialIndex index_;
    ViewportVirtualizer virtualizer_;
    OperationTracker operations_;
    CycleResolver cycles_;
    ChunkStreamer streamer_;

    Adjacency adjacency_;
    std::vector<std::string> trail_;

    static EngineConfig prepare(const EngineConfig& config);

    void link_node(const GraphNode& node);
    void link_edge(const GraphEdge& edge);
    void on_chunk_loaded(const DataChunk& chunk);
    void on_chunk_evicted(const ChunkEviction& eviction);
};

} // namespace gv
