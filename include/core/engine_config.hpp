#pragma once

#include "graph/graph_types.hpp"
#include <string>
#include <vector>
#include <limits>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace gv {

// ============================================================================
// Component Configuration
// ============================================================================

/**
 * @brief Quadtree shape
 */
struct SpatialIndexConfig {
    BoundingBox world_bounds{-10000.0, -10000.0, 10000.0, 10000.0};
    int max_depth = 8;                      ///< Leaves at this depth overflow instead of splitting
    size_t max_nodes_per_region = 50;       ///< Leaf capacity before a split
};

/**
 * @brief One row of the level-of-detail table
 */
struct LodTier {
    static constexpr int ALL_LEVELS = std::numeric_limits<int>::max();

    double zoom = 1.0;                      ///< Tier applies when zoom >= this
    size_t max_nodes = 1000;                ///< Visible node cap for the tier
    int skip_level = ALL_LEVELS;            ///< Nodes with level > skip_level are dropped
};

/**
 * @brief Viewport virtualization settings
 */
struct VirtualizationConfig {
    double buffer_zone = 200.0;             ///< Margin added around the viewport
    size_t max_visible_nodes = 1000;        ///< Hard cap independent of LOD
    bool level_of_detail_enabled = true;
    size_t render_time_window = 100;        ///< Samples kept for render_time_ms
    bool verbose = false;

    // Scanned in order; first tier with zoom <= current zoom wins
    std::vector<LodTier> lod_tiers = {
        {1.0, 1000, LodTier::ALL_LEVELS},
        {0.5, 500, 2},
        {0.25, 200, 1},
        {0.1, 50, 0}
    };
};

/**
 * @brief Chunk streaming settings
 */
struct StreamingConfig {
    double chunk_size = 100.0;              ///< Grid cell edge length
    int max_concurrent_chunks = 4;          ///< Upper bound on chunks loading at once
    int prefetch_distance = 2;              ///< Extra cells around the viewport
    bool compression_enabled = true;        ///< Ask HTTP sources for compressed bodies
    int64_t cache_expiration_ms = 300000;   ///< Chunk age before eviction (5 minutes)
    int64_t cleanup_interval_ms = 1000;     ///< How often pump() sweeps for expired chunks
    std::string data_source_url;            ///< Base URL for HttpDataSource
    bool verbose = false;
};

/**
 * @brief Race, retry and traversal guard settings
 */
struct EdgeCaseConfig {
    int max_circular_depth = 10;            ///< BFS depth bound for alternate paths
    int max_retry_attempts = 3;
    int retry_delay_ms = 1000;              ///< Delay before the second attempt
    double retry_backoff = 2.0;             ///< Delay multiplier per attempt
    int64_t network_timeout_ms = 10000;     ///< Per-attempt deadline
    int64_t race_condition_timeout_ms = 5000; ///< Pending operations older than this fail
    int64_t cleanup_delay_ms = 1000;        ///< Terminal operations are dropped after this
    int64_t failure_max_age_ms = 300000;    ///< Failure / cycle records older than this are pruned
    int navigation_priority = 5;            ///< Priority used by GraphSession::navigate_to
    bool verbose = false;
};

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Aggregate configuration for a GraphSession
 */
struct EngineConfig {
    SpatialIndexConfig spatial;
    VirtualizationConfig virtualization;
    StreamingConfig streaming;
    EdgeCaseConfig edge_cases;
    bool verbose = false;                   ///< Turns on verbose logging in every component

    /**
     * @brief Load configuration from JSON file
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    nlohmann::json to_json() const;

    /**
     * @brief Overlay the keys present in j on top of the defaults
     */
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load from environment variables
     *
     * Looks for GV_DATA_SOURCE_URL, GV_VERBOSE, GV_CHUNK_SIZE,
     * GV_MAX_CONCURRENT_CHUNKS and GV_NETWORK_TIMEOUT_MS.
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

/**
 * @brief Create default configuration
 */
EngineConfig create_default_config();

/**
 * @brief Load configuration from file with fallback to environment
 *
 * Tries, in order: config_path, .gv_config.json, ../.gv_config.json,
 * then the environment.
 */
EngineConfig load_config_with_fallback(const std::string& config_path = "");

} // namespace gv
