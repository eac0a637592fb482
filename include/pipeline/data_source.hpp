#pragma once

#include "graph/graph_types.hpp"
#include "net/http_transport.hpp"
#include <string>
#include <chrono>
#include <memory>

namespace gv {

// ============================================================================
// Data Source Interface
// ============================================================================

/**
 * @brief Supplier of graph data for one chunk
 *
 * fetch_chunk_data blocks and is called from worker threads, possibly for
 * several chunks at once. Failures are reported by throwing; NetworkError
 * subclasses are retried by the streamer.
 */
class DataSource {
public:
    virtual ~DataSource() = default;

    /**
     * @brief Fetch the nodes and edges of one chunk
     *
     * @param chunk_id Chunk id (chunk_<gridX>_<gridY>)
     * @param bounds Chunk rectangle
     * @return Chunk payload
     */
    virtual ChunkData fetch_chunk_data(
        const std::string& chunk_id,
        const BoundingBox& bounds
    ) = 0;

    /**
     * @brief Short name used in logs
     */
    virtual std::string get_source_name() const = 0;

    /**
     * @brief Key under which NetworkRetry records failures for chunk_id
     */
    virtual std::string request_key(const std::string& chunk_id) const {
        return "chunk:" + chunk_id;
    }
};

// ============================================================================
// HTTP Data Source
// ============================================================================

/**
 * @brief Fetches chunks from GET <base_url>/api/graph/chunk/<chunk_id>
 */
class HttpDataSource : public DataSource {
public:
    HttpDataSource(
        HttpTransport& transport,
        const std::string& base_url,
        bool compression_enabled = true,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)
    );

    ChunkData fetch_chunk_data(
        const std::string& chunk_id,
        const BoundingBox& bounds
    ) override;

    std::string get_source_name() const override { return "http"; }

    std::string request_key(const std::string& chunk_id) const override {
        return chunk_url(chunk_id);
    }

    std::string chunk_url(const std::string& chunk_id) const;

private:
    HttpTransport& transport_;
    std::string base_url_;
    bool compression_enabled_;
    std::chrono::milliseconds timeout_;
};

// ============================================================================
// Synthetic Data Source
// ============================================================================

/**
 * @brief Generates a reproducible random graph per chunk
 *
 * The same chunk id always yields the same nodes and edges, so a chunk that
 * is evicted and fetched again comes back identical.
 */
class SyntheticDataSource : public DataSource {
public:
    struct Options {
        size_t nodes_per_chunk = 20;
        int max_level = 3;                  ///< Levels are drawn from [0, max_level]
        size_t connections_per_node = 2;    ///< Upper bound; targets stay within the chunk
        std::chrono::milliseconds latency{0}; ///< Simulated fetch delay
        uint64_t seed = 0;                  ///< Mixed into every chunk's seed
    };

    SyntheticDataSource() : SyntheticDataSource(Options{}) {}
    explicit SyntheticDataSource(const Options& options);

    ChunkData fetch_chunk_data(
        const std::string& chunk_id,
        const BoundingBox& bounds
    ) override;

    std::string get_source_name() const override { return "synthetic"; }

    const Options& options() const { return options_; }

private:
    Options options_;
};

} // namespace gv
