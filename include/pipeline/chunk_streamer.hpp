#pragma once

#include "graph/graph_types.hpp"
#include "index/spatial_index.hpp"
#include "pipeline/data_source.hpp"
#include "net/network_retry.hpp"
#include "core/engine_config.hpp"
#include "core/cancellation.hpp"
#include "core/clock.hpp"
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <atomic>
#include <deque>
#include <memory>
#include <future>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <functional>
#include <exception>
#include <utility>
#include <nlohmann/json.hpp>

namespace gv {

// ============================================================================
// Chunk Ids
// ============================================================================

/**
 * @brief "chunk_<grid_x>_<grid_y>"
 */
std::string make_chunk_id(int64_t grid_x, int64_t grid_y);

/**
 * @brief Grid coordinates of a chunk id, or nullopt if malformed
 */
std::optional<std::pair<int64_t, int64_t>> parse_chunk_id(const std::string& chunk_id);

/**
 * @brief [gx*size, (gx+1)*size] x [gy*size, (gy+1)*size]
 */
BoundingBox chunk_bounds(int64_t grid_x, int64_t grid_y, double chunk_size);

/**
 * @brief Bounds of the cell named by chunk_id
 * @throws std::invalid_argument if chunk_id is malformed
 */
BoundingBox chunk_bounds_from_id(const std::string& chunk_id, double chunk_size);

// ============================================================================
// ChunkStreamer
// ============================================================================

/**
 * @brief Snapshot of a chunk as it was when its load completed
 */
using ChunkHandle = std::shared_ptr<const DataChunk>;
using ChunkFuture = std::shared_future<ChunkHandle>;

/**
 * @brief What an evicted chunk took out of the graph
 *
 * A node or edge id delivered by several chunks belongs to the one that
 * wrote it last; evicting an older chunk leaves it in place.
 */
struct ChunkEviction {
    std::string chunk_id;
    std::vector<std::string> node_ids;      ///< Removed from the index
    std::vector<std::string> edge_ids;      ///< Explicit edges no chunk provides any more
};

using ChunkLoadedHandler = std::function<void(const DataChunk&)>;
using ChunkEvictedHandler = std::function<void(const ChunkEviction&)>;
using ChunkFailedHandler = std::function<void(const std::string& chunk_id, const std::string& error)>;

/**
 * @brief Loads grid chunks around the viewport and evicts stale ones
 *
 * Fetches run on worker threads (std::async) through NetworkRetry. Their
 * results are queued and only applied by pump(), so the chunk registry and
 * the SpatialIndex are touched exclusively by the owner thread. At most
 * max_concurrent_chunks chunks are loading at any time; explicit load_chunk
 * requests beyond the cap wait in a FIFO queue until pump() frees a slot.
 */
class ChunkStreamer {
public:
    ChunkStreamer(
        SpatialIndex& index,
        DataSource& source,
        NetworkRetry& retry,
        const StreamingConfig& config = StreamingConfig{},
        const Clock& clock = SteadyClock::instance()
    );

    /**
     * @brief Cancels outstanding fetches and waits for the workers
     */
    ~ChunkStreamer();

    ChunkStreamer(const ChunkStreamer&) = delete;
    ChunkStreamer& operator=(const ChunkStreamer&) = delete;

    // ==========================================
    // Loading
    // ==========================================

    /**
     * @brief Request one chunk
     *
     * Idempotent: while a chunk is loading or queued every caller gets the
     * same future, and a loaded chunk yields an already-ready future. A chunk
     * whose last load failed is fetched again.
     *
     * @return Future fulfilled by pump() with the loaded chunk, or holding
     *         the fetch error / CancelledError
     */
    ChunkFuture load_chunk(const std::string& chunk_id, const BoundingBox& bounds);

    /**
     * @brief Start fetches for the cells covering a viewport
     *
     * Cells neither loaded nor loading are ranked by closeness to the
     * viewport center and launched while free slots remain; the rest are
     * picked up by a later call.
     *
     * @param expanded_viewport Viewport already grown by the buffer zone
     * @return Number of fetches launched
     */
    size_t load_visible_chunks(const BoundingBox& expanded_viewport);

    /**
     * @brief Apply finished fetches, start deferred ones, evict expired chunks
     *
     * @param wait How long to block for a completion when none is queued
     * @return Number of chunks whose data entered or left the index
     */
    size_t pump(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    /**
     * @brief Pump until future is ready
     *
     * @throws TimeoutError if it is not ready within timeout (wall time)
     * @throws Whatever the fetch failed with
     */
    ChunkHandle wait_for_chunk(const ChunkFuture& future, std::chrono::milliseconds timeout);

    /**
     * @brief Evict chunks older than the cache expiration
     *
     * Failed chunks nobody asked for again are dropped from the registry once
     * their failure is older than the cache expiration.
     *
     * @return Number of loaded chunks evicted
     */
    size_t cleanup_expired();

    /**
     * @brief Hand nodes or edges over to the caller
     *
     * Used when a node is written or removed directly; evicting the chunk
     * that last delivered it no longer touches it.
     */
    void release_nodes(const std::vector<std::string>& node_ids);
    void release_edges(const std::vector<std::string>& edge_ids);

    /**
     * @brief Forget every chunk; in-flight fetches resolve with CancelledError
     *
     * Nodes already inserted into the index stay there.
     */
    void clear();

    // ==========================================
    // Registry
    // ==========================================

    const DataChunk* get_chunk(const std::string& chunk_id) const;
    std::vector<std::string> chunk_ids() const;

    size_t chunk_count() const { return chunks_.size(); }
    size_t loading_count() const { return loading_; }
    size_t loaded_count() const;
    size_t deferred_count() const { return deferred_.size(); }

    /**
     * @brief Worker fetches still running, including ones abandoned by clear()
     */
    size_t fetches_in_flight() const { return running_.load(); }

    /**
     * @brief Chunk that last delivered node_id, if it is still cached
     */
    std::optional<std::string> node_owner(const std::string& node_id) const;

    // ==========================================
    // Metrics
    // ==========================================

    /**
     * @brief Loaded chunks / registered chunks (0 when empty)
     */
    double cache_hit_ratio() const;

    /**
     * @brief Chunks loaded per second, averaged over the last 10 seconds
     */
    double data_streaming_rate() const;

    nlohmann::json get_statistics() const;

    // ==========================================
    // Configuration
    // ==========================================

    const StreamingConfig& config() const { return config_; }

    void set_retry_policy(const RetryPolicy& policy) { policy_ = policy; }
    const RetryPolicy& retry_policy() const { return policy_; }

    void set_loaded_handler(ChunkLoadedHandler handler) { loaded_handler_ = std::move(handler); }
    void set_evicted_handler(ChunkEvictedHandler handler) { evicted_handler_ = std::move(handler); }
    void set_failed_handler(ChunkFailedHandler handler) { failed_handler_ = std::move(handler); }

private:
    struct Entry {
        DataChunk chunk;
        std::shared_ptr<std::promise<ChunkHandle>> promise;   // Set while queued or loading
        ChunkFuture future;
        CancellationSource cancel;
        uint64_t generation = 0;
        bool deferred = false;
        Clock::TimePoint failed_at{};
    };

    struct Completion {
        std::string chunk_id;
        uint64_t generation = 0;
        std::optional<ChunkData> data;
        std::exception_ptr error;
        std::string error_message;
    };

    SpatialIndex& index_;
    DataSource& source_;
    NetworkRetry& retry_;
    StreamingConfig config_;
    const Clock& clock_;
    RetryPolicy policy_;

    // Owner-thread state
    std::map<std::string, Entry> chunks_;
    std::deque<std::string> deferred_;
    size_t loading_ = 0;
    std::unordered_map<std::string, std::string> node_owner_;
    std::unordered_map<std::string, std::string> edge_owner_;
    uint64_t generation_ = 0;
    std::deque<Clock::TimePoint> load_times_;
    Clock::TimePoint last_cleanup_;

    // Shared with workers
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;
    std::vector<Completion> completions_;

    std::vector<std::future<void>> workers_;
    std::atomic<size_t> running_{0};

    ChunkLoadedHandler loaded_handler_;
    ChunkEvictedHandler evicted_handler_;
    ChunkFailedHandler failed_handler_;

    Entry& ensure_entry(const std::string& chunk_id, const BoundingBox& bounds);

    /**
     * @brief Give the entry a fresh promise if it has none
     */
    void arm(Entry& entry);

    /**
     * @brief Fetch slots taken, counting workers whose load was cleared
     */
    size_t slots_in_use() const;

    static bool is_idle_failure(const Entry& entry);

    void launch(Entry& entry);
    void launch_deferred();

    /**
     * @brief Worker-thread body
     */
    void run_fetch(
        std::string chunk_id,
        BoundingBox bounds,
        uint64_t generation,
        CancellationToken token,
        RetryPolicy policy
    );

    /**
     * @brief Owner-thread side of a finished fetch
     * @return true if data was inserted into the index
     */
    bool apply(Completion& completion);

    void reap_workers();
    void evict(Entry& entry);
};

} // namespace gv
