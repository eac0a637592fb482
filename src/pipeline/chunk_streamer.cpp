#include "pipeline/chunk_streamer.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace gv {

// ============================================================================
// Chunk Ids
// ============================================================================

namespace {

const std::string CHUNK_PREFIX = "chunk_";

// Window used by data_streaming_rate
constexpr std::chrono::seconds STREAMING_RATE_WINDOW(10);

bool parse_int(const std::string& text, int64_t& value) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        value = std::stoll(text, &consumed);
        return consumed == text.size();
    } catch (const std::logic_error&) {
        return false;
    }
}

} // anonymous namespace

std::string make_chunk_id(int64_t grid_x, int64_t grid_y) {
    return CHUNK_PREFIX + std::to_string(grid_x) + "_" + std::to_string(grid_y);
}

std::optional<std::pair<int64_t, int64_t>> parse_chunk_id(const std::string& chunk_id) {
    if (chunk_id.compare(0, CHUNK_PREFIX.size(), CHUNK_PREFIX) != 0) {
        return std::nullopt;
    }

    // Skip one character so a leading minus sign on x is not taken for the separator
    const size_t separator = chunk_id.find('_', CHUNK_PREFIX.size() + 1);
    if (separator == std::string::npos) {
        return std::nullopt;
    }

    int64_t x = 0;
    int64_t y = 0;
    if (!parse_int(chunk_id.substr(CHUNK_PREFIX.size(), separator - CHUNK_PREFIX.size()), x) ||
        !parse_int(chunk_id.substr(separator + 1), y)) {
        return std::nullopt;
    }

    return std::make_pair(x, y);
}

BoundingBox chunk_bounds(int64_t grid_x, int64_t grid_y, double chunk_size) {
    return BoundingBox(
        grid_x * chunk_size,
        grid_y * chunk_size,
        (grid_x + 1) * chunk_size,
        (grid_y + 1) * chunk_size
    );
}

BoundingBox chunk_bounds_from_id(const std::string& chunk_id, double chunk_size) {
    auto grid = parse_chunk_id(chunk_id);
    if (!grid) {
        throw std::invalid_argument("Malformed chunk id: " + chunk_id);
    }
    return chunk_bounds(grid->first, grid->second, chunk_size);
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

ChunkStreamer::ChunkStreamer(
    SpatialIndex& index,
    DataSource& source,
    NetworkRetry& retry,
    const StreamingConfig& config,
    const Clock& clock
) : index_(index),
    source_(source),
    retry_(retry),
    config_(config),
    clock_(clock),
    policy_(retry.default_policy()) {

    if (config_.chunk_size <= 0.0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    if (config_.max_concurrent_chunks < 1) {
        throw std::invalid_argument("Max concurrent chunks must be at least 1");
    }

    last_cleanup_ = clock_.now();
}

ChunkStreamer::~ChunkStreamer() {
    for (auto& [id, entry] : chunks_) {
        entry.cancel.cancel();
    }
    for (auto& worker : workers_) {
        if (worker.valid()) {
            worker.wait();
        }
    }
}

// ============================================================================
// Loading
// ============================================================================

ChunkStreamer::Entry& ChunkStreamer::ensure_entry(
    const std::string& chunk_id,
    const BoundingBox& bounds
) {
    auto it = chunks_.find(chunk_id);
    if (it != chunks_.end()) {
        return it->second;
    }

    Entry& entry = chunks_[chunk_id];
    entry.chunk.id = chunk_id;
    entry.chunk.bounds = bounds;
    entry.generation = generation_;
    return entry;
}

void ChunkStreamer::arm(Entry& entry) {
    if (!entry.promise) {
        entry.promise = std::make_shared<std::promise<ChunkHandle>>();
        entry.future = entry.promise->get_future().share();
    }
}

ChunkFuture ChunkStreamer::load_chunk(const std::string& chunk_id, const BoundingBox& bounds) {
    Entry& entry = ensure_entry(chunk_id, bounds);

    if (entry.chunk.is_loaded || entry.chunk.is_loading || entry.deferred) {
        return entry.future;
    }

    arm(entry);

    if (slots_in_use() < static_cast<size_t>(config_.max_concurrent_chunks)) {
        launch(entry);
    } else {
        entry.deferred = true;
        deferred_.push_back(chunk_id);
        if (config_.verbose) {
            std::cout << "Deferring chunk " << chunk_id << " ("
                      << loading_ << " already loading)" << std::endl;
        }
    }

    return entry.future;
}

size_t ChunkStreamer::load_visible_chunks(const BoundingBox& expanded_viewport) {
    const BoundingBox& world = index_.bounds();
    if (!expanded_viewport.is_valid() || !expanded_viewport.intersects(world)) {
        return 0;
    }

    // Cells outside the world could never hold indexable nodes
    const BoundingBox area(
        std::max(expanded_viewport.min_x, world.min_x),
        std::max(expanded_viewport.min_y, world.min_y),
        std::min(expanded_viewport.max_x, world.max_x),
        std::min(expanded_viewport.max_y, world.max_y)
    );

    const double size = config_.chunk_size;
    const int64_t pad = config_.prefetch_distance;
    const int64_t min_gx = static_cast<int64_t>(std::floor(area.min_x / size)) - pad;
    const int64_t max_gx = static_cast<int64_t>(std::ceil(area.max_x / size)) + pad;
    const int64_t min_gy = static_cast<int64_t>(std::floor(area.min_y / size)) - pad;
    const int64_t max_gy = static_cast<int64_t>(std::ceil(area.max_y / size)) + pad;

    const double center_x = expanded_viewport.center_x();
    const double center_y = expanded_viewport.center_y();

    struct Candidate {
        std::string id;
        BoundingBox bounds;
        double priority;
    };
    std::vector<Candidate> candidates;

    for (int64_t gx = min_gx; gx <= max_gx; ++gx) {
        for (int64_t gy = min_gy; gy <= max_gy; ++gy) {
            std::string id = make_chunk_id(gx, gy);

            auto it = chunks_.find(id);
            if (it != chunks_.end()) {
                const Entry& entry = it->second;
                if (entry.chunk.is_loaded || entry.chunk.is_loading || entry.deferred) {
                    continue;
                }
            }

            BoundingBox bounds = chunk_bounds(gx, gy, size);
            const double dx = bounds.center_x() - center_x;
            const double dy = bounds.center_y() - center_y;
            const double priority = 1.0 / (1.0 + std::sqrt(dx * dx + dy * dy));

            candidates.push_back({std::move(id), bounds, priority});
        }
    }

    std::sort(candidates.begin(), candidates.end(),
        [](const Candidate& a, const Candidate& b) {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.id < b.id;
        });

    const size_t cap = static_cast<size_t>(config_.max_concurrent_chunks);
    size_t launched = 0;

    for (const auto& candidate : candidates) {
        if (slots_in_use() >= cap) {
            break;
        }
        Entry& entry = ensure_entry(candidate.id, candidate.bounds);
        entry.chunk.priority = candidate.priority;
        launch(entry);
        ++launched;
    }

    if (config_.verbose && !candidates.empty()) {
        std::cout << "Viewport needs " << candidates.size() << " chunks, launched "
                  << launched << std::endl;
    }

    return launched;
}

size_t ChunkStreamer::slots_in_use() const {
    return std::max(loading_, running_.load());
}

bool ChunkStreamer::is_idle_failure(const Entry& entry) {
    return !entry.chunk.is_loaded && !entry.chunk.is_loading &&
           !entry.deferred && !entry.chunk.last_error.empty();
}

void ChunkStreamer::launch(Entry& entry) {
    arm(entry);
    entry.deferred = false;
    entry.chunk.is_loading = true;
    entry.chunk.last_error.clear();
    entry.chunk.attempts++;
    entry.cancel = CancellationSource();
    ++loading_;
    ++running_;

    if (config_.verbose) {
        std::cout << "Loading chunk " << entry.chunk.id
                  << " (priority " << entry.chunk.priority << ")" << std::endl;
    }

    workers_.push_back(std::async(
        std::launch::async,
        &ChunkStreamer::run_fetch,
        this,
        entry.chunk.id,
        entry.chunk.bounds,
        entry.generation,
        entry.cancel.token(),
        policy_
    ));
}

void ChunkStreamer::launch_deferred() {
    const size_t cap = static_cast<size_t>(config_.max_concurrent_chunks);

    while (slots_in_use() < cap && !deferred_.empty()) {
        std::string id = deferred_.front();
        deferred_.pop_front();

        auto it = chunks_.find(id);
        if (it == chunks_.end() || !it->second.deferred) {
            continue;
        }
        launch(it->second);
    }
}

void ChunkStreamer::run_fetch(
    std::string chunk_id,
    BoundingBox bounds,
    uint64_t generation,
    CancellationToken token,
    RetryPolicy policy
) {
    Completion completion;
    completion.chunk_id = chunk_id;
    completion.generation = generation;

    // Stop retrying once the owner has given up on this load
    auto classify = policy.should_retry;
    policy.should_retry = [token, classify](const std::exception& e) {
        if (token.is_cancelled()) {
            return false;
        }
        return classify ? classify(e) : NetworkRetry::is_retryable(e);
    };

    try {
        completion.data = retry_.execute(
            source_.request_key(chunk_id),
            "GET",
            [&]() {
                if (token.is_cancelled()) {
                    throw CancelledError("Chunk load cancelled: " + chunk_id);
                }
                return source_.fetch_chunk_data(chunk_id, bounds);
            },
            policy
        );
    } catch (const std::exception& e) {
        completion.error = std::current_exception();
        completion.error_message = e.what();
    }

    {
        std::lock_guard<std::mutex> lock(completion_mutex_);
        completions_.push_back(std::move(completion));
        --running_;
    }
    completion_cv_.notify_all();
}

// ============================================================================
// Pump
// ============================================================================

size_t ChunkStreamer::pump(std::chrono::milliseconds wait) {
    std::vector<Completion> batch;
    {
        std::unique_lock<std::mutex> lock(completion_mutex_);
        if (completions_.empty() && wait.count() > 0) {
            completion_cv_.wait_for(lock, wait, [this]() { return !completions_.empty(); });
        }
        batch.swap(completions_);
    }

    reap_workers();

    size_t changed = 0;
    for (auto& completion : batch) {
        if (apply(completion)) {
            ++changed;
        }
    }

    launch_deferred();

    const auto now = clock_.now();
    while (!load_times_.empty() && now - load_times_.front() > STREAMING_RATE_WINDOW) {
        load_times_.pop_front();
    }

    if (now - last_cleanup_ >= std::chrono::milliseconds(config_.cleanup_interval_ms)) {
        last_cleanup_ = now;
        changed += cleanup_expired();
    }

    return changed;
}

bool ChunkStreamer::apply(Completion& completion) {
    auto it = chunks_.find(completion.chunk_id);
    if (it == chunks_.end() ||
        it->second.generation != completion.generation ||
        !it->second.chunk.is_loading) {
        // Registry was cleared while this fetch was in flight
        return false;
    }

    Entry& entry = it->second;
    entry.chunk.is_loading = false;
    --loading_;

    std::shared_ptr<std::promise<ChunkHandle>> promise = std::move(entry.promise);
    entry.promise.reset();

    if (completion.error) {
        entry.chunk.last_error = completion.error_message;
        entry.failed_at = clock_.now();

        if (config_.verbose) {
            std::cerr << "Failed to load chunk " << entry.chunk.id << " after "
                      << entry.chunk.attempts << " launch(es): "
                      << completion.error_message << std::endl;
        }

        promise->set_exception(completion.error);
        if (failed_handler_) {
            failed_handler_(entry.chunk.id, completion.error_message);
        }
        return false;
    }

    ChunkData& data = *completion.data;

    size_t rejected = 0;
    for (const auto& node : data.nodes) {
        if (index_.insert(node)) {
            node_owner_[node.id] = entry.chunk.id;
        } else {
            ++rejected;
        }
    }
    for (const auto& edge : data.edges) {
        edge_owner_[edge.id] = entry.chunk.id;
    }
    if (rejected > 0 && config_.verbose) {
        std::cerr << "Warning: " << rejected << " node(s) of " << entry.chunk.id
                  << " lie outside the world bounds" << std::endl;
    }

    entry.chunk.nodes = std::move(data.nodes);
    entry.chunk.edges = std::move(data.edges);
    entry.chunk.is_loaded = true;
    entry.chunk.loaded_at = clock_.now();
    load_times_.push_back(entry.chunk.loaded_at);

    if (config_.verbose) {
        std::cout << "Loaded chunk " << entry.chunk.id << ": "
                  << entry.chunk.nodes.size() << " nodes, "
                  << entry.chunk.edges.size() << " edges" << std::endl;
    }

    promise->set_value(std::make_shared<const DataChunk>(entry.chunk));
    if (loaded_handler_) {
        loaded_handler_(entry.chunk);
    }
    return true;
}

void ChunkStreamer::reap_workers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it->get();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

ChunkHandle ChunkStreamer::wait_for_chunk(
    const ChunkFuture& future,
    std::chrono::milliseconds timeout
) {
    if (!future.valid()) {
        throw std::invalid_argument("wait_for_chunk called with an empty future");
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw TimeoutError("Timed out after " + std::to_string(timeout.count()) +
                               "ms waiting for chunk");
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        pump(std::max(std::chrono::milliseconds(1),
                      std::min(remaining, std::chrono::milliseconds(10))));
    }

    return future.get();
}

// ============================================================================
// Expiry
// ============================================================================

size_t ChunkStreamer::cleanup_expired() {
    const auto now = clock_.now();
    const auto expiration = std::chrono::milliseconds(config_.cache_expiration_ms);
    size_t removed = 0;
    size_t dropped_failures = 0;

    for (auto it = chunks_.begin(); it != chunks_.end();) {
        Entry& entry = it->second;
        if (entry.chunk.is_loaded && now - entry.chunk.loaded_at > expiration) {
            evict(entry);
            it = chunks_.erase(it);
            ++removed;
        } else if (is_idle_failure(entry) && now - entry.failed_at > expiration) {
            it = chunks_.erase(it);
            ++dropped_failures;
        } else {
            ++it;
        }
    }

    if (config_.verbose && (removed > 0 || dropped_failures > 0)) {
        std::cout << "Evicted " << removed << " expired chunk(s), forgot "
                  << dropped_failures << " failed chunk(s)" << std::endl;
    }

    return removed;
}

void ChunkStreamer::evict(Entry& entry) {
    ChunkEviction eviction;
    eviction.chunk_id = entry.chunk.id;

    for (const auto& node : entry.chunk.nodes) {
        auto owner = node_owner_.find(node.id);
        if (owner == node_owner_.end() || owner->second != entry.chunk.id) {
            continue;
        }
        node_owner_.erase(owner);
        index_.remove(node.id);
        eviction.node_ids.push_back(node.id);
    }

    for (const auto& edge : entry.chunk.edges) {
        auto owner = edge_owner_.find(edge.id);
        if (owner == edge_owner_.end() || owner->second != entry.chunk.id) {
            continue;
        }
        edge_owner_.erase(owner);
        eviction.edge_ids.push_back(edge.id);
    }

    if (evicted_handler_) {
        evicted_handler_(eviction);
    }
}

void ChunkStreamer::release_nodes(const std::vector<std::string>& node_ids) {
    for (const auto& id : node_ids) {
        node_owner_.erase(id);
    }
}

void ChunkStreamer::release_edges(const std::vector<std::string>& edge_ids) {
    for (const auto& id : edge_ids) {
        edge_owner_.erase(id);
    }
}

std::optional<std::string> ChunkStreamer::node_owner(const std::string& node_id) const {
    auto it = node_owner_.find(node_id);
    if (it == node_owner_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ChunkStreamer::clear() {
    ++generation_;

    for (auto& [id, entry] : chunks_) {
        if (entry.promise) {
            entry.cancel.cancel();
            entry.promise->set_exception(
                std::make_exception_ptr(CancelledError("Chunk load cancelled: " + id))
            );
        }
    }

    chunks_.clear();
    deferred_.clear();
    node_owner_.clear();
    edge_owner_.clear();

    // Cancelled workers keep their slots (running_) until they return
    loading_ = 0;
    load_times_.clear();

    std::lock_guard<std::mutex> lock(completion_mutex_);
    completions_.clear();
}

// ============================================================================
// Registry / Metrics
// ============================================================================

const DataChunk* ChunkStreamer::get_chunk(const std::string& chunk_id) const {
    auto it = chunks_.find(chunk_id);
    if (it == chunks_.end()) {
        return nullptr;
    }
    return &it->second.chunk;
}

std::vector<std::string> ChunkStreamer::chunk_ids() const {
    std::vector<std::string> ids;
    ids.reserve(chunks_.size());
    for (const auto& [id, entry] : chunks_) {
        ids.push_back(id);
    }
    return ids;
}

size_t ChunkStreamer::loaded_count() const {
    return std::count_if(chunks_.begin(), chunks_.end(),
        [](const auto& item) { return item.second.chunk.is_loaded; });
}

double ChunkStreamer::cache_hit_ratio() const {
    if (chunks_.empty()) {
        return 0.0;
    }
    return static_cast<double>(loaded_count()) / static_cast<double>(chunks_.size());
}

double ChunkStreamer::data_streaming_rate() const {
    const auto now = clock_.now();
    const auto recent = std::count_if(load_times_.begin(), load_times_.end(),
        [&](const Clock::TimePoint& t) { return now - t <= STREAMING_RATE_WINDOW; });
    return static_cast<double>(recent) / static_cast<double>(STREAMING_RATE_WINDOW.count());
}

json ChunkStreamer::get_statistics() const {
    size_t failed = 0;
    for (const auto& [id, entry] : chunks_) {
        if (is_idle_failure(entry)) {
            ++failed;
        }
    }

    json stats;
    stats["source"] = source_.get_source_name();
    stats["chunk_count"] = chunks_.size();
    stats["loaded"] = loaded_count();
    stats["loading"] = loading_;
    stats["fetches_in_flight"] = running_.load();
    stats["deferred"] = deferred_.size();
    stats["failed"] = failed;
    stats["cache_hit_ratio"] = cache_hit_ratio();
    stats["data_streaming_rate"] = data_streaming_rate();
    return stats;
}

} // namespace gv
