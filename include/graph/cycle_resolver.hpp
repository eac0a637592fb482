#pragma once

#include "core/clock.hpp"
#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace gv {

/**
 * @brief A traversal path that came back to a node it already visited
 */
struct CircularReference {
    std::string node_id;                    // The revisited node
    std::vector<std::string> path;          // From the first occurrence of node_id to the end
    size_t depth = 0;                       // path.size()
    Clock::TimePoint detected_at;

    nlohmann::json to_json() const;
};

/**
 * @brief Node id -> ordered neighbor ids
 */
using Adjacency = std::unordered_map<std::string, std::vector<std::string>>;

/**
 * @brief Cycle detection and alternate-route search for graph traversal
 *
 * An unresolved cycle is an ordinary outcome for transaction graphs, so
 * both operations report "nothing found" with std::nullopt rather than
 * throwing.
 */
class CycleResolver {
public:
    explicit CycleResolver(
        int max_circular_depth = 10,
        const Clock& clock = SteadyClock::instance()
    );

    /**
     * @brief Check whether visiting node_id after path closes a cycle
     *
     * @param node_id Node about to be visited
     * @param path Nodes visited so far, in order
     * @return The cycle starting at the first occurrence of node_id, or nullopt
     */
    std::optional<CircularReference> detect_circular_reference(
        const std::string& node_id,
        const std::vector<std::string>& path
    );

    /**
     * @brief Breadth-first search for a route from start to target
     *
     * Paths never revisit a node and are expanded only while their length is
     * within max_circular_depth. The direct zero-hop "path" [start] never
     * counts, so the result always has at least two entries. Ties go to the
     * first path discovered.
     *
     * @return Node ids from start to target, or nullopt if none exists within the bound
     */
    std::optional<std::vector<std::string>> break_circular_reference(
        const std::string& start,
        const std::string& target,
        const Adjacency& adjacency
    ) const;

    /**
     * @brief Recently detected cycles, keyed by node id
     */
    std::vector<CircularReference> recent_references() const;
    size_t reference_count() const { return recent_.size(); }

    /**
     * @brief Forget detections older than max_age
     * @return Number of records removed
     */
    size_t prune(std::chrono::milliseconds max_age);

    void clear() { recent_.clear(); }

    void set_circular_reference_handler(std::function<void(const CircularReference&)> handler) {
        handler_ = std::move(handler);
    }

    int max_circular_depth() const { return max_circular_depth_; }

private:
    int max_circular_depth_;
    const Clock& clock_;
    std::map<std::string, CircularReference> recent_;
    std::function<void(const CircularReference&)> handler_;
};

} // namespace gv
