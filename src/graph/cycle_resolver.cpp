#include "graph/cycle_resolver.hpp"
#include <algorithm>
#include <queue>
#include <unordered_set>
#include <stdexcept>

namespace gv {

nlohmann::json CircularReference::to_json() const {
    nlohmann::json j;
    j["node_id"] = node_id;
    j["path"] = path;
    j["depth"] = depth;
    return j;
}

CycleResolver::CycleResolver(int max_circular_depth, const Clock& clock)
    : max_circular_depth_(max_circular_depth), clock_(clock) {
    if (max_circular_depth_ < 1) {
        throw std::invalid_argument("Max circular depth must be at least 1");
    }
}

std::optional<CircularReference> CycleResolver::detect_circular_reference(
    const std::string& node_id,
    const std::vector<std::string>& path
) {
    auto it = std::find(path.begin(), path.end(), node_id);
    if (it == path.end()) {
        return std::nullopt;
    }

    CircularReference reference;
    reference.node_id = node_id;
    reference.path.assign(it, path.end());
    reference.depth = reference.path.size();
    reference.detected_at = clock_.now();

    recent_[node_id] = reference;
    if (handler_) {
        handler_(reference);
    }

    return reference;
}

std::optional<std::vector<std::string>> CycleResolver::break_circular_reference(
    const std::string& start,
    const std::string& target,
    const Adjacency& adjacency
) const {
    struct State {
        std::string node;
        std::vector<std::string> path;
    };

    std::unordered_set<std::string> visited;
    std::queue<State> queue;
    queue.push({start, {start}});

    while (!queue.empty()) {
        State state = std::move(queue.front());
        queue.pop();

        if (state.node == target && state.path.size() > 1) {
            return state.path;
        }

        if (visited.count(state.node) ||
            state.path.size() > static_cast<size_t>(max_circular_depth_)) {
            continue;
        }
        visited.insert(state.node);

        auto it = adjacency.find(state.node);
        if (it == adjacency.end()) {
            continue;
        }

        for (const auto& next : it->second) {
            if (visited.count(next)) continue;
            if (std::find(state.path.begin(), state.path.end(), next) != state.path.end()) continue;

            State child{next, state.path};
            child.path.push_back(next);
            queue.push(std::move(child));
        }
    }

    return std::nullopt;
}

std::vector<CircularReference> CycleResolver::recent_references() const {
    std::vector<CircularReference> result;
    result.reserve(recent_.size());
    for (const auto& [id, reference] : recent_) {
        result.push_back(reference);
    }
    return result;
}

size_t CycleResolver::prune(std::chrono::milliseconds max_age) {
    const auto now = clock_.now();
    size_t removed = 0;

    for (auto it = recent_.begin(); it != recent_.end();) {
        if (now - it->second.detected_at > max_age) {
            it = recent_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

} // namespace gv
