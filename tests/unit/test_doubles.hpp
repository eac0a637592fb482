#pragma once

#include "net/http_transport.hpp"
#include "pipeline/data_source.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace gv {
namespace test_support {

/**
 * @brief HttpTransport that replays scripted outcomes in order
 *
 * Once the script runs out, the last outcome repeats.
 */
class ScriptedTransport : public HttpTransport {
public:
    using Outcome = std::function<HttpResponse(const HttpRequest&)>;

    void push(Outcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_.push_back(std::move(outcome));
    }

    void push_response(long status, const std::string& body) {
        push([status, body](const HttpRequest&) { return HttpResponse{status, body}; });
    }

    void push_transport_error(const std::string& message = "connection refused") {
        push([message](const HttpRequest&) -> HttpResponse { throw TransportError(message); });
    }

    HttpResponse perform(const HttpRequest& request, std::chrono::milliseconds timeout) override {
        Outcome outcome;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            last_timeout_ = timeout;
            if (script_.empty()) {
                throw TransportError("no scripted response");
            }
            outcome = script_.front();
            if (script_.size() > 1) {
                script_.pop_front();
            }
        }
        return outcome(request);
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::vector<HttpRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::chrono::milliseconds last_timeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_timeout_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<Outcome> script_;
    std::vector<HttpRequest> requests_;
    std::chrono::milliseconds last_timeout_{0};
};

/**
 * @brief DataSource serving canned chunks, with failure injection and a gate
 *
 * While the gate is closed every fetch blocks, which keeps chunks in the
 * loading state for as long as a test needs.
 */
class FakeDataSource : public DataSource {
public:
    void set_chunk(const std::string& chunk_id, ChunkData data) {
        std::lock_guard<std::mutex> lock(mutex_);
        chunks_[chunk_id] = std::move(data);
    }

    // The next `count` fetches of chunk_id throw TransportError
    void fail_next(const std::string& chunk_id, int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[chunk_id] = count;
    }

    void close_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        gate_cv_.notify_all();
    }

    ChunkData fetch_chunk_data(const std::string& chunk_id, const BoundingBox& bounds) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++calls_[chunk_id];
        ++in_flight_;
        max_in_flight_ = std::max(max_in_flight_, in_flight_);
        gate_cv_.wait(lock, [this]() { return gate_open_; });
        --in_flight_;

        auto failure = failures_.find(chunk_id);
        if (failure != failures_.end() && failure->second > 0) {
            --failure->second;
            throw TransportError("injected failure for " + chunk_id);
        }

        auto it = chunks_.find(chunk_id);
        if (it != chunks_.end()) {
            return it->second;
        }

        // One node at the chunk center by default
        ChunkData data;
        GraphNode node;
        node.id = chunk_id + ":center";
        node.x = bounds.center_x();
        node.y = bounds.center_y();
        data.nodes.push_back(node);
        return data;
    }

    std::string get_source_name() const override { return "fake"; }

    int calls(const std::string& chunk_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(chunk_id);
        return it == calls_.end() ? 0 : it->second;
    }

    int total_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& [id, count] : calls_) {
            total += count;
        }
        return total;
    }

    int in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_;
    }

    int max_in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return max_in_flight_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    bool gate_open_ = true;
    std::map<std::string, ChunkData> chunks_;
    std::map<std::string, int> failures_;
    std::map<std::string, int> calls_;
    int in_flight_ = 0;
    int max_in_flight_ = 0;
};

/**
 * @brief Node with just the fields most tests care about
 */
inline GraphNode make_node(const std::string& id, double x, double y, int level = 0,
                           std::vector<std::string> connections = {}) {
    GraphNode node;
    node.id = id;
    node.x = x;
    node.y = y;
    node.level = level;
    node.connections = std::move(connections);
    return node;
}

} // namespace test_support
} // namespace gv
