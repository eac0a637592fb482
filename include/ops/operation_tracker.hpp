#pragma once

#include "core/engine_config.hpp"
#include "core/cancellation.hpp"
#include "core/clock.hpp"
#include "core/errors.hpp"
#include <string>
#include <vector>
#include <map>
#include <deque>
#include <memory>
#include <future>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <optional>
#include <functional>
#include <type_traits>
#include <exception>
#include <nlohmann/json.hpp>

namespace gv {

// ============================================================================
// Data Structures
// ============================================================================

enum class OperationType {
    Navigation,
    DataFetch,
    Layout,
    Render
};

enum class OperationStatus {
    Pending,
    Completed,
    Cancelled,
    Failed
};

std::string to_string(OperationType type);
std::string to_string(OperationStatus status);

/**
 * @brief A user-visible operation registered for race detection
 */
struct TrackedOperation {
    std::string id;
    OperationType type = OperationType::Navigation;
    OperationStatus status = OperationStatus::Pending;
    int priority = 0;                                   ///< Higher wins
    Clock::TimePoint start_time;
    std::optional<Clock::TimePoint> finished_at;        ///< Set once the status is terminal

    bool is_terminal() const { return status != OperationStatus::Pending; }

    nlohmann::json to_json() const;
};

/**
 * @brief Fired for rejected duplicates, preempted operations and timeouts
 */
using RaceConditionHandler = std::function<void(const TrackedOperation&)>;

// ============================================================================
// OperationTracker
// ============================================================================

/**
 * @brief Race detection, priority preemption and a timed work queue
 *
 * Tracked operations are bookkeeping only: the tracker never runs them. A
 * duplicate id is rejected while the first registration is pending, and a
 * newcomer cancels pending operations of the same type with strictly lower
 * priority. Equal priorities coexist; the incumbent is left alone.
 *
 * Timeouts are applied lazily whenever the tracker is consulted, so no timer
 * thread is needed. queue_operation is separate: it owns a dispatcher thread
 * that runs queued work one item at a time, highest priority first.
 *
 * All members are safe to call from any thread. Handlers run on the calling
 * thread, outside the tracker's lock.
 */
class OperationTracker {
public:
    explicit OperationTracker(
        const EdgeCaseConfig& config = EdgeCaseConfig{},
        const Clock& clock = SteadyClock::instance()
    );

    /**
     * @brief Stops the dispatcher; waiting work fails with CancelledError
     */
    ~OperationTracker();

    OperationTracker(const OperationTracker&) = delete;
    OperationTracker& operator=(const OperationTracker&) = delete;

    // ==========================================
    // Race tracking
    // ==========================================

    /**
     * @brief Register an operation
     *
     * @param operation_id Unique id; reusable once the previous one is terminal
     * @param type Operation category; preemption only happens within a type
     * @param priority Higher values preempt lower ones
     * @return false if an operation with this id is still pending
     */
    bool track_operation(
        const std::string& operation_id,
        OperationType type,
        int priority = 0
    );

    /**
     * @brief Mark a pending operation completed (or failed)
     * @return false if the operation is unknown or no longer pending
     */
    bool complete_operation(const std::string& operation_id, bool success = true);

    std::optional<OperationStatus> status(const std::string& operation_id);
    std::optional<TrackedOperation> get_operation(const std::string& operation_id);

    /**
     * @brief Token signalled when the operation is preempted or times out
     */
    std::optional<CancellationToken> token(const std::string& operation_id);

    /**
     * @brief Apply timeouts and drop expired terminal records
     * @return Number of operations that timed out
     */
    size_t sweep();

    // ==========================================
    // Queued work
    // ==========================================

    /**
     * @brief Run work on the dispatcher, racing it against timeout
     *
     * @param operation_id Used in logs and error messages
     * @param work Callable taking const CancellationToken&
     * @param priority Higher runs first; equal priorities run in FIFO order
     * @param timeout Wall-time limit once the work has started
     * @return Future with the work's result, its exception, or TimeoutError
     */
    template<typename Func>
    auto queue_operation(
        const std::string& operation_id,
        Func&& work,
        int priority = 0,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000)
    ) -> std::future<std::invoke_result_t<std::decay_t<Func>&, const CancellationToken&>>;

    size_t queued_count() const;

    // ==========================================
    // Statistics / lifecycle
    // ==========================================

    size_t active_count();

    nlohmann::json get_statistics();

    /**
     * @brief Forget all tracked operations and fail every queued item
     */
    void reset();

    void set_race_condition_handler(RaceConditionHandler handler);

    const EdgeCaseConfig& config() const { return config_; }

private:
    struct Record {
        TrackedOperation operation;
        CancellationSource cancel;
    };

    /**
     * @brief Type-erased queued item
     */
    struct Job {
        std::string id;
        int priority = 0;
        std::chrono::milliseconds timeout{0};
        // Starts the work on its own thread
        std::function<std::future<void>(const CancellationToken&)> start;
        // Settles the caller's future with an error unless the work already did
        std::function<void(std::exception_ptr)> fail;
    };

    EdgeCaseConfig config_;
    const Clock& clock_;

    mutable std::mutex mutex_;
    std::map<std::string, Record> operations_;
    size_t race_conditions_ = 0;
    RaceConditionHandler race_handler_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Job> queue_;
    bool stopping_ = false;
    std::vector<std::future<void>> orphans_;     // Timed-out work still running
    std::thread dispatcher_;

    void sweep_locked(std::vector<TrackedOperation>& events, size_t* timed_out = nullptr);
    void notify(const std::vector<TrackedOperation>& events);

    void enqueue(Job job);
    void dispatch_loop();
    void run_job(Job& job);
};

// ============================================================================
// Template implementation
// ============================================================================

template<typename Func>
auto OperationTracker::queue_operation(
    const std::string& operation_id,
    Func&& work,
    int priority,
    std::chrono::milliseconds timeout
) -> std::future<std::invoke_result_t<std::decay_t<Func>&, const CancellationToken&>> {
    using Result = std::invoke_result_t<std::decay_t<Func>&, const CancellationToken&>;

    // First of the work and the timeout to settle the promise wins
    struct State {
        std::promise<Result> promise;
        std::atomic<bool> settled{false};
    };

    auto state = std::make_shared<State>();
    auto callable = std::make_shared<std::decay_t<Func>>(std::forward<Func>(work));
    std::future<Result> future = state->promise.get_future();

    Job job;
    job.id = operation_id;
    job.priority = priority;
    job.timeout = timeout;

    job.start = [state, callable](const CancellationToken& token) {
        return std::async(std::launch::async, [state, callable, token]() {
            try {
                if constexpr (std::is_void_v<Result>) {
                    (*callable)(token);
                    if (!state->settled.exchange(true)) {
                        state->promise.set_value();
                    }
                } else {
                    Result result = (*callable)(token);
                    if (!state->settled.exchange(true)) {
                        state->promise.set_value(std::move(result));
                    }
                }
            } catch (...) {
                // Forwarded to the caller's future
                if (!state->settled.exchange(true)) {
                    state->promise.set_exception(std::current_exception());
                }
            }
        });
    };

    job.fail = [state](std::exception_ptr error) {
        if (!state->settled.exchange(true)) {
            state->promise.set_exception(error);
        }
    };

    enqueue(std::move(job));
    return future;
}

} // namespace gv
