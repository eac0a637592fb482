#include "ops/operation_tracker.hpp"
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace gv {

// ============================================================================
// Data Structures
// ============================================================================

std::string to_string(OperationType type) {
    switch (type) {
        case OperationType::Navigation: return "navigation";
        case OperationType::DataFetch: return "data_fetch";
        case OperationType::Layout: return "layout";
        case OperationType::Render: return "render";
        default: return "navigation";
    }
}

std::string to_string(OperationStatus status) {
    switch (status) {
        case OperationStatus::Pending: return "pending";
        case OperationStatus::Completed: return "completed";
        case OperationStatus::Cancelled: return "cancelled";
        case OperationStatus::Failed: return "failed";
        default: return "pending";
    }
}

json TrackedOperation::to_json() const {
    json j;
    j["id"] = id;
    j["type"] = to_string(type);
    j["status"] = to_string(status);
    j["priority"] = priority;
    return j;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

OperationTracker::OperationTracker(const EdgeCaseConfig& config, const Clock& clock)
    : config_(config), clock_(clock) {
    dispatcher_ = std::thread(&OperationTracker::dispatch_loop, this);
}

OperationTracker::~OperationTracker() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();

    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }

    // Work abandoned on timeout keeps running until it notices its token
    for (auto& orphan : orphans_) {
        if (orphan.valid()) {
            orphan.wait();
        }
    }
}

// ============================================================================
// Race tracking
// ============================================================================

void OperationTracker::sweep_locked(std::vector<TrackedOperation>& events, size_t* timed_out) {
    const auto now = clock_.now();
    const auto race_timeout = std::chrono::milliseconds(config_.race_condition_timeout_ms);
    const auto cleanup_delay = std::chrono::milliseconds(config_.cleanup_delay_ms);

    for (auto it = operations_.begin(); it != operations_.end();) {
        TrackedOperation& op = it->second.operation;

        if (op.status == OperationStatus::Pending && now - op.start_time > race_timeout) {
            op.status = OperationStatus::Failed;
            op.finished_at = now;
            it->second.cancel.cancel();
            events.push_back(op);
            if (timed_out) {
                ++*timed_out;
            }
            if (config_.verbose) {
                std::cerr << "Operation " << op.id << " timed out after "
                          << config_.race_condition_timeout_ms << "ms" << std::endl;
            }
        }

        if (op.finished_at && now - *op.finished_at >= cleanup_delay) {
            it = operations_.erase(it);
        } else {
            ++it;
        }
    }
}

void OperationTracker::notify(const std::vector<TrackedOperation>& events) {
    if (events.empty()) {
        return;
    }

    RaceConditionHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = race_handler_;
    }

    if (handler) {
        for (const auto& event : events) {
            handler(event);
        }
    }
}

bool OperationTracker::track_operation(
    const std::string& operation_id,
    OperationType type,
    int priority
) {
    std::vector<TrackedOperation> events;
    bool accepted = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweep_locked(events);

        auto existing = operations_.find(operation_id);
        if (existing != operations_.end() &&
            existing->second.operation.status == OperationStatus::Pending) {
            ++race_conditions_;
            events.push_back(existing->second.operation);
            if (config_.verbose) {
                std::cerr << "Race condition detected: " << operation_id
                          << " already pending" << std::endl;
            }
        } else {
            const auto now = clock_.now();

            // Preempt strictly lower priorities of the same type
            for (auto& [id, record] : operations_) {
                TrackedOperation& op = record.operation;
                if (op.type == type && op.priority < priority &&
                    op.status == OperationStatus::Pending) {
                    op.status = OperationStatus::Cancelled;
                    op.finished_at = now;
                    record.cancel.cancel();
                    events.push_back(op);
                    if (config_.verbose) {
                        std::cout << "Cancelled " << op.id << " (priority " << op.priority
                                  << ") in favor of " << operation_id
                                  << " (priority " << priority << ")" << std::endl;
                    }
                }
            }

            Record record;
            record.operation.id = operation_id;
            record.operation.type = type;
            record.operation.priority = priority;
            record.operation.start_time = now;
            operations_[operation_id] = std::move(record);
            accepted = true;
        }
    }

    notify(events);
    return accepted;
}

bool OperationTracker::complete_operation(const std::string& operation_id, bool success) {
    std::vector<TrackedOperation> events;
    bool updated = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweep_locked(events);

        auto it = operations_.find(operation_id);
        if (it != operations_.end() &&
            it->second.operation.status == OperationStatus::Pending) {
            it->second.operation.status = success ? OperationStatus::Completed
                                                  : OperationStatus::Failed;
            it->second.operation.finished_at = clock_.now();
            updated = true;
        }
    }

    notify(events);
    return updated;
}

std::optional<OperationStatus> OperationTracker::status(const std::string& operation_id) {
    auto op = get_operation(operation_id);
    if (!op) {
        return std::nullopt;
    }
    return op->status;
}

std::optional<TrackedOperation> OperationTracker::get_operation(const std::string& operation_id) {
    std::vector<TrackedOperation> events;
    std::optional<TrackedOperation> result;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweep_locked(events);

        auto it = operations_.find(operation_id);
        if (it != operations_.end()) {
            result = it->second.operation;
        }
    }

    notify(events);
    return result;
}

std::optional<CancellationToken> OperationTracker::token(const std::string& operation_id) {
    std::vector<TrackedOperation> events;
    std::optional<CancellationToken> result;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweep_locked(events);

        auto it = operations_.find(operation_id);
        if (it != operations_.end()) {
            result = it->second.cancel.token();
        }
    }

    notify(events);
    return result;
}

size_t OperationTracker::sweep() {
    std::vector<TrackedOperation> events;
    size_t timed_out = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweep_locked(events, &timed_out);
    }

    notify(events);
    return timed_out;
}

size_t OperationTracker::active_count() {
    std::vector<TrackedOperation> events;
    size_t active = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweep_locked(events);

        active = std::count_if(operations_.begin(), operations_.end(),
            [](const auto& item) {
                return item.second.operation.status == OperationStatus::Pending;
            });
    }

    notify(events);
    return active;
}

// ============================================================================
// Queued work
// ============================================================================

void OperationTracker::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (stopping_) {
            job.fail(std::make_exception_ptr(
                CancelledError("Operation tracker is shutting down: " + job.id)
            ));
            return;
        }

        // Insert before the first strictly lower priority; keeps ties FIFO
        auto position = std::find_if(queue_.begin(), queue_.end(),
            [&](const Job& queued) { return queued.priority < job.priority; });
        queue_.insert(position, std::move(job));
    }
    queue_cv_.notify_one();
}

size_t OperationTracker::queued_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

void OperationTracker::dispatch_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });

            if (stopping_) {
                for (auto& abandoned : queue_) {
                    abandoned.fail(std::make_exception_ptr(
                        CancelledError("Operation tracker is shutting down: " + abandoned.id)
                    ));
                }
                queue_.clear();
                return;
            }

            job = std::move(queue_.front());
            queue_.pop_front();
        }

        run_job(job);

        // Drop orphans whose work has finished by now
        orphans_.erase(
            std::remove_if(orphans_.begin(), orphans_.end(),
                [](std::future<void>& orphan) {
                    return orphan.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                }),
            orphans_.end());
    }
}

void OperationTracker::run_job(Job& job) {
    CancellationSource cancel;
    std::future<void> running = job.start(cancel.token());

    if (running.wait_for(job.timeout) == std::future_status::ready) {
        running.get();
        return;
    }

    job.fail(std::make_exception_ptr(
        TimeoutError("Operation timed out after " + std::to_string(job.timeout.count()) + "ms")
    ));
    cancel.cancel();
    orphans_.push_back(std::move(running));

    if (config_.verbose) {
        std::cerr << "Queue operation " << job.id << " timed out after "
                  << job.timeout.count() << "ms" << std::endl;
    }
}

// ============================================================================
// Statistics / lifecycle
// ============================================================================

json OperationTracker::get_statistics() {
    std::vector<TrackedOperation> events;
    json stats;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sweep_locked(events);

        size_t pending = 0;
        size_t completed = 0;
        size_t cancelled = 0;
        size_t failed = 0;
        for (const auto& [id, record] : operations_) {
            switch (record.operation.status) {
                case OperationStatus::Pending: ++pending; break;
                case OperationStatus::Completed: ++completed; break;
                case OperationStatus::Cancelled: ++cancelled; break;
                case OperationStatus::Failed: ++failed; break;
            }
        }

        stats["active_operations"] = pending;
        stats["tracked_operations"] = operations_.size();
        stats["completed"] = completed;
        stats["cancelled"] = cancelled;
        stats["failed"] = failed;
        stats["race_conditions"] = race_conditions_;
    }

    stats["queued_operations"] = queued_count();

    notify(events);
    return stats;
}

void OperationTracker::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, record] : operations_) {
            record.cancel.cancel();
        }
        operations_.clear();
        race_conditions_ = 0;
    }

    std::deque<Job> abandoned;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        abandoned.swap(queue_);
    }
    for (auto& job : abandoned) {
        job.fail(std::make_exception_ptr(CancelledError("Operation reset: " + job.id)));
    }
}

void OperationTracker::set_race_condition_handler(RaceConditionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    race_handler_ = std::move(handler);
}

} // namespace gv
