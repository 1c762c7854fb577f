/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEFERRED_TASK_QUEUE_HPP
#define DEFERRED_TASK_QUEUE_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

namespace HordeEngine {

using TaskHandle = uint64_t;
constexpr TaskHandle INVALID_TASK_HANDLE = 0;

/**
 * @brief Simulation-clock driven one-shot and repeating callbacks
 *
 * Time only moves when the host calls advance(), so delayed combat effects
 * and staged activation follow the fixed-step simulation rather than the
 * wall clock. Callbacks run on the thread that calls advance() and may
 * schedule or cancel other tasks (including themselves).
 *
 * Cancellation is lazy: the entry stays in the heap and is discarded when it
 * comes due.
 */
class DeferredTaskQueue {
public:
    using Task = std::function<void()>;

    DeferredTaskQueue() = default;
    ~DeferredTaskQueue() = default;

    DeferredTaskQueue(const DeferredTaskQueue&) = delete;
    DeferredTaskQueue& operator=(const DeferredTaskQueue&) = delete;

    /**
     * @brief Run a task once after delaySeconds of simulated time
     * @return Handle usable with cancel(); never INVALID_TASK_HANDLE
     */
    TaskHandle scheduleOnce(double delaySeconds, Task task);

    /**
     * @brief Run a task every intervalSeconds until cancelled
     * @throws std::invalid_argument if intervalSeconds <= 0
     */
    TaskHandle scheduleRepeating(double intervalSeconds, Task task);

    /**
     * @brief Cancel a pending task
     * @return true if the task was still pending
     */
    bool cancel(TaskHandle handle);

    bool isPending(TaskHandle handle) const;

    /**
     * @brief Advance the clock and fire every task that comes due
     *
     * Tasks fire in due-time order (ties in scheduling order). A repeating
     * task whose interval is shorter than deltaSeconds fires once per
     * elapsed interval.
     */
    void advance(double deltaSeconds);

    double now() const { return m_now; }
    size_t pendingCount() const { return m_live.size(); }

    // Drop every pending task without firing it
    void clear();

private:
    struct ScheduledTask {
        double dueTime{0.0};
        uint64_t sequence{0};
        TaskHandle handle{INVALID_TASK_HANDLE};
        double interval{0.0}; // 0 for one-shot tasks
        Task task;

        // Min-heap ordering for std::priority_queue
        bool operator<(const ScheduledTask& other) const {
            if (dueTime != other.dueTime) {
                return dueTime > other.dueTime;
            }
            return sequence > other.sequence;
        }
    };

    TaskHandle push(double delaySeconds, double interval, Task task);

    std::priority_queue<ScheduledTask, std::vector<ScheduledTask>> m_queue;
    std::unordered_set<TaskHandle> m_live;
    double m_now{0.0};
    uint64_t m_nextSequence{0};
    TaskHandle m_nextHandle{1};
};

} // namespace HordeEngine

#endif // DEFERRED_TASK_QUEUE_HPP
