/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/DeferredTaskQueue.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace HordeEngine {

namespace {
// Absorbs float accumulation from fixed-step deltas (e.g. 30 * 1/60 != 0.5)
constexpr double DUE_TIME_EPSILON = 1e-9;
} // namespace

TaskHandle DeferredTaskQueue::scheduleOnce(double delaySeconds, Task task) {
    return push(std::max(delaySeconds, 0.0), 0.0, std::move(task));
}

TaskHandle DeferredTaskQueue::scheduleRepeating(double intervalSeconds, Task task) {
    if (intervalSeconds <= 0.0) {
        SCHEDULER_ERROR(std::format("Rejected repeating task with interval {}", intervalSeconds));
        throw std::invalid_argument("Repeating task interval must be positive");
    }
    return push(intervalSeconds, intervalSeconds, std::move(task));
}

TaskHandle DeferredTaskQueue::push(double delaySeconds, double interval, Task task) {
    ScheduledTask entry;
    entry.dueTime = m_now + delaySeconds;
    entry.sequence = m_nextSequence++;
    entry.handle = m_nextHandle++;
    entry.interval = interval;
    entry.task = std::move(task);

    TaskHandle handle = entry.handle;
    m_live.insert(handle);
    m_queue.push(std::move(entry));
    return handle;
}

bool DeferredTaskQueue::cancel(TaskHandle handle) {
    return m_live.erase(handle) > 0;
}

bool DeferredTaskQueue::isPending(TaskHandle handle) const {
    return m_live.find(handle) != m_live.end();
}

void DeferredTaskQueue::advance(double deltaSeconds) {
    const double target = m_now + std::max(deltaSeconds, 0.0);

    while (!m_queue.empty() && m_queue.top().dueTime <= target + DUE_TIME_EPSILON) {
        ScheduledTask entry = m_queue.top();
        m_queue.pop();

        // Cancelled entries are discarded here
        if (!isPending(entry.handle)) {
            continue;
        }

        m_now = std::max(m_now, entry.dueTime);

        if (entry.interval <= 0.0) {
            m_live.erase(entry.handle);
            entry.task();
            continue;
        }

        entry.task();

        // The task may have cancelled itself
        if (isPending(entry.handle)) {
            entry.dueTime += entry.interval;
            entry.sequence = m_nextSequence++;
            m_queue.push(std::move(entry));
        }
    }

    m_now = target;
}

void DeferredTaskQueue::clear() {
    if (!m_live.empty()) {
        SCHEDULER_DEBUG(std::format("Dropping {} pending tasks", m_live.size()));
    }
    m_live.clear();
    m_queue = {};
}

} // namespace HordeEngine
