/// @file task_queue.hpp
/// @brief Off-thread work with completions dispatched on the control thread

#pragma once

#include "fwd.hpp"

#include <deque>
#include <functional>
#include <future>
#include <list>
#include <mutex>

namespace tonic_sound {

/// Runs work items either on worker threads or deferred to pump(), and
/// queues their completions so they only ever run inside pump().
class TaskQueue {
public:
    using Completion = std::function<void()>;
    using Work = std::function<Completion()>;

    enum class Mode {
        Threaded,  ///< Work runs via std::async
        Deferred   ///< Work runs on the control thread inside pump()
    };

    explicit TaskQueue(Mode mode = Mode::Threaded);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    [[nodiscard]] Mode mode() const { return m_mode; }

    /// Schedule work; the completion it returns (if any) is posted when it finishes
    void run_async(Work work);

    /// Queue a completion for the next pump()
    void post(Completion completion);

    /// Run deferred work, then dispatch every completion queued before the call.
    /// Returns the number of completions run.
    std::size_t pump();

    /// Pump until no work is in flight and nothing is queued
    void flush();

    /// Wait for in-flight workers, then drop everything queued
    void clear();

    [[nodiscard]] bool idle() const;

private:
    void reap_finished(bool wait);

    Mode m_mode;
    mutable std::mutex m_mutex;
    std::deque<Completion> m_completions;
    std::deque<Work> m_deferred;
    std::list<std::future<void>> m_inflight;
};

} // namespace tonic_sound
