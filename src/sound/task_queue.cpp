/// @file task_queue.cpp
/// @brief TaskQueue implementation

#include <tonic/sound/task_queue.hpp>
#include <tonic/sound/types.hpp>

#include <chrono>
#include <exception>

namespace tonic_sound {

TaskQueue::TaskQueue(Mode mode)
    : m_mode(mode) {}

TaskQueue::~TaskQueue() {
    clear();
}

void TaskQueue::run_async(Work work) {
    if (!work) return;

    if (m_mode == Mode::Deferred) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_deferred.push_back(std::move(work));
        return;
    }

    auto future = std::async(std::launch::async, [this, work = std::move(work)]() {
        Completion completion = work();
        if (completion) {
            post(std::move(completion));
        }
    });

    std::lock_guard<std::mutex> lock(m_mutex);
    m_inflight.push_back(std::move(future));
}

void TaskQueue::post(Completion completion) {
    if (!completion) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_completions.push_back(std::move(completion));
}

void TaskQueue::reap_finished(bool wait) {
    std::list<std::future<void>> done;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_inflight.begin(); it != m_inflight.end();) {
            if (wait || it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                done.splice(done.end(), m_inflight, it++);
            } else {
                ++it;
            }
        }
    }

    // get() outside the lock: the worker may still be posting its completion
    for (auto& f : done) {
        try {
            f.get();
        } catch (const std::exception& e) {
            sound_logger()->error("Background task failed: {}", e.what());
        }
    }
}

std::size_t TaskQueue::pump() {
    std::deque<Work> deferred;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        deferred.swap(m_deferred);
    }
    for (auto& work : deferred) {
        post(work());
    }

    reap_finished(false);

    std::deque<Completion> ready;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ready.swap(m_completions);
    }
    for (auto& completion : ready) {
        completion();
    }
    return ready.size();
}

void TaskQueue::flush() {
    while (!idle()) {
        reap_finished(true);
        pump();
    }
}

void TaskQueue::clear() {
    reap_finished(true);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_deferred.clear();
    m_completions.clear();
}

bool TaskQueue::idle() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_inflight.empty() && m_completions.empty() && m_deferred.empty();
}

} // namespace tonic_sound
