/// @file worker.cpp
/// @brief ThreadWorker and InlineWorker implementations

#include <tickspace/physics/worker.hpp>
#include <tickspace/core/log.hpp>

namespace tick_physics {

// =============================================================================
// ThreadWorker
// =============================================================================

ThreadWorker::ThreadWorker(std::string name)
    : m_name(std::move(name))
{
    m_thread = std::thread([this]() { run(); });
    tick_core::physics_logger()->debug("Worker '{}' started", m_name);
}

ThreadWorker::~ThreadWorker() {
    shutdown();
}

tick_core::Result<void> ThreadWorker::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.load()) {
            return tick_core::Err(tick_core::WorkerError::stopped(m_name));
        }
        m_jobs.push_back(std::move(job));
    }
    m_job_cv.notify_one();
    return tick_core::Ok();
}

void ThreadWorker::wait_idle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle_cv.wait(lock, [this]() {
        return m_jobs.empty() && !m_busy;
    });
}

void ThreadWorker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_running.load()) {
            return;
        }
        m_running.store(false);
    }
    m_job_cv.notify_all();

    if (m_thread.joinable()) {
        m_thread.join();
    }
    tick_core::physics_logger()->debug("Worker '{}' stopped after {} jobs",
        m_name, m_completed.load());
}

void ThreadWorker::run() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_job_cv.wait(lock, [this]() {
                return !m_jobs.empty() || !m_running.load();
            });

            // Drain what is queued before honoring shutdown
            if (m_jobs.empty()) {
                break;
            }
            job = std::move(m_jobs.front());
            m_jobs.pop_front();
            m_busy = true;
        }

        try {
            job();
        } catch (const std::exception& e) {
            m_failed.fetch_add(1);
            tick_core::physics_logger()->error("Job on worker '{}' threw: {}", m_name, e.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_busy = false;
            m_completed.fetch_add(1);
        }
        m_idle_cv.notify_all();
    }

    m_idle_cv.notify_all();
}

// =============================================================================
// InlineWorker
// =============================================================================

tick_core::Result<void> InlineWorker::submit(Job job) {
    if (!m_running) {
        return tick_core::Err(tick_core::WorkerError::stopped(m_name));
    }
    job();
    ++m_completed;
    return tick_core::Ok();
}

} // namespace tick_physics
