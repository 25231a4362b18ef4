/// @file worker.hpp
/// @brief Single-worker execution contexts for tick_physics

#pragma once

#include "fwd.hpp"

#include <tickspace/core/error.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace tick_physics {

// =============================================================================
// IWorker
// =============================================================================

/// An execution context that runs submitted jobs one at a time, in
/// submission order.
class IWorker {
public:
    using Job = std::function<void()>;

    virtual ~IWorker() = default;

    /// Queue a job
    /// @return WorkerError::stopped once the worker has been shut down
    [[nodiscard]] virtual tick_core::Result<void> submit(Job job) = 0;

    /// Block until every job submitted so far has finished
    virtual void wait_idle() = 0;

    /// Finish queued jobs and stop accepting new ones. Idempotent.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Jobs run to completion so far
    [[nodiscard]] virtual std::uint64_t jobs_completed() const = 0;
};

// =============================================================================
// ThreadWorker
// =============================================================================

/// Worker backed by one long-lived thread draining a job queue
class ThreadWorker : public IWorker {
public:
    explicit ThreadWorker(std::string name = "physics");
    ~ThreadWorker() override;

    ThreadWorker(const ThreadWorker&) = delete;
    ThreadWorker& operator=(const ThreadWorker&) = delete;

    [[nodiscard]] tick_core::Result<void> submit(Job job) override;
    void wait_idle() override;
    void shutdown() override;

    [[nodiscard]] bool is_running() const override { return m_running.load(); }
    [[nodiscard]] std::string name() const override { return m_name; }
    [[nodiscard]] std::uint64_t jobs_completed() const override { return m_completed.load(); }

    /// Jobs that threw
    [[nodiscard]] std::uint64_t jobs_failed() const { return m_failed.load(); }

private:
    void run();

    std::string m_name;
    std::deque<Job> m_jobs;
    mutable std::mutex m_mutex;
    std::condition_variable m_job_cv;
    std::condition_variable m_idle_cv;
    std::atomic<bool> m_running{true};
    bool m_busy = false;
    std::atomic<std::uint64_t> m_completed{0};
    std::atomic<std::uint64_t> m_failed{0};
    std::thread m_thread;
};

// =============================================================================
// InlineWorker
// =============================================================================

/// Worker that runs each job immediately on the submitting thread.
/// Deterministic; used by single-threaded hosts and tests.
class InlineWorker : public IWorker {
public:
    explicit InlineWorker(std::string name = "inline") : m_name(std::move(name)) {}

    [[nodiscard]] tick_core::Result<void> submit(Job job) override;
    void wait_idle() override {}
    void shutdown() override { m_running = false; }

    [[nodiscard]] bool is_running() const override { return m_running; }
    [[nodiscard]] std::string name() const override { return m_name; }
    [[nodiscard]] std::uint64_t jobs_completed() const override { return m_completed; }

private:
    std::string m_name;
    bool m_running = true;
    std::uint64_t m_completed = 0;
};

} // namespace tick_physics
