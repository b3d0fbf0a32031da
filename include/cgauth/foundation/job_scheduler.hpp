#pragma once

/// @file job_scheduler.hpp
/// @brief JobScheduler wrapping kcenon thread_system for off-request work.

#include "cgauth/foundation/auth_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace cgauth::foundation {

/// Fire-and-forget job runner used for work that must stay off the
/// request path, such as background password breach checks.
///
/// Uses PIMPL so thread_system headers stay out of the public API.
///
/// Example:
/// @code
///   JobScheduler scheduler(2);
///   auto id = scheduler.schedule("breach_check", [] { check(); });
///   scheduler.drain(std::chrono::seconds(5));
/// @endcode
class JobScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;

    explicit JobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    /// Stops the pool after running jobs finish.
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;
    JobScheduler(JobScheduler&&) noexcept;
    JobScheduler& operator=(JobScheduler&&) noexcept;

    /// Enqueue @p job under a descriptive @p name used in logs.
    AuthResult<JobId> schedule(std::string name, JobFunc job);

    /// Block until the job completes. A job that already completed and
    /// was forgotten counts as success.
    AuthResult<void> wait(JobId id);

    /// Block until no job is in flight or @p timeout elapses.
    /// @return true if the queue drained in time.
    bool drain(std::chrono::milliseconds timeout);

    /// Number of jobs scheduled but not yet finished.
    [[nodiscard]] std::size_t inFlight() const;

    /// Stop accepting jobs and wait for running ones. Idempotent.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace cgauth::foundation
