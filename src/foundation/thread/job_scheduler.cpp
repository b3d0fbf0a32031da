/// @file job_scheduler.cpp
/// @brief JobScheduler implementation on kcenon thread_system.

#include "cgauth/foundation/job_scheduler.hpp"
#include "cgauth/foundation/auth_logger.hpp"

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <future>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cgauth::foundation {

struct JobScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};
    std::atomic<bool> accepting{true};

    // Pending jobs only; a finished job removes its own entry.
    std::unordered_map<JobId, std::shared_future<void>> futures;
    std::size_t inFlight = 0;

    mutable std::mutex mutex;
    std::condition_variable idle;

    void finish(JobId id) {
        std::lock_guard lock(mutex);
        futures.erase(id);
        if (inFlight > 0) {
            --inFlight;
        }
        if (inFlight == 0) {
            idle.notify_all();
        }
    }
};

JobScheduler::JobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("cgauth_jobs");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    shutdown();
}

JobScheduler::JobScheduler(JobScheduler&&) noexcept = default;
JobScheduler& JobScheduler::operator=(JobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
AuthResult<JobScheduler::JobId> JobScheduler::schedule(std::string name,
                                                       JobFunc job) {
    if (!impl_ || !impl_->accepting.load(std::memory_order_acquire)) {
        return AuthResult<JobId>::err(
            AuthError(ErrorCode::JobScheduleFailed, "scheduler is shut down"));
    }

    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();
    Impl* impl = impl_.get();

    {
        std::lock_guard lock(impl->mutex);
        impl->futures[id] = future;
        ++impl->inFlight;
    }

    auto threadJob = kcenon::thread::job_builder()
        .name("cgauth_" + name + "_" + std::to_string(id))
        .work([fn = std::move(job), promise, impl, id, name]()
              -> kcenon::common::VoidResult {
            auto fail = [&](std::string_view what) {
                LogContext ctx;
                ctx.extra["job"] = name;
                AuthLogger::instance().logWithContext(
                    LogLevel::Error, LogCategory::Core,
                    "background job failed: " + std::string(what), ctx);
                promise->set_exception(std::current_exception());
            };
            try {
                fn();
                promise->set_value();
            } catch (const std::exception& e) {
                fail(e.what());
            } catch (...) {
                // Non-std throws still settle the promise and the in-flight count.
                fail("non-standard exception");
            }
            impl->finish(id);
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        impl->finish(id);
        return AuthResult<JobId>::err(
            AuthError(ErrorCode::JobScheduleFailed, "failed to enqueue job"));
    }
    return AuthResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// wait() / drain()
// ---------------------------------------------------------------------------
AuthResult<void> JobScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            if (id == 0 || id >= impl_->nextJobId.load(std::memory_order_relaxed)) {
                return AuthResult<void>::err(
                    AuthError(ErrorCode::JobNotFound, "job not found"));
            }
            return AuthResult<void>::ok();
        }
        future = it->second;
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ThreadError,
                      std::string("job execution failed: ") + e.what()));
    } catch (...) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::ThreadError, "job execution failed: non-standard exception"));
    }
    return AuthResult<void>::ok();
}

bool JobScheduler::drain(std::chrono::milliseconds timeout) {
    std::unique_lock lock(impl_->mutex);
    return impl_->idle.wait_for(lock, timeout,
                                [this] { return impl_->inFlight == 0; });
}

std::size_t JobScheduler::inFlight() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->inFlight;
}

void JobScheduler::shutdown() {
    if (!impl_ || !impl_->pool) {
        return;
    }
    if (impl_->accepting.exchange(false, std::memory_order_acq_rel)) {
        impl_->pool->stop(false);
    }
}

} // namespace cgauth::foundation
