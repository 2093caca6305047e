#include "core/JobSystem.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <utility>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace Forge {

namespace {

thread_local bool t_onWorker = false;

} // namespace

// ============================================================================
// JobCounter
// ============================================================================

void JobCounter::Increment(uint32_t n) {
    std::lock_guard lock(m_mutex);
    m_count += n;
}

void JobCounter::Decrement() {
    std::lock_guard lock(m_mutex);
    if (m_count > 0 && --m_count == 0) {
        m_cv.notify_all();
    }
}

void JobCounter::Fail(std::exception_ptr error) {
    std::lock_guard lock(m_mutex);
    if (!m_error) {
        m_error = std::move(error);
    }
}

bool JobCounter::IsComplete() const {
    std::lock_guard lock(m_mutex);
    return m_count == 0;
}

void JobCounter::Wait() {
    std::unique_lock lock(m_mutex);
    m_cv.wait(lock, [this] { return m_count == 0; });

    if (m_error) {
        std::rethrow_exception(std::exchange(m_error, nullptr));
    }
}

// ============================================================================
// JobSystem
// ============================================================================

JobSystem::~JobSystem() {
    Shutdown();
}

bool JobSystem::Initialize(const JobSystemConfig& config) {
    if (m_initialized) {
        FORGE_LOG_WARN("JobSystem already initialized");
        return true;
    }

    const uint32_t hardwareThreads = std::thread::hardware_concurrency();
    m_workerCount = config.workerThreads > 0
        ? config.workerThreads
        : std::max(1u, hardwareThreads > 1 ? hardwareThreads - 1 : 1u);

    FORGE_LOG_INFO("Starting {} job workers", m_workerCount);

    {
        std::lock_guard lock(m_queueMutex);
        m_stopping = false;
    }

    m_workers.reserve(m_workerCount);
    for (uint32_t i = 0; i < m_workerCount; ++i) {
        m_workers.emplace_back(&JobSystem::WorkerLoop, this);

#if defined(__linux__)
        // Linux caps thread names at 15 characters
        std::string name = (config.threadNamePrefix + std::to_string(i)).substr(0, 15);
        pthread_setname_np(m_workers.back().native_handle(), name.c_str());
#endif
    }

    m_initialized = true;
    return true;
}

void JobSystem::Shutdown() {
    if (!m_initialized) {
        return;
    }

    FORGE_LOG_INFO("Stopping job workers");

    {
        std::lock_guard lock(m_queueMutex);
        m_stopping = true;
    }
    m_queueCondition.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    m_workers.clear();
    m_workerCount = 0;
    m_initialized = false;
}

void JobSystem::ParallelFor(size_t start, size_t end, size_t batchSize,
                            const std::function<void(size_t)>& func) {
    if (start >= end) {
        return;
    }

    batchSize = std::max<size_t>(1, batchSize);

    if (end - start <= batchSize || m_workerCount == 0 || t_onWorker) {
        for (size_t i = start; i < end; ++i) {
            func(i);
        }
        return;
    }

    JobCounter counter;
    for (size_t first = start; first < end; first += batchSize) {
        const size_t last = std::min(first + batchSize, end);
        Enqueue([first, last, &func]() {
            for (size_t i = first; i < last; ++i) {
                func(i);
            }
        }, counter);
    }

    counter.Wait();
}

void JobSystem::ParallelFor(size_t count, const std::function<void(size_t)>& func) {
    const size_t batches = static_cast<size_t>(std::max(1u, m_workerCount)) * 4;
    ParallelFor(0, count, std::max<size_t>(1, count / batches), func);
}

void JobSystem::Enqueue(std::function<void()> work, JobCounter& counter) {
    counter.Increment();
    {
        std::lock_guard lock(m_queueMutex);
        m_queue.push_back(QueuedJob{std::move(work), &counter});
    }
    m_queueCondition.notify_one();
}

void JobSystem::WorkerLoop() {
    t_onWorker = true;

    while (true) {
        QueuedJob job;
        {
            std::unique_lock lock(m_queueMutex);
            m_queueCondition.wait(lock, [this] {
                return !m_queue.empty() || m_stopping;
            });

            if (m_queue.empty()) {
                break;
            }

            job = std::move(m_queue.front());
            m_queue.pop_front();
        }

        Run(job);
    }

    t_onWorker = false;
}

void JobSystem::Run(QueuedJob& job) {
    try {
        job.work();
    } catch (const std::exception& e) {
        FORGE_LOG_ERROR("Job failed: {}", e.what());
        job.counter->Fail(std::current_exception());
    } catch (...) {
        FORGE_LOG_ERROR("Job failed with a non-standard exception");
        job.counter->Fail(std::current_exception());
    }

    // Last access to the counter; the waiting thread may destroy it afterwards
    job.counter->Decrement();
}

} // namespace Forge
