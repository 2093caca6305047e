#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Forge {

/**
 * @brief Configuration for the job system, read from "jobs.*" settings
 */
struct JobSystemConfig {
    uint32_t workerThreads = 0;  // 0 = auto (hardware_concurrency - 1)
    std::string threadNamePrefix = "Forge_Worker_";
};

/**
 * @brief Outstanding work of one batch of jobs
 *
 * The count and the first failure share one mutex, and the waiter is woken
 * while that mutex is held. The counter can be destroyed as soon as Wait()
 * returns.
 */
class JobCounter {
public:
    explicit JobCounter(uint32_t count = 0)
        : m_count(count) {}

    JobCounter(const JobCounter&) = delete;
    JobCounter& operator=(const JobCounter&) = delete;

    void Increment(uint32_t n = 1);
    void Decrement();

    /**
     * @brief Record a job failure; only the first one is kept
     */
    void Fail(std::exception_ptr error);

    [[nodiscard]] bool IsComplete() const;

    /**
     * @brief Block until the count reaches zero
     * @throws The first exception recorded with Fail()
     */
    void Wait();

private:
    uint32_t m_count;
    std::exception_ptr m_error;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
};

/**
 * @brief Worker pool used to build per-character data in parallel
 *
 * Jobs never share mutable state with each other; callers partition the
 * output up front and each job writes only its own slots.
 */
class JobSystem {
public:
    static JobSystem& Instance() {
        static JobSystem instance;
        return instance;
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    /**
     * @brief Start the worker threads
     * @return true on success (also when already running)
     */
    bool Initialize(const JobSystemConfig& config = {});

    /**
     * @brief Finish queued jobs and join all workers
     */
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const { return m_initialized; }
    [[nodiscard]] uint32_t GetWorkerCount() const { return m_workerCount; }

    /**
     * @brief Call func(i) for every i in [start, end), batchSize indices per job
     *
     * Runs inline when the system has no workers, the range fits in one batch,
     * or the caller is itself a worker. Every batch runs to completion before
     * the call returns, even when one of them throws.
     *
     * @throws The first exception thrown by func
     */
    void ParallelFor(size_t start, size_t end, size_t batchSize,
                     const std::function<void(size_t)>& func);

    /**
     * @brief ParallelFor over [0, count) with about four batches per worker
     */
    void ParallelFor(size_t count, const std::function<void(size_t)>& func);

private:
    JobSystem() = default;
    ~JobSystem();

    struct QueuedJob {
        std::function<void()> work;
        JobCounter* counter = nullptr;
    };

    void Enqueue(std::function<void()> work, JobCounter& counter);
    void WorkerLoop();
    static void Run(QueuedJob& job);

    std::vector<std::thread> m_workers;
    uint32_t m_workerCount = 0;

    std::deque<QueuedJob> m_queue;
    std::mutex m_queueMutex;
    std::condition_variable m_queueCondition;
    bool m_stopping = false;

    bool m_initialized = false;
};

} // namespace Forge
