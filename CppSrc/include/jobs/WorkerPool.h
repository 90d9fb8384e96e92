#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace vera::jobs {

/**
 * @brief Fixed set of worker threads running one task per job id.
 *
 * Tasks for distinct ids run concurrently; a given id is queued or running at
 * most once. The destructor drains the queue and joins the workers.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queues a task for a job.
     * @throw core::JobStateError if the id is already queued or running.
     * @throw std::logic_error after shutdown().
     */
    void submit(const std::string& jobId, std::function<void()> task);

    /** @brief Ids queued or running. */
    std::vector<std::string> activeJobs() const;

    /** @brief Blocks until no task is queued or running. */
    void waitIdle();

    /** @brief Stops accepting tasks, finishes queued ones and joins. */
    void shutdown();

    size_t size() const { return m_threads.size(); }

private:
    struct Task {
        std::string jobId;
        std::function<void()> run;
    };

    void workerLoop();

    std::vector<std::thread> m_threads;
    std::deque<Task> m_queue;
    std::set<std::string> m_active;
    mutable std::mutex m_mutex;
    std::condition_variable m_taskAvailable;
    std::condition_variable m_idle;
    bool m_stopping = false;
};

} // namespace vera::jobs
