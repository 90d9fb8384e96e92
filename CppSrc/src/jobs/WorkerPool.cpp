#include "../../include/jobs/WorkerPool.h"
#include "../../include/core/Errors.h"
#include <iostream>
#include <stdexcept>

namespace vera::jobs {

WorkerPool::WorkerPool(size_t workers) {
    if (workers == 0) workers = 1;
    m_threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        m_threads.emplace_back([this] { workerLoop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(const std::string& jobId, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            throw std::logic_error("WorkerPool is shut down");
        }
        if (!m_active.insert(jobId).second) {
            throw core::JobStateError("Job " + jobId + " is already queued or running");
        }
        m_queue.push_back({jobId, std::move(task)});
    }
    m_taskAvailable.notify_one();
}

std::vector<std::string> WorkerPool::activeJobs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_active.begin(), m_active.end()};
}

void WorkerPool::waitIdle() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle.wait(lock, [this] { return m_active.empty(); });
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping && m_threads.empty()) return;
        m_stopping = true;
    }
    m_taskAvailable.notify_all();
    for (auto& t : m_threads) {
        if (t.joinable()) t.join();
    }
    m_threads.clear();
}

void WorkerPool::workerLoop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_taskAvailable.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) return;
            task = std::move(m_queue.front());
            m_queue.pop_front();
        }

        try {
            task.run();
        } catch (const std::exception& e) {
            std::cerr << "[Orchestrator] Task for job " << task.jobId << " failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "[Orchestrator] Task for job " << task.jobId << " failed: unknown error" << std::endl;
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_active.erase(task.jobId);
            if (m_active.empty()) m_idle.notify_all();
        }
    }
}

} // namespace vera::jobs
