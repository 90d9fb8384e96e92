#pragma once

#include "Job.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sqlite3.h>

namespace vera::jobs {

/**
 * @brief Durable job records in one SQLite database.
 *
 * All operations share a single connection behind a mutex. Every write is a
 * read-modify-write inside BEGIN IMMEDIATE ... COMMIT, so a committed stage is
 * visible in full or not at all. Failures raise core::StoreError after the
 * transaction has been rolled back.
 */
class JobStore {
public:
    /** @param path Database file, or ":memory:". */
    explicit JobStore(const std::string& path);
    virtual ~JobStore();

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    /** @throw core::StoreError if the id already exists. */
    void create(const Job& job);

    std::optional<Job> find(const std::string& id) const;

    /** @throw core::StoreError if the job does not exist. */
    Job get(const std::string& id) const;

    std::vector<std::string> listIds() const;

    /**
     * @brief Applies mutate to the stored job in one transaction.
     *
     * A status change must be a legal transition, progress of a processing
     * job may not go down, and completed or failed records are frozen.
     *
     * @return The job as committed.
     * @throw core::JobStateError on an illegal change (nothing is written).
     * @throw core::StoreError if the job is missing or SQLite fails.
     */
    virtual Job update(const std::string& id, const std::function<void(Job&)>& mutate);

    /**
     * @brief Atomically moves a pending job to processing.
     * @throw core::JobStateError if the job is not pending.
     */
    Job claim(const std::string& id, const std::string& startedAt);

private:
    void initialize();
    std::optional<Job> load(const std::string& id) const;
    void write(const Job& job, bool insert);

    sqlite3* m_db = nullptr;
    mutable std::mutex m_mutex;
};

} // namespace vera::jobs
