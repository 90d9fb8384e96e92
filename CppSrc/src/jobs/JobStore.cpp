#include "../../include/jobs/JobStore.h"
#include "../../include/core/Errors.h"
#include <iostream>

namespace vera::jobs {

namespace {

void exec_or_throw(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string message = err ? err : "Unknown sqlite error";
        sqlite3_free(err);
        throw core::StoreError(message);
    }
}

/** Owns a prepared statement. */
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : m_db(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw core::StoreError(sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        check(sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT));
    }
    void bind(int index, double value) {
        check(sqlite3_bind_double(m_stmt, index, value));
    }
    void bind(int index, const std::optional<std::string>& value) {
        if (value) bind(index, *value);
        else check(sqlite3_bind_null(m_stmt, index));
    }
    void bind(int index, const std::optional<double>& value) {
        if (value) bind(index, *value);
        else check(sqlite3_bind_null(m_stmt, index));
    }
    void bindJson(int index, const nlohmann::json& value) {
        if (value.is_null()) check(sqlite3_bind_null(m_stmt, index));
        // Invalid UTF-8 from a collaborator is stored with U+FFFD in its place
        else bind(index, value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    /** @return true while rows are available. */
    bool step() {
        const int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw core::StoreError(sqlite3_errmsg(m_db));
    }

    bool isNull(int col) const { return sqlite3_column_type(m_stmt, col) == SQLITE_NULL; }

    std::string text(int col) const {
        const unsigned char* value = sqlite3_column_text(m_stmt, col);
        return value ? reinterpret_cast<const char*>(value) : std::string();
    }
    std::optional<std::string> optionalText(int col) const {
        if (isNull(col)) return std::nullopt;
        return text(col);
    }
    double real(int col) const { return sqlite3_column_double(m_stmt, col); }
    std::optional<double> optionalReal(int col) const {
        if (isNull(col)) return std::nullopt;
        return real(col);
    }
    nlohmann::json json(int col) const {
        if (isNull(col)) return nullptr;
        return nlohmann::json::parse(text(col));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) throw core::StoreError(sqlite3_errmsg(m_db));
    }

    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;
};

/** BEGIN IMMEDIATE on construction, ROLLBACK unless committed. */
class Transaction {
public:
    explicit Transaction(sqlite3* db) : m_db(db) {
        exec_or_throw(m_db, "BEGIN IMMEDIATE;");
    }
    ~Transaction() {
        if (m_committed) return;
        char* err = nullptr;
        if (sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            std::cerr << "[JobStore] Rollback failed: " << (err ? err : "unknown error") << std::endl;
        }
        sqlite3_free(err);
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_or_throw(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3* m_db;
    bool m_committed = false;
};

constexpr const char* kColumns =
    "id, company_name, company_context, audio_path, chart_paths, status, progress, "
    "error_message, created_at, started_at, completed_at, overall_confidence, "
    "overall_sentiment, risk_level, transcript, audio_features, sentiment_analysis, "
    "chart_analysis, fusion_results, narrative";

} // namespace

JobStore::JobStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &m_db) != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw core::StoreError("Failed to open SQLite database at " + path + ": " + message);
    }
    try {
        initialize();
    } catch (const core::StoreError&) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
    std::cout << "[JobStore] Opened " << path << std::endl;
}

JobStore::~JobStore() {
    if (m_db) {
        sqlite3_close(m_db);
    }
}

void JobStore::initialize() {
    sqlite3_busy_timeout(m_db, 5000);
    const char* schema = R"SQL(
        PRAGMA journal_mode=WAL;

        CREATE TABLE IF NOT EXISTS jobs (
            id TEXT PRIMARY KEY,
            company_name TEXT NOT NULL,
            company_context TEXT,
            audio_path TEXT NOT NULL,
            chart_paths TEXT NOT NULL,
            status TEXT NOT NULL,
            progress REAL NOT NULL DEFAULT 0,
            error_message TEXT,
            created_at TEXT NOT NULL,
            started_at TEXT,
            completed_at TEXT,
            overall_confidence REAL,
            overall_sentiment TEXT,
            risk_level TEXT,
            transcript TEXT,
            audio_features TEXT,
            sentiment_analysis TEXT,
            chart_analysis TEXT,
            fusion_results TEXT,
            narrative TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_jobs_status ON jobs(status);
    )SQL";
    exec_or_throw(m_db, schema);
}

void JobStore::create(const Job& job) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Transaction tx(m_db);
    if (load(job.id)) {
        throw core::StoreError("Job already exists: " + job.id);
    }
    write(job, true);
    tx.commit();
}

std::optional<Job> JobStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return load(id);
}

Job JobStore::get(const std::string& id) const {
    auto job = find(id);
    if (!job) {
        throw core::StoreError("Job not found: " + id);
    }
    return *job;
}

std::vector<std::string> JobStore::listIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, "SELECT id FROM jobs ORDER BY created_at, id;");
    std::vector<std::string> ids;
    while (stmt.step()) {
        ids.push_back(stmt.text(0));
    }
    return ids;
}

Job JobStore::update(const std::string& id, const std::function<void(Job&)>& mutate) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Transaction tx(m_db);

    auto current = load(id);
    if (!current) {
        throw core::StoreError("Job not found: " + id);
    }

    if (isTerminal(current->status)) {
        throw core::JobStateError("Job " + id + " is " + toString(current->status) + " and can no longer change");
    }

    Job next = *current;
    mutate(next);
    next.id = current->id;

    if (next.status != current->status) {
        checkTransition(current->status, next.status);
    }
    if (current->status == JobStatus::Processing && next.progress < current->progress) {
        throw core::JobStateError("Progress of job " + id + " may not decrease");
    }

    write(next, false);
    tx.commit();
    return next;
}

Job JobStore::claim(const std::string& id, const std::string& startedAt) {
    return update(id, [&](Job& job) {
        if (job.status != JobStatus::Pending) {
            throw core::JobStateError("Job " + id + " cannot start: status is " + toString(job.status));
        }
        job.status = JobStatus::Processing;
        job.progress = 0.0;
        job.startedAt = startedAt;
    });
}

std::optional<Job> JobStore::load(const std::string& id) const {
    Statement stmt(m_db, std::string("SELECT ") + kColumns + " FROM jobs WHERE id = ?;");
    stmt.bind(1, id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    Job job;
    try {
        job.id = stmt.text(0);
        job.companyName = stmt.text(1);
        job.companyContext = stmt.text(2);
        job.audioPath = stmt.text(3);
        job.chartPaths = nlohmann::json::parse(stmt.text(4)).get<std::vector<std::string>>();
        job.status = jobStatusFromString(stmt.text(5));
        job.progress = stmt.real(6);
        job.errorMessage = stmt.optionalText(7);
        job.createdAt = stmt.text(8);
        job.startedAt = stmt.optionalText(9);
        job.completedAt = stmt.optionalText(10);
        job.overallConfidence = stmt.optionalReal(11);
        job.overallSentiment = stmt.optionalText(12);
        job.riskLevel = stmt.optionalText(13);
        job.transcript = stmt.json(14);
        job.audioFeatures = stmt.json(15);
        job.sentimentAnalysis = stmt.json(16);
        job.chartAnalysis = stmt.json(17);
        job.fusionResults = stmt.json(18);
        job.narrative = stmt.json(19);
    } catch (const nlohmann::json::exception& e) {
        throw core::StoreError("Corrupted record for job " + id + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw core::StoreError("Corrupted record for job " + id + ": " + e.what());
    }
    return job;
}

void JobStore::write(const Job& job, bool insert) {
    const std::string sql = insert
        ? std::string("INSERT INTO jobs (") + kColumns +
          ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19, ?20);"
        : "UPDATE jobs SET company_name = ?2, company_context = ?3, audio_path = ?4, chart_paths = ?5, "
          "status = ?6, progress = ?7, error_message = ?8, created_at = ?9, started_at = ?10, "
          "completed_at = ?11, overall_confidence = ?12, overall_sentiment = ?13, risk_level = ?14, "
          "transcript = ?15, audio_features = ?16, sentiment_analysis = ?17, chart_analysis = ?18, "
          "fusion_results = ?19, narrative = ?20 WHERE id = ?1;";

    Statement stmt(m_db, sql);
    stmt.bind(1, job.id);
    stmt.bind(2, job.companyName);
    stmt.bind(3, job.companyContext);
    stmt.bind(4, job.audioPath);
    stmt.bind(5, nlohmann::json(job.chartPaths).dump());
    stmt.bind(6, toString(job.status));
    stmt.bind(7, job.progress);
    stmt.bind(8, job.errorMessage);
    stmt.bind(9, job.createdAt);
    stmt.bind(10, job.startedAt);
    stmt.bind(11, job.completedAt);
    stmt.bind(12, job.overallConfidence);
    stmt.bind(13, job.overallSentiment);
    stmt.bind(14, job.riskLevel);
    stmt.bindJson(15, job.transcript);
    stmt.bindJson(16, job.audioFeatures);
    stmt.bindJson(17, job.sentimentAnalysis);
    stmt.bindJson(18, job.chartAnalysis);
    stmt.bindJson(19, job.fusionResults);
    stmt.bindJson(20, job.narrative);
    stmt.step();
}

} // namespace vera::jobs
