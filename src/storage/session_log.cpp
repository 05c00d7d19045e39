#include "storage/session_log.hpp"
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace loopscribe {

namespace {

void execSql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

// Owns a prepared statement for the duration of one call.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }

    void bind(int i, std::int64_t v) { sqlite3_bind_int64(st_, i, v); }
    void bind(int i, int v) { sqlite3_bind_int(st_, i, v); }
    void bind(int i, double v) { sqlite3_bind_double(st_, i, v); }
    void bind(int i, const std::string& v) {
        sqlite3_bind_text(st_, i, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }

    void run(const char* what) {
        if (sqlite3_step(st_) != SQLITE_DONE) {
            throw std::runtime_error(std::string("Failed to ") + what + ": " + sqlite3_errmsg(db_));
        }
    }

private:
    sqlite3* db_;
    sqlite3_stmt* st_ = nullptr;
};

} // namespace

SessionLog::SessionLog(const std::string& dbPath) : dbPath_(dbPath) {
    std::filesystem::path p(dbPath);
    if (!p.parent_path().empty()) {
        std::filesystem::create_directories(p.parent_path());
    }
    if (sqlite3_open(dbPath.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open SQLite DB at " + dbPath + ": " + msg);
    }
    try {
        initSchema();
    } catch (const std::runtime_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SessionLog::~SessionLog() {
    if (db_) sqlite3_close(db_);
}

void SessionLog::initSchema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS sessions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        started_ms INTEGER NOT NULL,
        ended_ms INTEGER,
        backend TEXT,
        device TEXT,
        device_rate INTEGER,
        target_rate INTEGER
    );
    CREATE TABLE IF NOT EXISTS transcripts (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id INTEGER NOT NULL,
        ts_ms INTEGER NOT NULL,
        text TEXT NOT NULL,
        confidence REAL,
        processing_time REAL,
        volume REAL,
        FOREIGN KEY(session_id) REFERENCES sessions(id)
    );
    )SQL";
    execSql(db_, schema);
}

std::int64_t SessionLog::nowMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::int64_t SessionLog::startSession(const SessionInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "INSERT INTO sessions (started_ms, backend, device, device_rate, target_rate) "
                      "VALUES (?, ?, ?, ?, ?);");
    st.bind(1, nowMs());
    st.bind(2, info.backend);
    st.bind(3, info.device);
    st.bind(4, info.deviceSampleRate);
    st.bind(5, info.targetSampleRate);
    st.run("insert session");
    return sqlite3_last_insert_rowid(db_);
}

void SessionLog::endSession(std::int64_t sessionId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "UPDATE sessions SET ended_ms=? WHERE id=?;");
    st.bind(1, nowMs());
    st.bind(2, sessionId);
    st.run("end session");
}

void SessionLog::logTranscript(std::int64_t sessionId, const TranscriptRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "INSERT INTO transcripts (session_id, ts_ms, text, confidence, processing_time, volume) "
                      "VALUES (?, ?, ?, ?, ?, ?);");
    st.bind(1, sessionId);
    st.bind(2, nowMs());
    st.bind(3, record.text);
    st.bind(4, record.confidence);
    st.bind(5, record.processingTime);
    st.bind(6, record.volume);
    st.run("insert transcript");
}

std::int64_t SessionLog::transcriptCount(std::int64_t sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "SELECT COUNT(*) FROM transcripts WHERE session_id=?;");
    st.bind(1, sessionId);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("Failed to count transcripts: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_column_int64(st.get(), 0);
}

bool SessionLog::sessionEnded(std::int64_t sessionId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement st(db_, "SELECT ended_ms FROM sessions WHERE id=?;");
    st.bind(1, sessionId);
    if (sqlite3_step(st.get()) != SQLITE_ROW) {
        return false;
    }
    return sqlite3_column_type(st.get(), 0) != SQLITE_NULL;
}

} // namespace loopscribe
