#pragma once
#include "asr/transcription_sink.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>

namespace loopscribe {

// Capture history in SQLite.
// Schema:
//  - sessions(id INTEGER PK, started_ms, ended_ms, backend, device, device_rate, target_rate)
//  - transcripts(id INTEGER PK, session_id, ts_ms, text, confidence, processing_time, volume)
//
// Times are wall-clock milliseconds since the epoch. Calls are serialized
// internally; transcripts arrive on the pipeline worker while sessions are
// opened and closed from the main thread.
class SessionLog {
public:
    struct SessionInfo {
        std::string backend;
        std::string device;
        int deviceSampleRate{0};
        int targetSampleRate{0};
    };

    explicit SessionLog(const std::string& dbPath);
    ~SessionLog();

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    std::int64_t startSession(const SessionInfo& info);
    void endSession(std::int64_t sessionId);
    void logTranscript(std::int64_t sessionId, const TranscriptRecord& record);

    std::int64_t transcriptCount(std::int64_t sessionId) const;
    bool sessionEnded(std::int64_t sessionId) const;

    const std::string& path() const { return dbPath_; }

private:
    void initSchema();
    static std::int64_t nowMs();

    std::string dbPath_;
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
};

} // namespace loopscribe
