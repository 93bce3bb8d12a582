#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// Lifecycle state of a download as reported by the server.
// Only non-terminal states are ever held in the live projection.
enum class DownloadStatus {
    Starting,
    Running,
    Completed,
    Failed,
    Cancelled
};

// Numeric fields that progress frames refresh independently of identity.
struct DownloadMetrics {
    uint64_t bytesDownloaded   = 0;
    double   durationSecs      = 0.0;
    uint64_t speedBytesPerSec  = 0;
    uint32_t segmentsCompleted = 0;
    double   mediaDurationSecs = 0.0;
    double   playbackRatio     = 0.0;   // media seconds per wall-clock second

    bool operator==(const DownloadMetrics&) const = default;
};

// One tracked download
struct DownloadEntity {
    std::string id;          // download id, assigned by the server
    std::string ownerId;     // streamer id
    std::string sessionId;
    std::string engineType;  // "ffmpeg", "mesio", ...
    std::string downloadUrl;
    DownloadStatus status = DownloadStatus::Starting;
    DownloadMetrics metrics;
    std::chrono::system_clock::time_point startedAt{};

    bool operator==(const DownloadEntity&) const = default;
};

inline bool isTerminal(DownloadStatus s) {
    return s == DownloadStatus::Completed
        || s == DownloadStatus::Failed
        || s == DownloadStatus::Cancelled;
}

inline const char* toString(DownloadStatus s) {
    switch (s) {
        case DownloadStatus::Starting:  return "Starting";
        case DownloadStatus::Running:   return "Running";
        case DownloadStatus::Completed: return "Completed";
        case DownloadStatus::Failed:    return "Failed";
        case DownloadStatus::Cancelled: return "Cancelled";
    }
    return "Running";
}

// The server reports "Downloading" for an active transfer; anything it does not
// name explicitly is treated as an active download.
inline DownloadStatus parseDownloadStatus(std::string_view s) {
    if (s == "Starting" || s == "Pending" || s.empty()) return DownloadStatus::Starting;
    if (s == "Completed") return DownloadStatus::Completed;
    if (s == "Failed")    return DownloadStatus::Failed;
    if (s == "Cancelled") return DownloadStatus::Cancelled;
    return DownloadStatus::Running;
}

inline std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
    return std::chrono::system_clock::time_point{std::chrono::milliseconds{ms}};
}

inline int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}
