#pragma once
#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "detection_summary.hpp"
#include "postprocess/detection.hpp"

// Public view of one inspection session
struct InspectionSession
{
    std::string id;
    std::chrono::system_clock::time_point started_at;
    uint64_t frames_processed = 0;
    size_t detection_count = 0;
};

// In-memory detection history, one list per inspection session
//
// The capture loop is the only writer; HTTP handlers read concurrently.
// A batch (all detections of one frame) is appended under a single exclusive
// lock so readers only ever see whole frames. Readers get copies.
//
// Unknown session ids behave like empty sessions for reads, appends to them are dropped.
class DetectionStore
{
public:
    DetectionStore() = default;

    // Start a fresh, empty session and make it current; returns its id
    std::string beginSession();

    // Current session id, a session is created on first use
    std::string currentSession();

    // Next frame sequence number of a session, starting at 1
    uint64_t nextSequence(const std::string &session_id);

    // Append the detections of one fully processed frame (may be empty)
    void append(const std::string &session_id, const std::vector<Detection> &detections);

    std::vector<Detection> snapshot(const std::string &session_id) const;

    // Last limit detections in arrival order
    std::vector<Detection> recent(const std::string &session_id, size_t limit) const;

    size_t size(const std::string &session_id) const;

    // Discard the session history; the session itself and its sequence counter survive
    void clear(const std::string &session_id);

    DetectionSummary summarize(const std::string &session_id) const;

    bool sessionInfo(const std::string &session_id, InspectionSession &info) const;

private:
    struct SessionData
    {
        std::chrono::system_clock::time_point started_at;
        std::vector<Detection> detections;
        uint64_t last_sequence = 0;
        uint64_t frames_processed = 0;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SessionData> sessions_;
    std::string current_;
    unsigned session_counter_ = 0;
};
