#include "detection_store.hpp"
#include "utils.hpp"
#include <mutex>

using namespace std;

string DetectionStore::beginSession()
{
    unique_lock<shared_mutex> lock(mutex_);

    auto now = chrono::system_clock::now();
    string id = timefmt::toCompactId(now) + "_" + to_string(++session_counter_);

    SessionData data;
    data.started_at = now;
    sessions_[id] = move(data);
    current_ = id;
    return id;
}

string DetectionStore::currentSession()
{
    {
        shared_lock<shared_mutex> lock(mutex_);
        if (!current_.empty())
            return current_;
    }
    return beginSession();
}

uint64_t DetectionStore::nextSequence(const string &session_id)
{
    unique_lock<shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        return 0;
    return ++it->second.last_sequence;
}

void DetectionStore::append(const string &session_id, const vector<Detection> &detections)
{
    unique_lock<shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
    {
        lock.unlock();
        log_debug("Dropping " + log_string(detections.size()) + " detections for unknown session " + session_id);
        return;
    }

    it->second.frames_processed++;
    it->second.detections.insert(it->second.detections.end(), detections.begin(), detections.end());
}

vector<Detection> DetectionStore::snapshot(const string &session_id) const
{
    shared_lock<shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        return {};
    return it->second.detections;
}

vector<Detection> DetectionStore::recent(const string &session_id, size_t limit) const
{
    shared_lock<shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        return {};

    const auto &all = it->second.detections;
    size_t count = min(limit, all.size());
    return vector<Detection>(all.end() - count, all.end());
}

size_t DetectionStore::size(const string &session_id) const
{
    shared_lock<shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? 0 : it->second.detections.size();
}

void DetectionStore::clear(const string &session_id)
{
    size_t dropped = 0;
    {
        unique_lock<shared_mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end())
            return;
        dropped = it->second.detections.size();
        it->second.detections.clear();
        it->second.detections.shrink_to_fit();
    }
    log_info("Cleared " + log_string(dropped) + " detections from session " + session_id);
}

DetectionSummary DetectionStore::summarize(const string &session_id) const
{
    // Aggregate outside the lock, the copy is the consistent view
    return DetectionSummary::fromDetections(snapshot(session_id));
}

bool DetectionStore::sessionInfo(const string &session_id, InspectionSession &info) const
{
    shared_lock<shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end())
        return false;

    info.id = session_id;
    info.started_at = it->second.started_at;
    info.frames_processed = it->second.frames_processed;
    info.detection_count = it->second.detections.size();
    return true;
}
