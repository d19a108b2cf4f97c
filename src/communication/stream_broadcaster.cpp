#include "stream_broadcaster.hpp"
#include "utils.hpp"
#include <algorithm>

using namespace std;

StreamBroadcaster::StreamBroadcaster(size_t queue_depth, int jpeg_quality)
    : queue_depth_(max<size_t>(1, queue_depth)), jpeg_quality_(jpeg_quality)
{
}

shared_ptr<StreamSubscriber> StreamBroadcaster::subscribe()
{
    lock_guard<mutex> lock(mutex_);
    auto subscriber = make_shared<StreamSubscriber>(next_id_++, queue_depth_);
    subscribers_.push_back(subscriber);
    log_info("Stream subscriber " + log_string(subscriber->id()) + " connected, " +
             log_string(subscribers_.size()) + " active");
    return subscriber;
}

void StreamBroadcaster::unsubscribe(const shared_ptr<StreamSubscriber> &subscriber)
{
    if (!subscriber)
        return;

    subscriber->close();

    size_t remaining = 0;
    bool removed = false;
    {
        lock_guard<mutex> lock(mutex_);
        auto it = find(subscribers_.begin(), subscribers_.end(), subscriber);
        if (it != subscribers_.end())
        {
            subscribers_.erase(it);
            removed = true;
        }
        remaining = subscribers_.size();
    }

    if (removed)
    {
        log_info("Stream subscriber " + log_string(subscriber->id()) + " disconnected (" +
                 log_string(subscriber->dropped()) + " frames dropped), " + log_string(remaining) + " active");
    }
}

void StreamBroadcaster::publish(cv::Mat annotated,
                                vector<Detection> detections,
                                uint64_t sequence,
                                chrono::system_clock::time_point timestamp)
{
    publish(make_shared<const StreamMessage>(move(annotated), move(detections), sequence, timestamp, jpeg_quality_));
}

void StreamBroadcaster::publish(shared_ptr<const StreamMessage> message)
{
    vector<shared_ptr<StreamSubscriber>> targets;
    {
        lock_guard<mutex> lock(mutex_);
        targets = subscribers_;
    }

    for (auto &subscriber : targets)
        subscriber->push(message);

    published_++;
}

void StreamBroadcaster::closeAll()
{
    vector<shared_ptr<StreamSubscriber>> closing;
    {
        lock_guard<mutex> lock(mutex_);
        closing.swap(subscribers_);
    }

    for (auto &subscriber : closing)
        subscriber->close();

    if (!closing.empty())
        log_info("Closed " + log_string(closing.size()) + " stream subscribers");
}

size_t StreamBroadcaster::subscriberCount() const
{
    lock_guard<mutex> lock(mutex_);
    return subscribers_.size();
}
