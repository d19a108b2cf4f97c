#include "stream_subscriber.hpp"
#include <algorithm>

using namespace std;

StreamSubscriber::StreamSubscriber(uint64_t id, size_t capacity)
    : id_(id), capacity_(max<size_t>(1, capacity))
{
}

bool StreamSubscriber::push(MessagePtr message)
{
    {
        lock_guard<mutex> lock(mutex_);
        if (closed_)
            return false;

        while (queue_.size() >= capacity_)
        {
            queue_.pop_front();
            dropped_++;
        }
        queue_.push_back(move(message));
    }
    condition_.notify_one();
    return true;
}

bool StreamSubscriber::pop(MessagePtr &message, int timeout_ms)
{
    unique_lock<mutex> lock(mutex_);

    if (condition_.wait_for(lock, chrono::milliseconds(timeout_ms),
                            [this]
                            { return closed_ || !queue_.empty(); }))
    {
        if (closed_)
            return false;
        message = move(queue_.front());
        queue_.pop_front();
        return true;
    }
    return false;
}

void StreamSubscriber::close()
{
    {
        lock_guard<mutex> lock(mutex_);
        closed_ = true;
        queue_.clear();
    }
    condition_.notify_all();
}

size_t StreamSubscriber::size() const
{
    lock_guard<mutex> lock(mutex_);
    return queue_.size();
}
