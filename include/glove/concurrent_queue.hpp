#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>
using namespace std;

namespace glove {

// Blocking FIFO shared by the training driver and its workers.
// push() blocks while the queue holds max_size items (-1 means unbounded).
template <typename T>
class Queue
{
public:
    Queue() : max_size_(-1) {}
    Queue(const Queue&) = delete;
    Queue& operator=(const Queue&) = delete;

    T pop()
    {
        unique_lock<mutex> mlock(mutex_);
        not_empty_.wait(mlock, [this]() { return !queue_.empty(); });
        T val = std::move(queue_.front());
        queue_.pop();
        mlock.unlock();
        not_full_.notify_one();
        return val;
    }

    size_t push(T item)
    {
        unique_lock<mutex> mlock(mutex_);
        not_full_.wait(mlock, [this]() {
            return max_size_ == -1 || (int)queue_.size() < max_size_;
        });
        queue_.push(std::move(item));
        size_t size = queue_.size();
        mlock.unlock();
        not_empty_.notify_one();
        return size;
    }

    void set_max_size(int max_size)
    {
        lock_guard<mutex> mlock(mutex_);
        max_size_ = max_size;
    }

    size_t get_size()
    {
        lock_guard<mutex> mlock(mutex_);
        return queue_.size();
    }

private:
    queue<T> queue_;
    mutex mutex_;
    condition_variable not_empty_, not_full_;
    int max_size_;
};

}
