#include "store/write_channel.hpp"
#include <boost/log/trivial.hpp>

namespace ghostnet {
namespace store {

bool WriteChannel::produce(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            BOOST_LOG_TRIVIAL(warning) << "Write channel: Rejected task, channel is closed";
            return false;
        }
        queue_.push(std::move(task));
        ++in_flight_;
        BOOST_LOG_TRIVIAL(trace) << "Write channel: Queued task. Channel size: " << queue_.size();
    }
    ready_.notify_one();
    return true;
}

bool WriteChannel::consume(Task& task, std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!ready_.wait_for(lock, wait, [this]() { return !queue_.empty() || closed_; })) {
        return false;
    }
    if (queue_.empty()) {
        return false;
    }

    task = std::move(queue_.front());
    queue_.pop();
    return true;
}

void WriteChannel::task_done() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ > 0 && --in_flight_ == 0) {
        idle_.notify_all();
    }
}

void WriteChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

void WriteChannel::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]() { return in_flight_ == 0; });
}

bool WriteChannel::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

std::size_t WriteChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool WriteChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace store
} // namespace ghostnet
