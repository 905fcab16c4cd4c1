#ifndef GHOSTNET_STORE_WRITE_CHANNEL_HPP
#define GHOSTNET_STORE_WRITE_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>

namespace ghostnet {
namespace store {

// FIFO of pending database writes handed from producer threads to the store writer
class WriteChannel {
public:
    using Task = std::function<void()>;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    WriteChannel() = default;
    ~WriteChannel() = default;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds a task to the back of the queue; false once the channel is closed
    bool produce(Task task);
    // Waits up to `wait` for the next task and removes it from the queue
    bool consume(Task& task, std::chrono::milliseconds wait);
    // Marks a consumed task as finished
    void task_done();
    // Rejects further tasks and wakes waiting consumers
    void close();
    // Blocks until every produced task has been consumed and finished
    void wait_idle();


    // ---- QUERY METHODS ----
    bool empty() const;
    std::size_t size() const;
    bool closed() const;

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::condition_variable idle_;
    std::queue<Task> queue_;
    std::size_t in_flight_ = 0;
    bool closed_ = false;
};

} // namespace store
} // namespace ghostnet

#endif // GHOSTNET_STORE_WRITE_CHANNEL_HPP
