#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace lolite::platform {

// Task queue driving the engine's run loop and the host-side frame
// dispatcher. Tasks run one at a time in due-time order, ties in posting
// order; quit() takes effect at the next task boundary.
class EventLoop {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post_task(Task task);
    void post_delayed_task(Task task, std::chrono::milliseconds delay);

    // Blocks until quit(). A quit() issued before run() is honoured, so
    // callers arm the loop with reset() before handing it to another thread.
    void run();

    void quit();

    // Drops queued tasks and clears a previous quit().
    void reset();

    bool quit_requested() const;
    size_t pending_count() const;

private:
    struct Entry {
        TimePoint run_at;
        uint64_t sequence;
        Task task;
        bool operator>(const Entry& other) const {
            if (run_at != other.run_at) return run_at > other.run_at;
            return sequence > other.sequence;
        }
    };
    using Queue = std::priority_queue<Entry, std::vector<Entry>, std::greater<>>;

    // Both expect mutex_ to be held.
    Task pop_front();
    std::optional<Task> next_task(std::unique_lock<std::mutex>& lock);

    Queue queue_;
    uint64_t next_sequence_ = 0;
    bool quit_requested_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace lolite::platform
