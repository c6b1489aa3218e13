#include <lolite/platform/event_loop.h>

namespace lolite::platform {

EventLoop::EventLoop() = default;

EventLoop::~EventLoop() {
    quit();
}

void EventLoop::post_task(Task task) {
    post_delayed_task(std::move(task), std::chrono::milliseconds(0));
}

void EventLoop::post_delayed_task(Task task, std::chrono::milliseconds delay) {
    {
        std::lock_guard lock(mutex_);
        queue_.push(Entry{Clock::now() + delay, next_sequence_++, std::move(task)});
    }
    cv_.notify_one();
}

// priority_queue only exposes a const top(); the entry is popped right after.
EventLoop::Task EventLoop::pop_front() {
    Task task = std::move(const_cast<Entry&>(queue_.top()).task);
    queue_.pop();
    return task;
}

std::optional<EventLoop::Task> EventLoop::next_task(std::unique_lock<std::mutex>& lock) {
    while (!quit_requested_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }
        TimePoint due = queue_.top().run_at;
        if (due <= Clock::now()) {
            return pop_front();
        }
        cv_.wait_until(lock, due);
    }
    return std::nullopt;
}

void EventLoop::run() {
    std::unique_lock lock(mutex_);
    while (auto task = next_task(lock)) {
        lock.unlock();
        (*task)();
        lock.lock();
    }
}

void EventLoop::quit() {
    {
        std::lock_guard lock(mutex_);
        quit_requested_ = true;
    }
    cv_.notify_all();
}

void EventLoop::reset() {
    std::lock_guard lock(mutex_);
    queue_ = Queue();
    quit_requested_ = false;
}

bool EventLoop::quit_requested() const {
    std::lock_guard lock(mutex_);
    return quit_requested_;
}

size_t EventLoop::pending_count() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

} // namespace lolite::platform
