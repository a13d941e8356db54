#include "debouncer.h"

#include "path_resolver.h"
#include "pipeline.h"

#include <vector>

namespace imgopt::core {

ThreadDebounceTimer::ThreadDebounceTimer() : worker_([this]() { run(); }) {}

ThreadDebounceTimer::~ThreadDebounceTimer() {
    {
        std::scoped_lock lock(mutex_);
        stopping_ = true;
        armed_ = false;
        callback_ = nullptr;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ThreadDebounceTimer::arm(std::chrono::milliseconds delay, std::function<void()> callback) {
    {
        std::scoped_lock lock(mutex_);
        deadline_ = std::chrono::steady_clock::now() + delay;
        callback_ = std::move(callback);
        armed_ = true;
    }
    cv_.notify_all();
}

void ThreadDebounceTimer::cancel() {
    std::unique_lock lock(mutex_);
    armed_ = false;
    callback_ = nullptr;
    // wait out a callback that already started, unless we are that callback
    if (std::this_thread::get_id() != worker_.get_id()) {
        cv_.wait(lock, [this]() { return !running_; });
    }
}

void ThreadDebounceTimer::run() {
    std::unique_lock lock(mutex_);
    while (!stopping_) {
        if (!armed_) {
            cv_.wait(lock, [this]() { return armed_ || stopping_; });
            continue;
        }
        const auto deadline = deadline_;
        if (std::chrono::steady_clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }
        std::function<void()> callback = std::move(callback_);
        callback_ = nullptr;
        armed_ = false;
        running_ = true;
        lock.unlock();
        if (callback) {
            callback();
        }
        lock.lock();
        running_ = false;
        cv_.notify_all();
    }
}

void ManualDebounceTimer::arm(std::chrono::milliseconds delay, std::function<void()> callback) {
    deadline_ = now_ + delay;
    callback_ = std::move(callback);
    armed_ = true;
}

void ManualDebounceTimer::cancel() {
    armed_ = false;
    callback_ = nullptr;
}

void ManualDebounceTimer::advance(std::chrono::milliseconds elapsed) {
    now_ += elapsed;
    if (!armed_ || now_ < deadline_) {
        return;
    }
    std::function<void()> callback = std::move(callback_);
    callback_ = nullptr;
    armed_ = false;
    if (callback) {
        callback();
    }
}

ChangeDebouncer::ChangeDebouncer(Pipeline& pipeline, DebounceTimer& timer, std::chrono::milliseconds quiet_period)
    : pipeline_(pipeline), timer_(timer), quiet_period_(quiet_period) {}

ChangeDebouncer::~ChangeDebouncer() {
    timer_.cancel();
    std::scoped_lock drain(drain_mutex_);
}

bool ChangeDebouncer::notify(FileChangeKind kind, const std::string& relative_path, const std::string& absolute_path) {
    if (kind == FileChangeKind::Deleted || !is_supported_image(relative_path)) {
        return false;
    }
    pipeline_.log().info(std::string("File ") + (kind == FileChangeKind::Created ? "created" : "modified") + ": " +
                         relative_path);
    pipeline_.log().detail("Queued " + absolute_path);
    {
        std::scoped_lock lock(mutex_);
        pending_.insert(relative_path);
    }
    timer_.arm(quiet_period_, [this]() { flush(); });
    return true;
}

size_t ChangeDebouncer::flush() {
    std::scoped_lock drain(drain_mutex_);
    std::set<std::string> batch;
    {
        std::scoped_lock lock(mutex_);
        batch.swap(pending_);
    }
    if (batch.empty()) {
        return 0;
    }
    ++drains_;

    const std::vector<std::string> paths(batch.begin(), batch.end());
    BatchSummary summary;
    std::string error;
    if (!pipeline_.process_paths(paths, summary, error)) {
        pipeline_.log().error("failed to apply changes: " + error);
    }
    return paths.size();
}

size_t ChangeDebouncer::pending_count() const {
    std::scoped_lock lock(mutex_);
    return pending_.size();
}

size_t ChangeDebouncer::drain_count() const {
    return drains_.load();
}

} // namespace imgopt::core
