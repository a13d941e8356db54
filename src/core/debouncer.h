#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace imgopt::core {

class Pipeline;

constexpr std::chrono::milliseconds k_default_quiet_period{300};

// Fire-once timer. Arming again before it fires replaces both the deadline and
// the callback, so it measures quiet time rather than total elapsed time.
class DebounceTimer {
public:
    virtual ~DebounceTimer() = default;
    virtual void arm(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
    virtual void cancel() = 0;
};

// Runs callbacks on a background thread owned by the timer.
class ThreadDebounceTimer : public DebounceTimer {
public:
    ThreadDebounceTimer();
    ~ThreadDebounceTimer() override;

    ThreadDebounceTimer(const ThreadDebounceTimer&) = delete;
    ThreadDebounceTimer& operator=(const ThreadDebounceTimer&) = delete;

    void arm(std::chrono::milliseconds delay, std::function<void()> callback) override;
    void cancel() override;

private:
    void run();

    std::mutex mutex_;
    std::condition_variable cv_;
    std::function<void()> callback_;
    std::chrono::steady_clock::time_point deadline_;
    bool armed_ = false;
    bool running_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

// Simulated clock; callbacks run inside advance() on the caller's thread.
class ManualDebounceTimer : public DebounceTimer {
public:
    void arm(std::chrono::milliseconds delay, std::function<void()> callback) override;
    void cancel() override;

    void advance(std::chrono::milliseconds elapsed);
    bool armed() const { return armed_; }
    std::chrono::milliseconds now() const { return now_; }

private:
    std::chrono::milliseconds now_{0};
    std::chrono::milliseconds deadline_{0};
    std::function<void()> callback_;
    bool armed_ = false;
};

enum class FileChangeKind { Created, Modified, Deleted };

// Collects change notifications and regenerates the changed originals once
// the notifications have been quiet for the configured period.
class ChangeDebouncer {
public:
    ChangeDebouncer(Pipeline& pipeline,
                    DebounceTimer& timer,
                    std::chrono::milliseconds quiet_period = k_default_quiet_period);
    ~ChangeDebouncer();

    ChangeDebouncer(const ChangeDebouncer&) = delete;
    ChangeDebouncer& operator=(const ChangeDebouncer&) = delete;

    // Returns false when the notification does not qualify.
    bool notify(FileChangeKind kind, const std::string& relative_path, const std::string& absolute_path);

    // Drains and regenerates whatever is pending right now. Returns the number
    // of originals regenerated.
    size_t flush();

    size_t pending_count() const;
    size_t drain_count() const;

private:
    Pipeline& pipeline_;
    DebounceTimer& timer_;
    std::chrono::milliseconds quiet_period_;
    mutable std::mutex mutex_;
    std::set<std::string> pending_;
    std::mutex drain_mutex_;
    std::atomic<size_t> drains_{0};
};

} // namespace imgopt::core
