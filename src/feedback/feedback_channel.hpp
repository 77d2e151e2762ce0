// ============================================================================
// feedback/feedback_channel.hpp - Debounced single-worker feedback queue
// ============================================================================
#pragma once
#include <string>
#include <deque>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <functional>
#include <stdexcept>
#include "../ortho_config.hpp"
#include "../utils/log.hpp"

namespace ortho {

// Output device for feedback messages (speech engine, console, ...)
class Announcer {
public:
    virtual ~Announcer() = default;
    virtual bool available() const = 0;
    // Blocks until the message has been fully delivered
    virtual void announce(const std::string& message) = 0;
};

class ConsoleAnnouncer : public Announcer {
public:
    bool available() const override { return true; }
    void announce(const std::string& message) override {
        log::info("Voice", message);
    }
};

// Stands in for a missing audio backend; every message is dropped
class UnavailableAnnouncer : public Announcer {
public:
    bool available() const override { return false; }
    void announce(const std::string&) override {}
};

class FeedbackChannel {
public:
    typedef std::chrono::steady_clock Clock;
    typedef std::function<Clock::time_point()> ClockFn;

private:
    std::shared_ptr<Announcer> announcer;
    FeedbackConfig config;
    ClockFn now;

    std::mutex mtx;
    std::condition_variable work_cv;
    std::condition_variable idle_cv;
    std::deque<std::string> queue;
    bool stopping = false;
    bool speaking = false;

    std::string last_message;
    Clock::time_point last_time;
    bool has_last = false;

    size_t delivered = 0;
    size_t debounced = 0;
    size_t failed = 0;

    std::thread worker;

public:
    FeedbackChannel(std::shared_ptr<Announcer> out, const FeedbackConfig& cfg,
                    ClockFn clock = []() { return Clock::now(); })
        : announcer(out ? out : std::make_shared<UnavailableAnnouncer>()),
          config(cfg),
          now(clock) {
        worker = std::thread(&FeedbackChannel::run, this);
    }

    ~FeedbackChannel() {
        stop();
    }

    FeedbackChannel(const FeedbackChannel&) = delete;
    FeedbackChannel& operator=(const FeedbackChannel&) = delete;

    // Non-blocking. Returns false when the message was dropped.
    bool enqueue(const std::string& message) {
        if (message.empty() || !announcer->available()) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mtx);
        if (stopping) {
            return false;
        }

        Clock::time_point t = now();
        if (has_last && message == last_message) {
            std::chrono::duration<float> elapsed = t - last_time;
            if (elapsed.count() < config.debounce_seconds) {
                debounced++;
                return false;
            }
        }

        last_message = message;
        last_time = t;
        has_last = true;
        queue.push_back(message);
        work_cv.notify_one();
        return true;
    }

    // Waits until every queued message has been announced
    bool wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        return idle_cv.wait_for(lock, timeout, [this]() { return queue.empty() && !speaking; });
    }

    // Finishes the message in flight, discards the rest and joins the worker
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (stopping && !worker.joinable()) return;
            stopping = true;
            if (!queue.empty()) {
                log::info("Feedback", "discarding " + std::to_string(queue.size()) + " pending messages");
                queue.clear();
            }
        }
        work_cv.notify_all();
        if (worker.joinable()) {
            worker.join();
        }
        idle_cv.notify_all();
    }

    size_t delivered_count() {
        std::lock_guard<std::mutex> lock(mtx);
        return delivered;
    }

    size_t debounced_count() {
        std::lock_guard<std::mutex> lock(mtx);
        return debounced;
    }

    size_t failed_count() {
        std::lock_guard<std::mutex> lock(mtx);
        return failed;
    }

private:
    void run() {
        auto poll = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::duration<float>(config.poll_seconds));
        if (poll.count() <= 0) poll = std::chrono::milliseconds(100);

        while (true) {
            std::string message;
            {
                std::unique_lock<std::mutex> lock(mtx);
                work_cv.wait_for(lock, poll, [this]() { return stopping || !queue.empty(); });
                if (stopping) break;
                if (queue.empty()) continue;

                message = queue.front();
                queue.pop_front();
                speaking = true;
            }

            bool ok = true;
            try {
                announcer->announce(message);
            } catch (const std::exception& e) {
                ok = false;
                log::error("Feedback", std::string("announcement failed: ") + e.what());
            } catch (...) {
                ok = false;
                log::error("Feedback", "announcement failed: unknown error");
            }

            {
                std::lock_guard<std::mutex> lock(mtx);
                speaking = false;
                if (ok) delivered++; else failed++;
            }
            idle_cv.notify_all();
        }
    }
};

} // namespace ortho
