#pragma once

#include <string>
#include <memory>
#include <functional>
#include <mutex>
#include <atomic>
#include <chrono>

using ProgressCallback = std::function<void(int progress)>;

class Job {
public:
    enum class State {
        PENDING,
        RUNNING,
        COMPLETED,
        FAILED,
        CANCELLED
    };

    Job();
    virtual ~Job() = default;

    // Job control
    virtual bool start() = 0;
    virtual bool cancel() = 0;
    // Blocks until the job's work has returned.
    virtual void wait() = 0;

    // Status queries
    bool isRunning() const { return getState() == State::RUNNING; }
    bool isCompleted() const { return getState() == State::COMPLETED; }
    bool isFailed() const { return getState() == State::FAILED; }
    bool isCancelled() const { return getState() == State::CANCELLED; }
    bool isFinished() const;
    int getProgress() const;
    std::string getStatus() const;
    std::string getError() const;
    std::string getId() const;
    State getState() const;

    void setProgressCallback(ProgressCallback callback);

protected:
    void updateProgress(int progress);
    void setError(const std::string& error);
    void setState(State state);
    void setStatus(const std::string& status);

    std::string id_;
    State state_{State::PENDING};
    std::string status_{"pending"};
    int progress_{0};
    std::string error_;
    ProgressCallback progressCallback_;
    mutable std::mutex mutex_;
};

const char* jobStateToString(Job::State state);
