#include "common/job.hpp"
#include "common/utils.hpp"

Job::Job() : state_(State::PENDING), progress_(0) {
    id_ = utils::generateId();
}

void Job::updateProgress(int progress) {
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_ = progress;
        callback = progressCallback_;
    }
    if (callback) {
        callback(progress);
    }
}

void Job::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
}

void Job::setState(State state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void Job::setStatus(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = status;
}

void Job::setProgressCallback(ProgressCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    progressCallback_ = std::move(callback);
}

bool Job::isFinished() const {
    State state = getState();
    return state == State::COMPLETED || state == State::FAILED || state == State::CANCELLED;
}

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int Job::getProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::string Job::getStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::string Job::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::string Job::getId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return id_;
}

const char* jobStateToString(Job::State state) {
    switch (state) {
        case Job::State::PENDING:   return "pending";
        case Job::State::RUNNING:   return "running";
        case Job::State::COMPLETED: return "completed";
        case Job::State::FAILED:    return "failed";
        case Job::State::CANCELLED: return "cancelled";
    }
    return "unknown";
}
