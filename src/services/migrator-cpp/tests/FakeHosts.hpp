#pragma once

#include "CommandExecutor.hpp"
#include "TransferService.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

inline int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

inline bool HasArg(const std::vector<std::string>& argv, const std::string& arg) {
    return std::find(argv.begin(), argv.end(), arg) != argv.end();
}

inline std::string Join(const std::vector<std::string>& argv) {
    std::string joined;
    for (const auto& arg : argv) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += arg;
    }
    return joined;
}

inline CommandResult Succeeded() {
    CommandResult result;
    result.exitCode = 0;
    return result;
}

inline CommandResult Exited(int exitCode, const std::string& err = {}) {
    CommandResult result;
    result.exitCode = exitCode;
    result.err = err;
    return result;
}

// Ordered record of everything the fakes were asked to do, shared across threads.
class EventLog {
public:
    void Add(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    std::vector<std::string> Events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    // Index of the first event containing every needle, or -1.
    int IndexOf(const std::vector<std::string>& needles) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < events_.size(); ++i) {
            bool match = true;
            for (const auto& needle : needles) {
                if (events_[i].find(needle) == std::string::npos) {
                    match = false;
                    break;
                }
            }
            if (match) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    int Count(const std::string& needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count_if(events_.begin(), events_.end(), [&](const std::string& event) {
            return event.find(needle) != std::string::npos;
        }));
    }

    void Dump() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& event : events_) {
            std::cerr << "  " << event << std::endl;
        }
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

// Holds a fake process open until the test lets it exit.
class Gate {
public:
    void Open(CommandResult result) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result_ = std::move(result);
            open_ = true;
        }
        cv_.notify_all();
    }

    CommandResult WaitOpen() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
        return result_;
    }

    bool IsOpen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    CommandResult result_;
};

class FakeProcess : public ProcessHandle {
public:
    explicit FakeProcess(std::shared_ptr<Gate> gate)
        : gate_(std::move(gate)) {}

    CommandResult Wait() override {
        return gate_->WaitOpen();
    }

private:
    std::shared_ptr<Gate> gate_;
};

class FakeExecutor : public RemoteExecutor {
public:
    using Handler = std::function<CommandResult(const std::vector<std::string>&)>;

    FakeExecutor(std::string name, std::shared_ptr<EventLog> log)
        : name_(std::move(name)),
          log_(std::move(log)),
          restoreGate_(std::make_shared<Gate>()) {}

    void SetHandler(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    void FailStart(const std::string& error) {
        startError_ = error;
    }

    std::shared_ptr<Gate> RestoreGate() const {
        return restoreGate_;
    }

    CommandResult Run(const std::vector<std::string>& argv) override {
        log_->Add(name_ + " run: " + Join(argv));
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = handler_;
        }
        return handler ? handler(argv) : Succeeded();
    }

    std::unique_ptr<ProcessHandle> Start(const std::vector<std::string>& argv, std::string& outError) override {
        log_->Add(name_ + " start: " + Join(argv));
        if (!startError_.empty()) {
            outError = startError_;
            return nullptr;
        }
        return std::make_unique<FakeProcess>(restoreGate_);
    }

    ResourceLocator Locator(const std::string& path) const override {
        ResourceLocator locator;
        locator.host = name_;
        locator.path = path;
        return locator;
    }

    std::string Describe() const override {
        return name_;
    }

private:
    std::string name_;
    std::shared_ptr<EventLog> log_;
    std::shared_ptr<Gate> restoreGate_;
    std::mutex mutex_;
    Handler handler_;
    std::string startError_;
};

class FakeTransfer : public TransferService {
public:
    explicit FakeTransfer(std::shared_ptr<EventLog> log)
        : log_(std::move(log)) {}

    // Fails the n-th copy (1-based); zero never fails.
    void FailOnCall(int call) {
        failOnCall_ = call;
    }

    bool Copy(const ResourceLocator& source, const ResourceLocator& destination, std::string& outError) override {
        ++calls_;
        log_->Add("transfer: " + source.ToString() + " -> " + destination.ToString());
        if (calls_ == failOnCall_) {
            outError = "connection reset";
            return false;
        }
        return true;
    }

    int Calls() const {
        return calls_;
    }

private:
    std::shared_ptr<EventLog> log_;
    int failOnCall_ = 0;
    int calls_ = 0;
};
