#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace layercast::materialize {

struct ProgressEvent {
    std::string message;
    float fraction = 0;  // 0..1
    std::size_t processed = 0;
    std::size_t total = 0;
    bool is_error = false;
};

// Observer for materialization progress.
class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;
    virtual void report(const ProgressEvent& event) = 0;
};

// Keeps every event.
class ProgressRecorder : public ProgressReporter {
public:
    void report(const ProgressEvent& event) override { events_.push_back(event); }

    const std::vector<ProgressEvent>& events() const { return events_; }

private:
    std::vector<ProgressEvent> events_;
};

class CallbackProgressReporter : public ProgressReporter {
public:
    explicit CallbackProgressReporter(std::function<void(const ProgressEvent&)> callback)
        : callback_(std::move(callback)) {}

    void report(const ProgressEvent& event) override {
        if (callback_) callback_(event);
    }

private:
    std::function<void(const ProgressEvent&)> callback_;
};

}  // namespace layercast::materialize
