#pragma once

#include "events.hpp"

#include <memory>
#include <mutex>
#include <vector>

#include <spdlog/spdlog.h>

namespace goapagent::event {

// Observer of everything the platform and its processes do
class AgenticEventListener {
public:
    virtual ~AgenticEventListener() = default;

    virtual void on_process_event(const ProcessEvent& event) { (void)event; }
    virtual void on_platform_event(const PlatformEvent& event) { (void)event; }
};

using EventListenerPtr = std::shared_ptr<AgenticEventListener>;

// Ignores everything
class NoOpEventListener : public AgenticEventListener {};

// Fans events out to every registered listener in order
class MulticastEventListener : public AgenticEventListener {
public:
    MulticastEventListener() = default;
    explicit MulticastEventListener(std::vector<EventListenerPtr> listeners)
        : listeners_(std::move(listeners)) {}

    void add(EventListenerPtr listener);

    void on_process_event(const ProcessEvent& event) override;
    void on_platform_event(const PlatformEvent& event) override;

private:
    mutable std::mutex mutex_;
    std::vector<EventListenerPtr> listeners_;

    std::vector<EventListenerPtr> snapshot() const;
};

// One log line per event
class LoggingEventListener : public AgenticEventListener {
public:
    explicit LoggingEventListener(spdlog::level::level_enum level = spdlog::level::info)
        : level_(level) {}

    void on_process_event(const ProcessEvent& event) override;
    void on_platform_event(const PlatformEvent& event) override;

private:
    spdlog::level::level_enum level_;
};

}  // namespace goapagent::event
