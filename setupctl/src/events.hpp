#pragma once

#include <string>
#include <variant>

struct InitializationEvent {
    std::string package_id;
};

struct ExecutingEvent {
    std::string package_id;
};

struct SuccessEvent {
    std::string package_id;
};

using InstallerEvent = std::variant<InitializationEvent, ExecutingEvent, SuccessEvent>;

// Fire-and-forget lifecycle notifications.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const InstallerEvent& event) = 0;
};

class LogEventSink : public EventSink {
public:
    void publish(const InstallerEvent& event) override;
};
