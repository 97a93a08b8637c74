/*
 * codegate - Structured Events
 *
 * The validator gate, the sandbox executor and the agent report what they
 * do through an EventSink handed to them at construction. Nothing in the
 * core reaches for a global logger to describe its decisions.
 */
#ifndef codegate_CORE_EVENTS_HPP
#define codegate_CORE_EVENTS_HPP

#include "types.hpp"
#include <string>
#include <vector>
#include <mutex>

namespace codegate {

class EventSink {
public:
    virtual ~EventSink() {}
    virtual void emit(const std::string& name, const Json& fields) = 0;
};

// Discards everything
class NullEventSink : public EventSink {
public:
    void emit(const std::string&, const Json&) override {}
};

// Forwards each event to the Logger as "[event] <name> <json>"
class LogEventSink : public EventSink {
public:
    void emit(const std::string& name, const Json& fields) override;
};

// Keeps events in memory (inspection in tests and diagnostics)
class RecordingEventSink : public EventSink {
public:
    struct Entry {
        std::string name;
        Json fields;
    };

    void emit(const std::string& name, const Json& fields) override;

    std::vector<Entry> entries() const;
    size_t count(const std::string& name) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

} // namespace codegate

#endif // codegate_CORE_EVENTS_HPP
