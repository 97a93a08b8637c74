#include <codegate/core/events.hpp>
#include <codegate/core/logger.hpp>

namespace codegate {

void LogEventSink::emit(const std::string& name, const Json& fields) {
    std::string payload = fields.dump(-1, ' ', false, Json::error_handler_t::replace);
    if (name.find("failed") != std::string::npos || name.find("exhausted") != std::string::npos) {
        LOG_WARN("[event] %s %s", name.c_str(), payload.c_str());
    } else {
        LOG_INFO("[event] %s %s", name.c_str(), payload.c_str());
    }
}

void RecordingEventSink::emit(const std::string& name, const Json& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry e;
    e.name = name;
    e.fields = fields;
    entries_.push_back(e);
}

std::vector<RecordingEventSink::Entry> RecordingEventSink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t RecordingEventSink::count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].name == name) ++n;
    }
    return n;
}

void RecordingEventSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace codegate
