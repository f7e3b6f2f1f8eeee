#include "context/LogContext.hpp"

#include <algorithm>

namespace orion::observability::context {

thread_local LogContext::Entries LogContext::entries_;

namespace {

LogContext::Entries::iterator findEntry(LogContext::Entries& entries, const std::string& key) {
    return std::find_if(entries.begin(), entries.end(),
                        [&key](const auto& entry) { return entry.first == key; });
}

} // namespace

void LogContext::put(const std::string& key, const std::string& value) {
    auto it = findEntry(entries_, key);
    if (it != entries_.end()) {
        it->second = value;
        return;
    }
    entries_.emplace_back(key, value);
}

void LogContext::remove(const std::string& key) {
    auto it = findEntry(entries_, key);
    if (it != entries_.end()) {
        entries_.erase(it);
    }
}

std::optional<std::string> LogContext::get(const std::string& key) {
    auto it = findEntry(entries_, key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool LogContext::contains(const std::string& key) {
    return findEntry(entries_, key) != entries_.end();
}

void LogContext::clear() {
    entries_.clear();
}

LogContext::Entries LogContext::snapshot() {
    return entries_;
}

} // namespace orion::observability::context
