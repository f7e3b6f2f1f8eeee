#include "logging/Logger.hpp"
#include "context/LogContext.hpp"

#include <iostream>
#include <mutex>
#include <sstream>

namespace orion::observability::logging {

namespace {

std::mutex& outputMutex() {
    static std::mutex mutex;
    return mutex;
}

std::mutex& serviceMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string& servicePrefix() {
    static std::string prefix;
    return prefix;
}

const SensitiveDataRedactor& redactor() {
    static const SensitiveDataRedactor instance;
    return instance;
}

} // namespace

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

void Logger::configure(const settings::ObservabilitySettings& settings) {
    std::lock_guard<std::mutex> lock(serviceMutex());
    servicePrefix() = "[" + settings.getServiceName() + "@" + settings.getServiceVersion()
                    + "/" + settings.getEnvironment() + "] ";
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(serviceMutex());
    servicePrefix().clear();
}

void Logger::info(const std::string& component, const std::string& message, const Fields& fields) {
    write(LogLevel::INFO, std::cout, component, message, fields);
}

void Logger::warn(const std::string& component, const std::string& message, const Fields& fields) {
    write(LogLevel::WARN, std::cerr, component, message, fields);
}

void Logger::error(const std::string& component, const std::string& message, const Fields& fields) {
    write(LogLevel::ERROR, std::cerr, component, message, fields);
}

std::string Logger::format(LogLevel level,
                           const std::string& component,
                           const std::string& message,
                           const Fields& fields) {
    std::ostringstream line;
    {
        std::lock_guard<std::mutex> lock(serviceMutex());
        line << servicePrefix();
    }
    if (level != LogLevel::INFO) {
        line << toString(level) << " ";
    }
    line << "[" << component << "] " << message;

    auto entries = context::LogContext::snapshot();
    if (!entries.empty()) {
        line << " {";
        for (size_t i = 0; i < entries.size(); ++i) {
            if (i > 0) {
                line << ", ";
            }
            line << entries[i].first << "=" << entries[i].second;
        }
        line << "}";
    }

    for (const auto& [key, value] : redactor().redact(fields)) {
        line << " " << key << "=" << value;
    }
    return line.str();
}

void Logger::write(LogLevel level, std::ostream& out, const std::string& component,
                   const std::string& message, const Fields& fields) {
    auto line = format(level, component, message, fields);
    std::lock_guard<std::mutex> lock(outputMutex());
    out << line << std::endl;
}

} // namespace orion::observability::logging
