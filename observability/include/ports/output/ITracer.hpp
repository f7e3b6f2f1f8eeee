#pragma once

#include <memory>
#include <string>

namespace orion::observability::ports::output {

enum class SpanKind {
    INTERNAL,
    SERVER,
    CLIENT,
    PRODUCER,
    CONSUMER
};

enum class SpanStatus {
    UNSET,
    OK,
    ERROR
};

/**
 * @brief Span трассировки (реализуется адаптером бэкенда трассировки)
 */
class ISpan {
public:
    virtual ~ISpan() = default;

    virtual void setAttribute(const std::string& key, const std::string& value) = 0;
    virtual void setStatus(SpanStatus status, const std::string& description) = 0;

    /**
     * @brief Записать ошибку, прервавшую операцию
     */
    virtual void recordError(const std::string& message) = 0;

    /// Завершить span. Вызывается ровно один раз.
    virtual void end() = 0;
};

/**
 * @brief Интерфейс трассировщика
 */
class ITracer {
public:
    virtual ~ITracer() = default;

    virtual std::shared_ptr<ISpan> startSpan(const std::string& name, SpanKind kind) = 0;
};

} // namespace orion::observability::ports::output
