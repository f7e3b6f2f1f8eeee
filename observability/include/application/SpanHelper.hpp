#pragma once

#include "context/CorrelationContextHolder.hpp"
#include "ports/output/ITracer.hpp"

#include <exception>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace orion::observability::application {

/**
 * @brief Обёртка над ITracer, помечающая span'ы контекстом корреляции
 *
 * Каждый span получает атрибуты correlation.id, tenant.id и user.id
 * из контекста, привязанного к текущему потоку. Если контекста нет,
 * атрибуты не выставляются. Бэкенд трассировки здесь не настраивается.
 */
class SpanHelper {
public:
    using Attributes = std::map<std::string, std::string>;

    static constexpr const char* ATTR_CORRELATION_ID = "correlation.id";
    static constexpr const char* ATTR_TENANT_ID = "tenant.id";
    static constexpr const char* ATTR_USER_ID = "user.id";

    explicit SpanHelper(std::shared_ptr<ports::output::ITracer> tracer)
        : tracer_(std::move(tracer))
    {
        if (!tracer_) {
            throw std::invalid_argument("tracer must not be null");
        }
    }

    /**
     * @brief Выполнить операцию внутри нового span'а
     *
     * Span завершается всегда. При исключении статус ERROR,
     * ошибка записывается в span и исключение пробрасывается дальше.
     *
     * @return результат операции
     */
    template <typename Operation>
    auto withSpan(const std::string& spanName,
                  Operation&& operation,
                  const Attributes& attributes = {},
                  ports::output::SpanKind kind = ports::output::SpanKind::INTERNAL)
        -> decltype(operation())
    {
        auto span = tracer_->startSpan(spanName, kind);
        for (const auto& [key, value] : attributes) {
            span->setAttribute(key, value);
        }
        tagWithCorrelation(*span);

        SpanEnder ender(span);
        try {
            if constexpr (std::is_void_v<decltype(operation())>) {
                operation();
                span->setStatus(ports::output::SpanStatus::OK, "");
            } else {
                auto result = operation();
                span->setStatus(ports::output::SpanStatus::OK, "");
                return result;
            }
        } catch (const std::exception& e) {
            span->setStatus(ports::output::SpanStatus::ERROR, e.what());
            span->recordError(e.what());
            throw;
        }
    }

    std::shared_ptr<ports::output::ITracer> tracer() const { return tracer_; }

private:
    std::shared_ptr<ports::output::ITracer> tracer_;

    struct SpanEnder {
        explicit SpanEnder(std::shared_ptr<ports::output::ISpan> span) : span_(std::move(span)) {}
        ~SpanEnder() { span_->end(); }
        std::shared_ptr<ports::output::ISpan> span_;
    };

    static void tagWithCorrelation(ports::output::ISpan& span) {
        auto context = context::CorrelationContextHolder::get();
        if (!context) {
            return;
        }
        span.setAttribute(ATTR_CORRELATION_ID, context->correlationId());
        if (context->tenantId()) {
            span.setAttribute(ATTR_TENANT_ID, *context->tenantId());
        }
        if (context->userId()) {
            span.setAttribute(ATTR_USER_ID, *context->userId());
        }
    }
};

} // namespace orion::observability::application
