#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace orion::observability::domain {

/**
 * @brief Контекст корреляции одного логического запроса
 *
 * Набор идентификаторов, который сопровождает запрос через все сервисы
 * платформы и попадает в каждую строку лога (см. LogContext).
 * Значение неизменяемое: для изменения используются with*-методы,
 * возвращающие копию.
 */
class CorrelationContext {
public:
    /// Ключи LogContext, в которые зеркалируются поля контекста
    static constexpr const char* LOG_CORRELATION_ID = "correlationId";
    static constexpr const char* LOG_TENANT_ID = "tenantId";
    static constexpr const char* LOG_USER_ID = "userId";
    static constexpr const char* LOG_REQUEST_ID = "requestId";
    static constexpr const char* LOG_SPAN_ID = "spanId";
    static constexpr const char* LOG_TRACE_ID = "traceId";

    /**
     * @param correlationId ID бизнес-потока (обязателен, не пустой)
     * @param tenantId Тенант (отсутствует для системных вызовов до аутентификации)
     * @param userId Пользователь, выполняющий действие
     * @param requestId ID конкретного запроса внутри потока
     * @param spanId Текущий span трассировки
     * @param traceId Текущий trace трассировки
     * @throws std::invalid_argument если correlationId пустой
     */
    explicit CorrelationContext(
        std::string correlationId,
        std::optional<std::string> tenantId = std::nullopt,
        std::optional<std::string> userId = std::nullopt,
        std::optional<std::string> requestId = std::nullopt,
        std::optional<std::string> spanId = std::nullopt,
        std::optional<std::string> traceId = std::nullopt)
        : correlationId_(std::move(correlationId))
        , tenantId_(std::move(tenantId))
        , userId_(std::move(userId))
        , requestId_(std::move(requestId))
        , spanId_(std::move(spanId))
        , traceId_(std::move(traceId))
    {
        if (correlationId_.find_first_not_of(" \t\r\n") == std::string::npos) {
            throw std::invalid_argument("correlationId must not be null or blank");
        }
    }

    const std::string& correlationId() const { return correlationId_; }
    const std::optional<std::string>& tenantId() const { return tenantId_; }
    const std::optional<std::string>& userId() const { return userId_; }
    const std::optional<std::string>& requestId() const { return requestId_; }
    const std::optional<std::string>& spanId() const { return spanId_; }
    const std::optional<std::string>& traceId() const { return traceId_; }

    CorrelationContext withRequestId(const std::string& requestId) const {
        CorrelationContext copy(*this);
        copy.requestId_ = requestId;
        return copy;
    }

    /**
     * @brief Копия с данными активного span'а трассировки
     */
    CorrelationContext withSpan(const std::string& spanId, const std::string& traceId) const {
        CorrelationContext copy(*this);
        copy.spanId_ = spanId;
        copy.traceId_ = traceId;
        return copy;
    }

    bool operator==(const CorrelationContext& other) const {
        return correlationId_ == other.correlationId_
            && tenantId_ == other.tenantId_
            && userId_ == other.userId_
            && requestId_ == other.requestId_
            && spanId_ == other.spanId_
            && traceId_ == other.traceId_;
    }

    bool operator!=(const CorrelationContext& other) const { return !(*this == other); }

private:
    std::string correlationId_;
    std::optional<std::string> tenantId_;
    std::optional<std::string> userId_;
    std::optional<std::string> requestId_;
    std::optional<std::string> spanId_;
    std::optional<std::string> traceId_;
};

} // namespace orion::observability::domain
