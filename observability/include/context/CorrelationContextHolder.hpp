#pragma once

#include "domain/CorrelationContext.hpp"

#include <optional>
#include <utility>

namespace orion::observability::context {

/**
 * @brief RAII-привязка контекста корреляции к текущему потоку
 *
 * Конструктор устанавливает контекст, деструктор восстанавливает тот,
 * что был установлен до него, или полностью очищает привязку,
 * если до него ничего не было.
 */
class ScopedCorrelationContext {
public:
    explicit ScopedCorrelationContext(const domain::CorrelationContext& context);
    ~ScopedCorrelationContext();

    ScopedCorrelationContext(const ScopedCorrelationContext&) = delete;
    ScopedCorrelationContext& operator=(const ScopedCorrelationContext&) = delete;

private:
    std::optional<domain::CorrelationContext> previous_;
};

/**
 * @brief Хранилище контекста корреляции текущего потока с мостом в LogContext
 *
 * Состояния: не привязан -> привязан -> не привязан.
 * Контекст, установленный в одном потоке, никогда не виден в другом.
 * При установке поля контекста копируются в LogContext, отсутствующие
 * опциональные поля не записываются (ключ удаляется).
 *
 * Для пулов потоков контекст передаётся явно: через runWithContext()
 * или wrap(). Очистка между запросами - ответственность вызывающего кода.
 */
class CorrelationContextHolder {
public:
    CorrelationContextHolder() = delete;

    /**
     * @brief Привязать контекст к текущему потоку
     * @throws domain::NullContextException если контекст отсутствует
     */
    static void set(const std::optional<domain::CorrelationContext>& context);

    /**
     * @brief Текущий контекст потока
     * @return контекст или nullopt если ничего не привязано
     */
    static std::optional<domain::CorrelationContext> get();

    /// Отвязать контекст и удалить все его ключи из LogContext
    static void clear();

    /**
     * @brief Выполнить операцию с указанным контекстом
     *
     * После возврата (в том числе через исключение) восстанавливается
     * контекст, который был привязан до вызова.
     *
     * @return результат операции
     */
    template <typename Operation>
    static auto runWithContext(const domain::CorrelationContext& context, Operation&& operation)
        -> decltype(std::forward<Operation>(operation)())
    {
        ScopedCorrelationContext scope(context);
        return std::forward<Operation>(operation)();
    }

    /**
     * @brief Захватить текущий контекст для передачи операции в другой поток
     *
     * Возвращает callable, который выполняет операцию под контекстом,
     * привязанным в момент вызова wrap(). Если в тот момент контекста
     * не было, операция выполняется с привязкой вызывающего потока как есть.
     */
    template <typename Operation>
    static auto wrap(Operation operation) {
        auto captured = get();
        return [captured, operation = std::move(operation)]() mutable {
            if (!captured) {
                return operation();
            }
            return runWithContext(*captured, operation);
        };
    }

private:
    static void populateLogContext(const domain::CorrelationContext& context);
    static void clearLogContext();

    static thread_local std::optional<domain::CorrelationContext> current_;
};

} // namespace orion::observability::context
