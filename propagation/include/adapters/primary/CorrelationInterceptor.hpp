#pragma once

#include "application/ContextPropagator.hpp"
#include "context/CorrelationContextHolder.hpp"
#include "domain/RpcMetadata.hpp"

#include <memory>
#include <stdexcept>
#include <utility>

namespace orion::propagation::adapters::primary {

/**
 * @brief Серверный перехватчик: привязка контекста корреляции на время вызова
 *
 * 1. Берёт correlation id из метаданных или генерирует новый
 * 2. Привязывает контекст к потоку на время обработчика
 * 3. Возвращает correlation id клиенту в метаданных ответа
 * 4. Восстанавливает предыдущую привязку после обработчика, в том числе при исключении
 *
 * Регистрация в конкретном RPC-фреймворке выполняется сервисом.
 */
class CorrelationInterceptor {
public:
    explicit CorrelationInterceptor(std::shared_ptr<application::ContextPropagator> propagator)
        : propagator_(std::move(propagator))
    {
        if (!propagator_) {
            throw std::invalid_argument("propagator must not be null");
        }
    }

    template <typename Handler>
    auto intercept(const domain::RpcMetadata& requestMetadata,
                   domain::RpcMetadata& responseMetadata,
                   Handler&& handler) -> decltype(std::forward<Handler>(handler)())
    {
        auto context = propagator_->extractCorrelation(requestMetadata);
        responseMetadata[propagator_->settings().getCorrelationHeader()] = context.correlationId();
        return observability::context::CorrelationContextHolder::runWithContext(
            context, std::forward<Handler>(handler));
    }

private:
    std::shared_ptr<application::ContextPropagator> propagator_;
};

} // namespace orion::propagation::adapters::primary
