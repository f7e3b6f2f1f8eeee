#pragma once

#include "domain/AuthorizationContext.hpp"
#include "domain/CorrelationContext.hpp"
#include "domain/PropagatedContext.hpp"
#include "domain/RpcMetadata.hpp"
#include "settings/PropagationSettings.hpp"

#include <memory>

namespace orion::propagation::application {

/**
 * @brief Передача контекста через метаданные RPC
 *
 * Исходящий вызов: закодированный контекст авторизации в одном заголовке
 * плюс отдельные "плоские" заголовки correlation id и tenant id для
 * транспорта и инструментов наблюдаемости, которым не нужен полный payload.
 * Входящий вызов: обратное преобразование.
 */
class ContextPropagator {
public:
    explicit ContextPropagator(std::shared_ptr<settings::PropagationSettings> settings);

    /**
     * @brief Записать контекст авторизации в исходящие метаданные
     * @throws security::domain::SerializationException если в контексте нет identity или tenant
     */
    void inject(const security::domain::AuthorizationContext& context, domain::RpcMetadata& metadata) const;

    /**
     * @brief Записать плоские заголовки корреляции (только присутствующие поля)
     */
    void inject(const observability::domain::CorrelationContext& context, domain::RpcMetadata& metadata) const;

    /**
     * @brief Записать контекст корреляции текущего потока, если он привязан
     * @return false если контекст не привязан
     */
    bool injectCurrent(domain::RpcMetadata& metadata) const;

    /**
     * @brief Восстановить контекст авторизации из входящих метаданных
     * @throws security::domain::MissingPropagatedContextException если заголовка нет
     * @throws security::domain::SerializationException если заголовок не декодируется
     */
    security::domain::PropagatedContext extract(const domain::RpcMetadata& metadata) const;

    /**
     * @brief Контекст корреляции входящего вызова
     *
     * correlation id берётся из заголовка или генерируется (UUID v4),
     * если заголовка нет или он пустой.
     */
    observability::domain::CorrelationContext extractCorrelation(const domain::RpcMetadata& metadata) const;

    const settings::PropagationSettings& settings() const { return *settings_; }

private:
    std::shared_ptr<settings::PropagationSettings> settings_;
};

} // namespace orion::propagation::application
