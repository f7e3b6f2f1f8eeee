#pragma once

#include "domain/AssetClass.hpp"
#include "domain/TradingLimits.hpp"

#include <set>
#include <string>

namespace orion::security::domain {

/**
 * @brief ABAC-разрешения пользователя
 *
 * Пустое множество означает "без ограничений", а не "ничего не разрешено".
 * Правило применяется к каждому измерению независимо.
 */
struct Entitlements {
    std::set<AssetClass> assetClasses;  ///< Разрешённые классы активов (пусто = все)
    std::set<std::string> instruments;  ///< Разрешённые инструменты (пусто = все)
    std::set<std::string> venues;       ///< Разрешённые площадки (пусто = все)
    TradingLimits limits;

    Entitlements() = default;

    Entitlements(std::set<AssetClass> assetClasses,
                 std::set<std::string> instruments,
                 std::set<std::string> venues,
                 TradingLimits limits)
        : assetClasses(std::move(assetClasses))
        , instruments(std::move(instruments))
        , venues(std::move(venues))
        , limits(limits)
    {}

    /**
     * @brief Все классы активов явно, без ограничений по инструментам и площадкам
     */
    static Entitlements defaults() {
        return Entitlements(
            std::set<AssetClass>(allAssetClasses().begin(), allAssetClasses().end()),
            {}, {}, TradingLimits::defaults());
    }

    /// Без ограничений ни по одному измерению
    static Entitlements unrestricted(TradingLimits limits) {
        return Entitlements({}, {}, {}, limits);
    }
};

} // namespace orion::security::domain
