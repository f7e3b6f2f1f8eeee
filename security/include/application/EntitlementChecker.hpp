#pragma once

#include "domain/AssetClass.hpp"
#include "domain/Entitlements.hpp"

#include <string>

namespace orion::security::application {

/**
 * @brief Проверка ABAC-разрешений
 *
 * Пустое множество в Entitlements означает "разрешено всё" по этому измерению.
 */
class EntitlementChecker {
public:
    static bool canTradeAssetClass(const domain::Entitlements& entitlements, domain::AssetClass assetClass) {
        return entitlements.assetClasses.empty()
            || entitlements.assetClasses.count(assetClass) > 0;
    }

    static bool canTradeInstrument(const domain::Entitlements& entitlements, const std::string& instrumentId) {
        return entitlements.instruments.empty()
            || entitlements.instruments.count(instrumentId) > 0;
    }

    static bool canAccessVenue(const domain::Entitlements& entitlements, const std::string& venueId) {
        return entitlements.venues.empty()
            || entitlements.venues.count(venueId) > 0;
    }

    /**
     * @brief Номинал в пределах лимита (граница включительно)
     */
    static bool isWithinNotionalLimit(const domain::Entitlements& entitlements, double notional) {
        return notional <= entitlements.limits.maxNotional;
    }
};

} // namespace orion::security::application
