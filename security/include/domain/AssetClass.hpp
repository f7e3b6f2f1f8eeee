#pragma once

#include <optional>
#include <string>
#include <vector>

namespace orion::security::domain {

/**
 * @brief Торгуемые классы активов
 */
enum class AssetClass {
    FX,
    RATES,
    CREDIT,
    EQUITIES,
    COMMODITIES
};

inline std::string toString(AssetClass assetClass) {
    switch (assetClass) {
        case AssetClass::FX:          return "FX";
        case AssetClass::RATES:       return "RATES";
        case AssetClass::CREDIT:      return "CREDIT";
        case AssetClass::EQUITIES:    return "EQUITIES";
        case AssetClass::COMMODITIES: return "COMMODITIES";
        default: return "UNKNOWN";
    }
}

inline const std::vector<AssetClass>& allAssetClasses() {
    static const std::vector<AssetClass> values = {
        AssetClass::FX, AssetClass::RATES, AssetClass::CREDIT,
        AssetClass::EQUITIES, AssetClass::COMMODITIES
    };
    return values;
}

/**
 * @return класс активов или nullopt если имя не распознано
 */
inline std::optional<AssetClass> assetClassFromString(const std::string& value) {
    for (AssetClass assetClass : allAssetClasses()) {
        if (toString(assetClass) == value) {
            return assetClass;
        }
    }
    return std::nullopt;
}

} // namespace orion::security::domain
