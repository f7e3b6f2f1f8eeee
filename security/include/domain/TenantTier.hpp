#pragma once

#include <optional>
#include <string>

namespace orion::security::domain {

/**
 * @brief Уровень тенанта (определяет доступные функции и лимиты)
 */
enum class TenantTier {
    STANDARD,
    PREMIUM,
    ENTERPRISE
};

inline std::string toString(TenantTier tier) {
    switch (tier) {
        case TenantTier::STANDARD:   return "standard";
        case TenantTier::PREMIUM:    return "premium";
        case TenantTier::ENTERPRISE: return "enterprise";
        default: return "unknown";
    }
}

inline std::optional<TenantTier> tenantTierFromString(const std::string& value) {
    if (value == "standard")   return TenantTier::STANDARD;
    if (value == "premium")    return TenantTier::PREMIUM;
    if (value == "enterprise") return TenantTier::ENTERPRISE;
    return std::nullopt;
}

} // namespace orion::security::domain
