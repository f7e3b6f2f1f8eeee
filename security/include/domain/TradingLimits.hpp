#pragma once

namespace orion::security::domain {

/**
 * @brief Торговые лимиты пользователя
 */
struct TradingLimits {
    double maxNotional = 0.0;  ///< Максимальный номинал одной сделки (в базовой валюте)
    int rfqRateLimit = 0;      ///< RFQ в минуту
    int orderRateLimit = 0;    ///< Ордеров в минуту
    int maxOpenOrders = 0;     ///< Одновременно открытых ордеров

    TradingLimits() = default;

    TradingLimits(double maxNotional, int rfqRateLimit, int orderRateLimit, int maxOpenOrders)
        : maxNotional(maxNotional)
        , rfqRateLimit(rfqRateLimit)
        , orderRateLimit(orderRateLimit)
        , maxOpenOrders(maxOpenOrders)
    {}

    /// Лимиты уровня standard
    static TradingLimits defaults() {
        return TradingLimits(10'000'000.0, 60, 120, 100);
    }
};

} // namespace orion::security::domain
