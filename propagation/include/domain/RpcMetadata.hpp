#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>

namespace orion::propagation::domain {

/**
 * @brief Метаданные RPC-вызова: имя заголовка в нижнем регистре -> значение
 */
using RpcMetadata = std::map<std::string, std::string>;

inline std::string toLowerCase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/**
 * @brief Найти заголовок (имя без учёта регистра)
 *
 * Ключи, записанные в смешанном регистре ("X-Correlation-Id"), тоже находятся.
 */
inline std::optional<std::string> findHeader(const RpcMetadata& metadata, const std::string& name) {
    const auto lowered = toLowerCase(name);
    auto it = metadata.find(lowered);
    if (it != metadata.end()) {
        return it->second;
    }
    for (const auto& [key, value] : metadata) {
        if (toLowerCase(key) == lowered) {
            return value;
        }
    }
    return std::nullopt;
}

} // namespace orion::propagation::domain
