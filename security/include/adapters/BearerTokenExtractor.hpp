#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace orion::security::adapters {

/**
 * @brief Извлечение bearer-токена из заголовка Authorization
 *
 * Ожидаемый формат: "Bearer <token>", префикс без учёта регистра.
 * Проверка подписи токена выполняется до этого слоя.
 */
class BearerTokenExtractor {
public:
    /**
     * @param authorizationHeader значение заголовка (nullopt если заголовка нет)
     * @return токен или nullopt если заголовок отсутствует или некорректен
     */
    static std::optional<std::string> extract(const std::optional<std::string>& authorizationHeader) {
        if (!authorizationHeader) {
            return std::nullopt;
        }

        std::string trimmed = trim(*authorizationHeader);
        if (trimmed.size() < PREFIX.size()) {
            return std::nullopt;
        }

        std::string prefix = trimmed.substr(0, PREFIX.size());
        std::transform(prefix.begin(), prefix.end(), prefix.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (prefix != PREFIX) {
            return std::nullopt;
        }

        std::string token = trim(trimmed.substr(PREFIX.size()));
        if (token.empty()) {
            return std::nullopt;
        }
        return token;
    }

private:
    static inline const std::string PREFIX = "bearer";

    static std::string trim(const std::string& value) {
        const char* whitespace = " \t\r\n";
        auto begin = value.find_first_not_of(whitespace);
        if (begin == std::string::npos) {
            return "";
        }
        auto end = value.find_last_not_of(whitespace);
        return value.substr(begin, end - begin + 1);
    }
};

} // namespace orion::security::adapters
