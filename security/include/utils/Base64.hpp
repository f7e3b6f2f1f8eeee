#pragma once

#include <string>

namespace orion::security::utils {

/**
 * @brief Base64 (RFC 4648, стандартный алфавит, с паддингом '=')
 *
 * Результат encode() состоит только из [A-Za-z0-9+/=] и безопасен
 * для значения заголовка метаданных RPC.
 */
class Base64 {
public:
    static std::string encode(const std::string& input);

    /**
     * @throws std::invalid_argument если вход не является корректным Base64
     */
    static std::string decode(const std::string& input);
};

} // namespace orion::security::utils
