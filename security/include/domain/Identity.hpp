#pragma once

#include <string>

namespace orion::security::domain {

/**
 * @brief Аутентифицированный пользователь
 *
 * Создаётся из уже проверенных claims на границе сервиса, не изменяется.
 */
struct Identity {
    std::string userId;       ///< ID пользователя (claim 'sub')
    std::string email;
    std::string username;     ///< Логин или preferred_username
    std::string displayName;  ///< Отображаемое имя (может быть пустым)

    Identity() = default;

    Identity(std::string userId,
             std::string email,
             std::string username,
             std::string displayName = "")
        : userId(std::move(userId))
        , email(std::move(email))
        , username(std::move(username))
        , displayName(std::move(displayName))
    {}
};

} // namespace orion::security::domain
