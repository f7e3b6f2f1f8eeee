#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace orion::security::domain {

/**
 * @brief Роли платформы (RBAC)
 *
 * Иерархия фиксирована и задана таблицей, а не выводится:
 * - ADMIN включает TRADER, SALES, RISK, ANALYST
 * - SALES включает TRADER
 * - остальные роли включают только себя
 * PLATFORM не связана ни с одной другой ролью (ADMIN её не включает).
 */
enum class Role {
    TRADER,
    SALES,
    RISK,
    ANALYST,
    ADMIN,
    PLATFORM
};

/**
 * @brief Каноническое имя роли ("ROLE_TRADER", ...)
 */
std::string toString(Role role);

/**
 * @brief Найти роль по каноническому имени
 *
 * Неизвестные имена (роль из более новой или старой версии
 * провайдера идентичности) не являются ошибкой.
 *
 * @return роль или nullopt если имя неизвестно
 */
std::optional<Role> roleFromString(const std::string& value);

bool isKnownRole(const std::string& value);

/**
 * @brief Роли, которые включает данная роль (без неё самой)
 *
 * Плоская таблица на один уровень, не транзитивное замыкание.
 */
const std::set<Role>& impliedRoles(Role role);

/**
 * @brief Включает ли роль held роль required (сама роль или по таблице)
 */
bool implies(Role held, Role required);

/// Все роли в порядке объявления
const std::vector<Role>& allRoles();

} // namespace orion::security::domain
