#pragma once

#include <string>
#include <vector>

namespace orion::security::domain {

/**
 * @brief Результат структурной проверки контекста авторизации
 *
 * Содержит все найденные нарушения, а не только первое.
 */
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;

    static ValidationResult ok() { return {true, {}}; }

    static ValidationResult fail(std::vector<std::string> errors) {
        return {false, std::move(errors)};
    }
};

} // namespace orion::security::domain
