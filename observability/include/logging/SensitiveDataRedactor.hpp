#pragma once

#include <map>
#include <regex>
#include <set>
#include <string>

namespace orion::observability::logging {

/**
 * @brief Маскирование чувствительных полей перед записью в лог
 *
 * Поле считается чувствительным, если его имя содержит (без учёта регистра)
 * один из шаблонов. Значения таких полей заменяются на REDACTED.
 */
class SensitiveDataRedactor {
public:
    using Fields = std::map<std::string, std::string>;

    static constexpr const char* REDACTED = "[REDACTED]";

    /// Шаблоны по умолчанию: password, token, secret, authorization, apikey, credential...
    static const std::set<std::string>& defaultPatterns();

    SensitiveDataRedactor();
    explicit SensitiveDataRedactor(std::set<std::string> patterns);

    /**
     * @brief Копия полей с замаскированными чувствительными значениями
     */
    Fields redact(const Fields& fields) const;

    bool isSensitive(const std::string& fieldName) const;

    const std::set<std::string>& patterns() const { return patterns_; }

private:
    std::set<std::string> patterns_;
    std::regex compiled_;
};

} // namespace orion::observability::logging
