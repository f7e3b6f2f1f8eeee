#pragma once

#include "logging/SensitiveDataRedactor.hpp"
#include "settings/ObservabilitySettings.hpp"

#include <map>
#include <ostream>
#include <string>

namespace orion::observability::logging {

/**
 * @brief Уровень строки лога
 */
enum class LogLevel {
    INFO,
    WARN,
    ERROR
};

std::string toString(LogLevel level);

/**
 * @brief Логгер с привязкой к LogContext
 *
 * Формат строки:
 *   [service@version/env] [Component] message {key=value, ...} fields...
 *
 * Метаданные сервиса выводятся только после configure(). Записи LogContext
 * текущего потока дописываются в порядке вставки; если их нет, блок {}
 * не выводится. INFO пишется в std::cout, WARN и ERROR в std::cerr.
 * Строка выводится целиком под мьютексом.
 */
class Logger {
public:
    using Fields = std::map<std::string, std::string>;

    Logger() = delete;

    /// Установить метаданные сервиса для всех потоков
    static void configure(const settings::ObservabilitySettings& settings);

    /// Сбросить метаданные сервиса (используется в тестах)
    static void reset();

    static void info(const std::string& component, const std::string& message, const Fields& fields = {});
    static void warn(const std::string& component, const std::string& message, const Fields& fields = {});
    static void error(const std::string& component, const std::string& message, const Fields& fields = {});

    /**
     * @brief Сформировать строку лога без вывода
     *
     * Дополнительные поля проходят через SensitiveDataRedactor.
     */
    static std::string format(LogLevel level,
                              const std::string& component,
                              const std::string& message,
                              const Fields& fields = {});

private:
    static void write(LogLevel level, std::ostream& out, const std::string& component,
                      const std::string& message, const Fields& fields);
};

} // namespace orion::observability::logging
