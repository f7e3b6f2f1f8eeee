#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace orion::observability::context {

/**
 * @brief Структурированный контекст логирования текущего потока (MDC)
 *
 * Хранилище ключ/значение, которое Logger дописывает к каждой строке.
 * Каждый поток видит только свои записи. Порядок ключей сохраняется
 * в порядке первой вставки.
 */
class LogContext {
public:
    using Entries = std::vector<std::pair<std::string, std::string>>;

    /**
     * @brief Записать значение (заменяет существующее с тем же ключом)
     */
    static void put(const std::string& key, const std::string& value);

    static void remove(const std::string& key);

    /**
     * @brief Получить значение по ключу
     * @return значение или nullopt если ключ не установлен
     */
    static std::optional<std::string> get(const std::string& key);

    static bool contains(const std::string& key);

    /// Удалить все записи текущего потока
    static void clear();

    /// Копия всех записей текущего потока
    static Entries snapshot();

private:
    static thread_local Entries entries_;
};

} // namespace orion::observability::context
