#pragma once

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace orion::observability::settings {

/**
 * @brief Метаданные сервиса для логов
 *
 * Читает из ENV:
 * - ORION_SERVICE_NAME (default: "orion-service")
 * - ORION_SERVICE_VERSION (default: "0.0.0")
 * - ORION_ENVIRONMENT (default: "development")
 */
class ObservabilitySettings {
public:
    ObservabilitySettings() {
        serviceName_ = getEnvOrDefault("ORION_SERVICE_NAME", "orion-service");
        serviceVersion_ = getEnvOrDefault("ORION_SERVICE_VERSION", "0.0.0");
        environment_ = getEnvOrDefault("ORION_ENVIRONMENT", "development");

        if (isBlank(serviceName_)) {
            throw std::invalid_argument("ORION_SERVICE_NAME must not be blank");
        }
        if (isBlank(environment_)) {
            environment_ = "development";
        }
    }

    std::string getServiceName() const { return serviceName_; }
    std::string getServiceVersion() const { return serviceVersion_; }
    std::string getEnvironment() const { return environment_; }

private:
    std::string serviceName_;
    std::string serviceVersion_;
    std::string environment_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static bool isBlank(const std::string& value) {
        return value.find_first_not_of(" \t\r\n") == std::string::npos;
    }
};

} // namespace orion::observability::settings
