#include <gtest/gtest.h>

#include "settings/ObservabilitySettings.hpp"

#include <cstdlib>

using orion::observability::settings::ObservabilitySettings;

class ObservabilitySettingsTest : public ::testing::Test {
protected:
    void SetUp() override { clearEnv(); }
    void TearDown() override { clearEnv(); }

    static void clearEnv() {
        unsetenv("ORION_SERVICE_NAME");
        unsetenv("ORION_SERVICE_VERSION");
        unsetenv("ORION_ENVIRONMENT");
    }
};

TEST_F(ObservabilitySettingsTest, Defaults) {
    ObservabilitySettings settings;

    EXPECT_EQ(settings.getServiceName(), "orion-service");
    EXPECT_EQ(settings.getServiceVersion(), "0.0.0");
    EXPECT_EQ(settings.getEnvironment(), "development");
}

TEST_F(ObservabilitySettingsTest, ReadsFromEnvironment) {
    setenv("ORION_SERVICE_NAME", "execution-service", 1);
    setenv("ORION_SERVICE_VERSION", "2.0.1", 1);
    setenv("ORION_ENVIRONMENT", "production", 1);

    ObservabilitySettings settings;

    EXPECT_EQ(settings.getServiceName(), "execution-service");
    EXPECT_EQ(settings.getServiceVersion(), "2.0.1");
    EXPECT_EQ(settings.getEnvironment(), "production");
}

TEST_F(ObservabilitySettingsTest, BlankEnvironment_FallsBackToDevelopment) {
    setenv("ORION_ENVIRONMENT", "  ", 1);

    EXPECT_EQ(ObservabilitySettings().getEnvironment(), "development");
}

TEST_F(ObservabilitySettingsTest, BlankServiceName_Throws) {
    setenv("ORION_SERVICE_NAME", "", 1);

    EXPECT_THROW(ObservabilitySettings(), std::invalid_argument);
}
