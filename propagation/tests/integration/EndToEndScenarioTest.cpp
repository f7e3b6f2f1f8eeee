#include <gtest/gtest.h>

#include "adapters/primary/CorrelationInterceptor.hpp"
#include "adapters/primary/ErrorStatusMapper.hpp"
#include "application/AuthorizationContextValidator.hpp"
#include "application/ContextPropagator.hpp"
#include "application/RoleChecker.hpp"
#include "application/TenantIsolationEnforcer.hpp"
#include "domain/exceptions/TenantMismatchException.hpp"
#include "testkit/TestAuthorizationContextFactory.hpp"

#include <memory>
#include <utility>

using namespace orion::propagation;
using orion::observability::context::CorrelationContextHolder;
using orion::security::application::AuthorizationContextValidator;
using orion::security::application::RoleChecker;
using orion::security::application::TenantIsolationEnforcer;
using orion::security::testkit::TestAuthorizationContextFactory;
namespace sec = orion::security::domain;

class EndToEndScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        CorrelationContextHolder::clear();
        propagator = std::make_shared<application::ContextPropagator>(
            std::make_shared<settings::PropagationSettings>());
    }

    void TearDown() override {
        CorrelationContextHolder::clear();
    }

    std::shared_ptr<application::ContextPropagator> propagator;
};

// ============================================
// SALES USER ON OWN / FOREIGN TENANT
// ============================================

TEST_F(EndToEndScenarioTest, SalesUser_OwnTenantAllowed_ForeignTenantRejected) {
    auto ctx = TestAuthorizationContextFactory::create(
        "u1", "t1", {sec::Role::SALES}, sec::Entitlements::defaults());

    EXPECT_TRUE(AuthorizationContextValidator::validate(ctx).valid);
    EXPECT_NO_THROW(TenantIsolationEnforcer::enforce(ctx, "t1"));

    try {
        TenantIsolationEnforcer::enforce(ctx, "t2");
        FAIL() << "Expected TenantMismatchException";
    } catch (const sec::TenantMismatchException& e) {
        EXPECT_EQ(e.expectedTenantId(), "t1");
        EXPECT_EQ(e.actualTenantId(), "t2");
    }

    EXPECT_TRUE(RoleChecker::hasRole(ctx, sec::Role::TRADER));
}

// ============================================
// RPC ROUND TRIP
// ============================================

TEST_F(EndToEndScenarioTest, CallerContextReachesCallee) {
    auto caller = TestAuthorizationContextFactory::create(
        "u1", "t1", {sec::Role::SALES}, sec::Entitlements::defaults());
    domain::RpcMetadata request;
    propagator->inject(caller, request);

    adapters::primary::CorrelationInterceptor interceptor(propagator);
    domain::RpcMetadata response;

    auto calleeView = interceptor.intercept(request, response, [this, &request] {
        auto propagated = propagator->extract(request);
        auto correlation = CorrelationContextHolder::get();
        return std::make_pair(propagated, correlation->correlationId());
    });

    EXPECT_EQ(calleeView.first.userId, "u1");
    EXPECT_EQ(calleeView.first.tenantId, "t1");
    EXPECT_EQ(calleeView.first.roles, std::vector<sec::Role>{sec::Role::SALES});
    EXPECT_EQ(calleeView.second, caller.correlationId);
    EXPECT_EQ(response["x-correlation-id"], caller.correlationId);
    EXPECT_FALSE(CorrelationContextHolder::get().has_value());
}

TEST_F(EndToEndScenarioTest, CalleeRejectsForeignTenantResource) {
    auto caller = TestAuthorizationContextFactory::createForTenant("t1");
    domain::RpcMetadata request;
    propagator->inject(caller, request);

    adapters::primary::CorrelationInterceptor interceptor(propagator);
    domain::RpcMetadata response;

    auto status = adapters::primary::ErrorStatusMapper::invoke([&] {
        interceptor.intercept(request, response, [&] {
            auto propagated = propagator->extract(request);
            if (propagated.tenantId != "t2") {
                throw sec::TenantMismatchException(propagated.tenantId, "t2");
            }
        });
    });

    EXPECT_EQ(status.code, domain::StatusCode::PERMISSION_DENIED);
}

TEST_F(EndToEndScenarioTest, CallWithoutAuthHeader_Unauthenticated) {
    adapters::primary::CorrelationInterceptor interceptor(propagator);
    domain::RpcMetadata request{{"x-correlation-id", "corr-anon"}};
    domain::RpcMetadata response;

    auto status = adapters::primary::ErrorStatusMapper::invoke([&] {
        interceptor.intercept(request, response, [&] { propagator->extract(request); });
    });

    EXPECT_EQ(status.code, domain::StatusCode::UNAUTHENTICATED);
    EXPECT_EQ(response["x-correlation-id"], "corr-anon");
}
