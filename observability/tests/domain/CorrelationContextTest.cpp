#include <gtest/gtest.h>

#include "domain/CorrelationContext.hpp"

using orion::observability::domain::CorrelationContext;

TEST(CorrelationContextTest, Construct_AllFields) {
    CorrelationContext ctx("corr-1", "tenant-1", "user-1", "req-1", "span-1", "trace-1");

    EXPECT_EQ(ctx.correlationId(), "corr-1");
    EXPECT_EQ(ctx.tenantId().value_or(""), "tenant-1");
    EXPECT_EQ(ctx.userId().value_or(""), "user-1");
    EXPECT_EQ(ctx.requestId().value_or(""), "req-1");
    EXPECT_EQ(ctx.spanId().value_or(""), "span-1");
    EXPECT_EQ(ctx.traceId().value_or(""), "trace-1");
}

TEST(CorrelationContextTest, Construct_OnlyCorrelationId) {
    CorrelationContext ctx("corr-1");

    EXPECT_EQ(ctx.correlationId(), "corr-1");
    EXPECT_FALSE(ctx.tenantId().has_value());
    EXPECT_FALSE(ctx.userId().has_value());
    EXPECT_FALSE(ctx.requestId().has_value());
    EXPECT_FALSE(ctx.spanId().has_value());
    EXPECT_FALSE(ctx.traceId().has_value());
}

TEST(CorrelationContextTest, Construct_EmptyCorrelationId_Throws) {
    EXPECT_THROW(CorrelationContext(""), std::invalid_argument);
}

TEST(CorrelationContextTest, Construct_BlankCorrelationId_Throws) {
    EXPECT_THROW(CorrelationContext("   "), std::invalid_argument);
}

TEST(CorrelationContextTest, WithSpan_ReturnsCopy) {
    CorrelationContext original("corr-1", "tenant-1");

    auto traced = original.withSpan("span-9", "trace-9");

    EXPECT_EQ(traced.spanId().value_or(""), "span-9");
    EXPECT_EQ(traced.traceId().value_or(""), "trace-9");
    EXPECT_EQ(traced.tenantId().value_or(""), "tenant-1");
    // исходное значение не меняется
    EXPECT_FALSE(original.spanId().has_value());
}

TEST(CorrelationContextTest, WithRequestId_ReturnsCopy) {
    CorrelationContext original("corr-1");

    auto withRequest = original.withRequestId("req-2");

    EXPECT_EQ(withRequest.requestId().value_or(""), "req-2");
    EXPECT_FALSE(original.requestId().has_value());
}

TEST(CorrelationContextTest, Equality_ComparesAllFields) {
    CorrelationContext a("corr-1", "tenant-1", "user-1");
    CorrelationContext b("corr-1", "tenant-1", "user-1");
    CorrelationContext c("corr-1", "tenant-1", "user-2");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
