/**
 * @file SpanHelperTest.cpp
 * @brief Тесты SpanHelper: атрибуты корреляции и статус span'а
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/SpanHelper.hpp"
#include "context/CorrelationContextHolder.hpp"
#include "mocks/MockTracer.hpp"

#include <stdexcept>

using namespace orion::observability;
using application::SpanHelper;
using context::CorrelationContextHolder;
using domain::CorrelationContext;
using ports::output::SpanKind;
using ports::output::SpanStatus;
using tests::mocks::MockSpan;
using tests::mocks::MockTracer;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class SpanHelperTest : public ::testing::Test {
protected:
    void SetUp() override {
        CorrelationContextHolder::clear();
        tracer_ = std::make_shared<MockTracer>();
        span_ = std::make_shared<NiceMock<MockSpan>>();
        helper_ = std::make_unique<SpanHelper>(tracer_);
    }

    void TearDown() override { CorrelationContextHolder::clear(); }

    std::shared_ptr<MockTracer> tracer_;
    std::shared_ptr<NiceMock<MockSpan>> span_;
    std::unique_ptr<SpanHelper> helper_;
};

TEST_F(SpanHelperTest, Construct_NullTracer_Throws) {
    EXPECT_THROW(SpanHelper(nullptr), std::invalid_argument);
}

TEST_F(SpanHelperTest, WithSpan_ReturnsResultAndEndsSpan) {
    EXPECT_CALL(*tracer_, startSpan("price", SpanKind::INTERNAL)).WillOnce(Return(span_));
    EXPECT_CALL(*span_, setStatus(SpanStatus::OK, _));
    EXPECT_CALL(*span_, end()).Times(1);

    int result = helper_->withSpan("price", []() { return 42; });

    EXPECT_EQ(result, 42);
}

TEST_F(SpanHelperTest, WithSpan_TagsBoundCorrelationContext) {
    CorrelationContextHolder::set(CorrelationContext("corr-1", "tenant-1", "user-1"));
    EXPECT_CALL(*tracer_, startSpan(_, _)).WillOnce(Return(span_));
    EXPECT_CALL(*span_, setAttribute("correlation.id", "corr-1"));
    EXPECT_CALL(*span_, setAttribute("tenant.id", "tenant-1"));
    EXPECT_CALL(*span_, setAttribute("user.id", "user-1"));

    helper_->withSpan("op", []() {});
}

TEST_F(SpanHelperTest, WithSpan_NoUserId_OmitsUserTag) {
    CorrelationContextHolder::set(CorrelationContext("corr-1", "tenant-1"));
    EXPECT_CALL(*tracer_, startSpan(_, _)).WillOnce(Return(span_));
    EXPECT_CALL(*span_, setAttribute("correlation.id", "corr-1"));
    EXPECT_CALL(*span_, setAttribute("tenant.id", "tenant-1"));
    EXPECT_CALL(*span_, setAttribute("user.id", _)).Times(0);

    helper_->withSpan("op", []() {});
}

TEST_F(SpanHelperTest, WithSpan_Unbound_NoCorrelationTags) {
    EXPECT_CALL(*tracer_, startSpan(_, _)).WillOnce(Return(span_));
    EXPECT_CALL(*span_, setAttribute(_, _)).Times(0);
    EXPECT_CALL(*span_, end()).Times(1);

    helper_->withSpan("op", []() {});
}

TEST_F(SpanHelperTest, WithSpan_CustomAttributesAndKind) {
    EXPECT_CALL(*tracer_, startSpan("rpc", SpanKind::CLIENT)).WillOnce(Return(span_));
    EXPECT_CALL(*span_, setAttribute("rpc.method", "GetQuote"));

    helper_->withSpan("rpc", []() {}, {{"rpc.method", "GetQuote"}}, SpanKind::CLIENT);
}

TEST_F(SpanHelperTest, WithSpan_OperationThrows_RecordsErrorAndRethrows) {
    EXPECT_CALL(*tracer_, startSpan(_, _)).WillOnce(Return(span_));
    EXPECT_CALL(*span_, setStatus(SpanStatus::ERROR, "venue down"));
    EXPECT_CALL(*span_, recordError("venue down"));
    EXPECT_CALL(*span_, setStatus(SpanStatus::OK, _)).Times(0);
    EXPECT_CALL(*span_, end()).Times(1);

    EXPECT_THROW(
        helper_->withSpan("op", []() -> int { throw std::runtime_error("venue down"); }),
        std::runtime_error);
}
