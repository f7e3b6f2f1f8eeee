#pragma once

#include "ports/output/ITracer.hpp"

#include <gmock/gmock.h>

namespace orion::observability::tests::mocks {

class MockSpan : public ports::output::ISpan {
public:
    MOCK_METHOD(void, setAttribute, (const std::string&, const std::string&), (override));
    MOCK_METHOD(void, setStatus, (ports::output::SpanStatus, const std::string&), (override));
    MOCK_METHOD(void, recordError, (const std::string&), (override));
    MOCK_METHOD(void, end, (), (override));
};

class MockTracer : public ports::output::ITracer {
public:
    MOCK_METHOD(std::shared_ptr<ports::output::ISpan>, startSpan,
                (const std::string&, ports::output::SpanKind), (override));
};

} // namespace orion::observability::tests::mocks
