#include "context/CorrelationContextHolder.hpp"
#include "context/LogContext.hpp"
#include "domain/NullContextException.hpp"

namespace orion::observability::context {

using domain::CorrelationContext;

thread_local std::optional<CorrelationContext> CorrelationContextHolder::current_;

namespace {

void putOrRemove(const char* key, const std::optional<std::string>& value) {
    if (value) {
        LogContext::put(key, *value);
    } else {
        LogContext::remove(key);
    }
}

} // namespace

// ============================================
// ScopedCorrelationContext
// ============================================

ScopedCorrelationContext::ScopedCorrelationContext(const CorrelationContext& context)
    : previous_(CorrelationContextHolder::get())
{
    CorrelationContextHolder::set(context);
}

ScopedCorrelationContext::~ScopedCorrelationContext() {
    if (previous_) {
        CorrelationContextHolder::set(previous_);
    } else {
        CorrelationContextHolder::clear();
    }
}

// ============================================
// CorrelationContextHolder
// ============================================

void CorrelationContextHolder::set(const std::optional<CorrelationContext>& context) {
    if (!context) {
        throw domain::NullContextException();
    }
    current_ = context;
    populateLogContext(*context);
}

std::optional<CorrelationContext> CorrelationContextHolder::get() {
    return current_;
}

void CorrelationContextHolder::clear() {
    current_.reset();
    clearLogContext();
}

void CorrelationContextHolder::populateLogContext(const CorrelationContext& context) {
    LogContext::put(CorrelationContext::LOG_CORRELATION_ID, context.correlationId());
    putOrRemove(CorrelationContext::LOG_TENANT_ID, context.tenantId());
    putOrRemove(CorrelationContext::LOG_USER_ID, context.userId());
    putOrRemove(CorrelationContext::LOG_REQUEST_ID, context.requestId());
    putOrRemove(CorrelationContext::LOG_SPAN_ID, context.spanId());
    putOrRemove(CorrelationContext::LOG_TRACE_ID, context.traceId());
}

void CorrelationContextHolder::clearLogContext() {
    LogContext::remove(CorrelationContext::LOG_CORRELATION_ID);
    LogContext::remove(CorrelationContext::LOG_TENANT_ID);
    LogContext::remove(CorrelationContext::LOG_USER_ID);
    LogContext::remove(CorrelationContext::LOG_REQUEST_ID);
    LogContext::remove(CorrelationContext::LOG_SPAN_ID);
    LogContext::remove(CorrelationContext::LOG_TRACE_ID);
}

} // namespace orion::observability::context
