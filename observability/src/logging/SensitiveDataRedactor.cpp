#include "logging/SensitiveDataRedactor.hpp"

namespace orion::observability::logging {

namespace {

std::string escapeRegex(const std::string& text) {
    static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
    return std::regex_replace(text, special, R"(\$&)");
}

std::regex compile(const std::set<std::string>& patterns) {
    std::string alternation;
    for (const auto& pattern : patterns) {
        if (pattern.empty()) {
            continue;
        }
        if (!alternation.empty()) {
            alternation += "|";
        }
        alternation += escapeRegex(pattern);
    }
    // пустой набор шаблонов не должен совпадать ни с чем
    if (alternation.empty()) {
        alternation = R"([^\s\S])";
    }
    return std::regex(alternation, std::regex::ECMAScript | std::regex::icase);
}

} // namespace

const std::set<std::string>& SensitiveDataRedactor::defaultPatterns() {
    static const std::set<std::string> patterns = {
        "password", "token", "accesstoken", "refreshtoken",
        "secret", "authorization", "apikey", "credential"
    };
    return patterns;
}

SensitiveDataRedactor::SensitiveDataRedactor()
    : SensitiveDataRedactor(defaultPatterns()) {}

SensitiveDataRedactor::SensitiveDataRedactor(std::set<std::string> patterns)
    : patterns_(std::move(patterns))
    , compiled_(compile(patterns_)) {}

SensitiveDataRedactor::Fields SensitiveDataRedactor::redact(const Fields& fields) const {
    Fields result;
    for (const auto& [key, value] : fields) {
        result[key] = isSensitive(key) ? REDACTED : value;
    }
    return result;
}

bool SensitiveDataRedactor::isSensitive(const std::string& fieldName) const {
    return std::regex_search(fieldName, compiled_);
}

} // namespace orion::observability::logging
