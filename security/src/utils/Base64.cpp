#include "utils/Base64.hpp"

#include <cstdint>
#include <stdexcept>

namespace orion::security::utils {

namespace {

const char* ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int lookup(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace

std::string Base64::encode(const std::string& input) {
    std::string result;
    result.reserve(((input.size() + 2) / 3) * 4);

    // В val хранятся только ещё не выведенные биты (не больше 14)
    uint32_t val = 0;
    int valb = -6;
    for (unsigned char c : input) {
        val = ((val << 8) | c) & 0xFFFF;
        valb += 8;
        while (valb >= 0) {
            result.push_back(ALPHABET[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        result.push_back(ALPHABET[(val << -valb) & 0x3F]);
    }
    while (result.size() % 4 != 0) {
        result.push_back('=');
    }
    return result;
}

std::string Base64::decode(const std::string& input) {
    if (input.size() % 4 != 0) {
        throw std::invalid_argument("Base64 input length must be a multiple of 4");
    }

    size_t padding = 0;
    if (!input.empty() && input[input.size() - 1] == '=') ++padding;
    if (input.size() > 1 && input[input.size() - 2] == '=') ++padding;

    std::string result;
    result.reserve((input.size() / 4) * 3);

    uint32_t val = 0;
    int valb = -8;
    for (size_t i = 0; i < input.size() - padding; ++i) {
        int digit = lookup(static_cast<unsigned char>(input[i]));
        if (digit < 0) {
            throw std::invalid_argument("Invalid Base64 character at position " + std::to_string(i));
        }
        val = ((val << 6) | static_cast<uint32_t>(digit)) & 0xFFFF;
        valb += 6;
        if (valb >= 0) {
            result.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    // Неиспользованные младшие биты последнего символа должны быть нулевыми
    int leftover = valb + 8;
    if (leftover > 0 && (val & ((1u << leftover) - 1)) != 0) {
        throw std::invalid_argument("Base64 input has non-zero trailing bits");
    }
    return result;
}

} // namespace orion::security::utils
