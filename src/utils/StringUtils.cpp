/**
 * StringUtils.cpp
 *
 * String manipulation helpers.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <random>

namespace craftkit::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return start < end ? std::string(start, end) : std::string();
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- UUID --

std::string StringUtils::generateUUID() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    static const char hex[] = "0123456789abcdef";

    std::string uuid(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex[dis(gen)];
    }
    uuid[14] = '4'; // version 4
    uuid[19] = hex[(dis(gen) & 0x3) | 0x8]; // variant
    return uuid;
}

bool StringUtils::isValidUUID(const std::string& str) {
    if (str.size() != 36) return false;
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (str[i] != '-') return false;
        } else {
            if (!std::isxdigit(static_cast<unsigned char>(str[i]))) return false;
        }
    }
    return true;
}

// -- File names --

std::string StringUtils::sanitizeFileName(const std::string& name, char replacement) {
    static const std::string illegal = "<>:\"/\\|?*";

    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || illegal.find(c) != std::string::npos) result += replacement;
        else result += c;
    }
    return result;
}

} // namespace craftkit::utils
