// Craftkit - String Utilities
// String manipulation helpers

#pragma once

#include <string>

namespace craftkit::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // UUID
    static std::string generateUUID();
    static bool isValidUUID(const std::string& str);

    // Replace characters that are not legal in a directory name
    static std::string sanitizeFileName(const std::string& name, char replacement = '-');
};

} // namespace craftkit::utils
