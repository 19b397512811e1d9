// Craftkit - Platform Utilities
// Cross-platform system utilities

#pragma once

#include <string>

namespace craftkit::utils {

/**
 * @brief Platform helpers
 */
class PlatformUtils {
public:
    // Hand a URL to the desktop's default handler
    static bool openUrl(const std::string& url);
};

} // namespace craftkit::utils
