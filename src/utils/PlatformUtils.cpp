/**
 * PlatformUtils.cpp
 *
 * Cross-platform system utilities.
 */

#include "PlatformUtils.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <windows.h>
#include <shellapi.h>
#endif

namespace craftkit::utils {

namespace {

// Single-quote for /bin/sh; the authorize URL carries '&'
std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += "'";
    return quoted;
}

} // namespace

bool PlatformUtils::openUrl(const std::string& url) {
#ifdef _WIN32
    return reinterpret_cast<intptr_t>(ShellExecuteA(nullptr, "open", url.c_str(), nullptr, nullptr, SW_SHOW)) > 32;
#elif defined(__APPLE__)
    return std::system(("open " + shellQuote(url)).c_str()) == 0;
#else
    return std::system(("xdg-open " + shellQuote(url) + " >/dev/null 2>&1").c_str()) == 0;
#endif
}

} // namespace craftkit::utils
