#include "RedirectCapture.hpp"
#include "../Logger.hpp"
#include "../../utils/PlatformUtils.hpp"

namespace craftkit::core::auth {

bool SystemBrowserLauncher::open(const std::string& url) {
    LOG_INFO("Opening browser for Microsoft sign-in");
    LOG_DEBUG("Authorize URL: {}", url);
    return utils::PlatformUtils::openUrl(url);
}

} // namespace craftkit::core::auth
