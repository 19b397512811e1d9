#include "AuthErrors.hpp"

#include <nlohmann/json.hpp>

namespace craftkit::core::auth {

namespace {

uint64_t extractXErr(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return 0;

    auto it = j.find("XErr");
    if (it == j.end()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) return static_cast<uint64_t>(it->get<int64_t>());
    return 0;
}

} // namespace

XSTSException::XSTSException(XboxLiveAuthResponse auth, int statusCode, std::string responseBody)
    : AuthenticationException("Unable to get the XSTS authentication token from server",
                              statusCode, responseBody)
    , m_auth(std::move(auth))
    , m_xerr(extractXErr(responseBody))
    , m_reason(describeXErr(m_xerr)) {}

std::string XSTSException::describeXErr(uint64_t xerr) {
    switch (xerr) {
        case 2148916233ULL: return "The account has no Xbox profile";
        case 2148916235ULL: return "Xbox Live is not available in the account's region";
        case 2148916236ULL:
        case 2148916237ULL: return "The account needs adult verification";
        case 2148916238ULL: return "The account belongs to a minor and must be added to a family";
        default:            return "";
    }
}

} // namespace craftkit::core::auth
