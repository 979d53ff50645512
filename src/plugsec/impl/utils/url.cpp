#include "utils/url.h"
#include <algorithm>
#include <cctype>

namespace plugsec {
namespace utils {

std::string toLower(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

namespace {

bool isValidScheme(const std::string& scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

bool isValidHostChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '%';
}

bool isValidPort(const std::string& port) {
    if (port.empty()) {
        return true;
    }
    if (port.size() > 5 || !std::all_of(port.begin(), port.end(),
                                        [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    return std::stoul(port) <= 65535;
}

} // anonymous namespace

std::optional<Url> parseUrl(const std::string& text) {
    auto schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }

    Url url;
    url.scheme = toLower(text.substr(0, schemeEnd));
    if (!isValidScheme(url.scheme)) {
        return std::nullopt;
    }

    std::string rest = text.substr(schemeEnd + 3);
    if (std::any_of(rest.begin(), rest.end(),
                    [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); })) {
        return std::nullopt;
    }

    // Split off fragment and query first
    auto hashPos = rest.find('#');
    if (hashPos != std::string::npos) {
        url.fragment = rest.substr(hashPos + 1);
        rest.erase(hashPos);
    }
    auto queryPos = rest.find('?');
    if (queryPos != std::string::npos) {
        url.query = rest.substr(queryPos + 1);
        rest.erase(queryPos);
    }

    auto pathPos = rest.find('/');
    std::string authority = rest.substr(0, pathPos);
    url.path = pathPos == std::string::npos ? "/" : rest.substr(pathPos);

    auto atPos = authority.rfind('@');
    if (atPos != std::string::npos) {
        authority.erase(0, atPos + 1);
    }

    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        url.host = toLower(authority.substr(1, close - 1));
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') {
                return std::nullopt;
            }
            url.port = tail.substr(1);
        }
        bool validIpv6 = !url.host.empty() &&
            std::all_of(url.host.begin(), url.host.end(), [](unsigned char c) {
                return std::isxdigit(c) || c == ':' || c == '.';
            });
        if (!validIpv6) {
            return std::nullopt;
        }
    } else {
        auto colon = authority.find(':');
        url.host = toLower(authority.substr(0, colon));
        if (colon != std::string::npos) {
            url.port = authority.substr(colon + 1);
        }
        if (url.host.empty() ||
            !std::all_of(url.host.begin(), url.host.end(), isValidHostChar)) {
            return std::nullopt;
        }
    }

    if (!isValidPort(url.port)) {
        return std::nullopt;
    }

    return url;
}

} // namespace utils
} // namespace plugsec
