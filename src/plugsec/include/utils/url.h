#ifndef PLUGSEC_URL_H
#define PLUGSEC_URL_H

#include <string>
#include <optional>

namespace plugsec {
namespace utils {

/**
 * @brief Components of an absolute URL
 *
 * Scheme and host are lowercased. IPv6 hosts are stored without the
 * surrounding brackets. Path always starts with '/' and is not
 * normalized, so ".." segments are preserved for inspection.
 */
struct Url {
    std::string scheme;     ///< e.g. "https"
    std::string host;       ///< e.g. "api.example.com" or "::1"
    std::string port;       ///< empty when not given
    std::string path;       ///< "/" when not given
    std::string query;      ///< without the leading '?'
    std::string fragment;   ///< without the leading '#'
};

/**
 * @brief Parse an absolute URL of the form scheme://[user@]host[:port][/path][?query][#fragment]
 * @return Parsed components, or std::nullopt if the text is not an absolute URL
 */
std::optional<Url> parseUrl(const std::string& text);

/**
 * @brief Lowercase ASCII copy of a string
 */
std::string toLower(const std::string& text);

} // namespace utils
} // namespace plugsec

#endif // PLUGSEC_URL_H
