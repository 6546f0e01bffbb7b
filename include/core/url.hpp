#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vaultclient {

/**
 * @brief Components of an absolute http/https URL
 */
struct ParsedUrl {
    std::string scheme;     // "http" or "https" (lowercased)
    std::string host;
    uint16_t port = 0;      // Explicit port, or the scheme default
    std::string base_path;  // Without trailing slash; empty for "/"

    [[nodiscard]] bool use_ssl() const { return scheme == "https"; }

    // "scheme://host:port", the form httplib::Client accepts
    [[nodiscard]] std::string origin() const;
};

/**
 * @brief Parse and validate an absolute http/https URL
 *
 * Rejects blank input, other schemes, missing host, userinfo, and ports that
 * are not numeric or are outside 1..65535. Query and fragment are discarded.
 */
[[nodiscard]] std::optional<ParsedUrl> parse_url(std::string_view url);

// Percent-encode a single URL path segment (RFC 3986 unreserved kept as is)
[[nodiscard]] std::string encode_path_segment(const std::string& segment);

} // namespace vaultclient
