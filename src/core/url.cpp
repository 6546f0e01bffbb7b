#include "core/url.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <charconv>
#include <format>

namespace vaultclient {

std::string ParsedUrl::origin() const {
    return std::format("{}://{}:{}", scheme, host, port);
}

std::optional<ParsedUrl> parse_url(std::string_view url) {
    const std::string trimmed = utils::trim(std::string(url));
    if (trimmed.empty()) return std::nullopt;

    const auto scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;

    ParsedUrl parsed;
    parsed.scheme = utils::to_lower(trimmed.substr(0, scheme_end));
    if (parsed.scheme == "https") {
        parsed.port = 443;
    } else if (parsed.scheme == "http") {
        parsed.port = 80;
    } else {
        return std::nullopt;
    }

    std::string rest = trimmed.substr(scheme_end + 3);
    if (const auto cut = rest.find_first_of("?#"); cut != std::string::npos) {
        rest.resize(cut);
    }

    std::string authority;
    if (const auto slash = rest.find('/'); slash != std::string::npos) {
        authority = rest.substr(0, slash);
        parsed.base_path = rest.substr(slash);
    } else {
        authority = rest;
    }

    if (authority.empty() || authority.find('@') != std::string::npos) return std::nullopt;

    // Bracketed IPv6 literal: [::1]:8200
    size_t port_sep = std::string::npos;
    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        parsed.host = authority.substr(0, close + 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            port_sep = close + 1;
        }
    } else {
        port_sep = authority.find(':');
        parsed.host = authority.substr(0, port_sep);
    }

    if (parsed.host.empty() || parsed.host == "[]") return std::nullopt;
    for (const char c : parsed.host) {
        if (std::isspace(static_cast<unsigned char>(c))) return std::nullopt;
    }

    if (port_sep != std::string::npos) {
        const std::string port_str = authority.substr(port_sep + 1);
        if (port_str.empty()) return std::nullopt;
        unsigned int port = 0;
        const auto [ptr, ec] = std::from_chars(
            port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) return std::nullopt;
        if (port == 0 || port > 65535) return std::nullopt;
        parsed.port = static_cast<uint16_t>(port);
    }

    while (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }

    return parsed;
}

std::string encode_path_segment(const std::string& segment) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string result;
    result.reserve(segment.size());
    for (const char c : segment) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '-' || c == '_' || c == '.' || c == '~') {
            result += c;
        } else {
            result += '%';
            result += kHex[uc >> 4];
            result += kHex[uc & 0x0F];
        }
    }
    return result;
}

} // namespace vaultclient
