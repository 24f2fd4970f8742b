#pragma once
#include <string>
#include <optional>
#include <regex>

struct UrlParts {
    bool isSsl = false;
    std::string host;
    int port = 80;
    std::string path;  // may be empty

    // "http://host:port" / "https://host:port", the form httplib::Client accepts.
    std::string schemeHostPort() const {
        return std::string(isSsl ? "https://" : "http://") + host + ":" + std::to_string(port);
    }
};

inline std::optional<UrlParts> parseUrl(const std::string& url) {
    static const std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (!std::regex_match(url, match, urlRegex)) {
        return std::nullopt;
    }
    UrlParts parts;
    parts.isSsl = (match[1] == "https");
    parts.host = match[2];
    if (match[3].matched) {
        const std::string digits = match[3];
        if (digits.size() > 5) return std::nullopt;
        parts.port = std::stoi(digits);
        if (parts.port < 1 || parts.port > 65535) return std::nullopt;
    } else {
        parts.port = parts.isSsl ? 443 : 80;
    }
    parts.path = match[4];
    return parts;
}
