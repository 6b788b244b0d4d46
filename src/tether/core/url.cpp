// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tether/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace tether::core {

namespace {

bool valid_scheme(std::string_view s) noexcept {
    if (s.empty() || !std::isalpha(static_cast<unsigned char>(s.front()))) {
        return false;
    }
    return std::all_of(s.begin(), s.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '+' || c == '-' || c == '.';
    });
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || !valid_scheme(url_str.substr(0, scheme_end))) {
            return std::unexpected(make_error_code(TaskErrc::invalid_url));
        }
        if (std::any_of(url_str.begin(), url_str.end(),
                        [](char c) { return std::isspace(static_cast<unsigned char>(c)); })) {
            return std::unexpected(make_error_code(TaskErrc::invalid_url));
        }

        Url url;
        url.str_ = std::string(url_str);
        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }

        auto rest = url_str.substr(scheme_end + 3);

        // Drop the fragment, split off the query
        if (auto hash = rest.find('#'); hash != std::string_view::npos) {
            rest = rest.substr(0, hash);
        }
        if (auto q = rest.find('?'); q != std::string_view::npos) {
            url.query_ = std::string(rest.substr(q + 1));
            rest = rest.substr(0, q);
        }

        auto slash = rest.find('/');
        auto authority = rest.substr(0, slash);
        url.path_ = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));

        // user:pass@host:port
        if (auto at = authority.rfind('@'); at != std::string_view::npos) {
            authority = authority.substr(at + 1);
        }

        if (!authority.empty() && authority.front() == '[') {
            auto close = authority.find(']');
            if (close == std::string_view::npos) {
                return std::unexpected(make_error_code(TaskErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, close + 1));
            auto after = authority.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return std::unexpected(make_error_code(TaskErrc::invalid_url));
                }
                url.port_ = std::string(after.substr(1));
            }
        } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
            url.host_ = std::string(authority.substr(0, colon));
            url.port_ = std::string(authority.substr(colon + 1));
        } else {
            url.host_ = std::string(authority);
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(TaskErrc::invalid_url));
        }
        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return std::unexpected(make_error_code(TaskErrc::invalid_url));
        }

        return url;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(TaskErrc::invalid_url));
    }
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    name = percent_decode(name);
    // A decoded name must not escape the output directory
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        return "index.html";
    }
    return name;
}

} // namespace tether::core
