// Source/connection_parameters.cpp
#include "sqlforge_sqldriver/connection_parameters.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace sqlforge_sqldriver {

    namespace {

        int hexDigit(char c) {
            if (c >= '0' && c <= '9') return c - '0';
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            return -1;
        }

        // %XY 解码, 不完整的转义原样保留
        std::string percentDecode(std::string_view text) {
            std::string out;
            out.reserve(text.size());
            for (size_t i = 0; i < text.size(); ++i) {
                if (text[i] == '%' && i + 2 < text.size()) {
                    int hi = hexDigit(text[i + 1]);
                    int lo = hexDigit(text[i + 2]);
                    if (hi >= 0 && lo >= 0) {
                        out += static_cast<char>(hi * 16 + lo);
                        i += 2;
                        continue;
                    }
                }
                out += text[i];
            }
            return out;
        }

        sqlforge::Error invalidUrl(std::string_view url, const std::string& reason) {
            return sqlforge::Error(sqlforge::ErrorCode::InvalidConfiguration, "Invalid connection url '" + std::string(url) + "': " + reason);
        }

        template <typename T>
        std::optional<T> parseNumber(std::string_view text) {
            T value{};
            auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc() || end != text.data() + text.size()) return std::nullopt;
            return value;
        }

        // user:pass@host:port, host 可以是 [ipv6]
        std::expected<void, std::string> parseAuthority(std::string_view authority, ConnectionParameters& params) {
            if (auto at = authority.rfind('@'); at != std::string_view::npos) {
                std::string_view userinfo = authority.substr(0, at);
                authority.remove_prefix(at + 1);
                auto colon = userinfo.find(':');
                params.user = percentDecode(userinfo.substr(0, colon));
                if (colon != std::string_view::npos) params.password = percentDecode(userinfo.substr(colon + 1));
            }
            if (authority.empty()) return std::unexpected("missing host");

            auto bracket = authority.rfind(']');
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos && (bracket == std::string_view::npos || colon > bracket)) {
                std::string_view port_text = authority.substr(colon + 1);
                auto port = port_text.size() <= 5 ? parseNumber<int>(port_text) : std::nullopt;
                if (!port || *port <= 0 || *port > 65535) return std::unexpected("invalid port");
                params.port = *port;
                authority = authority.substr(0, colon);
            }
            if (authority.size() >= 2 && authority.front() == '[' && authority.back() == ']') {
                authority = authority.substr(1, authority.size() - 2);
            }
            params.host = std::string(authority);
            return {};
        }

        void applyQueryOption(const std::string& key, std::string value, ConnectionParameters& params) {
            if (key == "charset" || key == "client_encoding") {
                params.charset = std::move(value);
            } else if (key == "pool_max_size" || key == "max_connections") {
                params.pool.max_size = parseNumber<int>(value);
            } else if (key == "pool_acquire_timeout_ms") {
                params.pool.acquire_timeout_ms = parseNumber<long long>(value);
            } else if (key == "connect_timeout") {
                params.timeouts.connect_seconds = parseNumber<int>(value);
            } else if (key == "read_timeout") {
                params.timeouts.read_seconds = parseNumber<int>(value);
            } else if (key == "write_timeout") {
                params.timeouts.write_seconds = parseNumber<int>(value);
            } else if (key == "application_name") {
                params.application_name = std::move(value);
            } else {
                params.extra_options.emplace_back(key, std::move(value));
            }
        }

    }  // namespace

    const char* driverKindName(DriverKind kind) {
        switch (kind) {
            case DriverKind::Sqlite:
                return "sqlite";
            case DriverKind::MySql:
                return "mysql";
            case DriverKind::Postgres:
                return "postgres";
            case DriverKind::Unspecified:
                break;
        }
        return "unspecified";
    }

    std::expected<ConnectionParameters, sqlforge::Error> ConnectionParameters::fromUrl(std::string_view url) {
        auto scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) return std::unexpected(invalidUrl(url, "missing scheme"));

        std::string scheme(url.substr(0, scheme_end));
        std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        std::string_view rest = url.substr(scheme_end + 3);
        std::string_view query;
        if (auto question = rest.find('?'); question != std::string_view::npos) {
            query = rest.substr(question + 1);
            rest = rest.substr(0, question);
        }

        ConnectionParameters params;
        if (scheme == "sqlite") {
            if (rest.empty()) return std::unexpected(invalidUrl(url, "missing database path"));
            params.driver = DriverKind::Sqlite;
            params.database = percentDecode(rest);
        } else if (scheme == "mysql" || scheme == "postgres" || scheme == "postgresql") {
            params.driver = scheme == "mysql" ? DriverKind::MySql : DriverKind::Postgres;
            auto slash = rest.find('/');
            if (slash != std::string_view::npos) params.database = percentDecode(rest.substr(slash + 1));
            auto parsed = parseAuthority(rest.substr(0, slash), params);
            if (!parsed) return std::unexpected(invalidUrl(url, parsed.error()));
        } else {
            return std::unexpected(invalidUrl(url, "unsupported scheme " + scheme));
        }

        while (!query.empty()) {
            auto amp = query.find('&');
            std::string_view pair = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view() : query.substr(amp + 1);
            if (pair.empty()) continue;
            auto eq = pair.find('=');
            std::string value = eq == std::string_view::npos ? std::string() : percentDecode(pair.substr(eq + 1));
            applyQueryOption(percentDecode(pair.substr(0, eq)), std::move(value), params);
        }
        return params;
    }

    std::string ConnectionParameters::extraOptionsText() const {
        std::string text;
        for (const auto& [key, value] : extra_options) {
            if (!text.empty()) text += ' ';
            text += key;
            text += '=';
            text += value;
        }
        return text;
    }

}  // namespace sqlforge_sqldriver
