#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace formupload::client
{

    struct Url
    {
        std::string scheme;
        std::string host;
        std::uint16_t port{};
        // Path plus query, always starting with '/'.
        std::string target{"/"};

        std::string authority() const;
        std::string to_string() const;
    };

    // Only absolute http URLs are accepted.
    std::optional<Url> parse_url(std::string_view text);

    // RFC 3986 reference resolution against base; the result must still be an http URL.
    std::optional<Url> resolve_url(const Url &base, std::string_view reference);

    // Escapes everything except A-Z a-z 0-9 - _ . ! ~ * ' ( )
    std::string percent_encode(std::string_view value);

} // namespace formupload::client
