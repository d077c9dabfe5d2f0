#include "formupload/client/url.hpp"

#include <algorithm>
#include <cctype>

#include <boost/url/encode.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>
#include <boost/url/url.hpp>
#include <boost/url/url_view.hpp>

namespace formupload::client
{

    namespace
    {
        constexpr std::uint16_t kDefaultHttpPort = 80;

        // encodeURIComponent keeps these on top of the RFC 3986 unreserved set.
        constexpr auto kComponentChars = boost::urls::unreserved_chars + boost::urls::grammar::lut_chars("!*'()");

        std::string to_std(boost::core::string_view value)
        {
            return std::string(value.data(), value.size());
        }

        std::string lowercase(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return value;
        }

        std::optional<Url> from_view(const boost::urls::url_view_base &uri)
        {
            if (uri.scheme_id() != boost::urls::scheme::http || !uri.has_authority() || uri.encoded_host().empty())
            {
                return std::nullopt;
            }
            Url url;
            url.scheme = "http";
            url.host = lowercase(to_std(uri.encoded_host()));
            url.port = kDefaultHttpPort;
            if (uri.has_port())
            {
                // port_number() is zero for an empty or out-of-range port.
                if (uri.port_number() == 0)
                {
                    return std::nullopt;
                }
                url.port = uri.port_number();
            }
            url.target = to_std(uri.encoded_target());
            if (url.target.empty() || url.target.front() != '/')
            {
                url.target.insert(url.target.begin(), '/');
            }
            return url;
        }

    } // namespace

    std::string Url::authority() const
    {
        if (port == kDefaultHttpPort)
        {
            return host;
        }
        return host + ':' + std::to_string(port);
    }

    std::string Url::to_string() const
    {
        return scheme + "://" + authority() + target;
    }

    std::optional<Url> parse_url(std::string_view text)
    {
        const auto parsed = boost::urls::parse_uri(boost::core::string_view(text.data(), text.size()));
        if (!parsed)
        {
            return std::nullopt;
        }
        return from_view(*parsed);
    }

    std::optional<Url> resolve_url(const Url &base, std::string_view reference)
    {
        const auto base_text = base.to_string();
        const auto base_uri = boost::urls::parse_uri(base_text);
        const auto reference_uri =
            boost::urls::parse_uri_reference(boost::core::string_view(reference.data(), reference.size()));
        if (!base_uri || !reference_uri)
        {
            return std::nullopt;
        }
        boost::urls::url resolved;
        if (!boost::urls::resolve(*base_uri, *reference_uri, resolved))
        {
            return std::nullopt;
        }
        return from_view(resolved);
    }

    std::string percent_encode(std::string_view value)
    {
        return boost::urls::encode(boost::core::string_view(value.data(), value.size()), kComponentChars);
    }

} // namespace formupload::client
