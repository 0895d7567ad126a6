/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/resolved_endpoint.hpp"

#include "discoverykit/core/string.hpp"
#include "discoverykit/core/util/overloaded.hpp"

#include <fmt/format.h>

namespace {

struct UrlAuthority {
    std::string host;
    std::optional<uint16_t> port;
};

/**
 * Takes host and port from an url of the form scheme://[userinfo@]host[:port][/path][?query][#fragment]. IPv6 hosts are
 * expected between brackets.
 */
std::optional<UrlAuthority> parse_url_authority(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    const auto authority_begin = scheme_end + 3;
    const auto authority_end = url.find_first_of("/?#", authority_begin);
    auto authority = url.substr(authority_begin, authority_end - authority_begin);

    if (const auto at = authority.rfind('@'); at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    UrlAuthority result;
    std::string port_text;

    if (!authority.empty() && authority.front() == '[') {
        const auto bracket = authority.find(']');
        if (bracket == std::string::npos) {
            return std::nullopt;
        }
        result.host = authority.substr(1, bracket - 1);
        if (bracket + 1 < authority.size()) {
            if (authority[bracket + 1] != ':') {
                return std::nullopt;
            }
            port_text = authority.substr(bracket + 2);
        }
    } else if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
        result.host = authority.substr(0, colon);
        port_text = authority.substr(colon + 1);
    } else {
        result.host = authority;
    }

    if (result.host.empty()) {
        return std::nullopt;
    }

    if (!port_text.empty()) {
        result.port = dsk::string_to_int<uint16_t>(port_text);
        if (!result.port) {
            return std::nullopt;
        }
    }

    return result;
}

}  // namespace

std::string dsk::dnssd::ResolvedEndpoint::to_string() const {
    std::string addresses_description;
    for (const auto& address : addresses) {
        if (!addresses_description.empty()) {
            addresses_description += ", ";
        }
        addresses_description += address.to_string();
    }

    return fmt::format(
        "{} hostname: {}, addresses: [{}], port: {}, txt: {}", dnssd::to_string(endpoint), hostname.value_or("-"),
        addresses_description, port ? std::to_string(*port) : "-", txt_record_to_string(txt)
    );
}

tl::expected<dsk::dnssd::ResolvedEndpoint, dsk::dnssd::BrowseError>
dsk::dnssd::make_resolved_endpoint(const Endpoint& endpoint, const std::optional<TxtRecord>& txt) {
    using Result = tl::expected<ResolvedEndpoint, BrowseError>;

    ResolvedEndpoint resolved;
    resolved.endpoint = endpoint;
    resolved.txt = txt.value_or(TxtRecord {});

    return std::visit(
        Overloaded {
            [&resolved](const HostPortEndpoint& e) -> Result {
                boost::system::error_code ec;
                const auto address = boost::asio::ip::make_address(e.host, ec);
                if (ec) {
                    resolved.hostname = e.host;
                } else {
                    resolved.addresses.push_back(address);
                }
                resolved.port = e.port;
                resolved.network_interface = e.network_interface;
                return resolved;
            },
            [&endpoint](const ServiceEndpoint&) -> Result {
                return tl::unexpected(BrowseError::unsupported_endpoint(endpoint_identity(endpoint)));
            },
            [&resolved](const UrlEndpoint& e) -> Result {
                const auto authority = parse_url_authority(e.url);
                if (!authority) {
                    return tl::unexpected(
                        BrowseError::resolution_failed(e.url, ErrorCause {0, {}, "url has no host"})
                    );
                }
                resolved.hostname = authority->host;
                resolved.port = authority->port;
                return resolved;
            },
            [&resolved](const UnixEndpoint&) -> Result {
                return resolved;
            },
            [&endpoint](const OpaqueEndpoint&) -> Result {
                return tl::unexpected(BrowseError::unsupported_endpoint(endpoint_identity(endpoint)));
            },
        },
        endpoint
    );
}
