/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include "dnssd_error.hpp"
#include "endpoint.hpp"
#include "txt_record.hpp"
#include "discoverykit/core/expected.hpp"

#include <boost/asio/ip/address.hpp>

#include <optional>
#include <string>
#include <vector>

namespace dsk::dnssd {

/**
 * The result of resolving an endpoint. A snapshot: a later resolution of the same endpoint produces a new instance.
 */
struct ResolvedEndpoint {
    /// The endpoint which was resolved.
    Endpoint endpoint;
    /// The host name, when known.
    std::optional<std::string> hostname;
    /// The addresses of the endpoint. Empty when only a host name is known.
    std::vector<boost::asio::ip::address> addresses;
    /// The port, when known.
    std::optional<uint16_t> port;
    /// The interface on which the endpoint was resolved.
    std::optional<NetworkInterface> network_interface;
    TxtRecord txt;

    [[nodiscard]] std::string identity() const {
        return endpoint_identity(endpoint);
    }

    [[nodiscard]] std::string to_string() const;
};

/**
 * Builds the resolved form of an endpoint which doesn't need resolution: a host and port, an url or a unix path.
 * Named services and opaque endpoints can't be converted and produce an unsupported_endpoint error, an url without host
 * a resolution_failed error.
 * @param endpoint The endpoint.
 * @param txt The TXT record which came with the endpoint.
 * @return The resolved endpoint, or an error.
 */
tl::expected<ResolvedEndpoint, BrowseError>
make_resolved_endpoint(const Endpoint& endpoint, const std::optional<TxtRecord>& txt = std::nullopt);

}  // namespace dsk::dnssd
