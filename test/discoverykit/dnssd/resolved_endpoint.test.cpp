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

#include <catch2/catch_all.hpp>

TEST_CASE("dsk::dnssd::make_resolved_endpoint") {
    using namespace dsk::dnssd;

    SECTION("Host name and port") {
        const HostPortEndpoint endpoint {"printer.local", 631, NetworkInterface {3, "en0"}};
        const auto resolved = make_resolved_endpoint(endpoint, TxtRecord {{"rp", "ipp/print"}});
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->hostname == "printer.local");
        REQUIRE(resolved->addresses.empty());
        REQUIRE(resolved->port == 631);
        REQUIRE(resolved->network_interface == NetworkInterface {3, "en0"});
        REQUIRE(resolved->txt.at("rp") == "ipp/print");
        REQUIRE(resolved->identity() == "printer.local:631");
    }

    SECTION("IP address and port") {
        const auto v4 = make_resolved_endpoint(HostPortEndpoint {"10.0.0.2", 9000, {}});
        REQUIRE(v4.has_value());
        REQUIRE_FALSE(v4->hostname.has_value());
        REQUIRE(v4->addresses.size() == 1);
        REQUIRE(v4->addresses.front() == boost::asio::ip::make_address("10.0.0.2"));

        const auto v6 = make_resolved_endpoint(HostPortEndpoint {"::1", 9000, {}});
        REQUIRE(v6.has_value());
        REQUIRE(v6->addresses.front().is_v6());
    }

    SECTION("Url with host and port") {
        const auto resolved = make_resolved_endpoint(UrlEndpoint {"http://user@device.local:8080/path?x=1"});
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->hostname == "device.local");
        REQUIRE(resolved->port == 8080);
    }

    SECTION("Url without port") {
        const auto resolved = make_resolved_endpoint(UrlEndpoint {"https://example.com/"});
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->hostname == "example.com");
        REQUIRE_FALSE(resolved->port.has_value());
    }

    SECTION("Url with IPv6 host") {
        const auto resolved = make_resolved_endpoint(UrlEndpoint {"http://[fe80::1]:80"});
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->hostname == "fe80::1");
        REQUIRE(resolved->port == 80);
    }

    SECTION("Url without host fails") {
        for (const auto* url : {"file:///etc/hosts", "not a url", "http://:80", "http://host:99999", "http://[::1"}) {
            const auto resolved = make_resolved_endpoint(UrlEndpoint {url});
            REQUIRE_FALSE(resolved.has_value());
            REQUIRE(resolved.error().kind == ErrorKind::resolution_failed);
            REQUIRE(resolved.error().identity == url);
        }
    }

    SECTION("Unix path") {
        const auto resolved = make_resolved_endpoint(UnixEndpoint {"/var/run/app.sock"});
        REQUIRE(resolved.has_value());
        REQUIRE(resolved->addresses.empty());
        REQUIRE_FALSE(resolved->hostname.has_value());
        REQUIRE(resolved->identity() == "unix:/var/run/app.sock");
    }

    SECTION("Services and opaque endpoints are not resolved by construction") {
        const auto service = make_resolved_endpoint(ServiceEndpoint {"A", "_http._tcp.", "local.", {}});
        REQUIRE_FALSE(service.has_value());
        REQUIRE(service.error() == BrowseError::unsupported_endpoint("A._http._tcp.local."));

        const auto opaque = make_resolved_endpoint(OpaqueEndpoint {"nfc", "tag"});
        REQUIRE_FALSE(opaque.has_value());
        REQUIRE(opaque.error().kind == ErrorKind::unsupported_endpoint);
    }
}
