/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/endpoint_resolver.hpp"
#include "discoverykit/dnssd/mock/mock_resolver.hpp"
#include "discoverykit/core/stream/sink.hpp"

#include <catch2/catch_all.hpp>

namespace {

using namespace dsk::dnssd;
using ResolvedSink = dsk::Sink<ResolvedEndpoint, BrowseError>;

const ServiceEndpoint k_service {"Camera", "_rtsp._tcp.", "local.", NetworkInterface {2, "eth0"}};

class EndpointFixture {
  public:
    boost::asio::io_context io_context;
    MockResolver* resolver = nullptr;

    ResolverFactory factory() {
        return make_mock_resolver_factory(io_context, [this](MockResolver& r) {
            resolver = &r;
        });
    }

    void run() {
        io_context.restart();
        io_context.run();
    }

    void poll() {
        io_context.restart();
        io_context.poll();
    }
};

}  // namespace

TEST_CASE("dsk::dnssd::EndpointResolver") {
    EndpointFixture fixture;

    SECTION("Host and port resolve by construction") {
        const EndpointResolver endpoint_resolver(HostPortEndpoint {"192.168.1.5", 554, {}}, {}, fixture.factory());
        ResolvedSink sink(dsk::Demand::none());
        const auto subscription = endpoint_resolver.subscribe(sink);
        REQUIRE(sink.values().empty());

        sink.request(dsk::Demand::max(1));
        REQUIRE(sink.values().size() == 1);
        REQUIRE(sink.values().front().addresses.front() == boost::asio::ip::make_address("192.168.1.5"));
        REQUIRE(sink.values().front().port == 554);
        REQUIRE(sink.completion().has_value());
        REQUIRE(sink.completion()->has_value());
        REQUIRE(fixture.resolver == nullptr);
    }

    SECTION("Unix paths resolve by construction") {
        const EndpointResolver endpoint_resolver(UnixEndpoint {"/run/camera.sock"}, {}, nullptr);
        ResolvedSink sink;
        const auto subscription = endpoint_resolver.subscribe(sink);
        REQUIRE(sink.values().size() == 1);
        REQUIRE(sink.values().front().identity() == "unix:/run/camera.sock");
        REQUIRE(sink.completion()->has_value());
    }

    SECTION("A url without host fails") {
        const EndpointResolver endpoint_resolver(UrlEndpoint {"urn:camera"}, {}, nullptr);
        ResolvedSink sink;
        const auto subscription = endpoint_resolver.subscribe(sink);
        REQUIRE(sink.values().empty());
        REQUIRE(sink.completion()->error().kind == ErrorKind::resolution_failed);
    }

    SECTION("Opaque endpoints are unsupported") {
        const EndpointResolver endpoint_resolver(OpaqueEndpoint {"usb", "1-2"}, {}, nullptr);
        ResolvedSink sink;
        const auto subscription = endpoint_resolver.subscribe(sink);
        REQUIRE(sink.completion()->error() == BrowseError::unsupported_endpoint("opaque:usb:1-2"));
    }

    SECTION("Services resolve through a resolver") {
        const EndpointResolver endpoint_resolver(k_service, {}, fixture.factory());
        ResolvedSink sink;
        const auto subscription = endpoint_resolver.subscribe(sink);
        REQUIRE(fixture.resolver != nullptr);
        REQUIRE(fixture.resolver->resolve_count() == 1);
        REQUIRE_FALSE(fixture.resolver->is_monitoring());

        fixture.resolver->mock_resolved("camera.local.", {"10.0.0.9"}, 554);
        fixture.resolver->mock_stopped();
        fixture.run();

        REQUIRE(sink.values().size() == 1);
        const auto& resolved = sink.values().front();
        REQUIRE(std::holds_alternative<ServiceEndpoint>(resolved.endpoint));
        REQUIRE(resolved.identity() == "Camera._rtsp._tcp.local.");
        REQUIRE(resolved.hostname == "camera.local.");
        REQUIRE(resolved.network_interface == NetworkInterface {2, "eth0"});
        REQUIRE(sink.completion().has_value());
        REQUIRE(sink.completion()->has_value());
    }

    SECTION("Filtered events don't use up demand") {
        const EndpointResolver endpoint_resolver(k_service, {}, fixture.factory());
        ResolvedSink sink(dsk::Demand::max(1));
        const auto subscription = endpoint_resolver.subscribe(sink);

        fixture.resolver->mock_resolved("camera.local.", {"10.0.0.9"}, 554);
        fixture.resolver->mock_resolved("camera.local.", {"10.0.0.10"}, 554);
        fixture.poll();
        REQUIRE(sink.values().size() == 1);
        REQUIRE(sink.values()[0].addresses.front() == boost::asio::ip::make_address("10.0.0.9"));

        sink.request(dsk::Demand::max(1));
        REQUIRE(sink.values().size() == 2);
        REQUIRE(sink.values()[1].addresses.front() == boost::asio::ip::make_address("10.0.0.10"));
        subscription->cancel();
    }

    SECTION("TXT record snapshots") {
        EndpointResolver::Configuration configuration;
        configuration.publish_resolved_addresses = false;
        configuration.publish_resolved_txt = true;
        const EndpointResolver endpoint_resolver(k_service, configuration, fixture.factory());
        ResolvedSink sink;
        const auto subscription = endpoint_resolver.subscribe(sink);
        REQUIRE(fixture.resolver->is_monitoring());

        fixture.resolver->mock_txt_updated({{"fw", "1.0"}});
        fixture.resolver->mock_resolved("camera.local.", {"10.0.0.9"}, 554);
        fixture.resolver->mock_txt_updated({{"fw", "1.1"}});
        fixture.poll();

        REQUIRE(sink.values().size() == 2);
        REQUIRE(sink.values()[0].txt.at("fw") == "1.0");
        REQUIRE(sink.values()[0].addresses.empty());
        REQUIRE(sink.values()[1].txt.at("fw") == "1.1");
        REQUIRE(sink.values()[1].hostname == "camera.local.");
        REQUIRE(sink.values()[1].identity() == "Camera._rtsp._tcp.local.");
        subscription->cancel();
    }

    SECTION("Resolver failures are forwarded") {
        EndpointResolver::Configuration configuration;
        configuration.timeout = std::chrono::milliseconds(20);
        const EndpointResolver endpoint_resolver(k_service, configuration, fixture.factory());
        ResolvedSink sink;
        const auto subscription = endpoint_resolver.subscribe(sink);
        fixture.run();

        REQUIRE(sink.values().empty());
        REQUIRE(sink.completion()->error() == BrowseError::resolution_timeout("Camera._rtsp._tcp.local."));
    }

    SECTION("Cancel silences the resolver") {
        const EndpointResolver endpoint_resolver(k_service, {}, fixture.factory());
        ResolvedSink sink;
        const auto subscription = endpoint_resolver.subscribe(sink);
        fixture.resolver->mock_resolved("camera.local.", {"10.0.0.9"}, 554);

        subscription->cancel();
        subscription->cancel();
        fixture.run();

        REQUIRE(sink.values().empty());
        REQUIRE_FALSE(sink.completion().has_value());
    }

    SECTION("Cancel from within a delivery") {
        const EndpointResolver endpoint_resolver(k_service, {}, fixture.factory());
        ResolvedSink sink;
        sink.on_value = [&sink](const ResolvedEndpoint&) {
            sink.cancel();
        };
        const auto subscription = endpoint_resolver.subscribe(sink);
        auto* resolver = fixture.resolver;

        resolver->mock_resolved("camera.local.", {"10.0.0.9"}, 554);
        resolver->mock_resolved("camera.local.", {"10.0.0.10"}, 554);
        resolver->mock_stopped();
        fixture.run();

        REQUIRE(sink.values().size() == 1);
        REQUIRE(sink.values().front().addresses.front() == boost::asio::ip::make_address("10.0.0.9"));
        REQUIRE_FALSE(sink.completion().has_value());
        REQUIRE(resolver->stop_count() == 1);
        REQUIRE_FALSE(resolver->is_resolving());
    }
}
