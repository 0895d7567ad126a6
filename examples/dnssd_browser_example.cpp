/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/core/log.hpp"
#include "discoverykit/core/string.hpp"
#include "discoverykit/dnssd/service_browser.hpp"
#include "discoverykit/dnssd/mock/mock_discovery_backend.hpp"
#include "discoverykit/dnssd/mock/mock_resolver.hpp"

#include <CLI/App.hpp>

#include <string>

/**
 * This example shows how to browse for services with a ServiceBrowser. Services are simulated by mock backends, which
 * find a couple of services, resolve some of them and let one time out.
 */

namespace {

/**
 * Logs every event and asks for a fixed amount of events at a time.
 */
class LoggingSubscriber final: public dsk::dnssd::ServiceBrowser::SubscriberType {
  public:
    explicit LoggingSubscriber(const size_t batch_size) : batch_size_(batch_size) {}

    void on_subscribe(dsk::Subscription& subscription) override {
        DSK_INFO("Subscribed, requesting {} event(s)", batch_size_);
        subscription.request(dsk::Demand::max(batch_size_));
    }

    dsk::Demand on_receive(const dsk::dnssd::BrowseEvent& event) override {
        DSK_INFO("Event: {}", dsk::dnssd::to_string(event));
        if (++received_ % batch_size_ == 0) {
            DSK_INFO("Received {} event(s), requesting {} more", received_, batch_size_);
            return dsk::Demand::max(batch_size_);
        }
        return dsk::Demand::none();
    }

    void on_completion(const dsk::Completion<dsk::dnssd::BrowseError>& completion) override {
        if (completion) {
            DSK_INFO("Browsing finished");
        } else {
            DSK_ERROR("Browsing failed: {}", completion.error().to_string());
        }
    }

  private:
    size_t batch_size_ {};
    size_t received_ {};
};

dsk::dnssd::DiscoveredEndpoint make_service(const std::string& name, const std::string& reg_type) {
    return dsk::dnssd::DiscoveredEndpoint {
        dsk::dnssd::ServiceEndpoint {name, reg_type, "local.", dsk::dnssd::NetworkInterface {1, "en0"}},
        dsk::dnssd::TxtRecord {{"txtvers", "1"}},
        true,
    };
}

}  // namespace

int main(int const argc, char* argv[]) {
    dsk::set_log_level_from_env();

    CLI::App app {"DNS-SD browser example"};
    argv = app.ensure_utf8(argv);

    std::string reg_type = "_http._tcp.";
    app.add_option("--reg-type", reg_type, "The service type to browse for (example: _http._tcp.)");

    int timeout_ms = 1000;
    app.add_option("--timeout-ms", timeout_ms, "The time after which a resolution times out")
        ->check(CLI::PositiveNumber);

    bool fatal_resolution_errors = false;
    app.add_flag("--fatal-resolution-errors", fatal_resolution_errors, "End browsing on the first resolution error");

    size_t demand = 2;
    app.add_option("--demand", demand, "The number of events to request at a time")->check(CLI::PositiveNumber);

    CLI11_PARSE(app, argc, argv);

    boost::asio::io_context io_context;

    auto backend_factory = dsk::dnssd::make_mock_discovery_backend_factory(
        io_context,
        [&reg_type](dsk::dnssd::MockDiscoveryBackend& backend) {
            backend.mock_state(dsk::dnssd::BackendState {dsk::dnssd::BackendState::Kind::ready, {}});
            backend.mock_batch({
                dsk::dnssd::BrowseResultChange::added(make_service("Kitchen", reg_type)),
                dsk::dnssd::BrowseResultChange::added(make_service("Living room", reg_type)),
                dsk::dnssd::BrowseResultChange::added(make_service("Garage", reg_type)),
            });
            const dsk::dnssd::HostPortEndpoint printer {"192.168.1.50", 8080, {}};
            backend.mock_added(dsk::dnssd::DiscoveredEndpoint {printer, {}, true});
            backend.mock_removed(make_service("Living room", reg_type));
        }
    );

    // Every service resolves after a while, except for the garage which never answers.
    auto resolver_factory = dsk::dnssd::make_mock_resolver_factory(
        io_context,
        [timeout_ms](dsk::dnssd::MockResolver& resolver) {
            const auto& service = resolver.get_service();
            if (service.name == "Garage") {
                return;
            }
            dsk::dnssd::ResolvedEndpoint resolved;
            resolved.endpoint = service;
            resolved.hostname = dsk::string_to_lower(service.name) + ".local.";
            resolved.addresses.push_back(boost::asio::ip::make_address("192.168.1.10"));
            resolved.port = 80;
            resolver.script_resolved_after(std::chrono::milliseconds(timeout_ms / 2), resolved);
        }
    );

    dsk::dnssd::ServiceBrowser::Configuration configuration;
    configuration.reg_type = reg_type;
    configuration.resolve_timeout = std::chrono::milliseconds(timeout_ms);
    configuration.resolution_error_policy =
        fatal_resolution_errors ? dsk::dnssd::ErrorPolicy::fatal : dsk::dnssd::ErrorPolicy::report;

    DSK_INFO("Browsing with {}", configuration.to_string());

    const dsk::dnssd::ServiceBrowser browser(io_context, configuration, backend_factory, resolver_factory);

    LoggingSubscriber subscriber(demand);
    const auto subscription = browser.subscribe(subscriber);

    io_context.run();

    subscription->cancel();

    DSK_INFO("Exit");

    return 0;
}
