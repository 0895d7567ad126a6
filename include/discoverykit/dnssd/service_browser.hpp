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

#include "browse_event.hpp"
#include "discovery_backend.hpp"
#include "dnssd_error.hpp"
#include "resolver.hpp"
#include "discoverykit/core/expected.hpp"
#include "discoverykit/core/stream/subscriber.hpp"

#include <boost/asio/io_context.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace dsk::dnssd {

/**
 * Browses for services of a type and reports what it finds as a stream of browse events. Every subscription gets its
 * own discovery backend, which is started on the first demand and stopped on cancellation. Named services are
 * resolved as they are found, each resolution with its own timeout.
 *
 * Events and the completion are delivered from the io_context thread, or from the thread which requests demand.
 * Subscriptions can be cancelled from any thread, but must be destroyed on the io_context thread or after the
 * io_context stopped running.
 */
class ServiceBrowser {
  public:
    using SubscriberType = Subscriber<BrowseEvent, BrowseError>;

    struct Configuration {
        /// The service type (i.e. _http._tcp.).
        std::string reg_type;
        /// The domain to browse in, or the default domains when not set.
        std::optional<std::string> domain;
        /// When false, services are only found and removed, never resolved.
        bool resolve_services {true};
        /// The time after which a resolution is reported as timed out.
        std::chrono::milliseconds resolve_timeout {5000};
        /// Whether a failed or timed out resolution ends the stream.
        ErrorPolicy resolution_error_policy {ErrorPolicy::report};
        /// Whether an endpoint of an unsupported kind ends the stream.
        ErrorPolicy unsupported_endpoint_policy {ErrorPolicy::report};

        /**
         * @return An empty result if the configuration can be used, or a message telling what is wrong.
         */
        [[nodiscard]] tl::expected<void, std::string> validate() const;

        /**
         * @return A description of the configuration, for logging.
         */
        [[nodiscard]] std::string to_string() const;
    };

    /**
     * @param io_context The context on which backends and resolvers run.
     * @param configuration What to browse for and how.
     * @param backend_factory Creates a discovery backend for every subscription.
     * @param resolver_factory Creates a resolver for every service which has to be resolved.
     */
    ServiceBrowser(
        boost::asio::io_context& io_context, Configuration configuration, DiscoveryBackendFactory backend_factory,
        ResolverFactory resolver_factory
    );

    /**
     * Subscribes to the stream. Nothing happens until the subscriber requests demand. When the configuration is
     * invalid, the stream completes right away with a search_failed error.
     * @param subscriber The subscriber, which must outlive the subscription.
     * @return The subscription. Destroying it cancels the subscription.
     */
    [[nodiscard]] std::unique_ptr<Subscription> subscribe(SubscriberType& subscriber) const;

    /**
     * @return The configuration.
     */
    [[nodiscard]] const Configuration& get_configuration() const;

  private:
    class BrowseSubscription;

    boost::asio::io_context& io_context_;
    Configuration configuration_;
    DiscoveryBackendFactory backend_factory_;
    ResolverFactory resolver_factory_;
};

}  // namespace dsk::dnssd
