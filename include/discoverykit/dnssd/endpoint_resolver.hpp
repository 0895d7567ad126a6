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
#include "resolved_endpoint.hpp"
#include "resolver.hpp"
#include "discoverykit/core/stream/subscriber.hpp"

#include <chrono>
#include <memory>

namespace dsk::dnssd {

/**
 * Turns an endpoint into a stream of resolved endpoints. Endpoints which are resolved by construction (host and port,
 * url, unix path) produce a single value and complete. Named services are resolved through a ServiceResolver, which
 * can produce any number of snapshots. Opaque endpoints fail with unsupported_endpoint.
 */
class EndpointResolver {
  public:
    using SubscriberType = Subscriber<ResolvedEndpoint, BrowseError>;

    struct Configuration {
        /// Report a snapshot for every resolved address.
        bool publish_resolved_addresses {true};
        /// Report a snapshot for every TXT record update. Enables TXT record monitoring.
        bool publish_resolved_txt {false};
        /// The time after which the resolver gives up.
        std::chrono::milliseconds timeout {5000};
    };

    /**
     * @param endpoint The endpoint to resolve.
     * @param configuration What to report.
     * @param resolver_factory Creates the resolver for named services.
     */
    EndpointResolver(Endpoint endpoint, Configuration configuration, ResolverFactory resolver_factory);

    /**
     * Subscribes to the stream.
     * @param subscriber The subscriber, which must outlive the subscription.
     * @return The subscription. Destroying it cancels the subscription.
     */
    [[nodiscard]] std::unique_ptr<Subscription> subscribe(SubscriberType& subscriber) const;

  private:
    class EndpointSubscription;

    Endpoint endpoint_;
    Configuration configuration_;
    ResolverFactory resolver_factory_;
};

}  // namespace dsk::dnssd
