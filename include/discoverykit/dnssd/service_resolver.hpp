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
#include "txt_record.hpp"
#include "discoverykit/core/stream/subscriber.hpp"

#include <chrono>
#include <memory>
#include <variant>

namespace dsk::dnssd {

/**
 * Resolves a single named service and reports the progress as a stream. The resolver is created on subscribe and
 * started on the first demand. The stream completes when the resolver stops, and fails when it could not resolve.
 */
class ServiceResolver {
  public:
    /// Whether to keep watching the TXT record of the service while resolving.
    enum class TxtMonitoring { do_not_monitor, keep_monitoring };

    struct Configuration {
        /// The time after which the resolver gives up.
        std::chrono::milliseconds timeout {5000};
        TxtMonitoring txt_monitoring {TxtMonitoring::do_not_monitor};
    };

    /// Resolving started.
    struct WillResolve {};

    /// The service was resolved. Might be reported more than once, for example for every address.
    struct DidResolveAddress {
        ResolvedEndpoint resolved;
    };

    /// The TXT record of the service changed.
    struct DidUpdateTxtRecord {
        TxtRecord txt;
    };

    using Event = std::variant<WillResolve, DidResolveAddress, DidUpdateTxtRecord>;
    using SubscriberType = Subscriber<Event, BrowseError>;

    /**
     * @param service The service to resolve.
     * @param configuration How to resolve.
     * @param resolver_factory Creates the resolver, once for every subscription.
     */
    ServiceResolver(ServiceEndpoint service, Configuration configuration, ResolverFactory resolver_factory);

    /**
     * Subscribes to the stream.
     * @param subscriber The subscriber, which must outlive the subscription.
     * @return The subscription. Destroying it cancels the subscription.
     */
    [[nodiscard]] std::unique_ptr<Subscription> subscribe(SubscriberType& subscriber) const;

    /**
     * @return The service this resolver resolves.
     */
    [[nodiscard]] const ServiceEndpoint& get_service() const;

  private:
    class ResolveSubscription;

    ServiceEndpoint service_;
    Configuration configuration_;
    ResolverFactory resolver_factory_;
};

}  // namespace dsk::dnssd
