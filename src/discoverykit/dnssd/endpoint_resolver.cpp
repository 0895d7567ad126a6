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

#include "discoverykit/core/log.hpp"
#include "discoverykit/core/stream/lazy_subscription.hpp"
#include "discoverykit/core/util/overloaded.hpp"
#include "discoverykit/dnssd/service_resolver.hpp"

/**
 * Maps the events of a ServiceResolver onto resolved endpoints. Events which are not reported ask the upstream for one
 * more value, so the demand of the subscriber is kept.
 *
 * Values flow upstream to downstream with the upstream mutex held. To keep the lock order the same on every path,
 * demand and cancellation are forwarded upstream after our own mutex was released.
 */
class dsk::dnssd::EndpointResolver::EndpointSubscription final:
    public LazySubscription<ResolvedEndpoint, BrowseError>,
    public ServiceResolver::SubscriberType {
  public:
    EndpointSubscription(
        const Endpoint& endpoint, const Configuration& configuration, const ResolverFactory& resolver_factory,
        EndpointResolver::SubscriberType& subscriber
    ) :
        LazySubscription(subscriber), endpoint_(endpoint), configuration_(configuration) {
        if (const auto* service = std::get_if<ServiceEndpoint>(&endpoint_)) {
            const ServiceResolver::Configuration resolver_configuration {
                configuration.timeout,
                configuration.publish_resolved_txt ? ServiceResolver::TxtMonitoring::keep_monitoring
                                                   : ServiceResolver::TxtMonitoring::do_not_monitor,
            };
            service_resolver_.emplace(*service, resolver_configuration, resolver_factory);
        }
    }

    ~EndpointSubscription() override {
        cancel();
    }

    void request(const Demand demand) override {
        LazySubscription::request(demand);

        std::shared_ptr<Subscription> upstream;
        {
            std::lock_guard lock(mutex());
            upstream = upstream_;
        }
        if (upstream != nullptr) {
            upstream->request(demand);
        }
    }

    // The upstream subscription stays alive until we are destroyed: cancel() might be called from a delivery which
    // the upstream is still making.
    void cancel() override {
        std::shared_ptr<Subscription> upstream;
        {
            std::lock_guard lock(mutex());
            upstream = upstream_;
        }
        LazySubscription::cancel();
        if (upstream != nullptr) {
            upstream->cancel();
        }
    }

    // ServiceResolver::SubscriberType overrides
    Demand on_receive(const ServiceResolver::Event& event) override {
        std::lock_guard lock(mutex());
        return std::visit(
            Overloaded {
                [](const ServiceResolver::WillResolve&) {
                    return Demand::max(1);
                },
                [this](const ServiceResolver::DidResolveAddress& e) {
                    last_resolved_ = e.resolved;
                    last_resolved_->endpoint = endpoint_;
                    if (!last_resolved_->network_interface) {
                        last_resolved_->network_interface = endpoint_interface(endpoint_);
                    }
                    if (!configuration_.publish_resolved_addresses) {
                        return Demand::max(1);
                    }
                    push(*last_resolved_);
                    return Demand::none();
                },
                [this](const ServiceResolver::DidUpdateTxtRecord& e) {
                    if (!last_resolved_) {
                        last_resolved_ = ResolvedEndpoint {};
                        last_resolved_->endpoint = endpoint_;
                        last_resolved_->network_interface = endpoint_interface(endpoint_);
                    }
                    last_resolved_->txt = e.txt;
                    if (!configuration_.publish_resolved_txt) {
                        return Demand::max(1);
                    }
                    push(*last_resolved_);
                    return Demand::none();
                },
            },
            event
        );
    }

    void on_completion(const Completion<BrowseError>& completion) override {
        std::lock_guard lock(mutex());
        complete(completion);
    }

  protected:
    void start() override {
        if (service_resolver_) {
            // Demand is forwarded by request() once our mutex is released.
            upstream_ = service_resolver_->subscribe(*this);
            return;
        }

        auto resolved = make_resolved_endpoint(endpoint_);
        if (!resolved) {
            DSK_WARNING("Can't resolve {}: {}", to_string(endpoint_), resolved.error().to_string());
            complete(completion_failure(resolved.error()));
            return;
        }
        push(std::move(*resolved));
        complete(completion_finished<BrowseError>());
    }

    void stop() override {}

  private:
    Endpoint endpoint_;
    Configuration configuration_;
    std::optional<ServiceResolver> service_resolver_;
    std::shared_ptr<Subscription> upstream_;
    std::optional<ResolvedEndpoint> last_resolved_;
};

dsk::dnssd::EndpointResolver::EndpointResolver(
    Endpoint endpoint, const Configuration configuration, ResolverFactory resolver_factory
) :
    endpoint_(std::move(endpoint)), configuration_(configuration), resolver_factory_(std::move(resolver_factory)) {}

std::unique_ptr<dsk::Subscription> dsk::dnssd::EndpointResolver::subscribe(SubscriberType& subscriber) const {
    auto subscription =
        std::make_unique<EndpointSubscription>(endpoint_, configuration_, resolver_factory_, subscriber);
    subscriber.on_subscribe(*subscription);
    return subscription;
}
