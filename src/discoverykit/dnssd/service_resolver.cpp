/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/service_resolver.hpp"

#include "discoverykit/core/log.hpp"
#include "discoverykit/core/stream/lazy_subscription.hpp"

class dsk::dnssd::ServiceResolver::ResolveSubscription final: public LazySubscription<Event, BrowseError> {
  public:
    ResolveSubscription(
        const ServiceEndpoint& service, const Configuration& configuration, const ResolverFactory& resolver_factory,
        SubscriberType& subscriber
    ) :
        LazySubscription(subscriber), identity_(endpoint_identity(service)), configuration_(configuration) {
        if (resolver_factory) {
            resolver_ = resolver_factory(service);
        }
        if (resolver_ == nullptr) {
            return;
        }

        resolver_->on_will_resolve = [this] {
            std::lock_guard lock(mutex());
            push(WillResolve {});
        };
        resolver_->on_resolved = [this](const ResolvedEndpoint& resolved) {
            std::lock_guard lock(mutex());
            push(DidResolveAddress {resolved});
        };
        resolver_->on_txt_updated = [this](const TxtRecord& txt) {
            std::lock_guard lock(mutex());
            push(DidUpdateTxtRecord {txt});
        };
        resolver_->on_not_resolved = [this](const ErrorCause& error) {
            std::lock_guard lock(mutex());
            if (error.code == error_code::k_resolver_timeout || error.code == error_code::k_timeout) {
                DSK_WARNING("Resolving {} timed out", identity_);
                complete(completion_failure(BrowseError::resolution_timeout(identity_)));
                return;
            }
            DSK_WARNING("Failed to resolve {}: {}", identity_, error.to_string());
            complete(completion_failure(BrowseError::resolution_failed(identity_, error)));
        };
        resolver_->on_stopped = [this] {
            std::lock_guard lock(mutex());
            complete(completion_finished<BrowseError>());
        };
    }

    ~ResolveSubscription() override {
        cancel();
    }

  protected:
    void start() override {
        if (resolver_ == nullptr) {
            DSK_ERROR("No resolver available for {}", identity_);
            const ErrorCause cause {0, {}, "no resolver available"};
            complete(completion_failure(BrowseError::resolution_failed(identity_, cause)));
            return;
        }
        DSK_DEBUG("Resolving {} (timeout: {}ms)", identity_, configuration_.timeout.count());
        if (configuration_.txt_monitoring == TxtMonitoring::keep_monitoring) {
            resolver_->start_monitoring();
        }
        resolver_->resolve(configuration_.timeout);
    }

    void stop() override {
        if (resolver_ == nullptr) {
            return;
        }
        if (configuration_.txt_monitoring == TxtMonitoring::keep_monitoring) {
            resolver_->stop_monitoring();
        }
        resolver_->stop();
    }

  private:
    std::string identity_;
    Configuration configuration_;
    std::unique_ptr<Resolver> resolver_;
};

dsk::dnssd::ServiceResolver::ServiceResolver(
    ServiceEndpoint service, const Configuration configuration, ResolverFactory resolver_factory
) :
    service_(std::move(service)), configuration_(configuration), resolver_factory_(std::move(resolver_factory)) {}

std::unique_ptr<dsk::Subscription> dsk::dnssd::ServiceResolver::subscribe(SubscriberType& subscriber) const {
    auto subscription = std::make_unique<ResolveSubscription>(service_, configuration_, resolver_factory_, subscriber);
    subscriber.on_subscribe(*subscription);
    return subscription;
}

const dsk::dnssd::ServiceEndpoint& dsk::dnssd::ServiceResolver::get_service() const {
    return service_;
}
