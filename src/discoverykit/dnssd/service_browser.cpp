/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/service_browser.hpp"

#include "discoverykit/core/log.hpp"
#include "discoverykit/core/stream/lazy_subscription.hpp"
#include "discoverykit/dnssd/discovery_state_machine.hpp"
#include "discoverykit/dnssd/resolution_registry.hpp"

#include <fmt/format.h>

class dsk::dnssd::ServiceBrowser::BrowseSubscription final: public LazySubscription<BrowseEvent, BrowseError> {
  public:
    BrowseSubscription(
        boost::asio::io_context& io_context, const Configuration& configuration,
        const DiscoveryBackendFactory& backend_factory, ResolverFactory resolver_factory, SubscriberType& subscriber
    ) :
        LazySubscription(subscriber),
        configuration_(configuration),
        state_machine_(
            DiscoveryStateMachine::Configuration {
                configuration.resolve_services,
                configuration.unsupported_endpoint_policy,
                configuration.resolution_error_policy,
            }
        ),
        registry_(io_context, std::move(resolver_factory), mutex()) {
        if (auto result = configuration.validate(); !result) {
            configuration_error_ = result.error();
            return;
        }

        if (backend_factory) {
            backend_ = backend_factory(DiscoveryBackend::Query {configuration.reg_type, configuration.domain});
        }

        state_machine_.on_event = [this](BrowseEvent event) {
            push(std::move(event));
        };
        state_machine_.on_resolve = [this](const ServiceEndpoint& service, const std::optional<TxtRecord>& txt) {
            registry_.resolve(service, configuration_.resolve_timeout, txt);
        };
        state_machine_.on_cancel_resolutions = [this](const std::string& identity) {
            registry_.cancel(identity);
        };
        state_machine_.on_failure = [this](const BrowseError& error) {
            registry_.cancel_all();
            complete(completion_failure(error));
        };

        registry_.on_resolved = [this](Id, const ResolvedEndpoint& resolved) {
            push(DidResolve {resolved.identity(), resolved});
        };
        registry_.on_failed = [this](Id, const BrowseError& error) {
            if (configuration_.resolution_error_policy == ErrorPolicy::fatal) {
                state_machine_.fail(error);
                return;
            }
            push(ResolutionFailed {error});
        };

        if (backend_ != nullptr) {
            backend_->on_changes = [this](const std::vector<BrowseResultChange>& changes) {
                std::lock_guard lock(mutex());
                if (is_cancelled()) {
                    return;
                }
                state_machine_.handle_changes(changes);
            };
            backend_->on_state_changed = [this](const BackendState& state) {
                std::lock_guard lock(mutex());
                if (is_cancelled()) {
                    return;
                }
                state_machine_.handle_state(state);
            };
        }
    }

    ~BrowseSubscription() override {
        cancel();
    }

    /**
     * Ends the stream when the configuration can't be used. The backend is never started in that case.
     */
    void complete_if_invalid() {
        std::lock_guard lock(mutex());
        if (!configuration_error_) {
            return;
        }
        DSK_ERROR("Invalid browse configuration: {}", *configuration_error_);
        const ErrorCause cause {0, "configuration", *configuration_error_};
        complete(completion_failure(BrowseError::search_failed(cause)));
    }

  protected:
    void start() override {
        if (configuration_error_) {
            return;
        }
        if (backend_ == nullptr) {
            DSK_ERROR("No discovery backend available for {}", configuration_.reg_type);
            state_machine_.fail(BrowseError::search_failed(ErrorCause {0, {}, "no discovery backend available"}));
            return;
        }
        DSK_DEBUG("Start browsing: {}", configuration_.to_string());
        backend_->start();
    }

    void stop() override {
        registry_.cancel_all();
        if (backend_ != nullptr) {
            DSK_DEBUG("Stop browsing for {}", configuration_.reg_type);
            backend_->stop();
        }
    }

  private:
    Configuration configuration_;
    DiscoveryStateMachine state_machine_;
    ResolutionRegistry registry_;
    std::unique_ptr<DiscoveryBackend> backend_;
    std::optional<std::string> configuration_error_;
};

tl::expected<void, std::string> dsk::dnssd::ServiceBrowser::Configuration::validate() const {
    if (reg_type.empty()) {
        return tl::unexpected("reg_type must not be empty");
    }
    if (resolve_timeout.count() <= 0) {
        return tl::unexpected(fmt::format("resolve_timeout must be positive, got {}ms", resolve_timeout.count()));
    }
    return {};
}

std::string dsk::dnssd::ServiceBrowser::Configuration::to_string() const {
    return fmt::format(
        "reg_type: {}, domain: {}, resolve_services: {}, resolve_timeout: {}ms, resolution_error_policy: {}, "
        "unsupported_endpoint_policy: {}",
        reg_type, domain.value_or("default"), resolve_services, resolve_timeout.count(),
        dnssd::to_string(resolution_error_policy), dnssd::to_string(unsupported_endpoint_policy)
    );
}

dsk::dnssd::ServiceBrowser::ServiceBrowser(
    boost::asio::io_context& io_context, Configuration configuration, DiscoveryBackendFactory backend_factory,
    ResolverFactory resolver_factory
) :
    io_context_(io_context),
    configuration_(std::move(configuration)),
    backend_factory_(std::move(backend_factory)),
    resolver_factory_(std::move(resolver_factory)) {}

std::unique_ptr<dsk::Subscription> dsk::dnssd::ServiceBrowser::subscribe(SubscriberType& subscriber) const {
    auto subscription = std::make_unique<BrowseSubscription>(
        io_context_, configuration_, backend_factory_, resolver_factory_, subscriber
    );
    subscriber.on_subscribe(*subscription);
    subscription->complete_if_invalid();
    return subscription;
}

const dsk::dnssd::ServiceBrowser::Configuration& dsk::dnssd::ServiceBrowser::get_configuration() const {
    return configuration_;
}
