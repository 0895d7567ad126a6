/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/discovery_state_machine.hpp"

#include "discoverykit/core/log.hpp"
#include "discoverykit/core/util/overloaded.hpp"

dsk::dnssd::DiscoveryStateMachine::DiscoveryStateMachine(Configuration configuration) :
    configuration_(configuration) {}

void dsk::dnssd::DiscoveryStateMachine::handle_changes(const std::vector<BrowseResultChange>& changes) {
    for (const auto& change : changes) {
        if (terminated_) {
            DSK_TRACE("Ignoring changes after failure");
            return;
        }
        std::visit(
            Overloaded {
                [this](const BrowseResultChange::Added& c) {
                    handle(c);
                },
                [this](const BrowseResultChange::Removed& c) {
                    handle(c);
                },
                [this](const BrowseResultChange::Changed& c) {
                    handle(c);
                },
                [](const BrowseResultChange::Identical&) {},
            },
            change.change
        );
    }
}

void dsk::dnssd::DiscoveryStateMachine::handle_state(const BackendState& state) {
    if (terminated_) {
        return;
    }

    switch (state.kind) {
        case BackendState::Kind::setup:
        case BackendState::Kind::ready:
        case BackendState::Kind::cancelled:
            DSK_TRACE("Backend state: {}", state.to_string());
            break;
        case BackendState::Kind::failed:
        case BackendState::Kind::waiting:
            DSK_ERROR("Backend failed: {}", state.to_string());
            fail(map_backend_error(state.error));
            break;
    }
}

void dsk::dnssd::DiscoveryStateMachine::fail(const BrowseError& error) {
    if (terminated_) {
        return;
    }
    terminated_ = true;
    on_failure(error);
}

bool dsk::dnssd::DiscoveryStateMachine::is_terminated() const {
    return terminated_;
}

const std::map<std::string, dsk::dnssd::DiscoveredEndpoint>& dsk::dnssd::DiscoveryStateMachine::endpoints() const {
    return endpoints_;
}

dsk::dnssd::BrowseError dsk::dnssd::DiscoveryStateMachine::map_backend_error(const std::optional<ErrorCause>& cause) {
    if (cause && cause->code == error_code::k_policy_denied) {
        return BrowseError::permission_denied(cause);
    }
    return BrowseError::search_failed(cause);
}

void dsk::dnssd::DiscoveryStateMachine::handle(const BrowseResultChange::Added& added) {
    auto endpoint = added.endpoint;
    endpoint.visible = true;
    const auto identity = endpoint.identity();
    DSK_TRACE("Found: {}", endpoint.to_string());

    endpoints_.insert_or_assign(identity, endpoint);
    on_event(DidFind {endpoint});

    // The event handler might have failed the stream.
    if (terminated_ || !configuration_.resolve_services) {
        return;
    }
    resolve(endpoint);
}

void dsk::dnssd::DiscoveryStateMachine::handle(const BrowseResultChange::Removed& removed) {
    auto endpoint = removed.endpoint;
    endpoint.visible = false;
    const auto identity = endpoint.identity();
    DSK_TRACE("Removed: {}", endpoint.to_string());

    endpoints_.erase(identity);
    if (endpoint_requires_resolution(endpoint.endpoint)) {
        on_cancel_resolutions(identity);
    }
    on_event(DidRemove {std::move(endpoint)});
}

void dsk::dnssd::DiscoveryStateMachine::handle(const BrowseResultChange::Changed& changed) {
    auto old_endpoint = changed.old_endpoint;
    auto new_endpoint = changed.new_endpoint;
    new_endpoint.visible = true;
    DSK_TRACE("Updated: {} ({})", new_endpoint.to_string(), changed.flags.to_string());

    const auto old_identity = old_endpoint.identity();
    const auto new_identity = new_endpoint.identity();
    if (old_identity != new_identity) {
        endpoints_.erase(old_identity);
        if (endpoint_requires_resolution(old_endpoint.endpoint)) {
            on_cancel_resolutions(old_identity);
        }
    }
    endpoints_.insert_or_assign(new_identity, new_endpoint);
    on_event(DidUpdate {std::move(old_endpoint), std::move(new_endpoint), changed.flags});
}

void dsk::dnssd::DiscoveryStateMachine::resolve(const DiscoveredEndpoint& endpoint) {
    if (const auto* service = std::get_if<ServiceEndpoint>(&endpoint.endpoint)) {
        on_resolve(*service, endpoint.txt);
        return;
    }

    auto resolved = make_resolved_endpoint(endpoint.endpoint, endpoint.txt);
    if (resolved) {
        on_event(DidResolve {endpoint.identity(), std::move(*resolved)});
        return;
    }

    const auto policy = resolved.error().kind == ErrorKind::unsupported_endpoint
        ? configuration_.unsupported_endpoint_policy
        : configuration_.resolution_error_policy;

    if (policy == ErrorPolicy::fatal) {
        DSK_ERROR("Failed to resolve {}: {}", endpoint.to_string(), resolved.error().to_string());
        fail(resolved.error());
        return;
    }

    DSK_WARNING("Failed to resolve {}: {}", endpoint.to_string(), resolved.error().to_string());
    on_event(ResolutionFailed {resolved.error()});
}
