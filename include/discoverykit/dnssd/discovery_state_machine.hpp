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
#include "discoverykit/core/util/safe_function.hpp"

#include <map>
#include <string>
#include <vector>

namespace dsk::dnssd {

/**
 * Turns the changes and state transitions reported by a discovery backend into browse events, and decides which
 * endpoints have to be resolved. Endpoints which are resolved by construction (host and port, url, unix path) get a
 * DidResolve right away, named services are handed off through on_resolve.
 *
 * Once a fatal error was reported, the state machine ignores all further input.
 * This class is not thread safe.
 */
class DiscoveryStateMachine {
  public:
    struct Configuration {
        /// When false, only find, remove and update events are produced.
        bool resolve_services {true};
        /// What to do with endpoints of an unsupported kind.
        ErrorPolicy unsupported_endpoint_policy {ErrorPolicy::report};
        /// What to do with endpoints which fail to resolve, like an url without host.
        ErrorPolicy resolution_error_policy {ErrorPolicy::report};
    };

    /// Called for every event, in order.
    SafeFunction<void(BrowseEvent event)> on_event;

    /// Called when a named service has to be resolved.
    SafeFunction<void(const ServiceEndpoint& service, const std::optional<TxtRecord>& txt)> on_resolve;

    /// Called when resolutions for an identity are no longer wanted.
    SafeFunction<void(const std::string& identity)> on_cancel_resolutions;

    /// Called once with the error which ends discovery.
    SafeFunction<void(const BrowseError& error)> on_failure;

    DiscoveryStateMachine() = default;
    explicit DiscoveryStateMachine(Configuration configuration);

    /**
     * Processes a batch of changes in the given order.
     * @param changes The changes.
     */
    void handle_changes(const std::vector<BrowseResultChange>& changes);

    /**
     * Processes a state transition of the backend. Failed and waiting states end discovery.
     * @param state The new state.
     */
    void handle_state(const BackendState& state);

    /**
     * Ends discovery with given error. Only the first call has effect.
     * @param error The error.
     */
    void fail(const BrowseError& error);

    /**
     * @return True once discovery ended with an error.
     */
    [[nodiscard]] bool is_terminated() const;

    /**
     * @return The endpoints which are currently visible, by identity.
     */
    [[nodiscard]] const std::map<std::string, DiscoveredEndpoint>& endpoints() const;

    /**
     * Maps a backend error to the error which ends discovery.
     * @param cause The error reported by the backend.
     * @return permission_denied for the policy denied code, search_failed otherwise.
     */
    static BrowseError map_backend_error(const std::optional<ErrorCause>& cause);

  private:
    Configuration configuration_;
    std::map<std::string, DiscoveredEndpoint> endpoints_;
    bool terminated_ = false;

    void handle(const BrowseResultChange::Added& added);
    void handle(const BrowseResultChange::Removed& removed);
    void handle(const BrowseResultChange::Changed& changed);
    void resolve(const DiscoveredEndpoint& endpoint);
};

}  // namespace dsk::dnssd
