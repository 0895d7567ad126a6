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

#include <string>
#include <variant>

namespace dsk::dnssd {

/// An endpoint was found.
struct DidFind {
    DiscoveredEndpoint endpoint;
};

/// A previously found endpoint is no longer published.
struct DidRemove {
    DiscoveredEndpoint endpoint;
};

/// A previously found endpoint changed. Usually this means it was found or removed on another interface, see flags.
struct DidUpdate {
    DiscoveredEndpoint old_endpoint;
    DiscoveredEndpoint new_endpoint;
    ChangeFlags flags;
};

/// An endpoint was resolved.
struct DidResolve {
    /// The identity of the endpoint which was found.
    std::string identity;
    ResolvedEndpoint resolved;
};

/// Resolving an endpoint failed. Only reported when the error policy is ErrorPolicy::report.
struct ResolutionFailed {
    BrowseError error;
};

using BrowseEvent = std::variant<DidFind, DidRemove, DidUpdate, DidResolve, ResolutionFailed>;

/**
 * @param event The event.
 * @return A description of the event for logging.
 */
std::string to_string(const BrowseEvent& event);

}  // namespace dsk::dnssd
