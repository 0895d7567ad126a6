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
#include "discoverykit/core/util/safe_function.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace dsk::dnssd {

/**
 * A single change reported by a discovery backend.
 */
struct BrowseResultChange {
    /// An endpoint was discovered.
    struct Added {
        DiscoveredEndpoint endpoint;
    };

    /// An endpoint is no longer published.
    struct Removed {
        DiscoveredEndpoint endpoint;
    };

    /// An endpoint changed, usually because it appeared or disappeared on another interface. See flags.
    struct Changed {
        DiscoveredEndpoint old_endpoint;
        DiscoveredEndpoint new_endpoint;
        ChangeFlags flags;
    };

    /// Reported again without changes.
    struct Identical {
        DiscoveredEndpoint endpoint;
    };

    std::variant<Added, Removed, Changed, Identical> change;

    static BrowseResultChange added(DiscoveredEndpoint endpoint) {
        return BrowseResultChange {Added {std::move(endpoint)}};
    }

    static BrowseResultChange removed(DiscoveredEndpoint endpoint) {
        return BrowseResultChange {Removed {std::move(endpoint)}};
    }

    static BrowseResultChange
    changed(DiscoveredEndpoint old_endpoint, DiscoveredEndpoint new_endpoint, const ChangeFlags flags) {
        return BrowseResultChange {Changed {std::move(old_endpoint), std::move(new_endpoint), flags}};
    }

    static BrowseResultChange identical(DiscoveredEndpoint endpoint) {
        return BrowseResultChange {Identical {std::move(endpoint)}};
    }
};

/**
 * The state of a discovery backend.
 */
struct BackendState {
    enum class Kind {
        setup,
        ready,
        /// The backend failed and won't recover.
        failed,
        /// The backend can't browse right now, the error tells why.
        waiting,
        cancelled,
    };

    Kind kind {Kind::setup};
    std::optional<ErrorCause> error;

    [[nodiscard]] std::string to_string() const;
};

/**
 * A push style source of discovery results, for example a Bonjour browser. Implementations deliver their callbacks on
 * a single serial execution context and stay silent after stop() was called.
 */
class DiscoveryBackend {
  public:
    /**
     * What to browse for.
     */
    struct Query {
        /// The service type (i.e. _http._tcp.).
        std::string reg_type;
        /// The domain, or the default domains when empty.
        std::optional<std::string> domain;
    };

    /// Called with every batch of changes, in the order the backend observed them.
    SafeFunction<void(const std::vector<BrowseResultChange>& changes)> on_changes;

    /// Called when the state of the backend changed.
    SafeFunction<void(const BackendState& state)> on_state_changed;

    virtual ~DiscoveryBackend() = default;

    /**
     * Starts browsing. Called at most once.
     */
    virtual void start() = 0;

    /**
     * Stops browsing. No callbacks are made after this call returns.
     */
    virtual void stop() = 0;
};

/// Creates a discovery backend for a query. Called once for every subscription.
using DiscoveryBackendFactory = std::function<std::unique_ptr<DiscoveryBackend>(const DiscoveryBackend::Query& query)>;

}  // namespace dsk::dnssd
