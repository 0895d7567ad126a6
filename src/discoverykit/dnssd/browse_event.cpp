/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/browse_event.hpp"

#include "discoverykit/core/util/overloaded.hpp"

#include <fmt/format.h>

std::string dsk::dnssd::to_string(const BrowseEvent& event) {
    return std::visit(
        Overloaded {
            [](const DidFind& e) {
                return fmt::format("did_find: {}", e.endpoint.to_string());
            },
            [](const DidRemove& e) {
                return fmt::format("did_remove: {}", e.endpoint.to_string());
            },
            [](const DidUpdate& e) {
                return fmt::format("did_update: {} ({})", e.new_endpoint.to_string(), e.flags.to_string());
            },
            [](const DidResolve& e) {
                return fmt::format("did_resolve: {}", e.resolved.to_string());
            },
            [](const ResolutionFailed& e) {
                return fmt::format("resolution_failed: {}", e.error.to_string());
            },
        },
        event
    );
}
