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

#include "txt_record.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace dsk::dnssd {

/**
 * Identifies the network interface on which something was observed.
 */
struct NetworkInterface {
    uint32_t index {};
    std::string name;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const NetworkInterface& lhs, const NetworkInterface& rhs) {
        return lhs.index == rhs.index && lhs.name == rhs.name;
    }

    friend bool operator!=(const NetworkInterface& lhs, const NetworkInterface& rhs) {
        return !(lhs == rhs);
    }
};

/// A host (name or literal IP address) and port.
struct HostPortEndpoint {
    std::string host;
    uint16_t port {};
    std::optional<NetworkInterface> network_interface;
};

/// A named DNS-SD service which has to be resolved before it can be connected to.
struct ServiceEndpoint {
    /// The name of the service.
    std::string name;
    /// The type of the service (ie. _http._tcp.).
    std::string type;
    /// The domain of the service (local.).
    std::string domain;
    std::optional<NetworkInterface> network_interface;
};

/// An endpoint given as URL. Host and port are taken from the URL.
struct UrlEndpoint {
    std::string url;
};

/// A filesystem path to an AF_UNIX socket.
struct UnixEndpoint {
    std::string path;
};

/// An endpoint of a kind a backend reported but which is not modelled here.
struct OpaqueEndpoint {
    std::string kind;
    std::string description;
};

using Endpoint = std::variant<HostPortEndpoint, ServiceEndpoint, UrlEndpoint, UnixEndpoint, OpaqueEndpoint>;

/**
 * @param endpoint The endpoint.
 * @return A key which identifies the endpoint: "host:port", "name.type.domain", the url, "unix:path" or
 * "opaque:kind:description".
 */
std::string endpoint_identity(const Endpoint& endpoint);

/**
 * @param endpoint The endpoint.
 * @return True if the endpoint is a named service which needs resolution before it can be used.
 */
bool endpoint_requires_resolution(const Endpoint& endpoint);

/**
 * @param endpoint The endpoint.
 * @return The interface the endpoint was observed on, if known.
 */
std::optional<NetworkInterface> endpoint_interface(const Endpoint& endpoint);

/**
 * @param endpoint The endpoint.
 * @return A description of the endpoint for logging.
 */
std::string to_string(const Endpoint& endpoint);

/**
 * Bit flags describing what changed about an endpoint.
 */
struct ChangeFlags {
    enum Flag : uint32_t {
        none = 0,
        interface_added = 1 << 0,
        interface_removed = 1 << 1,
        metadata_changed = 1 << 2,
    };

    uint32_t value {none};

    [[nodiscard]] bool has(const Flag flag) const {
        return (value & flag) != 0;
    }

    [[nodiscard]] std::string to_string() const;

    friend ChangeFlags operator|(const ChangeFlags lhs, const Flag rhs) {
        return ChangeFlags {lhs.value | rhs};
    }

    friend bool operator==(const ChangeFlags lhs, const ChangeFlags rhs) {
        return lhs.value == rhs.value;
    }

    friend bool operator!=(const ChangeFlags lhs, const ChangeFlags rhs) {
        return !(lhs == rhs);
    }
};

/**
 * An endpoint as observed by a discovery backend.
 */
struct DiscoveredEndpoint {
    Endpoint endpoint;
    /// The TXT record, if the backend reported one.
    std::optional<TxtRecord> txt;
    /// False once the endpoint is no longer published.
    bool visible {true};

    [[nodiscard]] std::string identity() const {
        return endpoint_identity(endpoint);
    }

    [[nodiscard]] std::optional<NetworkInterface> network_interface() const {
        return endpoint_interface(endpoint);
    }

    [[nodiscard]] std::string to_string() const;
};

}  // namespace dsk::dnssd
