/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/endpoint.hpp"

#include "discoverykit/core/string.hpp"
#include "discoverykit/core/util/overloaded.hpp"

#include <fmt/format.h>

namespace {

void append_label(std::string& out, const std::string& label) {
    if (label.empty()) {
        return;
    }
    if (!out.empty() && !dsk::string_ends_with(out, ".")) {
        out += '.';
    }
    out += label;
}

}  // namespace

std::string dsk::dnssd::NetworkInterface::to_string() const {
    if (name.empty()) {
        return fmt::format("if#{}", index);
    }
    return fmt::format("{}#{}", name, index);
}

std::string dsk::dnssd::endpoint_identity(const Endpoint& endpoint) {
    return std::visit(
        Overloaded {
            [](const HostPortEndpoint& e) {
                if (e.host.find(':') != std::string::npos) {
                    return fmt::format("[{}]:{}", e.host, e.port);
                }
                return fmt::format("{}:{}", e.host, e.port);
            },
            [](const ServiceEndpoint& e) {
                std::string identity;
                append_label(identity, e.name);
                append_label(identity, e.type);
                append_label(identity, e.domain);
                return identity;
            },
            [](const UrlEndpoint& e) {
                return e.url;
            },
            [](const UnixEndpoint& e) {
                return "unix:" + e.path;
            },
            [](const OpaqueEndpoint& e) {
                return fmt::format("opaque:{}:{}", e.kind, e.description);
            },
        },
        endpoint
    );
}

bool dsk::dnssd::endpoint_requires_resolution(const Endpoint& endpoint) {
    return std::holds_alternative<ServiceEndpoint>(endpoint);
}

std::optional<dsk::dnssd::NetworkInterface> dsk::dnssd::endpoint_interface(const Endpoint& endpoint) {
    return std::visit(
        Overloaded {
            [](const HostPortEndpoint& e) {
                return e.network_interface;
            },
            [](const ServiceEndpoint& e) {
                return e.network_interface;
            },
            [](const auto&) {
                return std::optional<NetworkInterface> {};
            },
        },
        endpoint
    );
}

std::string dsk::dnssd::to_string(const Endpoint& endpoint) {
    const auto kind = std::visit(
        Overloaded {
            [](const HostPortEndpoint&) {
                return "host_port";
            },
            [](const ServiceEndpoint&) {
                return "service";
            },
            [](const UrlEndpoint&) {
                return "url";
            },
            [](const UnixEndpoint&) {
                return "unix";
            },
            [](const OpaqueEndpoint&) {
                return "opaque";
            },
        },
        endpoint
    );

    if (const auto iface = endpoint_interface(endpoint)) {
        return fmt::format("{} {} on {}", kind, endpoint_identity(endpoint), iface->to_string());
    }
    return fmt::format("{} {}", kind, endpoint_identity(endpoint));
}

std::string dsk::dnssd::ChangeFlags::to_string() const {
    if (value == none) {
        return "none";
    }
    std::string result;
    const auto append = [&result](const char* name) {
        if (!result.empty()) {
            result += '|';
        }
        result += name;
    };
    if (has(interface_added)) {
        append("interface_added");
    }
    if (has(interface_removed)) {
        append("interface_removed");
    }
    if (has(metadata_changed)) {
        append("metadata_changed");
    }
    return result;
}

std::string dsk::dnssd::DiscoveredEndpoint::to_string() const {
    if (txt) {
        return fmt::format("{} txt: {}", dnssd::to_string(endpoint), txt_record_to_string(*txt));
    }
    return dnssd::to_string(endpoint);
}
