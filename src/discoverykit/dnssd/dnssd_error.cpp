/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/dnssd_error.hpp"

#include <fmt/format.h>

std::string dsk::dnssd::ErrorCause::to_string() const {
    if (domain.empty()) {
        return fmt::format("{} ({})", message, code);
    }
    return fmt::format("{} ({}: {})", message, domain, code);
}

dsk::dnssd::BrowseError dsk::dnssd::BrowseError::permission_denied(std::optional<ErrorCause> cause) {
    return BrowseError {ErrorKind::permission_denied, {}, std::move(cause)};
}

dsk::dnssd::BrowseError dsk::dnssd::BrowseError::search_failed(std::optional<ErrorCause> cause) {
    return BrowseError {ErrorKind::search_failed, {}, std::move(cause)};
}

dsk::dnssd::BrowseError dsk::dnssd::BrowseError::unsupported_endpoint(std::string identity) {
    return BrowseError {ErrorKind::unsupported_endpoint, std::move(identity), std::nullopt};
}

dsk::dnssd::BrowseError dsk::dnssd::BrowseError::resolution_timeout(std::string identity) {
    return BrowseError {ErrorKind::resolution_timeout, std::move(identity), std::nullopt};
}

dsk::dnssd::BrowseError dsk::dnssd::BrowseError::resolution_failed(std::string identity, ErrorCause cause) {
    return BrowseError {ErrorKind::resolution_failed, std::move(identity), std::move(cause)};
}

bool dsk::dnssd::BrowseError::is_scoped_to_endpoint() const {
    switch (kind) {
        case ErrorKind::unsupported_endpoint:
        case ErrorKind::resolution_timeout:
        case ErrorKind::resolution_failed:
            return true;
        case ErrorKind::permission_denied:
        case ErrorKind::search_failed:
            return false;
    }
    return false;
}

std::string dsk::dnssd::BrowseError::to_string() const {
    auto result = std::string(dnssd::to_string(kind));
    if (!identity.empty()) {
        result += fmt::format(" [{}]", identity);
    }
    if (cause) {
        result += ": " + cause->to_string();
    }
    return result;
}

const char* dsk::dnssd::to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::permission_denied:
            return "permission_denied";
        case ErrorKind::search_failed:
            return "search_failed";
        case ErrorKind::unsupported_endpoint:
            return "unsupported_endpoint";
        case ErrorKind::resolution_timeout:
            return "resolution_timeout";
        case ErrorKind::resolution_failed:
            return "resolution_failed";
    }
    return "unknown";
}

const char* dsk::dnssd::to_string(const ErrorPolicy policy) {
    switch (policy) {
        case ErrorPolicy::report:
            return "report";
        case ErrorPolicy::fatal:
            return "fatal";
    }
    return "unknown";
}
