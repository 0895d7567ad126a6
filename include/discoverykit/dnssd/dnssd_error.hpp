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

#include <cstdint>
#include <optional>
#include <string>

namespace dsk::dnssd {

/// Error codes reported by DNS-SD backends which are given a meaning of their own.
namespace error_code {
    /// kDNSServiceErr_PolicyDenied, browsing is not allowed by the platform.
    constexpr int32_t k_policy_denied = -65570;
    /// kDNSServiceErr_Timeout.
    constexpr int32_t k_timeout = -65568;
    /// The timeout code resolvers report when they gave up on a resolve.
    constexpr int32_t k_resolver_timeout = -72007;
}  // namespace error_code

/**
 * The kinds of errors a discovery stream can report.
 */
enum class ErrorKind {
    /// Discovery was blocked by policy. Ends the stream.
    permission_denied,
    /// Any other failure of the discovery backend. Ends the stream.
    search_failed,
    /// A discovered endpoint is of a kind which is not supported.
    unsupported_endpoint,
    /// A resolution did not finish in time.
    resolution_timeout,
    /// A resolution failed.
    resolution_failed,
};

/**
 * What to do with an error which only concerns a single endpoint or resolution.
 */
enum class ErrorPolicy {
    /// Report the error as an event, the stream continues.
    report,
    /// End the stream with the error.
    fatal,
};

/**
 * The error as reported by a backend.
 */
struct ErrorCause {
    int32_t code {};
    std::string domain;
    std::string message;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const ErrorCause& lhs, const ErrorCause& rhs) {
        return lhs.code == rhs.code && lhs.domain == rhs.domain && lhs.message == rhs.message;
    }

    friend bool operator!=(const ErrorCause& lhs, const ErrorCause& rhs) {
        return !(lhs == rhs);
    }
};

/**
 * An error reported by a discovery or resolution stream.
 */
struct BrowseError {
    ErrorKind kind {ErrorKind::search_failed};
    /// The identity of the endpoint the error is about. Empty for errors of the backend as a whole.
    std::string identity;
    std::optional<ErrorCause> cause;

    static BrowseError permission_denied(std::optional<ErrorCause> cause = std::nullopt);
    static BrowseError search_failed(std::optional<ErrorCause> cause);
    static BrowseError unsupported_endpoint(std::string identity);
    static BrowseError resolution_timeout(std::string identity);
    static BrowseError resolution_failed(std::string identity, ErrorCause cause);

    /**
     * @return True for errors which only concern a single endpoint.
     */
    [[nodiscard]] bool is_scoped_to_endpoint() const;

    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const BrowseError& lhs, const BrowseError& rhs) {
        return lhs.kind == rhs.kind && lhs.identity == rhs.identity && lhs.cause == rhs.cause;
    }

    friend bool operator!=(const BrowseError& lhs, const BrowseError& rhs) {
        return !(lhs == rhs);
    }
};

const char* to_string(ErrorKind kind);
const char* to_string(ErrorPolicy policy);

}  // namespace dsk::dnssd
