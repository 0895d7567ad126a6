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
#include "txt_record.hpp"
#include "discoverykit/core/util/safe_function.hpp"

#include <chrono>
#include <functional>
#include <memory>

namespace dsk::dnssd {

/**
 * Resolves a named service into host name, addresses and port, for example a Bonjour NetService. Implementations
 * deliver their callbacks on a single serial execution context and stay silent after stop() was called.
 */
class Resolver {
  public:
    /// Called when resolving begins.
    SafeFunction<void()> on_will_resolve;

    /// Called for every address the service was resolved to. Might be called more than once.
    SafeFunction<void(const ResolvedEndpoint& resolved)> on_resolved;

    /// Called when the service couldn't be resolved.
    SafeFunction<void(const ErrorCause& error)> on_not_resolved;

    /// Called when the TXT record of the service changed, while monitoring.
    SafeFunction<void(const TxtRecord& txt)> on_txt_updated;

    /// Called when the resolver stopped on its own.
    SafeFunction<void()> on_stopped;

    virtual ~Resolver() = default;

    /**
     * Starts resolving.
     * @param timeout The time after which the resolver gives up.
     */
    virtual void resolve(std::chrono::milliseconds timeout) = 0;

    /**
     * Stops resolving and monitoring. No callbacks are made after this call returns.
     */
    virtual void stop() = 0;

    /**
     * Starts monitoring the TXT record of the service.
     */
    virtual void start_monitoring() = 0;

    /**
     * Stops monitoring the TXT record of the service.
     */
    virtual void stop_monitoring() = 0;
};

/// Creates a resolver for a service.
using ResolverFactory = std::function<std::unique_ptr<Resolver>(const ServiceEndpoint& service)>;

}  // namespace dsk::dnssd
