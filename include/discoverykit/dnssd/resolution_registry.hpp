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
#include "resolver.hpp"
#include "discoverykit/core/util/id.hpp"
#include "discoverykit/core/util/safe_function.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dsk::dnssd {

/**
 * Runs any number of resolutions side by side, each with its own resolver and timeout. The registry is the only owner
 * of the resolvers: an entry is erased when its resolver resolved, failed or stopped, or when its timeout expired,
 * whichever comes first. Resolutions for the same identity are independent of each other.
 *
 * Callbacks from resolvers and timers lock the given mutex before touching the registry, so the registry can be used
 * together with the state it reports into. Resolvers and timers run on the given io_context.
 */
class ResolutionRegistry {
  public:
    /// Called when a resolution succeeded, with the endpoint set to the service. The entry was already erased.
    SafeFunction<void(Id id, const ResolvedEndpoint& resolved)> on_resolved;

    /// Called when a resolution failed or timed out. The entry was already erased.
    SafeFunction<void(Id id, const BrowseError& error)> on_failed;

    /**
     * @param io_context The context to run timers on.
     * @param factory Creates a resolver for every resolution.
     * @param mutex The mutex guarding the registry, must outlive the registry.
     */
    ResolutionRegistry(boost::asio::io_context& io_context, ResolverFactory factory, std::recursive_mutex& mutex);
    ~ResolutionRegistry();

    ResolutionRegistry(const ResolutionRegistry&) = delete;
    ResolutionRegistry& operator=(const ResolutionRegistry&) = delete;

    ResolutionRegistry(ResolutionRegistry&&) = delete;
    ResolutionRegistry& operator=(ResolutionRegistry&&) = delete;

    /**
     * Creates a resolver for the service, registers it and starts it.
     * @param service The service to resolve.
     * @param timeout The time after which the resolution is reported as timed out.
     * @param txt The TXT record found with the service, used when the resolver doesn't report one.
     * @return The id of the resolution.
     */
    Id resolve(const ServiceEndpoint& service, std::chrono::milliseconds timeout, std::optional<TxtRecord> txt = {});

    /**
     * Stops and erases all resolutions for given identity without reporting anything.
     * @param identity The identity of the endpoint.
     * @return The number of resolutions which were cancelled.
     */
    size_t cancel(const std::string& identity);

    /**
     * Stops and erases all resolutions without reporting anything.
     */
    void cancel_all();

    /**
     * @return The number of resolutions in flight.
     */
    [[nodiscard]] size_t size() const;

    /**
     * @param id The id of a resolution.
     * @return True if the resolution is in flight.
     */
    [[nodiscard]] bool contains(Id id) const;

    /**
     * @param identity The identity of an endpoint.
     * @return The number of resolutions in flight for given identity.
     */
    [[nodiscard]] size_t count(const std::string& identity) const;

  private:
    struct Entry {
        ServiceEndpoint service;
        std::string identity;
        std::optional<TxtRecord> txt;
        std::unique_ptr<Resolver> resolver;
        std::unique_ptr<boost::asio::steady_timer> timer;
    };

    boost::asio::io_context& io_context_;
    ResolverFactory factory_;
    std::recursive_mutex& mutex_;
    Id::Generator id_generator_;
    std::map<Id, Entry> entries_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    void handle_resolved(Id id, const ResolvedEndpoint& resolved);
    void handle_not_resolved(Id id, const ErrorCause& error);
    void handle_stopped(Id id);
    void handle_timeout(Id id);
    std::optional<Entry> take(Id id);
    void release(Entry entry);
};

}  // namespace dsk::dnssd
