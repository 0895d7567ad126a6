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

#include "discoverykit/core/net/timer/asio_timer.hpp"
#include "discoverykit/dnssd/resolver.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dsk::dnssd {

/**
 * A resolver for testing. Outcomes are mocked directly, or scripted up front to happen some time after resolve() was
 * called. Like a platform resolver, it gives up when the timeout expires: it reports not resolved when it never
 * resolved, and stopped otherwise. After stop() or destruction the resolver goes quiet.
 */
class MockResolver: public Resolver {
  public:
    MockResolver(boost::asio::io_context& io_context, ServiceEndpoint service);
    ~MockResolver() override;

    /**
     * Mocks resolving the service.
     * @param resolved The result.
     */
    void mock_resolved(ResolvedEndpoint resolved);

    /**
     * Mocks resolving the service.
     * @param hostname The host name of the service.
     * @param addresses The addresses, as strings. Must be valid IP addresses.
     * @param port The port of the service.
     * @param txt The TXT record of the service.
     */
    void mock_resolved(
        const std::string& hostname, const std::vector<std::string>& addresses, uint16_t port, TxtRecord txt = {}
    );

    /**
     * Mocks failing to resolve the service.
     * @param error The error.
     */
    void mock_not_resolved(ErrorCause error);

    /**
     * Mocks the resolver stopping on its own.
     */
    void mock_stopped();

    /**
     * Mocks a TXT record update. Only delivered while monitoring.
     * @param txt The new TXT record.
     */
    void mock_txt_updated(TxtRecord txt);

    /**
     * Scripts the service to resolve some time after resolve() was called.
     * @param delay The time after resolve().
     * @param resolved The result.
     */
    void script_resolved_after(std::chrono::milliseconds delay, ResolvedEndpoint resolved);

    /**
     * Scripts the resolver to fail some time after resolve() was called.
     * @param delay The time after resolve().
     * @param error The error.
     */
    void script_not_resolved_after(std::chrono::milliseconds delay, ErrorCause error);

    /**
     * @return The service this resolver resolves.
     */
    [[nodiscard]] const ServiceEndpoint& get_service() const;

    /**
     * @return The timeout given to resolve(), if it was called.
     */
    [[nodiscard]] std::optional<std::chrono::milliseconds> get_timeout() const;

    [[nodiscard]] bool is_resolving() const;
    [[nodiscard]] bool is_monitoring() const;
    [[nodiscard]] int resolve_count() const;
    [[nodiscard]] int stop_count() const;

    // Resolver overrides
    void resolve(std::chrono::milliseconds timeout) override;
    void stop() override;
    void start_monitoring() override;
    void stop_monitoring() override;

  private:
    boost::asio::io_context& io_context_;
    ServiceEndpoint service_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
    std::atomic<bool> resolving_ {false};
    std::atomic<bool> monitoring_ {false};
    std::atomic<int> resolve_count_ {0};
    std::atomic<int> stop_count_ {0};
    bool resolved_once_ = false;
    std::optional<std::chrono::milliseconds> timeout_;
    std::optional<std::pair<std::chrono::milliseconds, std::function<void()>>> script_;
    AsioTimer script_timer_;
    AsioTimer timeout_timer_;

    void deliver(std::function<void()> delivery);
    void handle_resolved(const ResolvedEndpoint& resolved);
    void handle_not_resolved(const ErrorCause& error);
    void handle_stopped();
};

/**
 * Creates a factory which makes mock resolvers and hands every created resolver to given function, which is where
 * tests get hold of them and script outcomes.
 * @param io_context The context for the resolvers.
 * @param on_created Called with every created resolver.
 * @return The factory.
 */
ResolverFactory make_mock_resolver_factory(
    boost::asio::io_context& io_context, std::function<void(MockResolver& resolver)> on_created = nullptr
);

}  // namespace dsk::dnssd
