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

#include "discoverykit/dnssd/discovery_backend.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace dsk::dnssd {

/**
 * A discovery backend for testing. Changes and states are delivered on the io_context. Changes mocked before the
 * backend was started are held back and delivered when it starts, the way a browser reports its cache. After stop() or
 * destruction the backend goes quiet.
 */
class MockDiscoveryBackend: public DiscoveryBackend {
  public:
    MockDiscoveryBackend(boost::asio::io_context& io_context, Query query);
    ~MockDiscoveryBackend() override;

    /**
     * Mocks discovering an endpoint.
     * @param endpoint The endpoint.
     */
    void mock_added(DiscoveredEndpoint endpoint);

    /**
     * Mocks an endpoint disappearing.
     * @param endpoint The endpoint.
     */
    void mock_removed(DiscoveredEndpoint endpoint);

    /**
     * Mocks an endpoint changing.
     * @param old_endpoint The endpoint as it was.
     * @param new_endpoint The endpoint as it is now.
     * @param flags What changed.
     */
    void mock_changed(DiscoveredEndpoint old_endpoint, DiscoveredEndpoint new_endpoint, ChangeFlags flags);

    /**
     * Mocks a batch of changes, delivered in a single callback.
     * @param changes The changes.
     */
    void mock_batch(std::vector<BrowseResultChange> changes);

    /**
     * Mocks a state transition.
     * @param state The new state.
     */
    void mock_state(BackendState state);

    /**
     * @return The query this backend was created for.
     */
    [[nodiscard]] const Query& get_query() const;

    /**
     * @return The number of times start() was called.
     */
    [[nodiscard]] int start_count() const;

    /**
     * @return The number of times stop() was called.
     */
    [[nodiscard]] int stop_count() const;

    /**
     * @return True if started and not stopped.
     */
    [[nodiscard]] bool is_running() const;

    // DiscoveryBackend overrides
    void start() override;
    void stop() override;

  private:
    boost::asio::io_context& io_context_;
    Query query_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
    std::atomic<int> start_count_ {0};
    std::atomic<int> stop_count_ {0};
    std::atomic<bool> running_ {false};
    std::atomic<bool> stopped_ {false};
    std::mutex pending_mutex_;
    std::vector<std::function<void()>> pending_;  // Deliveries mocked before start

    void deliver(std::function<void()> delivery);
};

/**
 * Creates a factory which makes mock backends and hands every created backend to given function, which is where tests
 * get hold of them.
 * @param io_context The context for the backends.
 * @param on_created Called with every created backend.
 * @return The factory.
 */
DiscoveryBackendFactory make_mock_discovery_backend_factory(
    boost::asio::io_context& io_context, std::function<void(MockDiscoveryBackend& backend)> on_created = nullptr
);

}  // namespace dsk::dnssd
