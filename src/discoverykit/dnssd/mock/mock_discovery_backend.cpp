/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/mock/mock_discovery_backend.hpp"

#include "discoverykit/core/exception.hpp"
#include "discoverykit/core/log.hpp"

dsk::dnssd::MockDiscoveryBackend::MockDiscoveryBackend(boost::asio::io_context& io_context, Query query) :
    io_context_(io_context), query_(std::move(query)) {}

dsk::dnssd::MockDiscoveryBackend::~MockDiscoveryBackend() {
    running_ = false;
    alive_.reset();
}

void dsk::dnssd::MockDiscoveryBackend::mock_added(DiscoveredEndpoint endpoint) {
    mock_batch({BrowseResultChange::added(std::move(endpoint))});
}

void dsk::dnssd::MockDiscoveryBackend::mock_removed(DiscoveredEndpoint endpoint) {
    mock_batch({BrowseResultChange::removed(std::move(endpoint))});
}

void dsk::dnssd::MockDiscoveryBackend::mock_changed(
    DiscoveredEndpoint old_endpoint, DiscoveredEndpoint new_endpoint, const ChangeFlags flags
) {
    mock_batch({BrowseResultChange::changed(std::move(old_endpoint), std::move(new_endpoint), flags)});
}

void dsk::dnssd::MockDiscoveryBackend::mock_batch(std::vector<BrowseResultChange> changes) {
    deliver([this, changes = std::move(changes)] {
        on_changes(changes);
    });
}

void dsk::dnssd::MockDiscoveryBackend::mock_state(BackendState state) {
    deliver([this, state = std::move(state)] {
        on_state_changed(state);
    });
}

const dsk::dnssd::DiscoveryBackend::Query& dsk::dnssd::MockDiscoveryBackend::get_query() const {
    return query_;
}

int dsk::dnssd::MockDiscoveryBackend::start_count() const {
    return start_count_;
}

int dsk::dnssd::MockDiscoveryBackend::stop_count() const {
    return stop_count_;
}

bool dsk::dnssd::MockDiscoveryBackend::is_running() const {
    return running_;
}

void dsk::dnssd::MockDiscoveryBackend::start() {
    if (start_count_.fetch_add(1) > 0) {
        DSK_THROW_EXCEPTION("Already browsing for reg_type: {}", query_.reg_type);
    }

    std::vector<std::function<void()>> pending;
    {
        std::lock_guard lock(pending_mutex_);
        if (stopped_) {
            DSK_THROW_EXCEPTION("Backend for reg_type {} was stopped before it was started", query_.reg_type);
        }
        running_ = true;
        pending = std::move(pending_);
        pending_.clear();
    }

    if (pending.empty()) {
        return;
    }

    boost::asio::dispatch(io_context_, [this, alive = std::weak_ptr<bool>(alive_), pending = std::move(pending)] {
        for (const auto& delivery : pending) {
            if (alive.expired() || !running_) {
                return;
            }
            delivery();
        }
    });
}

void dsk::dnssd::MockDiscoveryBackend::stop() {
    std::lock_guard lock(pending_mutex_);
    ++stop_count_;
    running_ = false;
    stopped_ = true;
    pending_.clear();
}

void dsk::dnssd::MockDiscoveryBackend::deliver(std::function<void()> delivery) {
    {
        std::lock_guard lock(pending_mutex_);
        if (stopped_) {
            DSK_TRACE("Backend for {} is stopped, dropping mocked delivery", query_.reg_type);
            return;
        }
        if (!running_) {
            pending_.push_back(std::move(delivery));
            return;
        }
    }

    boost::asio::dispatch(io_context_, [this, alive = std::weak_ptr<bool>(alive_), delivery = std::move(delivery)] {
        if (alive.expired() || !running_) {
            return;
        }
        delivery();
    });
}

dsk::dnssd::DiscoveryBackendFactory dsk::dnssd::make_mock_discovery_backend_factory(
    boost::asio::io_context& io_context, std::function<void(MockDiscoveryBackend& backend)> on_created
) {
    return [&io_context, on_created = std::move(on_created)](const DiscoveryBackend::Query& query) {
        auto backend = std::make_unique<MockDiscoveryBackend>(io_context, query);
        if (on_created) {
            on_created(*backend);
        }
        return std::unique_ptr<DiscoveryBackend>(std::move(backend));
    };
}
