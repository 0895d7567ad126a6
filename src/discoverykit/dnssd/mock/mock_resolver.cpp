/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/mock/mock_resolver.hpp"

#include "discoverykit/core/exception.hpp"
#include "discoverykit/core/log.hpp"

dsk::dnssd::MockResolver::MockResolver(boost::asio::io_context& io_context, ServiceEndpoint service) :
    io_context_(io_context), service_(std::move(service)), script_timer_(io_context), timeout_timer_(io_context) {}

dsk::dnssd::MockResolver::~MockResolver() {
    resolving_ = false;
    monitoring_ = false;
    alive_.reset();
}

void dsk::dnssd::MockResolver::mock_resolved(ResolvedEndpoint resolved) {
    deliver([this, resolved = std::move(resolved)] {
        handle_resolved(resolved);
    });
}

void dsk::dnssd::MockResolver::mock_resolved(
    const std::string& hostname, const std::vector<std::string>& addresses, const uint16_t port, TxtRecord txt
) {
    ResolvedEndpoint resolved;
    resolved.endpoint = service_;
    resolved.hostname = hostname;
    for (const auto& address : addresses) {
        resolved.addresses.push_back(boost::asio::ip::make_address(address));
    }
    resolved.port = port;
    resolved.network_interface = service_.network_interface;
    resolved.txt = std::move(txt);
    mock_resolved(std::move(resolved));
}

void dsk::dnssd::MockResolver::mock_not_resolved(ErrorCause error) {
    deliver([this, error = std::move(error)] {
        handle_not_resolved(error);
    });
}

void dsk::dnssd::MockResolver::mock_stopped() {
    deliver([this] {
        handle_stopped();
    });
}

void dsk::dnssd::MockResolver::mock_txt_updated(TxtRecord txt) {
    deliver([this, txt = std::move(txt)] {
        if (!monitoring_) {
            DSK_TRACE("Not monitoring {}, dropping TXT record update", endpoint_identity(service_));
            return;
        }
        on_txt_updated(txt);
    });
}

void dsk::dnssd::MockResolver::script_resolved_after(const std::chrono::milliseconds delay, ResolvedEndpoint resolved) {
    script_ = std::make_pair(delay, [this, resolved = std::move(resolved)] {
        handle_resolved(resolved);
    });
}

void dsk::dnssd::MockResolver::script_not_resolved_after(const std::chrono::milliseconds delay, ErrorCause error) {
    script_ = std::make_pair(delay, [this, error = std::move(error)] {
        handle_not_resolved(error);
    });
}

const dsk::dnssd::ServiceEndpoint& dsk::dnssd::MockResolver::get_service() const {
    return service_;
}

std::optional<std::chrono::milliseconds> dsk::dnssd::MockResolver::get_timeout() const {
    return timeout_;
}

bool dsk::dnssd::MockResolver::is_resolving() const {
    return resolving_;
}

bool dsk::dnssd::MockResolver::is_monitoring() const {
    return monitoring_;
}

int dsk::dnssd::MockResolver::resolve_count() const {
    return resolve_count_;
}

int dsk::dnssd::MockResolver::stop_count() const {
    return stop_count_;
}

void dsk::dnssd::MockResolver::resolve(const std::chrono::milliseconds timeout) {
    if (resolving_) {
        DSK_THROW_EXCEPTION("Already resolving: {}", endpoint_identity(service_));
    }

    ++resolve_count_;
    resolving_ = true;
    resolved_once_ = false;
    timeout_ = timeout;

    timeout_timer_.once(timeout, [this] {
        if (resolved_once_) {
            handle_stopped();
            return;
        }
        handle_not_resolved(ErrorCause {error_code::k_resolver_timeout, "NSNetServicesErrorDomain", "timed out"});
    });

    if (script_) {
        script_timer_.once(script_->first, script_->second);
    }

    deliver([this] {
        if (resolving_) {
            on_will_resolve();
        }
    });
}

void dsk::dnssd::MockResolver::stop() {
    ++stop_count_;
    resolving_ = false;
    monitoring_ = false;
    script_timer_.stop();
    timeout_timer_.stop();
}

void dsk::dnssd::MockResolver::start_monitoring() {
    monitoring_ = true;
}

void dsk::dnssd::MockResolver::stop_monitoring() {
    monitoring_ = false;
}

void dsk::dnssd::MockResolver::deliver(std::function<void()> delivery) {
    boost::asio::dispatch(io_context_, [alive = std::weak_ptr<bool>(alive_), delivery = std::move(delivery)] {
        if (alive.expired()) {
            return;
        }
        delivery();
    });
}

void dsk::dnssd::MockResolver::handle_resolved(const ResolvedEndpoint& resolved) {
    if (resolve_count_ == 0) {
        DSK_THROW_EXCEPTION("Not resolving: {}", endpoint_identity(service_));
    }
    if (!resolving_) {
        return;
    }
    resolved_once_ = true;
    on_resolved(resolved);
}

void dsk::dnssd::MockResolver::handle_not_resolved(const ErrorCause& error) {
    if (resolve_count_ == 0) {
        DSK_THROW_EXCEPTION("Not resolving: {}", endpoint_identity(service_));
    }
    if (!resolving_) {
        return;
    }
    resolving_ = false;
    script_timer_.stop();
    timeout_timer_.stop();
    on_not_resolved(error);
}

void dsk::dnssd::MockResolver::handle_stopped() {
    if (!resolving_) {
        return;
    }
    resolving_ = false;
    monitoring_ = false;
    script_timer_.stop();
    timeout_timer_.stop();
    on_stopped();
}

dsk::dnssd::ResolverFactory dsk::dnssd::make_mock_resolver_factory(
    boost::asio::io_context& io_context, std::function<void(MockResolver& resolver)> on_created
) {
    return [&io_context, on_created = std::move(on_created)](const ServiceEndpoint& service) {
        auto resolver = std::make_unique<MockResolver>(io_context, service);
        if (on_created) {
            on_created(*resolver);
        }
        return std::unique_ptr<Resolver>(std::move(resolver));
    };
}
