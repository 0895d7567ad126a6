/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/resolution_registry.hpp"

#include "discoverykit/core/log.hpp"

dsk::dnssd::ResolutionRegistry::ResolutionRegistry(
    boost::asio::io_context& io_context, ResolverFactory factory, std::recursive_mutex& mutex
) :
    io_context_(io_context), factory_(std::move(factory)), mutex_(mutex) {}

dsk::dnssd::ResolutionRegistry::~ResolutionRegistry() {
    cancel_all();
    alive_.reset();
}

dsk::Id dsk::dnssd::ResolutionRegistry::resolve(
    const ServiceEndpoint& service, const std::chrono::milliseconds timeout, std::optional<TxtRecord> txt
) {
    std::lock_guard lock(mutex_);

    const auto id = id_generator_.next();
    const auto identity = endpoint_identity(service);

    auto resolver = factory_ ? factory_(service) : nullptr;
    if (resolver == nullptr) {
        DSK_WARNING("No resolver available for {}", identity);
        on_failed(id, BrowseError::resolution_failed(identity, ErrorCause {0, {}, "no resolver available"}));
        return id;
    }

    DSK_DEBUG("Resolving {} (id: {}, timeout: {}ms)", identity, id.value(), timeout.count());

    resolver->on_resolved = [this, id](const ResolvedEndpoint& resolved) {
        handle_resolved(id, resolved);
    };
    resolver->on_not_resolved = [this, id](const ErrorCause& error) {
        handle_not_resolved(id, error);
    };
    resolver->on_stopped = [this, id] {
        handle_stopped(id);
    };

    auto timer = std::make_unique<boost::asio::steady_timer>(io_context_);
    timer->expires_after(timeout);
    timer->async_wait([this, id, alive = std::weak_ptr<bool>(alive_)](const boost::system::error_code& ec) {
        if (ec || alive.expired()) {
            return;  // Cancelled, the entry is gone
        }
        handle_timeout(id);
    });

    auto* resolver_ptr = resolver.get();
    entries_.emplace(id, Entry {service, identity, std::move(txt), std::move(resolver), std::move(timer)});

    // The resolver might report right away, which erases the entry.
    resolver_ptr->resolve(timeout);
    return id;
}

size_t dsk::dnssd::ResolutionRegistry::cancel(const std::string& identity) {
    std::lock_guard lock(mutex_);
    size_t cancelled = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.identity != identity) {
            ++it;
            continue;
        }
        auto entry = std::move(it->second);
        it = entries_.erase(it);
        entry.timer->cancel();
        entry.resolver->stop();
        ++cancelled;
    }
    if (cancelled > 0) {
        DSK_DEBUG("Cancelled {} resolution(s) for {}", cancelled, identity);
    }
    return cancelled;
}

void dsk::dnssd::ResolutionRegistry::cancel_all() {
    std::lock_guard lock(mutex_);
    auto entries = std::move(entries_);
    entries_.clear();
    for (auto& [id, entry] : entries) {
        entry.timer->cancel();
        entry.resolver->stop();
    }
}

size_t dsk::dnssd::ResolutionRegistry::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool dsk::dnssd::ResolutionRegistry::contains(const Id id) const {
    std::lock_guard lock(mutex_);
    return entries_.find(id) != entries_.end();
}

size_t dsk::dnssd::ResolutionRegistry::count(const std::string& identity) const {
    std::lock_guard lock(mutex_);
    size_t result = 0;
    for (const auto& [id, entry] : entries_) {
        if (entry.identity == identity) {
            ++result;
        }
    }
    return result;
}

void dsk::dnssd::ResolutionRegistry::handle_resolved(const Id id, const ResolvedEndpoint& resolved) {
    std::lock_guard lock(mutex_);
    auto entry = take(id);
    if (!entry) {
        return;
    }

    auto result = resolved;
    result.endpoint = entry->service;
    if (!result.network_interface) {
        result.network_interface = entry->service.network_interface;
    }
    if (result.txt.empty() && entry->txt) {
        result.txt = *entry->txt;
    }
    DSK_DEBUG("Resolved {} (id: {})", entry->identity, id.value());
    release(std::move(*entry));
    on_resolved(id, result);
}

void dsk::dnssd::ResolutionRegistry::handle_not_resolved(const Id id, const ErrorCause& error) {
    std::lock_guard lock(mutex_);
    auto entry = take(id);
    if (!entry) {
        return;
    }

    auto identity = entry->identity;
    release(std::move(*entry));

    if (error.code == error_code::k_resolver_timeout || error.code == error_code::k_timeout) {
        DSK_WARNING("Resolver timed out for {}", identity);
        on_failed(id, BrowseError::resolution_timeout(std::move(identity)));
        return;
    }

    DSK_WARNING("Failed to resolve {}: {}", identity, error.to_string());
    on_failed(id, BrowseError::resolution_failed(std::move(identity), error));
}

void dsk::dnssd::ResolutionRegistry::handle_stopped(const Id id) {
    std::lock_guard lock(mutex_);
    if (auto entry = take(id)) {
        DSK_DEBUG("Resolver stopped for {} (id: {})", entry->identity, id.value());
        release(std::move(*entry));
    }
}

void dsk::dnssd::ResolutionRegistry::handle_timeout(const Id id) {
    std::lock_guard lock(mutex_);
    auto entry = take(id);
    if (!entry) {
        return;
    }

    auto identity = entry->identity;
    DSK_WARNING("Resolution timed out for {} (id: {})", identity, id.value());
    release(std::move(*entry));
    on_failed(id, BrowseError::resolution_timeout(std::move(identity)));
}

std::optional<dsk::dnssd::ResolutionRegistry::Entry> dsk::dnssd::ResolutionRegistry::take(const Id id) {
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    auto entry = std::move(it->second);
    entries_.erase(it);
    entry.timer->cancel();
    entry.resolver->stop();
    return entry;
}

void dsk::dnssd::ResolutionRegistry::release(Entry entry) {
    // The resolver might be calling into us, so it is destroyed once the call returned.
    boost::asio::post(io_context_, [resolver = std::shared_ptr<Resolver>(std::move(entry.resolver))] {});
}
