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

#include "demand_buffer.hpp"
#include "subscriber.hpp"
#include "discoverykit/core/assert.hpp"
#include "discoverykit/core/log.hpp"

#include <memory>
#include <mutex>

namespace dsk {

/**
 * A subscription around a resource with side effects (a browse, a resolve) which is started on the first non-zero
 * demand and stopped on cancellation. Values produced by the resource go through a DemandBuffer.
 *
 * Subclasses implement start() and stop(), produce values with push() and finish with complete(). Both are called
 * with the subscription mutex held. A subclass must call cancel() from its destructor.
 *
 * The mutex is locked before the buffer's mutex on every path. Code that runs on behalf of the resource (callbacks
 * from a backend, timers) should lock mutex() before touching subscription state.
 *
 * @tparam T The value type.
 * @tparam E The error type.
 */
template<class T, class E>
class LazySubscription: public Subscription {
  public:
    enum class State { idle, active, cancelled };

    explicit LazySubscription(Subscriber<T, E>& subscriber) :
        buffer_(std::make_shared<DemandBuffer<T, E>>(subscriber)) {}

    ~LazySubscription() override {
        DSK_ASSERT_NO_THROW(state_ == State::cancelled, "Subclass must call cancel() from its destructor");
    }

    /**
     * Starts the resource on the first non-zero demand, then forwards the demand to the buffer.
     * @param demand The additional demand.
     */
    void request(const Demand demand) override {
        std::lock_guard lock(mutex_);
        if (state_ == State::cancelled || demand.is_none()) {
            return;
        }
        if (state_ == State::idle) {
            state_ = State::active;
            DSK_TRACE("Starting subscription with demand {}", demand.to_string());
            start();
        }
        if (auto buffer = buffer_) {
            buffer->demand(demand);
        }
    }

    /**
     * Stops the resource (if it was started) and discards the buffer. Only the first call has effect.
     */
    void cancel() override {
        std::lock_guard lock(mutex_);
        if (state_ == State::cancelled) {
            return;
        }
        const auto was_active = state_ == State::active;
        state_ = State::cancelled;
        if (buffer_) {
            buffer_->cancel();
            buffer_.reset();
        }
        if (was_active) {
            DSK_TRACE("Stopping cancelled subscription");
            stop();
        }
    }

    /**
     * @return The current state.
     */
    [[nodiscard]] State state() const {
        std::lock_guard lock(mutex_);
        return state_;
    }

    /**
     * @return True if the subscription was cancelled.
     */
    [[nodiscard]] bool is_cancelled() const {
        return state() == State::cancelled;
    }

  protected:
    /**
     * Starts the underlying resource. Called at most once.
     */
    virtual void start() = 0;

    /**
     * Stops the underlying resource. Called at most once, and only after start().
     */
    virtual void stop() = 0;

    /**
     * Feeds a value into the buffer.
     * @param value The value.
     * @return The remaining demand, or none when the subscription is cancelled.
     */
    Demand push(T value) {
        std::lock_guard lock(mutex_);
        if (auto buffer = buffer_) {
            return buffer->buffer(std::move(value));
        }
        return Demand::none();
    }

    /**
     * Finishes the buffer. Only the first completion has effect.
     * @param completion The outcome.
     */
    void complete(Completion<E> completion) {
        std::lock_guard lock(mutex_);
        if (auto buffer = buffer_) {
            buffer->complete(std::move(completion));
        }
    }

    /**
     * @return True if the buffer recorded a completion.
     */
    [[nodiscard]] bool is_complete() const {
        std::lock_guard lock(mutex_);
        return buffer_ == nullptr || buffer_->is_complete();
    }

    /**
     * @return The mutex which guards this subscription.
     */
    std::recursive_mutex& mutex() const {
        return mutex_;
    }

  private:
    mutable std::recursive_mutex mutex_;
    State state_ = State::idle;
    std::shared_ptr<DemandBuffer<T, E>> buffer_;
};

}  // namespace dsk
