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

#include "discoverykit/core/assert.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

namespace dsk {

/**
 * A timer on top of boost::asio::steady_timer which owns its callback, so that callers don't have to think about the
 * lifetime of pending waits. Destroying the timer cancels it.
 */
class AsioTimer {
  public:
    using TimerCallback = std::function<void()>;

    explicit AsioTimer(boost::asio::io_context& io_context);
    ~AsioTimer();

    AsioTimer(const AsioTimer&) = delete;
    AsioTimer& operator=(const AsioTimer&) = delete;

    AsioTimer(AsioTimer&&) = delete;
    AsioTimer& operator=(AsioTimer&&) = delete;

    /**
     * Fires the callback once after the given duration. A running timer is stopped first.
     * @param duration The duration to wait before firing the callback.
     * @param cb The callback to fire after the duration.
     */
    void once(std::chrono::milliseconds duration, TimerCallback cb);

    /**
     * Fires the callback after the given duration, and keeps firing it every duration when repeating is true. A
     * running timer is stopped first. Safe to call from any thread.
     * @param duration The duration to wait before firing the callback.
     * @param cb The callback to fire.
     * @param repeating True to keep firing until stopped.
     */
    void start(std::chrono::milliseconds duration, TimerCallback cb, bool repeating = true);

    /**
     * Stops the timer. After this call returns no more callbacks will be fired. Safe to call from any thread.
     */
    void stop();

    /**
     * @return True if a callback is pending.
     */
    [[nodiscard]] bool is_running() const;

  private:
    boost::asio::steady_timer timer_;
    mutable std::recursive_mutex mutex_;
    TimerCallback callback_;
    bool repeating_ = false;
    std::chrono::milliseconds duration_ {0};
    // Replaced on every wait and reset on stop. A wait which already expired can't be cancelled anymore, its handler
    // checks the token instead.
    std::shared_ptr<int> arm_token_;

    void wait();
};

}  // namespace dsk
