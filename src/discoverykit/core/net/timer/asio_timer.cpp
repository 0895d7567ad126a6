/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/core/net/timer/asio_timer.hpp"

#include "discoverykit/core/log.hpp"

dsk::AsioTimer::AsioTimer(boost::asio::io_context& io_context) : timer_(io_context) {}

dsk::AsioTimer::~AsioTimer() {
    stop();
}

void dsk::AsioTimer::once(const std::chrono::milliseconds duration, TimerCallback cb) {
    start(duration, std::move(cb), false);
}

void dsk::AsioTimer::start(const std::chrono::milliseconds duration, TimerCallback cb, const bool repeating) {
    DSK_ASSERT(duration.count() >= 0, "Timer duration must not be negative");
    std::lock_guard lock(mutex_);
    timer_.cancel();
    callback_ = std::move(cb);
    duration_ = duration;
    repeating_ = repeating;
    wait();
}

void dsk::AsioTimer::stop() {
    std::lock_guard lock(mutex_);
    timer_.cancel();
    arm_token_.reset();
    callback_ = nullptr;
    repeating_ = false;
}

bool dsk::AsioTimer::is_running() const {
    std::lock_guard lock(mutex_);
    return callback_ != nullptr;
}

void dsk::AsioTimer::wait() {
    arm_token_ = std::make_shared<int>(0);
    timer_.expires_after(duration_);
    timer_.async_wait([this, token = std::weak_ptr<int>(arm_token_)](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || token.expired()) {
            return;
        }

        if (ec) {
            DSK_ERROR("Timer error: {}", ec.message());
            return;
        }

        std::lock_guard lock(mutex_);
        if (!callback_) {
            return;
        }

        if (repeating_) {
            callback_();
            // The callback may have stopped or restarted the timer.
            if (repeating_ && callback_) {
                wait();
            }
            return;
        }

        // Moved out first so the callback can start the timer again.
        auto cb = std::move(callback_);
        callback_ = nullptr;
        cb();
    });
}
