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

#include "subscriber.hpp"
#include "discoverykit/core/log.hpp"

#include <deque>
#include <mutex>
#include <optional>

namespace dsk {

/**
 * Bridges a producer which pushes values whenever it likes to a subscriber which pulls values by requesting demand.
 * Values without outstanding demand are queued and delivered in order once demand arrives. The buffer finishes exactly
 * once: a successful completion is delivered after the queue drained, a failure discards the queue and is delivered
 * right away.
 *
 * All functions are thread safe. Calls made from within a delivery (the subscriber requesting more, or the producer
 * pushing from a callback) only update the bookkeeping and the outer delivery loop picks up the work.
 *
 * @tparam T The value type.
 * @tparam E The error type.
 */
template<class T, class E>
class DemandBuffer {
  public:
    explicit DemandBuffer(Subscriber<T, E>& subscriber) : subscriber_(subscriber) {}

    DemandBuffer(const DemandBuffer&) = delete;
    DemandBuffer& operator=(const DemandBuffer&) = delete;

    DemandBuffer(DemandBuffer&&) = delete;
    DemandBuffer& operator=(DemandBuffer&&) = delete;

    /**
     * Delivers the value when there is outstanding demand, otherwise queues it. Values are dropped once a completion
     * was recorded or the buffer was cancelled.
     * @param value The value.
     * @return The remaining demand.
     */
    Demand buffer(T value) {
        std::lock_guard lock(mutex_);
        if (cancelled_ || completion_.has_value()) {
            DSK_TRACE("Dropping value, buffer is finished");
            return Demand::none();
        }
        queue_.push_back(std::move(value));
        flush();
        return demand_;
    }

    /**
     * Adds demand and delivers queued values for as long as the demand allows.
     * @param demand The additional demand.
     * @return The remaining demand.
     */
    Demand demand(const Demand demand) {
        std::lock_guard lock(mutex_);
        if (cancelled_) {
            return Demand::none();
        }
        demand_ += demand;
        flush();
        return demand_;
    }

    /**
     * Records the terminal outcome. Only the first call has effect.
     * @param completion The outcome.
     */
    void complete(Completion<E> completion) {
        std::lock_guard lock(mutex_);
        if (cancelled_ || completion_.has_value()) {
            return;
        }
        if (!completion.has_value()) {
            queue_.clear();
        }
        completion_ = std::move(completion);
        flush();
    }

    /**
     * Discards all queued values and stops all deliveries, including the completion.
     */
    void cancel() {
        std::lock_guard lock(mutex_);
        cancelled_ = true;
        queue_.clear();
    }

    /**
     * @return True if a completion was recorded, even when it was not delivered yet.
     */
    [[nodiscard]] bool is_complete() const {
        std::lock_guard lock(mutex_);
        return completion_.has_value();
    }

    /**
     * @return True if the completion reached the subscriber.
     */
    [[nodiscard]] bool is_completion_delivered() const {
        std::lock_guard lock(mutex_);
        return completion_delivered_;
    }

    /**
     * @return The number of queued values.
     */
    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    /**
     * @return The demand which was requested but not used yet.
     */
    [[nodiscard]] Demand outstanding_demand() const {
        std::lock_guard lock(mutex_);
        return demand_;
    }

  private:
    mutable std::recursive_mutex mutex_;
    Subscriber<T, E>& subscriber_;
    std::deque<T> queue_;
    Demand demand_;
    std::optional<Completion<E>> completion_;
    bool completion_delivered_ = false;
    bool cancelled_ = false;
    bool flushing_ = false;

    void flush() {
        if (flushing_) {
            return;  // The delivery loop further up the stack picks up the new state.
        }

        flushing_ = true;
        while (!cancelled_) {
            if (!queue_.empty() && demand_ > 0) {
                auto value = std::move(queue_.front());
                queue_.pop_front();
                demand_.decrement();
                demand_ += subscriber_.on_receive(value);
                continue;
            }

            if (completion_.has_value() && !completion_delivered_ && queue_.empty()) {
                completion_delivered_ = true;
                subscriber_.on_completion(*completion_);
            }
            break;
        }
        flushing_ = false;
    }
};

}  // namespace dsk
