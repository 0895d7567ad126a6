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

#include "completion.hpp"
#include "demand.hpp"

#include <tuple>

namespace dsk {

/**
 * Handle given to a subscriber through which it pulls values from a stream.
 */
class Subscription {
  public:
    virtual ~Subscription() = default;

    /**
     * Requests additional values. Safe to call from any thread, and from within Subscriber::on_receive.
     * @param demand The number of additional values.
     */
    virtual void request(Demand demand) = 0;

    /**
     * Cancels the stream. After this call returns no more values nor a completion will be delivered. Calling it more
     * than once has no effect.
     */
    virtual void cancel() = 0;
};

/**
 * Receives the values of a stream. Values are only delivered against demand requested through the subscription, and
 * a stream ends with exactly one call to on_completion unless it was cancelled.
 * @tparam T The value type.
 * @tparam E The error type.
 */
template<class T, class E>
class Subscriber {
  public:
    virtual ~Subscriber() = default;

    /**
     * Called once when subscribing. The subscription stays valid for as long as the owner keeps it.
     * @param subscription The subscription.
     */
    virtual void on_subscribe(Subscription& subscription) {
        std::ignore = subscription;
    }

    /**
     * Called for every value.
     * @param value The value.
     * @return Additional demand, added to the outstanding demand.
     */
    virtual Demand on_receive(const T& value) = 0;

    /**
     * Called once when the stream ends.
     * @param completion The outcome.
     */
    virtual void on_completion(const Completion<E>& completion) {
        std::ignore = completion;
    }
};

}  // namespace dsk
