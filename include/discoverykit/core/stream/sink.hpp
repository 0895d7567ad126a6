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
#include "discoverykit/core/util/safe_function.hpp"

#include <optional>
#include <vector>

namespace dsk {

/**
 * A subscriber which requests an initial demand on subscribe, optionally requests more for every value, and records
 * what it received.
 * @tparam T The value type.
 * @tparam E The error type.
 */
template<class T, class E>
class Sink: public Subscriber<T, E> {
  public:
    /// Called for every value, after it was recorded.
    SafeFunction<void(const T& value)> on_value;

    /// Called with the completion, after it was recorded.
    SafeFunction<void(const Completion<E>& completion)> on_complete;

    /**
     * @param initial_demand The demand requested when subscribing.
     * @param demand_per_value The demand requested again for every received value.
     */
    explicit Sink(const Demand initial_demand = Demand::unlimited(), const Demand demand_per_value = Demand::none()) :
        initial_demand_(initial_demand), demand_per_value_(demand_per_value) {}

    void on_subscribe(Subscription& subscription) override {
        subscription_ = &subscription;
        if (!initial_demand_.is_none()) {
            subscription.request(initial_demand_);
        }
    }

    Demand on_receive(const T& value) override {
        values_.push_back(value);
        on_value(value);
        return demand_per_value_;
    }

    void on_completion(const Completion<E>& completion) override {
        completion_ = completion;
        on_complete(completion);
    }

    /**
     * Requests more values from the subscription this sink was subscribed with.
     * @param demand The additional demand.
     */
    void request(const Demand demand) {
        if (subscription_ != nullptr) {
            subscription_->request(demand);
        }
    }

    /**
     * Cancels the subscription this sink was subscribed with.
     */
    void cancel() {
        if (subscription_ != nullptr) {
            subscription_->cancel();
        }
    }

    /**
     * @return The values received so far.
     */
    [[nodiscard]] const std::vector<T>& values() const {
        return values_;
    }

    /**
     * @return The completion, if the stream finished.
     */
    [[nodiscard]] const std::optional<Completion<E>>& completion() const {
        return completion_;
    }

  private:
    Demand initial_demand_;
    Demand demand_per_value_;
    Subscription* subscription_ = nullptr;
    std::vector<T> values_;
    std::optional<Completion<E>> completion_;
};

}  // namespace dsk
