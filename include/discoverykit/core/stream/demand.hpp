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

#include <cstddef>
#include <limits>
#include <string>

namespace dsk {

/**
 * The number of values a subscriber is prepared to receive. Either a finite number or unlimited. Adding to unlimited
 * stays unlimited and finite additions saturate at unlimited.
 */
class Demand {
  public:
    Demand() = default;

    /**
     * @return A demand of zero values.
     */
    static Demand none() {
        return Demand(0);
    }

    /**
     * @return A demand which is never exhausted.
     */
    static Demand unlimited() {
        return Demand(k_unlimited);
    }

    /**
     * @param count The number of values.
     * @return A demand for at most count values.
     */
    static Demand max(const size_t count) {
        return Demand(count);
    }

    [[nodiscard]] bool is_unlimited() const {
        return value_ == k_unlimited;
    }

    [[nodiscard]] bool is_none() const {
        return value_ == 0;
    }

    /**
     * @return The finite value of this demand, or std::numeric_limits<size_t>::max() when unlimited.
     */
    [[nodiscard]] size_t value() const {
        return value_;
    }

    /**
     * Takes one unit of demand. Unlimited demand and zero demand are left untouched.
     */
    void decrement() {
        if (value_ != 0 && !is_unlimited()) {
            --value_;
        }
    }

    Demand& operator+=(const Demand& other) {
        if (other.value_ > k_unlimited - value_) {
            value_ = k_unlimited;
        } else {
            value_ += other.value_;
        }
        return *this;
    }

    friend Demand operator+(Demand lhs, const Demand& rhs) {
        lhs += rhs;
        return lhs;
    }

    friend bool operator==(const Demand& lhs, const Demand& rhs) {
        return lhs.value_ == rhs.value_;
    }

    friend bool operator!=(const Demand& lhs, const Demand& rhs) {
        return !(lhs == rhs);
    }

    friend bool operator==(const Demand& lhs, const size_t rhs) {
        return lhs.value_ == rhs;
    }

    friend bool operator!=(const Demand& lhs, const size_t rhs) {
        return !(lhs == rhs);
    }

    friend bool operator>(const Demand& lhs, const size_t rhs) {
        return lhs.value_ > rhs;
    }

    friend bool operator<(const Demand& lhs, const size_t rhs) {
        return lhs.value_ < rhs;
    }

    [[nodiscard]] std::string to_string() const {
        if (is_unlimited()) {
            return "unlimited";
        }
        return "max(" + std::to_string(value_) + ")";
    }

  private:
    static constexpr size_t k_unlimited = std::numeric_limits<size_t>::max();

    size_t value_ {};

    explicit Demand(const size_t value) : value_(value) {}
};

}  // namespace dsk
