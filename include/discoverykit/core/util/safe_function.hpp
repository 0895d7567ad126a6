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

#include <functional>
#include <type_traits>

namespace dsk {

template<class Signature>
class SafeFunction;

/**
 * A wrapper around std::function which can be called without checking whether a target is set. Calling an empty
 * SafeFunction is a no-op which returns a default constructed value.
 * @tparam R The return type.
 * @tparam Args The argument types.
 */
template<class R, class... Args>
class SafeFunction<R(Args...)> {
  public:
    SafeFunction() = default;

    template<class Fn, class = std::enable_if_t<!std::is_same_v<std::decay_t<Fn>, SafeFunction>>>
    SafeFunction(Fn&& fn) : function_(std::forward<Fn>(fn)) {}  // NOLINT(google-explicit-constructor)

    /**
     * Assigns a new target.
     * @param fn The new target, can be nullptr.
     */
    template<class Fn, class = std::enable_if_t<!std::is_same_v<std::decay_t<Fn>, SafeFunction>>>
    SafeFunction& operator=(Fn&& fn) {
        function_ = std::forward<Fn>(fn);
        return *this;
    }

    /**
     * Sets the target.
     * @param fn The new target, can be nullptr.
     */
    void set(std::function<R(Args...)> fn) {
        function_ = std::move(fn);
    }

    /**
     * Removes the target.
     */
    void reset() {
        function_ = nullptr;
    }

    /**
     * Calls the target if there is one.
     * @return The return value of the target, or a default constructed value when no target was set.
     */
    R operator()(Args... args) const {
        if (function_) {
            return function_(std::forward<Args>(args)...);
        }
        if constexpr (!std::is_void_v<R>) {
            return R {};
        }
    }

    /**
     * @return True if a target is set.
     */
    explicit operator bool() const {
        return function_ != nullptr;
    }

  private:
    std::function<R(Args...)> function_;
};

}  // namespace dsk
