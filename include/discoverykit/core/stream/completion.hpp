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

#include "discoverykit/core/expected.hpp"

namespace dsk {

/**
 * The terminal outcome of a stream: either success (has_value) or failure carrying the error.
 */
template<class E>
using Completion = tl::expected<void, E>;

/**
 * @return A successful completion.
 */
template<class E>
Completion<E> completion_finished() {
    return {};
}

/**
 * @param error The error to complete with.
 * @return A failed completion.
 */
template<class E>
Completion<E> completion_failure(E error) {
    return tl::unexpected<E>(std::move(error));
}

}  // namespace dsk
