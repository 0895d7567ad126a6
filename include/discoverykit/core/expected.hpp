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

#include "assert.hpp"

#ifdef TL_EXPECTED_HPP
    #error "Include discoverykit/core/expected.hpp before <tl/expected.hpp> so that TL_ASSERT goes through DSK_ASSERT"
#endif

// Misuse of an expected (like value() on an error) is reported the way every other assertion in discoverykit is.
#ifndef TL_ASSERT
    #define TL_ASSERT(condition) DSK_ASSERT(condition, "Bad tl::expected access: " #condition)
#endif

#include <tl/expected.hpp>
