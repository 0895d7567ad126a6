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

// Note: these constants are always defined, as 0 or 1.

#if defined(__APPLE__)
    #include <TargetConditionals.h>
    #if TARGET_OS_OSX
        #define DSK_MACOS 1
    #else
        #define DSK_MACOS 0
    #endif
#else
    #define DSK_MACOS 0
#endif

#if defined(_MSC_VER)
    #define DSK_FUNCTION __FUNCSIG__
#else
    #define DSK_FUNCTION __PRETTY_FUNCTION__
#endif
