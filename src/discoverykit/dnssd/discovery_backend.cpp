/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/discovery_backend.hpp"

std::string dsk::dnssd::BackendState::to_string() const {
    std::string result;
    switch (kind) {
        case Kind::setup:
            result = "setup";
            break;
        case Kind::ready:
            result = "ready";
            break;
        case Kind::failed:
            result = "failed";
            break;
        case Kind::waiting:
            result = "waiting";
            break;
        case Kind::cancelled:
            result = "cancelled";
            break;
    }
    if (error) {
        result += ": " + error->to_string();
    }
    return result;
}
