/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/core/stream/demand.hpp"

#include <catch2/catch_all.hpp>

#include <limits>

TEST_CASE("dsk::Demand") {
    SECTION("Default is none") {
        const dsk::Demand demand;
        REQUIRE(demand.is_none());
        REQUIRE(demand == dsk::Demand::none());
        REQUIRE(demand == 0);
    }

    SECTION("Finite demand decrements to zero and stays there") {
        auto demand = dsk::Demand::max(2);
        REQUIRE(demand > 0);
        demand.decrement();
        REQUIRE(demand == 1);
        demand.decrement();
        REQUIRE(demand.is_none());
        demand.decrement();
        REQUIRE(demand.is_none());
    }

    SECTION("Unlimited never decrements") {
        auto demand = dsk::Demand::unlimited();
        demand.decrement();
        REQUIRE(demand.is_unlimited());
        REQUIRE(demand.value() == std::numeric_limits<size_t>::max());
    }

    SECTION("Addition saturates at unlimited") {
        REQUIRE(dsk::Demand::max(2) + dsk::Demand::max(3) == 5);
        REQUIRE((dsk::Demand::max(2) + dsk::Demand::unlimited()).is_unlimited());
        REQUIRE((dsk::Demand::unlimited() + dsk::Demand::max(1)).is_unlimited());
        auto demand = dsk::Demand::max(std::numeric_limits<size_t>::max() - 1);
        demand += dsk::Demand::max(10);
        REQUIRE(demand.is_unlimited());
    }

    SECTION("To string") {
        REQUIRE(dsk::Demand::unlimited().to_string() == "unlimited");
        REQUIRE(dsk::Demand::max(3).to_string() == "max(3)");
        REQUIRE(dsk::Demand::none().to_string() == "max(0)");
    }
}
