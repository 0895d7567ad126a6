/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/core/stream/sink.hpp"
#include "discoverykit/core/stream/demand_buffer.hpp"

#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

namespace {

class RecordingSubscription: public dsk::Subscription {
  public:
    std::vector<dsk::Demand> requests;
    int cancel_count = 0;

    void request(const dsk::Demand demand) override {
        requests.push_back(demand);
    }

    void cancel() override {
        cancel_count++;
    }
};

}  // namespace

TEST_CASE("dsk::Sink") {
    SECTION("Requests the initial demand on subscribe") {
        dsk::Sink<int, std::string> sink(dsk::Demand::max(4));
        RecordingSubscription subscription;
        sink.on_subscribe(subscription);
        REQUIRE(subscription.requests == std::vector<dsk::Demand> {dsk::Demand::max(4)});
    }

    SECTION("Zero initial demand requests nothing") {
        dsk::Sink<int, std::string> sink(dsk::Demand::none());
        RecordingSubscription subscription;
        sink.on_subscribe(subscription);
        REQUIRE(subscription.requests.empty());

        sink.request(dsk::Demand::max(2));
        sink.cancel();
        REQUIRE(subscription.requests == std::vector<dsk::Demand> {dsk::Demand::max(2)});
        REQUIRE(subscription.cancel_count == 1);
    }

    SECTION("Request and cancel without subscription are no-ops") {
        dsk::Sink<int, std::string> sink;
        sink.request(dsk::Demand::max(1));
        sink.cancel();
        REQUIRE(sink.values().empty());
    }

    SECTION("Records values and the completion") {
        dsk::Sink<int, std::string> sink;
        std::vector<int> seen;
        sink.on_value = [&seen](const int value) {
            seen.push_back(value);
        };
        bool completed = false;
        sink.on_complete = [&completed](const dsk::Completion<std::string>& completion) {
            completed = completion.has_value();
        };

        REQUIRE(sink.on_receive(7) == dsk::Demand::none());
        sink.on_completion(dsk::completion_finished<std::string>());

        REQUIRE(sink.values() == std::vector<int> {7});
        REQUIRE(seen == std::vector<int> {7});
        REQUIRE(completed);
        REQUIRE(sink.completion().has_value());
    }

    SECTION("Demand per value keeps a buffer flowing") {
        dsk::Sink<int, std::string> sink(dsk::Demand::none(), dsk::Demand::max(1));
        dsk::DemandBuffer<int, std::string> buffer(sink);
        buffer.buffer(1);
        buffer.buffer(2);
        buffer.demand(dsk::Demand::max(1));
        REQUIRE(sink.values() == std::vector<int> {1, 2});
    }
}
