/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/core/stream/lazy_subscription.hpp"
#include "discoverykit/core/stream/sink.hpp"

#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

namespace {

using TestSink = dsk::Sink<int, std::string>;

class CountingSubscription final: public dsk::LazySubscription<int, std::string> {
  public:
    int start_count = 0;
    int stop_count = 0;
    std::vector<int> values_on_start;

    explicit CountingSubscription(dsk::Subscriber<int, std::string>& subscriber) : LazySubscription(subscriber) {}

    ~CountingSubscription() override {
        cancel();
    }

    dsk::Demand produce(const int value) {
        return push(value);
    }

    void finish(dsk::Completion<std::string> completion) {
        complete(std::move(completion));
    }

    [[nodiscard]] bool finished() const {
        return is_complete();
    }

  protected:
    void start() override {
        start_count++;
        for (const auto value : values_on_start) {
            push(value);
        }
    }

    void stop() override {
        stop_count++;
    }
};

}  // namespace

TEST_CASE("dsk::LazySubscription") {
    SECTION("Nothing starts before the first non-zero demand") {
        TestSink sink(dsk::Demand::none());
        CountingSubscription subscription(sink);
        sink.on_subscribe(subscription);

        subscription.request(dsk::Demand::none());
        REQUIRE(subscription.start_count == 0);
        REQUIRE(subscription.state() == CountingSubscription::State::idle);

        subscription.request(dsk::Demand::max(1));
        REQUIRE(subscription.start_count == 1);
        REQUIRE(subscription.state() == CountingSubscription::State::active);

        subscription.request(dsk::Demand::max(1));
        subscription.request(dsk::Demand::unlimited());
        REQUIRE(subscription.start_count == 1);
    }

    SECTION("Values produced during start are delivered against the first demand") {
        TestSink sink(dsk::Demand::none());
        CountingSubscription subscription(sink);
        subscription.values_on_start = {1, 2, 3};
        sink.on_subscribe(subscription);

        sink.request(dsk::Demand::max(1));
        REQUIRE(subscription.start_count == 1);
        REQUIRE(sink.values() == std::vector<int> {1});

        sink.request(dsk::Demand::max(5));
        REQUIRE(sink.values() == std::vector<int> {1, 2, 3});
    }

    SECTION("Cancel stops exactly once") {
        TestSink sink;
        CountingSubscription subscription(sink);
        sink.on_subscribe(subscription);
        REQUIRE(subscription.start_count == 1);

        subscription.cancel();
        subscription.cancel();
        sink.cancel();
        REQUIRE(subscription.stop_count == 1);
        REQUIRE(subscription.is_cancelled());
    }

    SECTION("Cancel while idle never starts nor stops") {
        TestSink sink(dsk::Demand::none());
        CountingSubscription subscription(sink);
        sink.on_subscribe(subscription);

        subscription.cancel();
        subscription.request(dsk::Demand::max(3));
        REQUIRE(subscription.start_count == 0);
        REQUIRE(subscription.stop_count == 0);
        REQUIRE(subscription.is_cancelled());
    }

    SECTION("Cancel after two of five values delivers nothing more") {
        TestSink sink(dsk::Demand::none());
        CountingSubscription subscription(sink);
        sink.on_subscribe(subscription);

        sink.request(dsk::Demand::max(2));
        for (int i = 0; i < 5; ++i) {
            subscription.produce(i);
        }
        REQUIRE(sink.values() == std::vector<int> {0, 1});

        subscription.cancel();
        REQUIRE(subscription.produce(5) == dsk::Demand::none());
        sink.request(dsk::Demand::unlimited());
        subscription.finish(dsk::completion_finished<std::string>());

        REQUIRE(sink.values() == std::vector<int> {0, 1});
        REQUIRE_FALSE(sink.completion().has_value());
        REQUIRE(subscription.stop_count == 1);
    }

    SECTION("Cancel from within on_receive") {
        TestSink sink(dsk::Demand::none());
        CountingSubscription subscription(sink);
        sink.on_subscribe(subscription);
        sink.on_value = [&sink](const int value) {
            if (value == 1) {
                sink.cancel();
            }
        };

        for (int i = 0; i < 4; ++i) {
            subscription.produce(i);
        }
        sink.request(dsk::Demand::unlimited());
        REQUIRE(sink.values() == std::vector<int> {0, 1});
        REQUIRE(subscription.stop_count == 1);
    }

    SECTION("A failure does not cancel the subscription") {
        TestSink sink;
        CountingSubscription subscription(sink);
        sink.on_subscribe(subscription);

        subscription.finish(dsk::completion_failure<std::string>("failed"));
        REQUIRE(subscription.finished());
        REQUIRE(sink.completion().has_value());
        REQUIRE(sink.completion()->error() == "failed");
        REQUIRE(subscription.state() == CountingSubscription::State::active);
        REQUIRE(subscription.stop_count == 0);

        subscription.cancel();
        REQUIRE(subscription.stop_count == 1);
    }

    SECTION("Destroying cancels") {
        TestSink sink;
        int stop_count = 0;
        {
            CountingSubscription subscription(sink);
            sink.on_subscribe(subscription);
            subscription.produce(1);
            stop_count = subscription.stop_count;
            REQUIRE(stop_count == 0);
        }
        REQUIRE(sink.values() == std::vector<int> {1});
    }
}
