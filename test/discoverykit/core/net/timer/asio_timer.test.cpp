/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/core/net/timer/asio_timer.hpp"

#include <catch2/catch_all.hpp>

#include <cstdlib>
#include <thread>

TEST_CASE("dsk::AsioTimer") {
    SECTION("Once") {
        boost::asio::io_context io_context;
        dsk::AsioTimer timer(io_context);

        bool callback_called = false;
        timer.once(std::chrono::milliseconds(20), [&] {
            callback_called = true;
        });
        REQUIRE(timer.is_running());

        io_context.run();
        CHECK(callback_called);
        CHECK_FALSE(timer.is_running());
    }

    SECTION("Once replaces a pending callback") {
        boost::asio::io_context io_context;
        dsk::AsioTimer timer(io_context);

        int first = 0;
        int second = 0;
        timer.once(std::chrono::milliseconds(20), [&] {
            first++;
        });
        timer.once(std::chrono::milliseconds(10), [&] {
            second++;
        });

        io_context.run();
        CHECK(first == 0);
        CHECK(second == 1);
    }

    SECTION("Repeatedly until stopped from the callback") {
        boost::asio::io_context io_context;
        dsk::AsioTimer timer(io_context);

        int callback_count = 0;
        timer.start(std::chrono::milliseconds(10), [&] {
            if (++callback_count == 3) {
                timer.stop();
            }
        });

        io_context.run();
        CHECK(callback_count == 3);
    }

    SECTION("Once may rearm itself") {
        boost::asio::io_context io_context;
        dsk::AsioTimer timer(io_context);

        int callback_count = 0;
        std::function<void()> rearm = [&] {
            if (++callback_count < 2) {
                timer.once(std::chrono::milliseconds(5), rearm);
            }
        };
        timer.once(std::chrono::milliseconds(5), rearm);

        io_context.run();
        CHECK(callback_count == 2);
    }

    SECTION("Destroying cancels pending callbacks") {
        static constexpr auto times = 500;
        boost::asio::io_context io_context;

        int callback_count = 0;
        int creation_count = 0;
        for (auto i = 0; i < times; ++i) {
            boost::asio::post(io_context, [&io_context, &callback_count, &creation_count, i] {
                dsk::AsioTimer timer(io_context);
                timer.start(std::chrono::milliseconds(i), [&callback_count] {
                    callback_count++;
                });
                creation_count++;
            });
        }

        io_context.run();

        CHECK(callback_count == 0);
        CHECK(creation_count == times);
    }

    SECTION("Start and stop from another thread") {
        static constexpr auto times = 1'000;
        boost::asio::io_context io_context;

        // Keeps the io_context alive and acts as a timeout.
        dsk::AsioTimer guard(io_context);
        guard.once(std::chrono::milliseconds(100'000), [] {
            std::abort();  // Timeout
        });

        std::thread runner([&io_context] {
            io_context.run();
        });

        dsk::AsioTimer timer(io_context);
        for (auto i = 0; i < times; ++i) {
            i % 2 == 0 ? timer.start(std::chrono::milliseconds(i), [] {}) : timer.stop();
        }

        timer.stop();
        guard.stop();
        runner.join();
        CHECK_FALSE(timer.is_running());
    }
}
