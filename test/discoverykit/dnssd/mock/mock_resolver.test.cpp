/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#include "discoverykit/dnssd/mock/mock_resolver.hpp"

#include <catch2/catch_all.hpp>

#include <string>
#include <vector>

namespace {

using namespace dsk::dnssd;

void run(boost::asio::io_context& io_context) {
    io_context.restart();
    io_context.run();
}

}  // namespace

TEST_CASE("dsk::dnssd::MockResolver") {
    boost::asio::io_context io_context;
    MockResolver resolver(io_context, ServiceEndpoint {"A", "_http._tcp.", "local.", {}});

    std::vector<std::string> log;
    resolver.on_will_resolve = [&log] {
        log.emplace_back("will_resolve");
    };
    resolver.on_resolved = [&log](const ResolvedEndpoint& resolved) {
        log.push_back("resolved:" + resolved.hostname.value_or("-"));
    };
    resolver.on_not_resolved = [&log](const ErrorCause& error) {
        log.push_back("not_resolved:" + std::to_string(error.code));
    };
    resolver.on_txt_updated = [&log](const TxtRecord& txt) {
        log.push_back("txt:" + txt_record_to_string(txt));
    };
    resolver.on_stopped = [&log] {
        log.emplace_back("stopped");
    };

    SECTION("Reports what was mocked") {
        resolver.resolve(std::chrono::milliseconds(5000));
        resolver.mock_resolved("a.local.", {"10.0.0.1"}, 80);
        resolver.mock_stopped();
        run(io_context);
        REQUIRE(log == std::vector<std::string> {"will_resolve", "resolved:a.local.", "stopped"});
        REQUIRE_FALSE(resolver.is_resolving());
    }

    SECTION("Times out when nothing resolved") {
        resolver.resolve(std::chrono::milliseconds(10));
        run(io_context);
        REQUIRE(log == std::vector<std::string> {"will_resolve", "not_resolved:-72007"});
    }

    SECTION("Stops at the timeout after resolving") {
        resolver.resolve(std::chrono::milliseconds(10));
        resolver.mock_resolved("a.local.", {}, 80);
        run(io_context);
        REQUIRE(log == std::vector<std::string> {"will_resolve", "resolved:a.local.", "stopped"});
    }

    SECTION("Scripted outcomes fire after their delay") {
        ResolvedEndpoint resolved;
        resolved.hostname = "scripted.local.";
        resolver.script_resolved_after(std::chrono::milliseconds(5), resolved);
        resolver.resolve(std::chrono::milliseconds(50));
        run(io_context);
        REQUIRE(log == std::vector<std::string> {"will_resolve", "resolved:scripted.local.", "stopped"});
    }

    SECTION("Scripted failure") {
        resolver.script_not_resolved_after(std::chrono::milliseconds(5), ErrorCause {-65537, {}, "unknown"});
        resolver.resolve(std::chrono::milliseconds(5000));
        run(io_context);
        REQUIRE(log == std::vector<std::string> {"will_resolve", "not_resolved:-65537"});
    }

    SECTION("TXT record updates only while monitoring") {
        resolver.mock_txt_updated({{"a", "1"}});
        run(io_context);
        resolver.start_monitoring();
        resolver.mock_txt_updated({{"a", "2"}});
        run(io_context);
        resolver.stop_monitoring();
        resolver.mock_txt_updated({{"a", "3"}});
        run(io_context);
        REQUIRE(log == std::vector<std::string> {"txt:{a=2}"});
    }

    SECTION("Stop silences the resolver") {
        resolver.resolve(std::chrono::milliseconds(10));
        resolver.mock_resolved("a.local.", {}, 80);
        resolver.stop();
        run(io_context);
        REQUIRE(log.empty());
        REQUIRE(resolver.stop_count() == 1);
    }

    SECTION("Resolving twice throws") {
        resolver.resolve(std::chrono::milliseconds(5000));
        REQUIRE_THROWS_AS(resolver.resolve(std::chrono::milliseconds(5000)), dsk::Exception);
        REQUIRE(resolver.resolve_count() == 1);
        resolver.stop();
    }

    SECTION("Reporting without resolving throws") {
        resolver.mock_resolved("a.local.", {}, 80);
        REQUIRE_THROWS_AS(run(io_context), dsk::Exception);
    }
}
