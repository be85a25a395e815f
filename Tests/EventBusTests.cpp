//
// EventBusTests.cpp - Tests for the type-indexed event bus
//

#include <catch2/catch_test_macros.hpp>
#include <Core/EventBus.h>
#include "WorkflowTestHelpers.h"
#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace MaestroEngine::Core;

namespace {
    struct BuildFinished {
        std::string target;
        int exitCode = 0;
    };

    struct CacheEvicted {
        size_t entries = 0;
    };
}

SCENARIO("EventBus delivers events by type", "[eventbus]") {
    GIVEN("A bus with subscribers for two event types") {
        EventBus bus;
        std::vector<std::string> builds;
        size_t evicted = 0;

        auto buildId = bus.subscribe<BuildFinished>([&builds](const BuildFinished& e) {
            builds.push_back(e.target);
        });
        bus.subscribe<CacheEvicted>([&evicted](const CacheEvicted& e) {
            evicted += e.entries;
        });

        WHEN("Events of each type are published") {
            size_t buildHandlers = bus.publish(BuildFinished{"core", 0});
            size_t cacheHandlers = bus.publish(CacheEvicted{3});

            THEN("Only matching handlers run") {
                CHECK(buildHandlers == 1);
                CHECK(cacheHandlers == 1);
                REQUIRE(builds.size() == 1);
                CHECK(builds[0] == "core");
                CHECK(evicted == 3);
            }
        }

        WHEN("A handler is unsubscribed") {
            REQUIRE(bus.unsubscribe<BuildFinished>(buildId));
            size_t handlers = bus.publish(BuildFinished{"tests", 1});

            THEN("It no longer receives events") {
                CHECK(handlers == 0);
                CHECK(builds.empty());
                CHECK(bus.getSubscriberCount<BuildFinished>() == 0);
                CHECK_FALSE(bus.unsubscribe<BuildFinished>(buildId));
            }
        }

        WHEN("The bus is cleared") {
            bus.clear();

            THEN("No subscriptions remain") {
                CHECK_FALSE(bus.hasSubscribers());
                CHECK(bus.getTotalSubscriptions() == 0);
            }
        }
    }
}

TEST_CASE("EventBus isolates failing handlers", "[eventbus]") {
    Testing::ScopedLogCapture capture;
    EventBus bus;
    int delivered = 0;

    bus.subscribe<BuildFinished>([](const BuildFinished&) {
        throw std::runtime_error("handler exploded");
    });
    bus.subscribe<BuildFinished>([&delivered](const BuildFinished&) {
        ++delivered;
    });

    CHECK_NOTHROW(bus.publish(BuildFinished{"core", 0}));
    CHECK(delivered == 1);

    auto entries = capture.sink().entriesForCategory("EventBus");
    REQUIRE_FALSE(entries.empty());
    CHECK(capture.sink().contains("handler exploded"));
}

TEST_CASE("EventBus handlers may publish re-entrantly", "[eventbus]") {
    EventBus bus;
    size_t evictions = 0;

    bus.subscribe<BuildFinished>([&bus](const BuildFinished& e) {
        bus.publish(CacheEvicted{static_cast<size_t>(e.exitCode)});
    });
    bus.subscribe<CacheEvicted>([&evictions](const CacheEvicted& e) {
        evictions += e.entries;
    });

    bus.publish(BuildFinished{"core", 4});
    CHECK(evictions == 4);
}

TEST_CASE("EventBus concurrent publishing", "[eventbus]") {
    EventBus bus;
    std::atomic<int> received{0};
    bus.subscribe<CacheEvicted>([&received](const CacheEvicted&) {
        received.fetch_add(1, std::memory_order_relaxed);
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&bus]() {
            for (int i = 0; i < 250; ++i) {
                bus.publish(CacheEvicted{1});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(received.load() == 1000);
}
