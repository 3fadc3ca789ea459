#include <catch2/catch_test_macros.hpp>
#include "index/MemoryGeoIndex.hpp"
#include "index/RadiusQuery.hpp"
#include "index/EventLoop.hpp"
#include "TestIndexes.hpp"
#include <algorithm>
#include <chrono>
#include <atomic>
#include <future>
#include <latch>
#include <thread>

using namespace corridor;
using corridor::geo::LatLng;
using corridor::test::offsetNorth;

namespace {

std::vector<std::string> keysOf(std::vector<core::IndexMatch> matches) {
    std::vector<std::string> keys;
    for (const auto& match : matches) {
        keys.push_back(match.key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

// 总是返回空句柄的索引
class NullHandleGeoIndex : public index::IGeoIndex {
public:
    std::shared_ptr<index::IGeoQuery>
    query(const LatLng&, double, index::QueryCallbacks) override {
        return nullptr;
    }
};

} // namespace

TEST_CASE("EventLoop runs tasks in order", "[event_loop]") {
    std::vector<int> order;
    std::thread::id loopThread;
    std::latch done(1);
    {
        index::EventLoop loop;
        for (int i = 0; i < 5; ++i) {
            loop.post([&order, i]() { order.push_back(i); });
        }
        loop.post([&done, &loopThread]() {
            loopThread = std::this_thread::get_id();
            done.count_down();
        });
        done.wait();
    }
    REQUIRE(loopThread != std::this_thread::get_id());
    REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
}

TEST_CASE("EventLoop survives a failing task", "[event_loop]") {
    std::latch done(1);
    index::EventLoop loop;
    loop.post([]() { throw std::runtime_error("boom"); });
    loop.post([&done]() { done.count_down(); });
    done.wait();
}

TEST_CASE("MemoryGeoIndex storage", "[memory_index]") {
    index::MemoryGeoIndex geoIndex;

    geoIndex.set("a", LatLng(1.0, 1.0));
    geoIndex.set({{"b", LatLng(2.0, 2.0)}, {"c", LatLng(3.0, 3.0)}});
    REQUIRE(geoIndex.size() == 3);

    SECTION("Overwrite keeps one entry per key") {
        geoIndex.set("a", LatLng(1.5, 1.5));
        REQUIRE(geoIndex.size() == 3);
        REQUIRE(geoIndex.get("a") == LatLng(1.5, 1.5));
    }

    SECTION("Remove") {
        REQUIRE(geoIndex.remove("b"));
        REQUIRE_FALSE(geoIndex.remove("b"));
        REQUIRE_FALSE(geoIndex.get("b").has_value());
        REQUIRE(geoIndex.size() == 2);
    }
}

TEST_CASE("MemoryGeoIndex radius queries", "[memory_index]") {
    auto geoIndex = std::make_shared<index::MemoryGeoIndex>();
    const LatLng center(45.0, 7.0);
    geoIndex->set("near", offsetNorth(center, 50.0));
    geoIndex->set("edge", offsetNorth(center, 99.0));
    geoIndex->set("far", offsetNorth(center, 150.0));
    geoIndex->set("elsewhere", LatLng(-45.0, -7.0));

    SECTION("Synchronous scan") {
        REQUIRE(keysOf(geoIndex->within(center, 100.0)) == std::vector<std::string>{"edge", "near"});
    }

    SECTION("Radius is given in kilometers") {
        auto matches = index::queryRadius(*geoIndex, center, 0.1).get();
        REQUIRE(keysOf(matches) == std::vector<std::string>{"edge", "near"});
    }

    SECTION("Subscriptions are cancelled once ready") {
        std::vector<std::future<std::vector<core::IndexMatch>>> pending;
        for (int i = 0; i < 10; ++i) {
            pending.push_back(index::queryRadius(*geoIndex, center, 0.2));
        }
        for (auto& future : pending) {
            REQUIRE(future.get().size() == 3);
        }
        REQUIRE(geoIndex->activeQueryCount() == 0);
    }

    SECTION("A cancelled subscription delivers nothing") {
        std::atomic<int> events{0};
        std::shared_ptr<index::IGeoQuery> inner;
        std::promise<void> issued;

        // 在循环线程上发起并立即取消，保证它的送达任务尚未执行
        index::QueryCallbacks outer;
        outer.onKeyEntered = [](const std::string&, const LatLng&) {};
        outer.onReady = [&]() {
            index::QueryCallbacks callbacks;
            callbacks.onKeyEntered = [&events](const std::string&, const LatLng&) { ++events; };
            callbacks.onReady = [&events]() { ++events; };
            inner = geoIndex->query(center, 1.0, std::move(callbacks));
            inner->cancel();
            inner->cancel();
            issued.set_value();
        };
        auto outerQuery = geoIndex->query(center, 1.0, std::move(outer));
        issued.get_future().wait();
        outerQuery->cancel();
        REQUIRE(inner->cancelled());

        // 排在后面的查询完成时，前面的任务已执行
        REQUIRE(index::queryRadius(*geoIndex, center, 1.0).get().size() == 3);
        REQUIRE(events == 0);
        REQUIRE(geoIndex->activeQueryCount() == 0);
    }
}

TEST_CASE("Radius query adapter", "[radius_query]") {
    const LatLng center(0.0, 0.0);

    SECTION("Ready delivered before the handle is returned") {
        test::ScriptedGeoIndex geoIndex({{"k", offsetNorth(center, 10.0)}});
        auto future = index::queryRadius(geoIndex, center, 0.05);
        REQUIRE(future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
        REQUIRE(future.get().size() == 1);
        REQUIRE(geoIndex.allCancelled());
    }

    SECTION("Index exceptions surface through the future") {
        test::ThrowingGeoIndex geoIndex;
        auto future = index::queryRadius(geoIndex, center, 0.05);
        REQUIRE_THROWS_AS(future.get(), std::runtime_error);
    }

    SECTION("A missing handle is an error") {
        NullHandleGeoIndex geoIndex;
        auto future = index::queryRadius(geoIndex, center, 0.05);
        REQUIRE_THROWS_AS(future.get(), std::runtime_error);
    }
}
