#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "pipeline/QueryOrchestrator.hpp"
#include "core/PolylineSegmenter.hpp"
#include "geo/GeoMath.hpp"
#include "TestIndexes.hpp"

using namespace corridor;
using corridor::geo::LatLng;
using corridor::test::offsetNorth;

TEST_CASE("Buffer inclusion tolerance", "[orchestrator]") {
    const double width = 50.0;

    REQUIRE(pipeline::withinBuffer(0.0, width));
    REQUIRE(pipeline::withinBuffer(width, width));
    REQUIRE(pipeline::withinBuffer(width + 0.05, width));
    REQUIRE_FALSE(pipeline::withinBuffer(width + 0.2, width));
    REQUIRE_FALSE(pipeline::withinBuffer(width + 10.0, width));
}

TEST_CASE("Corridor distance of a sample point", "[orchestrator]") {
    const LatLng prev(0.0, 0.0);
    const LatLng current(0.0, 0.001);
    const LatLng next(0.0, 0.002);

    SECTION("Interior sample uses both neighbouring segments") {
        const LatLng location = offsetNorth(LatLng(0.0, 0.0005), 30.0);
        const double expected = geo::closestDistanceToSegment(prev, current, location);
        REQUIRE(pipeline::corridorDistance(prev, current, next, location) == Catch::Approx(expected));
        REQUIRE(expected == Catch::Approx(30.0).epsilon(1e-3));
    }

    SECTION("Isolated sample uses the plain distance") {
        const LatLng location = offsetNorth(current, 20.0);
        REQUIRE(pipeline::corridorDistance(std::nullopt, current, std::nullopt, location) ==
                Catch::Approx(geo::distanceMeters(current, location)));
    }

    SECTION("Endpoint sample uses the plain distance") {
        const LatLng location = offsetNorth(LatLng(0.0, 0.0015), 30.0);
        const double plain = geo::distanceMeters(current, location);
        REQUIRE(pipeline::corridorDistance(std::nullopt, current, next, location) == Catch::Approx(plain));
        REQUIRE(pipeline::corridorDistance(prev, current, std::nullopt, location) == Catch::Approx(plain));
        REQUIRE(plain > 60.0);
    }
}

TEST_CASE("Merging per-point matches", "[orchestrator]") {
    core::MatchMap merged;

    REQUIRE(pipeline::mergeMatches(merged, {{"a", LatLng(1.0, 1.0)}, {"b", LatLng(2.0, 2.0)}}) == 2);
    // 重复 key 保留先到的位置
    REQUIRE(pipeline::mergeMatches(merged, {{"a", LatLng(9.0, 9.0)}, {"c", LatLng(3.0, 3.0)}}) == 1);
    REQUIRE(pipeline::mergeMatches(merged, {{"a", LatLng(9.0, 9.0)}}) == 0);

    REQUIRE(merged.size() == 3);
    REQUIRE(merged.at("a").location == LatLng(1.0, 1.0));
}

TEST_CASE("Orchestrating one query section", "[orchestrator]") {
    const double width = 50.0;
    const double step = core::bufferStepLength(width);
    const core::Leg leg = {{0.0, 0.0}, {0.0, 0.01}};
    const LatLng midpoint(0.0, 0.005);

    std::vector<core::IndexMatch> entries = {
        {"inside", offsetNorth(midpoint, 40.0)},
        {"onLine", midpoint},
        {"outside", offsetNorth(midpoint, 55.0)},
        {"faraway", LatLng(1.0, 1.0)}
    };

    SECTION("One query per sample point with the radius in kilometers") {
        auto geoIndex = std::make_shared<test::ScriptedGeoIndex>(entries);
        pipeline::QueryOrchestrator orchestrator{geoIndex, step, width};

        auto section = core::buildQuerySection(leg, step);
        const auto samples = section.sampleCount();
        auto result = orchestrator.run(std::move(section));

        REQUIRE(geoIndex->queryCount() == samples);
        for (double radius : geoIndex->radiiKm()) {
            REQUIRE(radius == Catch::Approx(step / 1000.0));
        }
        REQUIRE(geoIndex->allCancelled());
        REQUIRE(result.querySection.sampleCount() == samples);
    }

    SECTION("Circular false positives are filtered and duplicates merged") {
        // 忽略半径，每个采样点都收到全部记录
        auto geoIndex = std::make_shared<test::ScriptedGeoIndex>(entries, true);
        pipeline::QueryOrchestrator orchestrator{geoIndex, step, width};

        auto result = orchestrator.run(core::buildQuerySection(leg, step));

        REQUIRE(geoIndex->timesDelivered("inside") > 1);
        REQUIRE(result.matches.size() == 2);
        REQUIRE(result.matches.count("inside") == 1);
        REQUIRE(result.matches.count("onLine") == 1);
        REQUIRE(result.matches.count("outside") == 0);
        REQUIRE(result.matches.count("faraway") == 0);
    }

    SECTION("Overlapping circles find the same key once") {
        // 离采样点很近的记录会被相邻两个圆同时查到
        auto section = core::buildQuerySection(leg, step);
        const LatLng between = offsetNorth(
            geo::interpolate(section.samplePoints[3], section.samplePoints[4], 0.5), 10.0);

        auto geoIndex = std::make_shared<test::ScriptedGeoIndex>(std::vector<core::IndexMatch>{{"shared", between}});
        pipeline::QueryOrchestrator orchestrator{geoIndex, step, width};
        auto result = orchestrator.run(std::move(section));

        REQUIRE(geoIndex->timesDelivered("shared") >= 2);
        REQUIRE(result.matches.size() == 1);
        REQUIRE(result.matches.at("shared").location == between);
    }

    SECTION("Dispatch does not wait for the index") {
        auto geoIndex = std::make_shared<test::HoldingGeoIndex>(entries);
        pipeline::QueryOrchestrator orchestrator{geoIndex, step, width};

        auto pending = orchestrator.dispatch(core::buildQuerySection(leg, step));
        REQUIRE(geoIndex->heldCount() == pending.queryCount());

        geoIndex->releaseInReverse();
        auto result = pending.collect();
        REQUIRE(result.matches.count("inside") == 1);
        REQUIRE(result.matches.count("outside") == 0);
    }
}
