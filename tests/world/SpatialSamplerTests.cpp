/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE SpatialSamplerTests
#include <boost/test/unit_test.hpp>

#include "core/PopulationErrors.hpp"
#include "world/SpatialSampler.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace HordeEngine;

namespace {
constexpr int SAMPLE_COUNT = 20000;

float horizontalDistance(const Vector3D& a, const Vector3D& b) {
    return (a - b).horizontal().length();
}
} // namespace

struct SamplerFixture {
    SpatialSampler sampler{1234u};
    Vector3D player{5.0f, 2.5f, -3.0f};
};

BOOST_FIXTURE_TEST_SUITE(DefaultPolicyTests, SamplerFixture)

BOOST_AUTO_TEST_CASE(EmptyRegionListUsesPlayerRing) {
    sampler.configure({});
    BOOST_CHECK(sampler.usesDefaultPolicy());

    for (int i = 0; i < 2000; ++i) {
        Vector3D p = sampler.sample(player);
        float d = horizontalDistance(p, player);
        BOOST_CHECK_GE(d, SpatialSampler::DEFAULT_MIN_DISTANCE - 0.01f);
        BOOST_CHECK_LE(d, SpatialSampler::DEFAULT_MAX_DISTANCE + 0.01f);
        BOOST_CHECK_EQUAL(p.getY(), player.getY());
    }
}

BOOST_AUTO_TEST_CASE(UnconfiguredSamplerUsesPlayerRing) {
    Vector3D p = sampler.sample(player);
    float d = horizontalDistance(p, player);
    BOOST_CHECK_GE(d, 29.99f);
    BOOST_CHECK_LE(d, 80.01f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ShapeSamplingTests, SamplerFixture)

BOOST_AUTO_TEST_CASE(CircleSamplesStayWithinRadius) {
    const Vector3D center(100.0f, 7.0f, -40.0f);
    const float radius = 12.0f;
    sampler.configure({SpawnRegion::circle("pit", center, radius)});

    for (int i = 0; i < 5000; ++i) {
        Vector3D p = sampler.sample(player);
        BOOST_CHECK_LE(horizontalDistance(p, center), radius + 1e-3f);
        // Region samples sit at the region's elevation, not the player's
        BOOST_CHECK_EQUAL(p.getY(), center.getY());
    }
}

BOOST_AUTO_TEST_CASE(CircleRadiiAreUniformNotAreaWeighted) {
    const Vector3D center(0.0f, 0.0f, 0.0f);
    const float radius = 10.0f;
    sampler.configure({SpawnRegion::circle("ring", center, radius)});

    std::vector<float> radii;
    radii.reserve(SAMPLE_COUNT);
    for (int i = 0; i < SAMPLE_COUNT; ++i) {
        radii.push_back(horizontalDistance(sampler.sample(player), center));
    }
    std::sort(radii.begin(), radii.end());

    // Empirical CDF against F(r) = r / R. Area-uniform sampling would give
    // (r / R)^2, which misses by 0.25 at the midpoint.
    float maxDeviation = 0.0f;
    for (int k = 1; k <= 9; ++k) {
        const float r = radius * static_cast<float>(k) / 10.0f;
        const auto below = std::lower_bound(radii.begin(), radii.end(), r) - radii.begin();
        const float empirical = static_cast<float>(below) / static_cast<float>(SAMPLE_COUNT);
        maxDeviation = std::max(maxDeviation, std::fabs(empirical - r / radius));
    }
    BOOST_CHECK_LT(maxDeviation, 0.02f);
}

BOOST_AUTO_TEST_CASE(RectangleSamplesStayWithinHalfExtents) {
    const Vector3D center(-20.0f, 1.0f, 30.0f);
    sampler.configure({SpawnRegion::rectangle("field", center, 8.0f, 3.0f)});

    float minX = 1e9f, maxX = -1e9f;
    for (int i = 0; i < 5000; ++i) {
        Vector3D p = sampler.sample(player);
        BOOST_CHECK_LE(std::fabs(p.getX() - center.getX()), 8.0f + 1e-3f);
        BOOST_CHECK_LE(std::fabs(p.getZ() - center.getZ()), 3.0f + 1e-3f);
        BOOST_CHECK_EQUAL(p.getY(), center.getY());
        minX = std::min(minX, p.getX());
        maxX = std::max(maxX, p.getX());
    }
    // Both halves of the rectangle get used
    BOOST_CHECK_LT(minX, center.getX() - 6.0f);
    BOOST_CHECK_GT(maxX, center.getX() + 6.0f);
}

BOOST_AUTO_TEST_CASE(ZeroWidthRectangleCollapsesToLine) {
    const Vector3D center(0.0f, 0.0f, 0.0f);
    sampler.configure({SpawnRegion::rectangle("wall", center, 0.0f, 5.0f)});

    for (int i = 0; i < 100; ++i) {
        BOOST_CHECK_EQUAL(sampler.sample(player).getX(), 0.0f);
    }
}

BOOST_AUTO_TEST_CASE(MinMaxDistanceAreNotEnforced) {
    SpawnRegion region = SpawnRegion::circle("near", player, 5.0f);
    region.minDistance = 30.0f;
    region.maxDistance = 80.0f;
    sampler.configure({region});

    // All samples land within 5 of the player despite the 30-80 band
    for (int i = 0; i < 200; ++i) {
        BOOST_CHECK_LE(horizontalDistance(sampler.sample(player), player), 5.0f + 1e-3f);
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(WeightedSelectionTests, SamplerFixture)

BOOST_AUTO_TEST_CASE(WeightsTwoOneOneOnePickFirstRegionFortyPercent) {
    // Far-apart single-point regions so each sample identifies its region
    std::vector<SpawnRegion> regions = {
        SpawnRegion::rectangle("a", Vector3D(0.0f, 0.0f, 0.0f), 0.0f, 0.0f, 2.0f),
        SpawnRegion::rectangle("b", Vector3D(100.0f, 0.0f, 0.0f), 0.0f, 0.0f, 1.0f),
        SpawnRegion::rectangle("c", Vector3D(200.0f, 0.0f, 0.0f), 0.0f, 0.0f, 1.0f),
        SpawnRegion::rectangle("d", Vector3D(300.0f, 0.0f, 0.0f), 0.0f, 0.0f, 1.0f),
    };
    sampler.configure(regions);
    BOOST_CHECK_CLOSE(sampler.getTotalWeight(), 5.0f, 0.001f);

    int counts[4] = {0, 0, 0, 0};
    for (int i = 0; i < SAMPLE_COUNT; ++i) {
        int index = static_cast<int>(std::lround(sampler.sample(player).getX() / 100.0f));
        BOOST_REQUIRE(index >= 0 && index < 4);
        ++counts[index];
    }

    const float first = static_cast<float>(counts[0]) / SAMPLE_COUNT;
    BOOST_CHECK_CLOSE(first, 0.4f, 5.0f); // within 5% relative
    for (int i = 1; i < 4; ++i) {
        BOOST_CHECK_CLOSE(static_cast<float>(counts[i]) / SAMPLE_COUNT, 0.2f, 8.0f);
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ConfigurationTests, SamplerFixture)

BOOST_AUTO_TEST_CASE(ZeroWeightIsRejected) {
    BOOST_CHECK_THROW(
        sampler.configure({SpawnRegion::circle("bad", Vector3D(), 10.0f, 0.0f)}),
        ConfigError);
}

BOOST_AUTO_TEST_CASE(NonPositiveRadiusIsRejected) {
    BOOST_CHECK_THROW(sampler.configure({SpawnRegion::circle("bad", Vector3D(), 0.0f)}),
                      ConfigError);
}

BOOST_AUTO_TEST_CASE(NegativeHalfExtentIsRejected) {
    BOOST_CHECK_THROW(
        sampler.configure({SpawnRegion::rectangle("bad", Vector3D(), -1.0f, 2.0f)}),
        ConfigError);
}

BOOST_AUTO_TEST_CASE(RejectedConfigurationKeepsPreviousRegions) {
    sampler.configure({SpawnRegion::circle("good", Vector3D(), 10.0f, 3.0f)});

    std::vector<SpawnRegion> mixed = {
        SpawnRegion::circle("fine", Vector3D(), 10.0f),
        SpawnRegion::circle("broken", Vector3D(), 10.0f, -2.0f),
    };
    BOOST_CHECK_THROW(sampler.configure(mixed), ConfigError);

    BOOST_REQUIRE_EQUAL(sampler.getRegions().size(), 1u);
    BOOST_CHECK_EQUAL(sampler.getRegions()[0].id, "good");
    BOOST_CHECK_CLOSE(sampler.getTotalWeight(), 3.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(ErrorCarriesConfigCode) {
    try {
        sampler.configure({SpawnRegion::circle("bad", Vector3D(), 10.0f, 0.0f)});
        BOOST_FAIL("Expected ConfigError");
    } catch (const PopulationError& e) {
        BOOST_CHECK(e.code() == PopulationErrorCode::ConfigError);
    }
}

BOOST_AUTO_TEST_CASE(ReconfigureRecomputesTotalWeight) {
    sampler.configure({SpawnRegion::circle("a", Vector3D(), 1.0f, 2.0f),
                       SpawnRegion::circle("b", Vector3D(), 1.0f, 2.0f)});
    BOOST_CHECK_CLOSE(sampler.getTotalWeight(), 4.0f, 0.001f);

    sampler.configure({SpawnRegion::circle("c", Vector3D(), 1.0f, 0.5f)});
    BOOST_CHECK_CLOSE(sampler.getTotalWeight(), 0.5f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
