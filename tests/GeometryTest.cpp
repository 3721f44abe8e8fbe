#include "chrome/Geometry.hpp"
#include "chrome/Region.hpp"

#include <vector>

#include <doctest/doctest.h>

using namespace fk::chrome;

namespace
{
bool any_intersection(std::vector<RectInt> const &lhs,
                      std::vector<RectInt> const &rhs)
{
    for (auto const &a : lhs)
    {
        for (auto const &b : rhs)
        {
            if (a.intersects(b))
            {
                return true;
            }
        }
    }
    return false;
}

long long area(std::vector<RectInt> const &rects)
{
    long long total = 0;
    for (auto const &rect : rects)
    {
        total += static_cast<long long>(rect.width) * rect.height;
    }
    return total;
}
} // namespace

TEST_CASE("rectangles that only touch do not intersect")
{
    RectInt const a{0, 0, 33, 33};
    CHECK(a.intersects({32, 32, 33, 33}));
    CHECK_FALSE(a.intersects({0, 33, 33, 33}));
    CHECK_FALSE(a.intersects({33, 0, 33, 33}));
    CHECK_FALSE(a.intersects({10, 10, 0, 5}));
    CHECK(a.contains({0, 0}));
    CHECK_FALSE(a.contains({33, 0}));
}

TEST_CASE("to_device_size rounds and clamps to the native coordinate range")
{
    CHECK(to_device_size(32.0, 1.0) == 32);
    CHECK(to_device_size(410.0, 1.5) == 615);
    CHECK(to_device_size(33.0, 1.25) == 41);
    CHECK(to_device_size(-5.0, 1.0) == 0);
    CHECK(to_device_size(1.0e9, 2.0) == 32767);
    CHECK(scale_factor_from_dpi(144) == doctest::Approx(1.5));
    CHECK(scale_factor_from_dpi(0) == doctest::Approx(1.0));
}

TEST_CASE("scaled_rect converts logical bounds to device pixels")
{
    auto rect = scaled_rect({10.0, 20.5}, {100.0, 50.0}, 1.5);
    CHECK(rect == RectInt{15, 31, 150, 75});
}

TEST_CASE("subtract leaves the uncovered part of a rectangle")
{
    RectInt const outer{0, 0, 100, 100};

    SUBCASE("hole in the middle")
    {
        auto pieces = subtract(outer, {40, 40, 20, 20});
        CHECK(pieces.size() == 4);
        CHECK(area(pieces) == 100 * 100 - 20 * 20);
        CHECK_FALSE(any_intersection(
            pieces, std::vector<RectInt>{RectInt{40, 40, 20, 20}}));
    }
    SUBCASE("disjoint hole")
    {
        auto pieces = subtract(outer, {200, 200, 10, 10});
        REQUIRE(pieces.size() == 1);
        CHECK(pieces.front() == outer);
    }
    SUBCASE("hole covering everything")
    {
        CHECK(subtract(outer, {-10, -10, 200, 200}).empty());
    }
    SUBCASE("hole across the top edge")
    {
        auto pieces = subtract(outer, {-5, -5, 110, 30});
        REQUIRE(pieces.size() == 1);
        CHECK(pieces.front() == RectInt{0, 25, 100, 75});
    }
}

TEST_CASE("passthrough claims are carved out of the caption")
{
    auto region = Region::whole_caption({800, 600});
    REQUIRE(region.rects(RegionKind::Caption).size() == 1);
    CHECK(region.empty(RegionKind::Passthrough));

    region.add_passthrough({0, 0, 800, 40});
    region.add_passthrough({100, 100, 200, 200});
    // overlaps the previous claim
    region.add_passthrough({250, 250, 100, 100});

    auto const &caption = region.rects(RegionKind::Caption);
    auto const &passthrough = region.rects(RegionKind::Passthrough);

    CHECK_FALSE(any_intersection(caption, passthrough));
    for (size_t i = 0; i < passthrough.size(); ++i)
    {
        for (size_t j = i + 1; j < passthrough.size(); ++j)
        {
            CHECK_FALSE(passthrough[i].intersects(passthrough[j]));
        }
    }
    long long const claimed = 800 * 40 + 200 * 200 + 100 * 100 - 50 * 50;
    CHECK(area(passthrough) == claimed);
    CHECK(area(caption) == 800 * 600 - claimed);
}

TEST_CASE("all passthrough region has no caption")
{
    auto region = Region::all_passthrough({640, 480});
    CHECK(region.empty(RegionKind::Caption));
    REQUIRE(region.rects(RegionKind::Passthrough).size() == 1);
    CHECK(region.rects(RegionKind::Passthrough).front() ==
          RectInt{0, 0, 640, 480});
    CHECK(Region::whole_caption({0, 0}).empty(RegionKind::Caption));
}
