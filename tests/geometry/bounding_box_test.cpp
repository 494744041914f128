/**
 * @file bounding_box_test.cpp
 * @brief Unit tests for bounding_box and multi_bounding_box
 */

#include <tagcheck/geometry/bounding_box.hpp>
#include <tagcheck/geometry/multi_bounding_box.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

using namespace tagcheck::geometry;
using Catch::Matchers::WithinAbs;

// =============================================================================
// bounding_box
// =============================================================================

TEST_CASE("bounding_box derived edges", "[geometry][bounding_box]") {
    bounding_box box{0, 10.0, 20.0, 100.0, 50.0};

    CHECK(box.page_index() == 0);
    CHECK(box.left_x() == 10.0);
    CHECK(box.right_x() == 110.0);
    CHECK(box.bottom_y() == 20.0);
    CHECK(box.top_y() == 70.0);
    CHECK(box.area() == 5000.0);
    CHECK(box.center() == point{60.0, 45.0});
    CHECK_FALSE(box.is_empty());
}

TEST_CASE("bounding_box normalizes negative extents", "[geometry][bounding_box]") {
    bounding_box box{2, 110.0, 70.0, -100.0, -50.0};

    CHECK(box.x() == 10.0);
    CHECK(box.y() == 20.0);
    CHECK(box.width() == 100.0);
    CHECK(box.height() == 50.0);
    CHECK(box == bounding_box::from_corners(2, 10.0, 20.0, 110.0, 70.0));
}

TEST_CASE("bounding_box zero area is empty", "[geometry][bounding_box]") {
    CHECK(bounding_box{}.is_empty());
    CHECK(bounding_box{0, 5.0, 5.0, 0.0, 10.0}.is_empty());
}

TEST_CASE("bounding_box union", "[geometry][bounding_box]") {
    bounding_box a{0, 0.0, 0.0, 10.0, 10.0};
    bounding_box b{0, 20.0, 5.0, 10.0, 10.0};

    SECTION("same page covers both") {
        auto merged = a.union_with(b);
        REQUIRE(merged.has_value());
        CHECK(*merged == bounding_box::from_corners(0, 0.0, 0.0, 30.0, 15.0));
        CHECK(merged->contains(a));
        CHECK(merged->contains(b));
    }

    SECTION("different pages have no union") {
        bounding_box other_page{1, 0.0, 0.0, 10.0, 10.0};
        CHECK_FALSE(a.union_with(other_page).has_value());
    }
}

TEST_CASE("bounding_box intersection", "[geometry][bounding_box]") {
    bounding_box a{0, 0.0, 0.0, 10.0, 10.0};

    SECTION("overlapping boxes") {
        bounding_box b{0, 5.0, 5.0, 10.0, 10.0};
        auto overlap = a.intersection_with(b);
        REQUIRE(overlap.has_value());
        CHECK(*overlap == bounding_box{0, 5.0, 5.0, 5.0, 5.0});
        CHECK(a.intersects(b));
    }

    SECTION("touching edges do not intersect") {
        bounding_box b{0, 10.0, 0.0, 10.0, 10.0};
        CHECK_FALSE(a.intersection_with(b).has_value());
        CHECK_FALSE(a.intersects(b));
    }

    SECTION("different pages never intersect") {
        bounding_box b{1, 0.0, 0.0, 10.0, 10.0};
        CHECK_FALSE(a.intersects(b));
        CHECK(a.overlap_percentage(b) == 0.0);
    }
}

TEST_CASE("bounding_box containment", "[geometry][bounding_box]") {
    bounding_box outer{0, 0.0, 0.0, 100.0, 100.0};

    CHECK(outer.contains(bounding_box{0, 10.0, 10.0, 20.0, 20.0}));
    CHECK(outer.contains(outer));
    CHECK_FALSE(outer.contains(bounding_box{0, 90.0, 90.0, 20.0, 20.0}));
    CHECK_FALSE(outer.contains(bounding_box{1, 10.0, 10.0, 20.0, 20.0}));

    CHECK(outer.contains(point{0.0, 0.0}));
    CHECK(outer.contains(point{100.0, 100.0}));
    CHECK_FALSE(outer.contains(point{100.1, 50.0}));
}

TEST_CASE("bounding_box overlap percentage uses the smaller area", "[geometry][bounding_box]") {
    bounding_box big{0, 0.0, 0.0, 100.0, 100.0};
    bounding_box small{0, 90.0, 0.0, 20.0, 10.0};

    CHECK_THAT(big.overlap_percentage(small), WithinAbs(0.5, 1e-9));
    CHECK_THAT(small.overlap_percentage(big), WithinAbs(0.5, 1e-9));

    bounding_box degenerate{0, 10.0, 10.0, 0.0, 0.0};
    CHECK(big.overlap_percentage(degenerate) == 0.0);
}

TEST_CASE("bounding_box inset grows or shrinks symmetrically", "[geometry][bounding_box]") {
    bounding_box box{0, 10.0, 10.0, 20.0, 20.0};

    auto grown = box.inset_by(5.0, 2.0);
    CHECK(grown == bounding_box::from_corners(0, 5.0, 8.0, 35.0, 32.0));
    CHECK(grown.center() == box.center());
}

// =============================================================================
// multi_bounding_box
// =============================================================================

TEST_CASE("multi_bounding_box keeps boxes ordered by page", "[geometry][multi_bounding_box]") {
    multi_bounding_box region{{bounding_box{2, 0.0, 0.0, 10.0, 10.0},
                               bounding_box{0, 0.0, 0.0, 5.0, 5.0},
                               bounding_box{2, 50.0, 50.0, 10.0, 10.0}}};

    REQUIRE(region.size() == 3);
    CHECK(region.first()->page_index() == 0);
    CHECK(region.last()->page_index() == 2);
    CHECK(region.page_indices() == std::set<int>{0, 2});
    CHECK(region.page_count() == 2);
    CHECK(region.is_multi_page());
    CHECK(region.total_area() == 225.0);
}

TEST_CASE("multi_bounding_box empty region", "[geometry][multi_bounding_box]") {
    multi_bounding_box region;

    CHECK(region.empty());
    CHECK_FALSE(region.first().has_value());
    CHECK_FALSE(region.last().has_value());
    CHECK(region.page_count() == 0);
    CHECK_FALSE(region.union_box_for_page(0).has_value());
}

TEST_CASE("multi_bounding_box per-page queries", "[geometry][multi_bounding_box]") {
    multi_bounding_box region{{bounding_box{0, 0.0, 0.0, 10.0, 10.0},
                               bounding_box{1, 0.0, 0.0, 10.0, 10.0},
                               bounding_box{1, 40.0, 40.0, 10.0, 10.0}}};

    CHECK(region.boxes_on_page(1).size() == 2);
    CHECK(region.filtered_by_page(1).page_count() == 1);

    auto page_union = region.union_box_for_page(1);
    REQUIRE(page_union.has_value());
    CHECK(*page_union == bounding_box::from_corners(1, 0.0, 0.0, 50.0, 50.0));

    CHECK(region.contains(point{45.0, 45.0}, 1));
    CHECK_FALSE(region.contains(point{45.0, 45.0}, 0));
    CHECK(region.intersects(bounding_box{1, 5.0, 5.0, 2.0, 2.0}));
    CHECK_FALSE(region.intersects(bounding_box{2, 5.0, 5.0, 2.0, 2.0}));
}

TEST_CASE("multi_bounding_box adding returns a new region", "[geometry][multi_bounding_box]") {
    multi_bounding_box region{bounding_box{1, 0.0, 0.0, 10.0, 10.0}};

    auto grown = region.adding(bounding_box{0, 0.0, 0.0, 1.0, 1.0});
    CHECK(region.size() == 1);
    REQUIRE(grown.size() == 2);
    CHECK(grown.first()->page_index() == 0);

    auto merged = region.merged_with(grown);
    CHECK(merged.size() == 3);
}
