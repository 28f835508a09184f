#include <shroud/core/column.hpp>
#include <shroud/core/time.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <string>
#include <vector>

TEST_CASE("Column<int64_t> basic operations", "[core][column]") {
    shroud::Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("span provides zero-copy view") {
        auto view = col.span();
        REQUIRE(view.size() == 5);
        REQUIRE(view[2] == 3);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column take gathers rows in the given order", "[core][column]") {
    shroud::Column<std::string> col{"a", "b", "c", "d"};
    std::vector<std::size_t> order{3, 0, 0, 2};

    auto taken = col.take(order);

    REQUIRE(taken.size() == 4);
    REQUIRE(taken[0] == "d");
    REQUIRE(taken[1] == "a");
    REQUIRE(taken[2] == "a");
    REQUIRE(taken[3] == "c");
    REQUIRE(col.size() == 4);
}

TEST_CASE("Column default-constructs empty", "[core][column]") {
    shroud::Column<double> col;

    REQUIRE(col.empty());
    REQUIRE(col.size() == 0);
}

TEST_CASE("Column range-for iteration", "[core][column]") {
    shroud::Column<std::int64_t> col{10, 20, 30};

    std::int64_t sum = 0;
    for (auto val : col) {
        sum += val;
    }
    REQUIRE(sum == 60);
}

TEST_CASE("Date civil conversion", "[core][time]") {
    REQUIRE(shroud::make_date(1970, 1, 1).days == 0);
    REQUIRE(shroud::make_date(2000, 3, 1).days == 11017);

    auto civil = shroud::civil_from_date(shroud::make_date(2024, 2, 29));
    REQUIRE(civil.year == 2024);
    REQUIRE(civil.month == 2);
    REQUIRE(civil.day == 29);

    REQUIRE(shroud::format_date(shroud::make_date(1999, 12, 31)) == "1999-12-31");
    REQUIRE(shroud::format_date(shroud::make_date(1969, 7, 20)) == "1969-07-20");
}

TEST_CASE("days_in_month handles leap years", "[core][time]") {
    REQUIRE(shroud::days_in_month(2023, 2) == 28);
    REQUIRE(shroud::days_in_month(2024, 2) == 29);
    REQUIRE(shroud::days_in_month(1900, 2) == 28);
    REQUIRE(shroud::days_in_month(2000, 2) == 29);
    REQUIRE(shroud::days_in_month(2023, 4) == 30);
    REQUIRE(shroud::days_in_month(2023, 13) == 0);
}
