#include <catch2/catch.hpp>

#include "models.hpp"
#include "errors.hpp"

TEST_CASE("grade scale maps letters to points", "[models]") {
    const GradeScale& scale = GradeScale::standard();
    CHECK(*scale.point(Grade::S) == 10);
    CHECK(*scale.point(Grade::A) == 9);
    CHECK(*scale.point(Grade::B) == 8);
    CHECK(*scale.point(Grade::C) == 7);
    CHECK(*scale.point(Grade::D) == 6);
    CHECK(*scale.point(Grade::E) == 5);
    CHECK(*scale.point(Grade::F) == 0);
    CHECK_FALSE(scale.point(Grade::P).has_value());
    CHECK_FALSE(scale.is_gradeable(Grade::P));
    CHECK(scale.max_point() == 10);
}

TEST_CASE("grade scale is a single shared instance", "[models]") {
    CHECK(&GradeScale::standard() == &GradeScale::standard());
}

TEST_CASE("gradeable grades are listed best first", "[models]") {
    const auto& g = GradeScale::standard().gradeable();
    REQUIRE(g.size() == 7);
    CHECK(g.front() == Grade::S);
    CHECK(g.back() == Grade::F);
    for (std::size_t i = 1; i < g.size(); ++i)
        CHECK(*GradeScale::standard().point(g[i - 1]) > *GradeScale::standard().point(g[i]));
}

TEST_CASE("parse_grade accepts the eight symbols", "[models]") {
    CHECK(parse_grade("S") == Grade::S);
    CHECK(parse_grade(" A ") == Grade::A);
    CHECK(parse_grade("P") == Grade::P);
    CHECK(grade_symbol(Grade::C) == "C");
}

TEST_CASE("parse_grade rejects anything else", "[models]") {
    CHECK_THROWS_AS(parse_grade("G"), InvalidGradeError);
    CHECK_THROWS_AS(parse_grade("AB"), InvalidGradeError);
    CHECK_THROWS_AS(parse_grade(""), InvalidGradeError);
    CHECK_THROWS_AS(parse_grade("a"), InvalidGradeError);
    CHECK_FALSE(try_parse_grade("N").has_value());
}

TEST_CASE("dates order by year, month, day", "[models]") {
    const Date a{ 2023, 5, 17 };
    const Date b{ 2023, 11, 2 };
    CHECK(a < b);
    CHECK_FALSE(b < a);
    CHECK(a != b);
    CHECK(a == Date{ 2023, 5, 17 });
    CHECK(Date{ 1970, 1, 1 }.to_days() == 0);
    CHECK(Date{ 2000, 3, 1 }.to_days() - Date{ 2000, 2, 28 }.to_days() == 2);
    CHECK(a.to_string() == "2023-05-17");
}
