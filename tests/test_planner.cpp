#include <catch2/catch.hpp>

#include "planner.hpp"
#include "errors.hpp"

namespace {

int point(Grade g) { return *GradeScale::standard().point(g); }

} // namespace

TEST_CASE("unreachable target reports the required average and no assignments", "[planner]") {
    // average 9.0 over 20 credits, one 4-credit course left
    const TargetPlan plan = plan_target(9.5, 20, 180, { { "Capstone", 4 } });
    CHECK(plan.required_average == Approx(12.0));
    CHECK(plan.total_future_credits == Approx(4.0));
    CHECK(plan.assignments.empty());
}

TEST_CASE("reachable target lists sufficient assignments weakest first", "[planner]") {
    // 20 credits at 8.0, two 4-credit courses: (8.5 * 28 - 160) / 8 = 9.75
    const TargetPlan plan = plan_target(8.5, 20, 160, { { "Compilers", 4 }, { "Networks", 4 } });
    CHECK(plan.required_average == Approx(9.75));

    // Needs bucket points >= 78: (S,S)=80, (S,A)=76 is short.
    REQUIRE(plan.assignments.size() == 1);
    CHECK(assignment_grades(plan.assignments[0], 2) == std::vector<Grade>{ Grade::S, Grade::S });
    CHECK(plan.assignments[0].projected_cgpa == Approx(240.0 / 28.0));
}

TEST_CASE("assignments are sorted ascending and all reach the target", "[planner]") {
    const double target = 8.0;
    const TargetPlan plan = plan_target(target, 30, 240, { { "G1", 3 }, { "G2", 4 }, { "G3", 2 } });
    REQUIRE_FALSE(plan.assignments.empty());

    for (std::size_t i = 0; i < plan.assignments.size(); ++i) {
        const Assignment& a = plan.assignments[i];
        REQUIRE(assignment_grades(a, plan.bucket_count).size() == 3);
        CHECK(a.projected_cgpa + kTargetTolerance >= target);
        if (i > 0) CHECK(plan.assignments[i - 1].projected_cgpa <= a.projected_cgpa);
    }
    // weakest sufficient first, strongest (all S) last
    CHECK(assignment_grades(plan.assignments.back(), 3) == std::vector<Grade>{ Grade::S, Grade::S, Grade::S });
}

TEST_CASE("every valid assignment is found", "[planner]") {
    // required average is exactly 8, so the count is the number of pairs with
    // 2*p1 + 2*p2 >= 32 over the scale.
    const TargetPlan plan = plan_target(8.0, 4, 32, { { "X", 2 }, { "Y", 2 } });
    std::size_t expected = 0;
    for (Grade a : GradeScale::standard().gradeable())
        for (Grade b : GradeScale::standard().gradeable())
            if (point(a) + point(b) >= 16) ++expected;
    CHECK(plan.assignments.size() == expected);
    CHECK(plan.assignments.front().projected_cgpa == Approx(8.0));
}

TEST_CASE("a trivially met target accepts every assignment", "[planner]") {
    const TargetPlan plan = plan_target(5.0, 100, 1000, { { "G1", 1 }, { "G2", 1 } });
    CHECK(plan.required_average <= 0.0);
    CHECK(plan.assignments.size() == 49);
    CHECK(assignment_grades(plan.assignments.front(), 2) == std::vector<Grade>{ Grade::F, Grade::F });
}

TEST_CASE("raising a bucket's grade never lowers the projection", "[planner]") {
    const std::vector<Bucket> buckets = { { "G1", 3 }, { "G2", 1.5 }, { "G3", 4 } };
    const auto& grades = GradeScale::standard().gradeable(); // S..F
    for (std::size_t b = 0; b < buckets.size(); ++b) {
        std::vector<Grade> assign = { Grade::C, Grade::B, Grade::E };
        double previous = -1.0;
        for (auto it = grades.rbegin(); it != grades.rend(); ++it) { // F up to S
            assign[b] = *it;
            const double projected = project_cgpa(25, 190, buckets, assign);
            CHECK(projected >= previous);
            previous = projected;
        }
    }
}

TEST_CASE("project_cgpa evaluates one assignment", "[planner]") {
    const std::vector<Bucket> buckets = { { "Compilers", 4 }, { "Networks", 3 } };
    // (160 + 36 + 24) / 27
    CHECK(project_cgpa(20, 160, buckets, { Grade::A, Grade::B }) == Approx(220.0 / 27.0));
    CHECK_THROWS_AS(project_cgpa(20, 160, buckets, { Grade::A }), InvalidGradeError);
    CHECK_THROWS_AS(project_cgpa(20, 160, buckets, { Grade::A, Grade::P }), InvalidGradeError);
    CHECK_THROWS_AS(project_cgpa(0, 0, {}, {}), DivisionGuardError);
}

TEST_CASE("planning needs future credits", "[planner]") {
    CHECK_THROWS_AS(plan_target(8.0, 20, 160, {}), DivisionGuardError);
    CHECK_THROWS_AS(plan_target(8.0, 20, 160, { { "Nothing", 0 } }), DivisionGuardError);
    CHECK_THROWS_AS(required_average(8.0, 20, 160, {}), DivisionGuardError);
}

TEST_CASE("every bucket needs positive credits", "[planner]") {
    try {
        plan_target(8.0, 20, 160, { { "Good", 4 }, { "Bad", -1 } });
        FAIL("expected InvalidBucketError");
    }
    catch (const InvalidBucketError& e) {
        CHECK(e.index() == 1);
    }
}

TEST_CASE("planning works without existing credits", "[planner]") {
    const TargetPlan plan = plan_target(9.0, 0, 0, { { "First term", 20 } });
    CHECK(plan.required_average == Approx(9.0));
    REQUIRE(plan.assignments.size() == 2);
    CHECK(assignment_grades(plan.assignments[0], 1)[0] == Grade::A);
    CHECK(assignment_grades(plan.assignments[1], 1)[0] == Grade::S);
}

TEST_CASE("bucket count above the cap needs opt-in", "[planner]") {
    const std::vector<Bucket> buckets(3, Bucket{ "G", 1 });
    PlannerOptions opts;
    opts.max_buckets = 2;
    CHECK_THROWS_AS(plan_target(8.0, 10, 80, buckets, opts), PlanTooLargeError);

    opts.allow_large = true;
    const TargetPlan plan = plan_target(8.0, 10, 80, buckets, opts);
    CHECK_FALSE(plan.assignments.empty());
}

TEST_CASE("required average alone skips enumeration", "[planner]") {
    const std::vector<Bucket> many(20, Bucket{ "Course", 3 });
    // 7^20 assignments would never finish; the formula is immediate.
    CHECK(required_average(8.0, 100, 750, many) == Approx((8.0 * 160 - 750) / 60.0));
}

TEST_CASE("all-S shortfall skips the enumeration even above the cap", "[planner]") {
    const std::vector<Bucket> many(12, Bucket{ "Course", 1 });
    PlannerOptions opts;
    opts.allow_large = true;
    // 12 S credits cannot lift 100 credits at 5.0 to 9.9.
    const TargetPlan plan = plan_target(9.9, 100, 500, many, opts);
    CHECK(plan.assignments.empty());
    CHECK(plan.required_average > GradeScale::standard().max_point());
}

TEST_CASE("assignment codes count in odometer order", "[planner]") {
    CHECK(assignment_grades(Assignment{ 0, 0.0 }, 3) == std::vector<Grade>{ Grade::S, Grade::S, Grade::S });
    CHECK(assignment_grades(Assignment{ 1, 0.0 }, 3) == std::vector<Grade>{ Grade::S, Grade::S, Grade::A });
    CHECK(assignment_grades(Assignment{ 7, 0.0 }, 3) == std::vector<Grade>{ Grade::S, Grade::A, Grade::S });
    CHECK(assignment_grades(Assignment{ 342, 0.0 }, 3) == std::vector<Grade>{ Grade::F, Grade::F, Grade::F });
    CHECK(assignment_grades(Assignment{ 0, 0.0 }, 0).empty());
}

TEST_CASE("decoded assignments reproduce their projections", "[planner]") {
    const std::vector<Bucket> buckets = { { "G1", 3 }, { "G2", 4 }, { "G3", 2 } };
    const TargetPlan plan = plan_target(7.5, 30, 240, buckets);
    REQUIRE(plan.bucket_count == 3);
    REQUIRE_FALSE(plan.assignments.empty());
    for (const Assignment& a : plan.assignments)
        CHECK(project_cgpa(30, 240, buckets, assignment_grades(a, plan.bucket_count)) == Approx(a.projected_cgpa));
}

TEST_CASE("bucket counts past the packing limit are refused even with opt-in", "[planner]") {
    const std::vector<Bucket> many(kMaxPlanBuckets + 1, Bucket{ "Course", 1 });
    PlannerOptions opts;
    opts.allow_large = true;
    CHECK_THROWS_AS(plan_target(5.0, 10, 50, many, opts), PlanTooLargeError);
}

TEST_CASE("projections within rounding distance of the target are kept", "[planner]") {
    // One 1-credit course and nothing else: the projection is the grade point.
    const std::vector<Bucket> one = { { "Only", 1 } };
    const TargetPlan close = plan_target(9.0 + kTargetTolerance / 2, 0, 0, one);
    REQUIRE(close.assignments.size() == 2);
    CHECK(assignment_grades(close.assignments[0], 1)[0] == Grade::A);

    const TargetPlan above = plan_target(9.0 + 1e-6, 0, 0, one);
    REQUIRE(above.assignments.size() == 1);
    CHECK(assignment_grades(above.assignments[0], 1)[0] == Grade::S);
}
