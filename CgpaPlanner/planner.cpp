#include "planner.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

/*
-------------------------------------------------------------------------------
 planner.cpp — Required average and assignment enumeration
-------------------------------------------------------------------------------
Assignments are generated like an odometer over the gradeable grades
(S, A, ... F): the last bucket turns fastest, so the first assignment is all-S
and the order matches a Cartesian product over buckets. Read as base-7 digits
the odometer simply counts up, so its reading is the assignment's code. The
result is stable-sorted by projected CGPA, so equal projections keep
generation order.
-------------------------------------------------------------------------------
*/

namespace {

// Validates buckets and returns their total credits.
double checked_future_credits(const std::vector<Bucket>& buckets) {
    double total = 0.0;
    for (const auto& b : buckets) total += b.credits;
    if (!(total > 0.0))
        throw DivisionGuardError("Future credits must add up to more than zero");

    for (std::size_t i = 0; i < buckets.size(); ++i) {
        if (!std::isfinite(buckets[i].credits) || buckets[i].credits <= 0.0)
            throw InvalidBucketError(i, "Bucket " + std::to_string(i + 1) + " ('" + buckets[i].label +
                "') needs a positive number of credits");
    }
    return total;
}

} // namespace

double required_average(double target, double current_credits, double current_points,
    const std::vector<Bucket>& buckets) {
    const double future = checked_future_credits(buckets);
    return (target * (current_credits + future) - current_points) / future;
}

TargetPlan plan_target(double target, double current_credits, double current_points,
    const std::vector<Bucket>& buckets, const PlannerOptions& options) {
    const double future = checked_future_credits(buckets);

    if (buckets.size() > kMaxPlanBuckets)
        throw PlanTooLargeError(std::to_string(buckets.size()) + " buckets exceed the hard limit of " +
            std::to_string(kMaxPlanBuckets));
    if (buckets.size() > options.max_buckets && !options.allow_large)
        throw PlanTooLargeError(std::to_string(buckets.size()) + " buckets exceed the limit of " +
            std::to_string(options.max_buckets) + " (7^k assignments); reduce buckets or allow a large plan");

    const double denom = current_credits + future;
    if (!(denom > 0.0))
        throw DivisionGuardError("Total credits after planning are zero");

    TargetPlan plan;
    plan.total_future_credits = future;
    plan.bucket_count = buckets.size();
    plan.required_average = required_average(target, current_credits, current_points, buckets);

    const GradeScale& scale = GradeScale::standard();
    const auto& grades = scale.gradeable();
    const std::size_t k = buckets.size();

    // All-S is the best any assignment can do.
    const double best = (current_points + future * scale.max_point()) / denom;
    if (best + kTargetTolerance < target) return plan;

    std::vector<std::size_t> digit(k, 0);
    std::uint64_t code = 0;
    bool done = false;
    while (!done) {
        double points = current_points;
        for (std::size_t i = 0; i < k; ++i)
            points += buckets[i].credits * *scale.point(grades[digit[i]]);
        const double projected = points / denom;

        if (projected + kTargetTolerance >= target)
            plan.assignments.push_back(Assignment{ code, projected });
        ++code;

        // Advance the odometer; all-F is the last assignment.
        std::size_t pos = k;
        for (;;) {
            if (pos == 0) { done = true; break; }
            --pos;
            if (++digit[pos] < grades.size()) break;
            digit[pos] = 0;
        }
    }

    std::stable_sort(plan.assignments.begin(), plan.assignments.end(),
        [](const Assignment& a, const Assignment& b) { return a.projected_cgpa < b.projected_cgpa; });
    return plan;
}

double project_cgpa(double current_credits, double current_points,
    const std::vector<Bucket>& buckets, const std::vector<Grade>& grades) {
    if (grades.size() != buckets.size())
        throw InvalidGradeError("Expected " + std::to_string(buckets.size()) + " grades, got " +
            std::to_string(grades.size()));

    const GradeScale& scale = GradeScale::standard();
    double credits = current_credits, points = current_points;
    for (std::size_t i = 0; i < buckets.size(); ++i) {
        auto p = scale.point(grades[i]);
        if (!p) throw InvalidGradeError("Grade P cannot be planned for ('" + buckets[i].label + "')");
        credits += buckets[i].credits;
        points += buckets[i].credits * *p;
    }
    if (!(credits > 0.0))
        throw DivisionGuardError("Total credits after planning are zero");
    return points / credits;
}

std::vector<Grade> assignment_grades(const Assignment& a, std::size_t bucket_count) {
    const auto& grades = GradeScale::standard().gradeable();
    std::vector<Grade> out(bucket_count, Grade::S);
    std::uint64_t code = a.code;
    for (std::size_t i = bucket_count; i > 0; --i) {
        out[i - 1] = grades[code % grades.size()];
        code /= grades.size();
    }
    return out;
}
