#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 planner.hpp — Target CGPA planning
-------------------------------------------------------------------------------
Given the current gradeable totals and a list of future credit buckets (one
course each, or one described group of courses), plan_target reports:
  - the average grade point the buckets must reach, and
  - every assignment of S..F to the buckets that reaches the target, weakest
    first.

Cost
  Enumeration visits 7^k assignments for k buckets. PlannerOptions::max_buckets
  caps k (8 buckets = 5.7M assignments); larger plans need allow_large. Results
  are never truncated. If even all-S misses the target the enumeration is
  skipped, since raising a bucket's grade never lowers the projection.
  Assignments are stored as one packed integer each and expanded with
  assignment_grades, so a full 8-bucket result stays around 90 MB.

Target comparison
  An assignment reaches the target when projected + kTargetTolerance >= target.
  The tolerance is a rounding allowance: a projection that equals the target
  in decimal (e.g. fractional credits) may land a few ulps below it in binary
  and still counts as reaching it.
-------------------------------------------------------------------------------
*/

// Future credits that will share one grade.
struct Bucket {
    std::string label;
    double credits{ 0.0 };
};

// One grade per bucket. `code` packs the grades as base-7 digits (0 = S,
// 6 = F), first bucket most significant; use assignment_grades to expand.
struct Assignment {
    std::uint64_t code{ 0 };
    double projected_cgpa{ 0.0 };
};

struct TargetPlan {
    double required_average{ 0.0 };    // may be <= 0 or above the top grade point
    double total_future_credits{ 0.0 };
    std::size_t bucket_count{ 0 };
    std::vector<Assignment> assignments; // ascending projected_cgpa
};

struct PlannerOptions {
    std::size_t max_buckets{ 8 };
    bool allow_large{ false };
};

// Largest bucket count whose assignments fit in Assignment::code (7^22 < 2^64).
// Not lifted by allow_large.
inline constexpr std::size_t kMaxPlanBuckets = 22;

// Projections within this distance of the target count as reaching it.
inline constexpr double kTargetTolerance = 1e-9;

// Average grade point the buckets must reach; no enumeration.
// Throws DivisionGuardError, InvalidBucketError.
double required_average(double target, double current_credits, double current_points,
    const std::vector<Bucket>& buckets);

// Throws DivisionGuardError, InvalidBucketError, PlanTooLargeError.
TargetPlan plan_target(double target, double current_credits, double current_points,
    const std::vector<Bucket>& buckets, const PlannerOptions& options = PlannerOptions());

// CGPA after the buckets are completed with the given grades.
// Throws InvalidGradeError (size mismatch or P) and DivisionGuardError.
double project_cgpa(double current_credits, double current_points,
    const std::vector<Bucket>& buckets, const std::vector<Grade>& grades);

// Grades of one assignment, in bucket order.
std::vector<Grade> assignment_grades(const Assignment& a, std::size_t bucket_count);
