#pragma once
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 services.hpp - CGPA arithmetic, the ledger, and what-if simulators
-------------------------------------------------------------------------------
This header defines:
  - Free functions that compute CGPA, distributions and totals from records.
  - GradeLedger: the normalized records of one session plus cached aggregates.
  - The two simulators that edit a Distribution:
      * simulate_improvement -> move credits from one grade to another
      * simulate_future      -> add credits earned in future courses

Design notes
  - Everything here is a pure function of its arguments. Simulators take the
    distribution by const reference and return a new one, so a failed batch
    leaves the caller's distribution exactly as it was.
  - P is counted in distributions (it is a real course) but never in CGPA.
  - Sums of credits and points over records use 64-bit integers; only the
    final division produces a double. Nothing is rounded for display here.

Conventions
  - Errors are thrown (see errors.hpp). CGPA over zero credits is 0.0, not an
    error.
-------------------------------------------------------------------------------
*/

// Credits and points over gradeable (non-P) records.
struct GradeTotals {
    long long credits{ 0 };
    long long points{ 0 };
};

// One step of the cumulative CGPA history.
struct HistoryPoint {
    Date date;
    double cgpa{ 0.0 };
};

// ==========================
// CGPA ARITHMETIC
// ==========================

GradeTotals gradeable_totals(const std::vector<CourseRecord>& records);

// Credit-weighted mean grade point, P excluded. 0.0 when no gradeable credits.
double calculate_cgpa(const std::vector<CourseRecord>& records);

// Credits per grade over all records (P included). Zero totals omitted.
Distribution grade_distribution(const std::vector<CourseRecord>& records);

// CGPA implied by a distribution, P excluded. 0.0 when no gradeable credits.
double cgpa_from_distribution(const Distribution& dist);

// Cumulative CGPA after each dated, gradeable record in date order.
// Empty when no record carries a date.
std::vector<HistoryPoint> cgpa_history(const std::vector<CourseRecord>& records);

// ==========================
// LEDGER
// ==========================

// Built once per session from normalized records; read-only afterwards.
class GradeLedger {
public:
    explicit GradeLedger(std::vector<CourseRecord> records);

    const std::vector<CourseRecord>& records() const { return records_; }
    double cgpa() const { return cgpa_; }
    const Distribution& distribution() const { return distribution_; }
    const GradeTotals& totals() const { return totals_; }
    std::vector<HistoryPoint> history() const { return cgpa_history(records_); }
    bool empty() const { return records_.empty(); }

private:
    std::vector<CourseRecord> records_;
    Distribution distribution_;
    GradeTotals totals_;
    double cgpa_{ 0.0 };
};

// ==========================
// SIMULATORS
// ==========================

// Move `credits` from one grade to another.
struct Conversion {
    Grade from{ Grade::B };
    Grade to{ Grade::A };
    double credits{ 0.0 };
};

// Credits expected from future courses at a given grade.
struct Addition {
    Grade grade{ Grade::A };
    double credits{ 0.0 };
};

// Relative slack for credit comparisons in simulate_improvement. Sums of
// fractional credits like 0.3 + 0.3 + 0.4 are not exact in binary.
inline constexpr double kCreditSlack = 1e-9;

// Apply conversions in order, each checked against the state left by the
// previous ones. All-or-nothing: throws InvalidConversionError (with the
// index of the failing step) and returns nothing partial.
Distribution simulate_improvement(const Distribution& dist, const std::vector<Conversion>& ops);

// Add future credits. Throws InvalidAdditionError for a P grade or a
// non-positive amount.
Distribution simulate_future(const Distribution& dist, const std::vector<Addition>& ops);
