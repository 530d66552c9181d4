#include "services.hpp"
#include <algorithm>
#include <utility>

/*
-------------------------------------------------------------------------------
 ledger.cpp — CGPA and distribution arithmetic
-------------------------------------------------------------------------------
All record-level sums are exact (integer credits times integer points). The
distribution-level CGPA works on doubles because simulated distributions may
hold fractional credits.
-------------------------------------------------------------------------------
*/

GradeTotals gradeable_totals(const std::vector<CourseRecord>& records) {
    const GradeScale& scale = GradeScale::standard();
    GradeTotals t;
    for (const auto& r : records) {
        auto p = scale.point(r.grade);
        if (!p) continue; // P
        t.credits += r.credits;
        t.points += static_cast<long long>(r.credits) * *p;
    }
    return t;
}

double calculate_cgpa(const std::vector<CourseRecord>& records) {
    const GradeTotals t = gradeable_totals(records);
    if (t.credits == 0) return 0.0;
    return static_cast<double>(t.points) / static_cast<double>(t.credits);
}

Distribution grade_distribution(const std::vector<CourseRecord>& records) {
    Distribution dist;
    for (const auto& r : records)
        dist[r.grade] += r.credits;
    // credits > 0 for every record, so no entry can be zero here.
    return dist;
}

double cgpa_from_distribution(const Distribution& dist) {
    const GradeScale& scale = GradeScale::standard();
    double credits = 0.0, points = 0.0;
    for (const auto& kv : dist) {
        auto p = scale.point(kv.first);
        if (!p) continue;
        credits += kv.second;
        points += kv.second * *p;
    }
    return credits > 0.0 ? points / credits : 0.0;
}

std::vector<HistoryPoint> cgpa_history(const std::vector<CourseRecord>& records) {
    const GradeScale& scale = GradeScale::standard();

    std::vector<const CourseRecord*> dated;
    for (const auto& r : records)
        if (r.recorded_date && scale.is_gradeable(r.grade)) dated.push_back(&r);

    std::stable_sort(dated.begin(), dated.end(), [](const CourseRecord* a, const CourseRecord* b) {
        return *a->recorded_date < *b->recorded_date;
        });

    std::vector<HistoryPoint> out;
    out.reserve(dated.size());
    long long credits = 0, points = 0;
    for (const CourseRecord* r : dated) {
        credits += r->credits;
        points += static_cast<long long>(r->credits) * *scale.point(r->grade);
        out.push_back(HistoryPoint{ *r->recorded_date, static_cast<double>(points) / static_cast<double>(credits) });
    }
    return out;
}

GradeLedger::GradeLedger(std::vector<CourseRecord> records)
    : records_(std::move(records)),
      distribution_(grade_distribution(records_)),
      totals_(gradeable_totals(records_)),
      cgpa_(calculate_cgpa(records_)) {}
