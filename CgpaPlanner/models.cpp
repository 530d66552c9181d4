#include "models.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <cstdio>

/*
-------------------------------------------------------------------------------
 models.cpp — Grade table and small value helpers
-------------------------------------------------------------------------------
The grade table is a function-local static: it is built on first use and never
changes afterwards. Grades are indexed by their enum order, so S..F map onto
points_[0..6] and P has no slot.
-------------------------------------------------------------------------------
*/

const GradeScale& GradeScale::standard() {
    static const GradeScale scale;
    return scale;
}

GradeScale::GradeScale()
    : points_{ 10, 9, 8, 7, 6, 5, 0 },
      gradeable_{ Grade::S, Grade::A, Grade::B, Grade::C, Grade::D, Grade::E, Grade::F } {}

std::optional<int> GradeScale::point(Grade g) const {
    if (g == Grade::P) return std::nullopt;
    return points_[static_cast<std::size_t>(g)];
}

char GradeScale::symbol(Grade g) const {
    static const char symbols[] = { 'S', 'A', 'B', 'C', 'D', 'E', 'F', 'P' };
    return symbols[static_cast<std::size_t>(g)];
}

std::optional<Grade> try_parse_grade(const std::string& text) {
    const std::string t = trim(text);
    if (t.size() != 1) return std::nullopt;
    switch (t[0]) {
    case 'S': return Grade::S;
    case 'A': return Grade::A;
    case 'B': return Grade::B;
    case 'C': return Grade::C;
    case 'D': return Grade::D;
    case 'E': return Grade::E;
    case 'F': return Grade::F;
    case 'P': return Grade::P;
    default:  return std::nullopt;
    }
}

Grade parse_grade(const std::string& text) {
    auto g = try_parse_grade(text);
    if (!g) throw InvalidGradeError("Invalid grade: '" + trim(text) + "' (expected one of S A B C D E F P)");
    return *g;
}

std::string grade_symbol(Grade g) {
    return std::string(1, GradeScale::standard().symbol(g));
}

// Howard Hinnant's days_from_civil.
long long Date::to_days() const {
    const long long y = month <= 2 ? year - 1 : year;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = (month + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

bool operator!=(const Date& a, const Date& b) { return !(a == b); }

bool operator<(const Date& a, const Date& b) {
    if (a.year != b.year) return a.year < b.year;
    if (a.month != b.month) return a.month < b.month;
    return a.day < b.day;
}

double total_credits(const Distribution& dist) {
    double total = 0.0;
    for (const auto& kv : dist) total += kv.second;
    return total;
}
