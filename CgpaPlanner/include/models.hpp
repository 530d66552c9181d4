#pragma once
#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

/*
-------------------------------------------------------------------------------
 models.hpp — Core domain types
-------------------------------------------------------------------------------
Defines the value types shared by every part of the planner:
  - Grade / GradeScale: the fixed letter-grade table (S..F plus P)
  - Date: calendar date used only to order duplicate transcript rows
  - CourseRecord: one normalized transcript line
  - Distribution: total credits earned at each grade (sparse)

All types are plain values. Nothing here holds session state; the grade table
is built once and handed out by const reference.
-------------------------------------------------------------------------------
*/

// Letter grades as printed on the transcript. P (pass) carries no points.
enum class Grade { S, A, B, C, D, E, F, P };

// Immutable grade -> point table. Use GradeScale::standard().
class GradeScale {
public:
    static const GradeScale& standard();

    // Point value, empty for P.
    std::optional<int> point(Grade g) const;

    // True for S..F (the grades that count toward CGPA).
    bool is_gradeable(Grade g) const { return point(g).has_value(); }

    char symbol(Grade g) const;

    // Highest point value on the scale (S).
    int max_point() const { return points_[0]; }

    // S, A, B, C, D, E, F (best first).
    const std::array<Grade, 7>& gradeable() const { return gradeable_; }

private:
    GradeScale();

    std::array<int, 7> points_{};
    std::array<Grade, 7> gradeable_{};
};

// Parse a grade symbol ("A", " S ", "P"). Throws InvalidGradeError.
Grade parse_grade(const std::string& text);

// Same as parse_grade but returns empty instead of throwing.
std::optional<Grade> try_parse_grade(const std::string& text);

// Single-character string for display ("A").
std::string grade_symbol(Grade g);

// A calendar date. Compared field by field.
struct Date {
    int year{ 0 };
    int month{ 0 };  // 1..12
    int day{ 0 };    // 1..31

    // Days since 1970-01-01 (proleptic Gregorian).
    long long to_days() const;

    std::string to_string() const; // YYYY-MM-DD
};

bool operator==(const Date& a, const Date& b);
bool operator!=(const Date& a, const Date& b);
bool operator<(const Date& a, const Date& b);

// One course as it survives normalization.
struct CourseRecord {
    std::string course_code;
    std::string title;                  // trimmed display title
    int credits{ 0 };                   // always > 0
    Grade grade{ Grade::F };
    std::optional<Date> recorded_date;  // only when the source had a date column
};

// Grade -> total credits. Grades with zero credits are not stored.
using Distribution = std::map<Grade, double>;

// Sum of all credits in a distribution (P included).
double total_credits(const Distribution& dist);

// A raw row of text cells as delivered by the extractor.
using RawRow = std::vector<std::string>;
using RawTable = std::vector<RawRow>;
