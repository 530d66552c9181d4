/*
-------------------------------------------------------------------------------
 normalizer.cpp — Transcript cleaning pipeline
-------------------------------------------------------------------------------
Implements the stages declared in normalizer.hpp. Every stage takes values and
returns values; nothing mutates the caller's table.

Notes
  - Cells are compared after clean_cell, so "Course\nCode" in a wrapped PDF
    header still matches "Course Code".
  - Credits like "4.0" are accepted and truncated, the way the transcript
    export prints them. Zero or negative credits drop the row.
  - The grade filter runs after deduplication: a most-recent row
    with an unknown grade (e.g. withdrawn) hides the older attempt too.
-------------------------------------------------------------------------------
*/

#include "normalizer.hpp"
#include "errors.hpp"
#include "text.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <regex>
#include <unordered_set>

// ==========================
// Cell helpers
// ==========================

std::string clean_cell(const std::string& cell) {
    std::string out;
    out.reserve(cell.size());
    bool pending_space = false;
    for (std::size_t i = 0; i < cell.size(); ++i) {
        const unsigned char ch = static_cast<unsigned char>(cell[i]);

        // UTF-8 no-break space (C2 A0) counts as whitespace.
        if (ch == 0xC2 && i + 1 < cell.size() && static_cast<unsigned char>(cell[i + 1]) == 0xA0) {
            pending_space = true; ++i; continue;
        }
        // Byte order mark and zero-width space are dropped.
        if (ch == 0xEF && i + 2 < cell.size() &&
            static_cast<unsigned char>(cell[i + 1]) == 0xBB && static_cast<unsigned char>(cell[i + 2]) == 0xBF) {
            i += 2; continue;
        }
        if (ch == 0xE2 && i + 2 < cell.size() &&
            static_cast<unsigned char>(cell[i + 1]) == 0x80 && static_cast<unsigned char>(cell[i + 2]) == 0x8B) {
            i += 2; continue;
        }
        if (std::isspace(ch)) { pending_space = true; continue; }

        if (pending_space && !out.empty()) out.push_back(' ');
        pending_space = false;
        out.push_back(static_cast<char>(ch));
    }
    return out;
}

std::string normalize_title(const std::string& title) {
    std::string key;
    key.reserve(title.size());
    for (unsigned char ch : title) {
        const unsigned char lower = static_cast<unsigned char>(std::tolower(ch));
        if ((lower >= 'a' && lower <= 'z') || (lower >= '0' && lower <= '9'))
            key.push_back(static_cast<char>(lower));
    }
    return key;
}

// ==========================
// Header and columns
// ==========================

std::size_t find_header_row(const RawTable& rows) {
    for (std::size_t i = 0; i < rows.size(); ++i) {
        bool has_code = false, has_grade = false;
        for (const auto& cell : rows[i]) {
            const std::string c = clean_cell(cell);
            if (c == kColCode) has_code = true;
            else if (c == kColGrade) has_grade = true;
        }
        if (has_code && has_grade) return i;
    }
    throw HeaderNotFoundError("Headers not found: no row contains both '" + std::string(kColCode) +
        "' and '" + std::string(kColGrade) + "'");
}

ColumnMap map_columns(const RawRow& header) {
    std::optional<std::size_t> code, grade, date, declared;
    ColumnMap cols;
    for (std::size_t i = 0; i < header.size(); ++i) {
        const std::string label = clean_cell(header[i]);
        // First occurrence of a label wins.
        if (label == kColCode && !code) code = i;
        else if (label == kColTitle && !cols.title) cols.title = i;
        else if (label == kColCredits && !cols.credits) cols.credits = i;
        else if (label == kColGrade && !grade) grade = i;
        else if (label == kColDate && !date) date = i;
        else if (label == kColDeclared && !declared) declared = i;
    }
    if (!code || !grade)
        throw HeaderNotFoundError("Header row lacks '" + std::string(kColCode) + "' or '" + std::string(kColGrade) + "'");

    cols.code = *code;
    cols.grade = *grade;
    cols.date = date ? date : declared;
    return cols;
}

// ==========================
// Row extraction and coercion
// ==========================

std::optional<RowCells> extract_row(const RawRow& row, const ColumnMap& cols) {
    auto cell_at = [&](std::optional<std::size_t> idx) -> std::optional<std::string> {
        if (!idx || *idx >= row.size()) return std::nullopt;
        std::string v = clean_cell(row[*idx]);
        if (v.empty()) return std::nullopt;
        return v;
    };

    auto code = cell_at(cols.code);
    auto title = cell_at(cols.title);
    auto credits = cell_at(cols.credits);
    auto grade = cell_at(cols.grade);
    if (!code || !title || !credits || !grade) return std::nullopt;

    RowCells out{ *code, *title, *credits, *grade, std::string() };
    if (cols.date) {
        auto date = cell_at(cols.date);
        if (!date) return std::nullopt;
        out.date = *date;
    }
    return out;
}

std::optional<int> parse_credits(const std::string& cell) {
    const std::string t = trim(cell);
    if (t.empty()) return std::nullopt;

    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || errno == ERANGE || !std::isfinite(v)) return std::nullopt;
    // Reject hex and exponent forms strtod would take; transcripts print plain decimals.
    for (char ch : t) {
        if (!(std::isdigit(static_cast<unsigned char>(ch)) || ch == '.' || ch == '+' || ch == '-'))
            return std::nullopt;
    }

    const double whole = std::trunc(v);
    if (whole <= 0.0 || whole > static_cast<double>(std::numeric_limits<int>::max())) return std::nullopt;
    return static_cast<int>(whole);
}

namespace {

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

std::optional<Date> make_date(int y, int m, int d) {
    static const int days_in_month[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (y < 1900 || y > 2999 || m < 1 || m > 12 || d < 1) return std::nullopt;
    int limit = days_in_month[m - 1];
    if (m == 2 && is_leap(y)) limit = 29;
    if (d > limit) return std::nullopt;
    return Date{ y, m, d };
}

// "jan", "january", "sept" -> 1..12; 0 when unknown.
int month_from_name(std::string name) {
    static const char* full[] = { "january", "february", "march", "april", "may", "june",
        "july", "august", "september", "october", "november", "december" };
    for (auto& ch : name) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    if (name == "sept") return 9;
    for (int i = 0; i < 12; ++i) {
        const std::string f = full[i];
        if (name == f || name == f.substr(0, 3)) return i + 1;
    }
    return 0;
}

} // namespace

std::optional<Date> parse_date(const std::string& cell) {
    // Anything after the date (time of day, timezone) is ignored.
    static const std::regex iso("^(\\d{4})[-/.](\\d{1,2})[-/.](\\d{1,2})(?:[ T].*)?$");
    static const std::regex day_first("^(\\d{1,2})[-/.](\\d{1,2})[-/.](\\d{4})(?: .*)?$");
    static const std::regex named("^(\\d{1,2})[- ]([A-Za-z]+)[- ,]+(\\d{4})(?: .*)?$");

    const std::string t = trim(cell);
    std::smatch m;
    try {
        if (std::regex_match(t, m, iso))
            return make_date(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]));
        if (std::regex_match(t, m, day_first))
            return make_date(std::stoi(m[3]), std::stoi(m[2]), std::stoi(m[1]));
        if (std::regex_match(t, m, named)) {
            const int month = month_from_name(m[2]);
            if (month == 0) return std::nullopt;
            return make_date(std::stoi(m[3]), month, std::stoi(m[1]));
        }
    }
    catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return std::nullopt;
}

// ==========================
// Deduplication and grade filter
// ==========================

std::vector<ParsedRow> deduplicate(std::vector<ParsedRow> rows, std::size_t* removed) {
    // Most recent first; equal keys keep source order.
    std::sort(rows.begin(), rows.end(), [](const ParsedRow& a, const ParsedRow& b) {
        if (a.sort_key != b.sort_key) return a.sort_key > b.sort_key;
        return a.source_index < b.source_index;
        });

    std::vector<ParsedRow> kept;
    std::unordered_set<std::string> seen;
    for (auto& r : rows) {
        if (seen.insert(normalize_title(r.title)).second)
            kept.push_back(std::move(r));
    }
    if (removed) *removed = rows.size() - kept.size();
    return kept;
}

std::vector<CourseRecord> filter_grades(const std::vector<ParsedRow>& rows, std::size_t* dropped) {
    std::vector<CourseRecord> out;
    out.reserve(rows.size());
    for (const auto& r : rows) {
        auto g = try_parse_grade(r.grade);
        if (!g) continue;
        out.push_back(CourseRecord{ r.code, r.title, r.credits, *g, r.date });
    }
    if (dropped) *dropped = rows.size() - out.size();
    return out;
}

// ==========================
// Pipeline
// ==========================

std::vector<CourseRecord> normalize_transcript(const RawTable& rows, NormalizeStats* stats) {
    NormalizeStats local;
    NormalizeStats& st = stats ? *stats : local;
    st = NormalizeStats{};

    const std::size_t header = find_header_row(rows);
    const ColumnMap cols = map_columns(rows[header]);
    st.has_date_column = cols.date.has_value();

    std::vector<ParsedRow> parsed;
    for (std::size_t i = header + 1; i < rows.size(); ++i) {
        ++st.rows_scanned;

        auto cells = extract_row(rows[i], cols);
        if (!cells) { ++st.missing_fields; continue; }

        auto credits = parse_credits(cells->credits);
        if (!credits) { ++st.bad_credits; continue; }

        ParsedRow r;
        r.source_index = i;
        r.code = cells->code;
        r.title = cells->title;
        r.credits = *credits;
        r.grade = cells->grade;

        if (cols.date) {
            r.date = parse_date(cells->date);
            if (!r.date) { ++st.bad_dates; continue; }
            r.sort_key = r.date->to_days();
        }
        else {
            // Synthetic dates: earlier rows are "more recent".
            r.sort_key = -static_cast<long long>(i);
        }
        parsed.push_back(std::move(r));
    }

    std::vector<ParsedRow> unique = deduplicate(std::move(parsed), &st.duplicates);
    return filter_grades(unique, &st.bad_grades);
}
