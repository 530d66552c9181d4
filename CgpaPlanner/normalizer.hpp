#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 normalizer.hpp — Raw transcript rows -> CourseRecords
-------------------------------------------------------------------------------
The extractor hands us a table of text cells: page banners, a header row
somewhere, then course rows, sometimes repeated across pages. normalize_transcript
runs the table through a fixed pipeline:

    find_header_row -> map_columns -> extract_row -> parse_credits/parse_date
                    -> deduplicate -> filter_grades

Each stage is a free function so it can be tested on its own. Only a missing
header is fatal (HeaderNotFoundError). Rows that fail a stage are dropped and
counted in NormalizeStats.

Deduplication key is normalize_title(title). Within a key the latest date wins;
equal dates go to the row that came first. Without a date column rows get
synthetic dates that decrease with row order, so the first occurrence wins.
-------------------------------------------------------------------------------
*/

// Column labels recognized in the header row.
inline constexpr const char* kColCode = "Course Code";
inline constexpr const char* kColTitle = "Course Title";
inline constexpr const char* kColCredits = "Credits";
inline constexpr const char* kColGrade = "Grade";
inline constexpr const char* kColDate = "Date";
inline constexpr const char* kColDeclared = "Result Declared On";

// Positions of the allow-listed columns inside a row.
struct ColumnMap {
    std::size_t code{ 0 };
    std::optional<std::size_t> title;
    std::optional<std::size_t> credits;
    std::size_t grade{ 0 };
    std::optional<std::size_t> date;
};

// Cells of one row after column selection, before validation.
struct RowCells {
    std::string code;
    std::string title;
    std::string credits;
    std::string grade;
    std::string date;   // empty when the table has no date column
};

// A row that passed coercion. sort_key orders rows for deduplication
// (larger = more recent).
struct ParsedRow {
    std::size_t source_index{ 0 };
    std::string code;
    std::string title;
    int credits{ 0 };
    std::string grade;
    std::optional<Date> date;
    long long sort_key{ 0 };
};

// What the pipeline dropped and why.
struct NormalizeStats {
    std::size_t rows_scanned{ 0 };
    std::size_t missing_fields{ 0 };
    std::size_t bad_credits{ 0 };
    std::size_t bad_dates{ 0 };
    std::size_t duplicates{ 0 };
    std::size_t bad_grades{ 0 };
    bool has_date_column{ false };
};

// Strip line breaks, tabs and no-break spaces; collapse and trim whitespace.
std::string clean_cell(const std::string& cell);

// Lowercase and keep only [a-z0-9]. Used only as the deduplication key.
std::string normalize_title(const std::string& title);

// Index of the first row holding both "Course Code" and "Grade".
// Throws HeaderNotFoundError.
std::size_t find_header_row(const RawTable& rows);

// Map header labels to positions. Unknown labels are ignored.
ColumnMap map_columns(const RawRow& header);

// Pick the mapped cells out of a row; empty when a required cell is missing.
std::optional<RowCells> extract_row(const RawRow& row, const ColumnMap& cols);

// Whole-cell decimal number truncated to int; empty when unparsable or <= 0.
std::optional<int> parse_credits(const std::string& cell);

// ISO, day-first numeric ("10-05-2022") or named month ("15-Jan-2023");
// empty when unparsable or not a real calendar date.
std::optional<Date> parse_date(const std::string& cell);

// Keep one row per normalized title, ordered most recent first.
std::vector<ParsedRow> deduplicate(std::vector<ParsedRow> rows, std::size_t* removed = nullptr);

// Convert rows with a recognized grade into CourseRecords.
std::vector<CourseRecord> filter_grades(const std::vector<ParsedRow>& rows, std::size_t* dropped = nullptr);

// Full pipeline. Throws HeaderNotFoundError; an empty result is not an error.
std::vector<CourseRecord> normalize_transcript(const RawTable& rows, NormalizeStats* stats = nullptr);
