#pragma once
#include <string>
#include <regex>
#include <algorithm>
#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include "text.hpp"   // trim, to_upper

/*
-------------------------------------------------------------------------------
 validation.hpp - Input validation and console prompt helpers (ASCII only)
-------------------------------------------------------------------------------
What this file provides:
  - Validators: grade symbol, plannable grade, short label, file path.
  - parse_count: strict whole-number parsing for command-line values.
  - Prompt helpers for the interactive console:
      * prompt_until_valid_or_back    -> text until validator passes, Back/Exit
      * prompt_number_or_back         -> numeric with range and Back/Exit
      * prompt_int_or_back            -> whole number with range and Back/Exit
      * confirm_or_back               -> yes/no confirmation (Back on no)

Conventions:
  - Special inputs:
      Back: "0", "b", "B"
      Exit: "x", "X", "q", "Q"
  - End of input (Ctrl-D, closed pipe) is treated as Exit.
  - All characters are plain ASCII (no Unicode dashes).
-------------------------------------------------------------------------------
*/

// One of S A B C D E F P.
inline bool is_valid_grade_symbol(const std::string& x) {
    static const std::regex re("^[SABCDEFP]$");
    return std::regex_match(x, re);
}

// Grades that carry points (everything but P).
inline bool is_plannable_grade(const std::string& x) {
    static const std::regex re("^[SABCDEF]$");
    return std::regex_match(x, re);
}

// non-empty, max 60
inline bool is_non_empty_short(const std::string& x) {
    return !trim(x).empty() && x.size() <= 60;
}

// Something that looks like a path to a database file.
inline bool is_db_path(const std::string& x) {
    return !trim(x).empty() && x.size() <= 4096;
}

// Whole number in [lo, hi] made of digits only (no sign, no spaces).
inline std::optional<std::size_t> parse_count(const std::string& x, std::size_t lo, std::size_t hi) {
    static const std::regex re("^[0-9]{1,9}$");
    if (!std::regex_match(x, re)) return std::nullopt;
    const std::size_t n = static_cast<std::size_t>(std::stoul(x));
    if (n < lo || n > hi) return std::nullopt;
    return n;
}

// ---- back / exit aware prompts ----
enum class InputCtl { Ok, Back, Exit };

namespace detail {

// Read one trimmed line. False on end of input.
inline bool read_line(std::string& v) {
    if (!std::getline(std::cin >> std::ws, v)) return false;
    v = trim(v);
    return true;
}

inline bool is_back(const std::string& v) { return v == "0" || v == "b" || v == "B"; }
inline bool is_exit(const std::string& v) { return v == "x" || v == "X" || v == "q" || v == "Q"; }

} // namespace detail

// String prompt that accepts Back/Exit keywords.
// Back: "0", "b", "B"   Exit: "x","X","q","Q"
// When upper is set the answer is upper-cased before validation (grades).
inline InputCtl prompt_until_valid_or_back(
    const std::string& label,
    std::string& out,
    bool (*validator)(const std::string&),
    const std::string& error_msg,
    bool upper = false)
{
    for (;;) {
        std::string v;
        std::cout << label << " (0=Back, x=Exit): ";
        if (!detail::read_line(v)) return InputCtl::Exit;
        if (detail::is_back(v)) return InputCtl::Back;
        if (detail::is_exit(v)) return InputCtl::Exit;
        if (upper) v = to_upper(v);
        if (validator(v)) { out = v; return InputCtl::Ok; }
        std::cout << "  -> " << error_msg << "\n";
    }
}

// Number prompt with range + Back/Exit
inline InputCtl prompt_number_or_back(
    const std::string& label,
    double& out,
    double lo, double hi)
{
    for (;;) {
        std::string v;
        std::cout << label << " [" << lo << "-" << hi << "] (0=Back, x=Exit): ";
        if (!detail::read_line(v)) return InputCtl::Exit;
        if (detail::is_back(v)) return InputCtl::Back;
        if (detail::is_exit(v)) return InputCtl::Exit;
        try {
            std::size_t used = 0;
            double d = std::stod(v, &used);
            if (used != v.size()) { std::cout << "  -> Please enter a number.\n"; continue; }
            if (d < lo || d > hi) { std::cout << "  -> Must be between " << lo << " and " << hi << ".\n"; continue; }
            out = d; return InputCtl::Ok;
        }
        catch (const std::logic_error&) {
            // std::invalid_argument / std::out_of_range from stod
            std::cout << "  -> Please enter a number.\n";
        }
    }
}

// Whole-number prompt with range + Back/Exit
inline InputCtl prompt_int_or_back(
    const std::string& label,
    int& out,
    int lo, int hi)
{
    for (;;) {
        double d = 0;
        auto r = prompt_number_or_back(label, d, lo, hi);
        if (r != InputCtl::Ok) return r;
        if (d != static_cast<double>(static_cast<int>(d))) {
            std::cout << "  -> Please enter a whole number.\n";
            continue;
        }
        out = static_cast<int>(d);
        return InputCtl::Ok;
    }
}

// Yes/No confirmation. Empty or "n" is treated as cancel (Back).
inline InputCtl confirm_or_back(const std::string& msg) {
    for (;;) {
        std::string v;
        std::cout << msg << " [y/N] (0=Back, x=Exit): ";
        if (!std::getline(std::cin, v)) return InputCtl::Exit;
        v = trim(v);
        if (v.empty() || v == "n" || v == "N") return InputCtl::Back; // treat as cancel
        if (detail::is_back(v)) return InputCtl::Back;
        if (detail::is_exit(v)) return InputCtl::Exit;
        if (v == "y" || v == "Y") return InputCtl::Ok;
        std::cout << "  -> Please enter y or n.\n";
    }
}
