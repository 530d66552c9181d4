#include "helpers.hpp"
#include <iostream>
#include <iomanip>
#include <algorithm>
#include <sstream>

/*
-------------------------------------------------------------------------------
 helpers.cpp — Plain-text views for the console
-------------------------------------------------------------------------------
Rounding happens only here: the core hands over full-precision values and each
view formats them (two decimals for CGPA, compact form for credits).

Layout notes
  - Tables are padded with std::setw; widths fit the 53-column menu banner.
  - Bars use '#' so the output stays plain ASCII.
-------------------------------------------------------------------------------
*/

std::string fmt2(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << v;
    return os.str();
}

std::string fmt_credits(double v) {
    std::ostringstream os;
    os << v; // default formatting drops trailing zeros
    return os.str();
}

std::string bar(double value, double max_value, int width) {
    if (max_value <= 0.0 || value <= 0.0) return "";
    const int n = static_cast<int>((value / max_value) * width);
    return std::string(static_cast<std::size_t>(std::max(n, 0)), '#');
}

std::vector<std::string> line_graph(const std::vector<double>& data, int height, int width) {
    if (data.empty() || height < 1 || width < 1) return {};
    const auto mm = std::minmax_element(data.begin(), data.end());
    const double lo = *mm.first, hi = *mm.second;
    const double range = hi > lo ? hi - lo : 1.0;

    std::vector<std::string> grid(static_cast<std::size_t>(height), std::string(static_cast<std::size_t>(width), ' '));
    const std::size_t n = data.size();
    for (std::size_t i = 0; i < n; ++i) {
        const int col = n > 1 ? static_cast<int>(static_cast<double>(i) * (width - 1) / static_cast<double>(n - 1)) : 0;
        const int row = static_cast<int>((hi - data[i]) / range * (height - 1));
        grid[static_cast<std::size_t>(row)][static_cast<std::size_t>(col)] = '*';
    }
    return grid;
}

static const Grade kDisplayOrder[] = { Grade::S, Grade::A, Grade::B, Grade::C, Grade::D, Grade::E, Grade::F, Grade::P };

// Print the academic summary shown right after loading.
void show_summary(const GradeLedger& ledger) {
    std::cout << "--- ********************** ---\n";
    std::cout << "       Academic Summary       \n";
    std::cout << "--- ********************** ---\n";
    std::cout << "Total Courses: " << ledger.records().size() << "\n";
    std::cout << "Current CGPA:  " << fmt2(ledger.cgpa()) << "\n\n";

    const Distribution& dist = ledger.distribution();
    const double total = total_credits(dist);
    std::cout << std::left << std::setw(8) << "Grade" << std::right << std::setw(10) << "Credits"
        << std::setw(12) << "Percentage" << "\n";
    for (Grade g : kDisplayOrder) {
        auto it = dist.find(g);
        const double credits = it == dist.end() ? 0.0 : it->second;
        if (g == Grade::P && credits == 0.0) continue;
        const double pct = total > 0.0 ? credits / total * 100.0 : 0.0;
        std::ostringstream p;
        p << std::fixed << std::setprecision(1) << pct << "%";
        std::cout << std::left << std::setw(8) << grade_symbol(g) << std::right << std::setw(10)
            << fmt_credits(credits) << std::setw(12) << p.str() << "\n";
    }

    for (Grade g : kDisplayOrder) {
        bool header = false;
        for (const auto& r : ledger.records()) {
            if (r.grade != g) continue;
            if (!header) { std::cout << "\n" << grade_symbol(g) << " Grade Courses:\n"; header = true; }
            std::cout << "  " << std::left << std::setw(12) << r.course_code << r.title
                << " (" << r.credits << " credits)\n";
        }
    }
    std::cout << std::right;
}

// Bar chart of one distribution.
void show_distribution(const Distribution& dist, const std::string& title) {
    if (dist.empty()) { std::cout << "No data to visualize.\n"; return; }
    double max_credits = 0.0;
    for (const auto& kv : dist) max_credits = std::max(max_credits, kv.second);

    std::cout << "--- " << title << " ---\n";
    for (Grade g : kDisplayOrder) {
        auto it = dist.find(g);
        const double credits = it == dist.end() ? 0.0 : it->second;
        if (g == Grade::P && credits == 0.0) continue;
        std::cout << "  " << grade_symbol(g) << " | " << std::left << std::setw(30) << bar(credits, max_credits)
            << std::right << " " << fmt_credits(credits) << "\n";
    }
    std::cout << "  CGPA: " << fmt2(cgpa_from_distribution(dist)) << "\n";
}

// Cumulative CGPA per dated record. CGPA bars are scaled to the top grade point.
void show_history(const std::vector<HistoryPoint>& history) {
    if (history.empty()) {
        std::cout << "No date column available for grade history.\n";
        return;
    }
    const double top = GradeScale::standard().max_point();
    std::cout << "--- Grade History (Cumulative CGPA) ---\n";
    for (const auto& h : history) {
        std::cout << "  " << h.date.to_string() << "  " << fmt2(h.cgpa) << "  " << bar(h.cgpa, top) << "\n";
    }

    std::vector<double> values;
    values.reserve(history.size());
    for (const auto& h : history) values.push_back(h.cgpa);
    const auto mm = std::minmax_element(values.begin(), values.end());

    std::cout << "\n--- CGPA Progression ---\n";
    const auto rows = line_graph(values);
    for (std::size_t i = 0; i < rows.size(); ++i) {
        std::string label;
        if (i == 0) label = fmt2(*mm.second);
        else if (i + 1 == rows.size()) label = fmt2(*mm.first);
        std::cout << std::setw(6) << label << " |" << rows[i] << "\n";
    }
    std::cout << "       +" << std::string(50, '-') << "\n"
        << "        " << history.front().date.to_string() << " .. " << history.back().date.to_string() << "\n";
}

void show_predicted(const std::vector<Bucket>& buckets, const std::vector<Grade>& grades, double projected) {
    const GradeScale& scale = GradeScale::standard();
    std::cout << "--- Predicted Grades ---\n";
    std::cout << std::left << std::setw(24) << "Course" << std::right << std::setw(9) << "Credits"
        << std::setw(17) << "Predicted Grade" << std::setw(14) << "Grade Points" << "\n";
    for (std::size_t i = 0; i < buckets.size() && i < grades.size(); ++i) {
        const auto p = scale.point(grades[i]);
        std::cout << std::left << std::setw(24) << buckets[i].label << std::right << std::setw(9)
            << fmt_credits(buckets[i].credits) << std::setw(17) << grade_symbol(grades[i])
            << std::setw(14) << (p ? std::to_string(*p) : "-") << "\n";
    }
    std::cout << "Projected overall CGPA: " << fmt2(projected) << "\n";
}

void show_conversions(const std::vector<Conversion>& chain) {
    if (chain.empty()) { std::cout << "No improvement changes added yet.\n"; return; }
    std::cout << std::setw(6) << "Step" << std::setw(6) << "From" << std::setw(6) << "To"
        << std::setw(10) << "Credits" << "\n";
    for (std::size_t i = 0; i < chain.size(); ++i) {
        std::cout << std::setw(6) << (i + 1) << std::setw(6) << grade_symbol(chain[i].from)
            << std::setw(6) << grade_symbol(chain[i].to) << std::setw(10) << fmt_credits(chain[i].credits) << "\n";
    }
}

void show_additions(const std::vector<Addition>& chain) {
    if (chain.empty()) { std::cout << "No future courses added yet.\n"; return; }
    std::cout << std::setw(6) << "Step" << std::setw(8) << "Grade" << std::setw(10) << "Credits" << "\n";
    for (std::size_t i = 0; i < chain.size(); ++i) {
        std::cout << std::setw(6) << (i + 1) << std::setw(8) << grade_symbol(chain[i].grade)
            << std::setw(10) << fmt_credits(chain[i].credits) << "\n";
    }
}

// Required average, then one row per valid assignment (weakest first).
void show_plan(const TargetPlan& plan, const std::vector<Bucket>& buckets, double target) {
    std::cout << "To reach a target CGPA of " << fmt2(target) << ", you need to average at least "
        << fmt2(plan.required_average) << " grade points per credit over "
        << fmt_credits(plan.total_future_credits) << " future credits.\n";

    const int top = GradeScale::standard().max_point();
    if (plan.required_average > top)
        std::cout << "  -> That is above " << top << ", so the target cannot be reached with these credits.\n";
    else if (plan.required_average <= 0.0)
        std::cout << "  -> The target is already secured whatever the grades.\n";

    if (plan.assignments.empty()) {
        std::cout << "No valid grade combination found with the given groups to achieve the target CGPA.\n";
        return;
    }

    std::cout << "\nValid grade combinations (" << plan.assignments.size() << "):\n";
    for (std::size_t i = 0; i < buckets.size(); ++i)
        std::cout << "  G" << (i + 1) << ": " << buckets[i].label << " (" << fmt_credits(buckets[i].credits) << " cr)\n";
    for (std::size_t i = 0; i < buckets.size(); ++i)
        std::cout << std::setw(5) << ("G" + std::to_string(i + 1));
    std::cout << std::setw(12) << "CGPA" << "\n";
    for (const auto& a : plan.assignments) {
        for (Grade g : assignment_grades(a, plan.bucket_count)) std::cout << std::setw(5) << grade_symbol(g);
        std::cout << std::setw(12) << fmt2(a.projected_cgpa) << "\n";
    }
}
