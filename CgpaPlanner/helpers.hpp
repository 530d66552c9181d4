#pragma once
#include <string>
#include <utility>
#include <vector>
#include "services.hpp"   // brings in GradeLedger, Distribution, Conversion, Addition
#include "planner.hpp"

/*
-------------------------------------------------------------------------------
 helpers.hpp — Console session state and plain-text views
-------------------------------------------------------------------------------
These functions belong to the interactive controller, not to the core. They
print to std::cout and never change core values.

Naming convention:
  - show_*   -> print a view of a value.
  - Session  -> what the controller remembers between menu choices.

Session rules (mirrors the menu flow):
  - `improved` starts as the ledger distribution and is replaced only when an
    improvement chain is finalized.
  - Future courses are always simulated on top of `improved`.
-------------------------------------------------------------------------------
*/

struct Session {
    explicit Session(GradeLedger l)
        : ledger(std::move(l)), improved(ledger.distribution()), future(ledger.distribution()) {}

    GradeLedger ledger;
    Distribution improved;
    Distribution future;
    std::vector<Conversion> improvement_chain;
    std::vector<Addition> future_chain;
};

// Two decimals, for CGPA and averages.
std::string fmt2(double v);

// Compact credits: "4", "2.5".
std::string fmt_credits(double v);

// A bar of '#' scaled to `width` at `max_value`.
std::string bar(double value, double max_value, int width = 30);

// ASCII line graph of `data`: `height` rows of `width` characters, '*' per
// point, top row = maximum. Points are spread evenly across the width.
std::vector<std::string> line_graph(const std::vector<double>& data, int height = 10, int width = 50);

// ==========================
// Views
// ==========================

/// Academic summary: course count, CGPA, distribution table, courses by grade.
void show_summary(const GradeLedger& ledger);

/// Distribution as a bar chart (S..F, plus P when present).
void show_distribution(const Distribution& dist, const std::string& title);

/// Cumulative CGPA over time: a bar per step, then a line graph.
void show_history(const std::vector<HistoryPoint>& history);

void show_conversions(const std::vector<Conversion>& chain);
void show_additions(const std::vector<Addition>& chain);

/// Course, credits, predicted grade and grade points per bucket, then the
/// projected CGPA.
void show_predicted(const std::vector<Bucket>& buckets, const std::vector<Grade>& grades, double projected);

/// Required average and, when present, the table of valid assignments.
void show_plan(const TargetPlan& plan, const std::vector<Bucket>& buckets, double target);
