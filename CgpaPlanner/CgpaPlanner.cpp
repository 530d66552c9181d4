/*
-------------------------------------------------------------------------------
 CgpaPlanner.cpp
-------------------------------------------------------------------------------
 Purpose:
   Console front end for the CGPA planner. Loads the transcript tables that the
   PDF extractor exported to SQLite, normalizes them into course records, and
   drives a menu for what-if simulations and target planning.

 Data flow (very important):
   - Input: SQLite export of the extracted tables (db.hpp, read-only)
   - Core: normalize_transcript -> GradeLedger -> simulators / planner
   - Session state (chains, simulated distributions) lives in Session
     (helpers.hpp). The core functions never see it.

 User input model:
   - Prompts come from validation.hpp and return InputCtl:
       * Back  -> cancel current action and return to the previous menu
       * Exit  -> leave the program (we set running = false)
   - Core errors (CgpaError) are printed as "Error: ..." and the user is asked
     again; nothing partial is kept.

 Command line:
   cgpa_planner [--db transcript.db] [--table name] [--max-buckets N]
   Without --db the path is asked for interactively.

 Build:
   - Requires SQLite3 dev headers/libs and a C++17 (or later) compiler.
-------------------------------------------------------------------------------
*/

#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <utility>
#include "services.hpp"     // GradeLedger, simulators
#include "normalizer.hpp"   // normalize_transcript
#include "planner.hpp"      // plan_target, project_cgpa
#include "errors.hpp"       // CgpaError and friends
#include "db.hpp"           // SQLite reader for extracted tables
#include "validation.hpp"   // prompt helpers and InputCtl enum
#include "helpers.hpp"      // Session, show_* views

// Settings taken from the command line.
struct RunConfig {
    std::string db_path;
    std::string table;          // empty = all tables
    std::size_t max_buckets{ PlannerOptions().max_buckets };
};

// Prints the banner once at startup.
static void showWelcome() {
    std::cout << "=====================================================\n";
    std::cout << "                        WELCOME                      \n";
    std::cout << "=====================================================\n";
    std::cout << "              CGPA Analyzer and Planner              \n";
    std::cout << "-----------------------------------------------------\n";
    std::cout << "   Simulate grade changes, plan for a target CGPA    \n";
    std::cout << "=====================================================\n\n";
}

static void showUsage() {
    std::cout << "Usage: cgpa_planner [--db <transcript.db>] [--table <name>] [--max-buckets N]\n"
        << "  --db           SQLite file with the extracted transcript tables\n"
        << "  --table        read only this table (default: all tables in order)\n"
        << "  --max-buckets  largest planning group count before asking to confirm\n"
        << "                 (1-" << kMaxPlanBuckets << ", default 8)\n";
}

// Load rows from the database and normalize them. Returns false when nothing
// usable was loaded; the reason has already been printed.
static bool load_ledger(const RunConfig& cfg, std::vector<CourseRecord>& records) {
    sqlite3* db = nullptr;
    if (!db_open_readonly(db, cfg.db_path)) {
        std::cout << "Could not open transcript database.\n";
        return false;
    }

    RawTable rows;
    const bool loaded = cfg.table.empty() ? db_load_transcript(db, rows) : db_load_table(db, cfg.table, rows);
    db_close(db);
    if (!loaded) {
        std::cout << "Could not read transcript tables.\n";
        return false;
    }

    NormalizeStats stats;
    try {
        records = normalize_transcript(rows, &stats);
    }
    catch (const HeaderNotFoundError& e) {
        std::cout << "Data cleaning error: " << e.what() << "\n";
        return false;
    }

    std::cout << "Read " << stats.rows_scanned << " rows: " << records.size() << " courses kept";
    const std::size_t dropped = stats.missing_fields + stats.bad_credits + stats.bad_dates + stats.bad_grades;
    if (dropped > 0 || stats.duplicates > 0)
        std::cout << " (" << stats.duplicates << " repeated attempts merged, " << dropped << " rows skipped)";
    std::cout << ".\n";

    if (records.empty()) {
        std::cout << "No graded courses were found in the transcript.\n";
        return false;
    }
    return true;
}

// Ask for a grade symbol; plannable_only rejects P.
static InputCtl prompt_grade(const std::string& label, Grade& out, bool plannable_only) {
    std::string s;
    auto r = prompt_until_valid_or_back(label, s,
        plannable_only ? is_plannable_grade : is_valid_grade_symbol,
        plannable_only ? "Enter one of S A B C D E F." : "Enter one of S A B C D E F P.", true);
    if (r == InputCtl::Ok) out = parse_grade(s);
    return r;
}

// ---- 1) Grade improvement --------------------------------------------------
// Returns false when the user asked to exit the program.
static bool improvement_menu(Session& s) {
    for (;;) {
        std::cout
            << "-----------------------------------------------------\n"
            << "             GRADE IMPROVEMENT SIMULATOR             \n"
            << "-----------------------------------------------------\n"
            << "  [1] Add a grade improvement   [2] View chain       \n"
            << "  [3] Reset chain               [4] Finalize & return\n"
            << "  [0] Back                                           \n";
        int choice = 0;
        auto r = prompt_int_or_back("  CHOICE", choice, 1, 4);
        if (r == InputCtl::Back) return true;
        if (r == InputCtl::Exit) return false;

        if (choice == 1) {
            Conversion op;
            double credits = 0;
            auto a = prompt_grade("From Grade (e.g. B)", op.from, true);
            if (a == InputCtl::Back) continue;
            if (a == InputCtl::Exit) return false;
            auto b = prompt_grade("To Grade (e.g. S)", op.to, true);
            if (b == InputCtl::Back) continue;
            if (b == InputCtl::Exit) return false;
            auto c = prompt_number_or_back("Credits to convert", credits, 0.5, 1000);
            if (c == InputCtl::Back) continue;
            if (c == InputCtl::Exit) return false;
            op.credits = credits;

            // Re-run the whole chain from the original distribution.
            std::vector<Conversion> trial = s.improvement_chain;
            trial.push_back(op);
            try {
                const Distribution next = simulate_improvement(s.ledger.distribution(), trial);
                s.improvement_chain = trial;
                show_conversions(s.improvement_chain);
                std::cout << "Original CGPA:  " << fmt2(s.ledger.cgpa()) << "\n"
                    << "Projected CGPA: " << fmt2(cgpa_from_distribution(next)) << "\n"
                    << "Grade improvement added.\n";
            }
            catch (const InvalidConversionError& e) {
                std::cout << "Error: " << e.what() << "\n";
            }
        }
        else if (choice == 2) {
            show_conversions(s.improvement_chain);
        }
        else if (choice == 3) {
            s.improvement_chain.clear();
            std::cout << "Improvement chain reset.\n";
        }
        else if (choice == 4) {
            if (s.improvement_chain.empty()) {
                s.improved = s.ledger.distribution();
                std::cout << "No improvement changes applied. Using the original distribution.\n";
                return true;
            }
            // The chain was validated step by step, so this cannot throw.
            s.improved = simulate_improvement(s.ledger.distribution(), s.improvement_chain);
            std::cout << "New projected CGPA after improvements: " << fmt2(cgpa_from_distribution(s.improved)) << "\n";
            return true;
        }
    }
}

// ---- 2) Future courses -----------------------------------------------------
static bool future_menu(Session& s) {
    for (;;) {
        std::cout
            << "-----------------------------------------------------\n"
            << "               FUTURE COURSES SIMULATOR              \n"
            << "-----------------------------------------------------\n"
            << "  [1] Add a future course       [2] View chain       \n"
            << "  [3] Reset chain               [4] Finalize & return\n"
            << "  [0] Back                                           \n";
        int choice = 0;
        auto r = prompt_int_or_back("  CHOICE", choice, 1, 4);
        if (r == InputCtl::Back) return true;
        if (r == InputCtl::Exit) return false;

        if (choice == 1) {
            Addition op;
            double credits = 0;
            auto a = prompt_grade("Grade achieved (e.g. A)", op.grade, true);
            if (a == InputCtl::Back) continue;
            if (a == InputCtl::Exit) return false;
            auto b = prompt_number_or_back("Credits earned", credits, 0.5, 1000);
            if (b == InputCtl::Back) continue;
            if (b == InputCtl::Exit) return false;
            op.credits = credits;

            std::vector<Addition> trial = s.future_chain;
            trial.push_back(op);
            try {
                const Distribution next = simulate_future(s.improved, trial);
                s.future_chain = trial;
                std::cout << "Projected CGPA including future courses: " << fmt2(cgpa_from_distribution(next)) << "\n";
            }
            catch (const InvalidAdditionError& e) {
                std::cout << "Error: " << e.what() << "\n";
            }
        }
        else if (choice == 2) {
            show_additions(s.future_chain);
        }
        else if (choice == 3) {
            s.future_chain.clear();
            std::cout << "Future courses chain reset.\n";
        }
        else if (choice == 4) {
            s.future = simulate_future(s.improved, s.future_chain);
            if (s.future_chain.empty())
                std::cout << "No future courses applied. Using the current distribution.\n";
            else
                std::cout << "Final projected CGPA including future courses: " << fmt2(cgpa_from_distribution(s.future)) << "\n";
            return true;
        }
    }
}

// ---- 4) Distribution views -------------------------------------------------
static bool distribution_menu(const Session& s) {
    std::cout << "  [1] Original   [2] After grade improvement   [3] After future courses\n";
    int choice = 0;
    auto r = prompt_int_or_back("  CHOICE", choice, 1, 3);
    if (r == InputCtl::Back) return true;
    if (r == InputCtl::Exit) return false;
    if (choice == 1) show_distribution(s.ledger.distribution(), "Original Grade Distribution");
    else if (choice == 2) show_distribution(s.improved, "After Grade Improvement");
    else show_distribution(s.future, "After Future Courses Simulation");
    return true;
}

// Collect `n` labelled buckets. `what` is "course" or "group".
static InputCtl prompt_buckets(const std::string& what, int n, std::vector<Bucket>& out) {
    out.clear();
    for (int i = 1; i <= n; ++i) {
        Bucket b;
        auto a = prompt_until_valid_or_back("Name/description for " + what + " " + std::to_string(i),
            b.label, is_non_empty_short, "Required (max 60).");
        if (a != InputCtl::Ok) return a;
        auto c = prompt_number_or_back("Credits for " + what + " " + std::to_string(i), b.credits, 0.5, 1000);
        if (c != InputCtl::Ok) return c;
        out.push_back(b);
    }
    return InputCtl::Ok;
}

// ---- 5) Target planning ----------------------------------------------------
static bool target_menu(const Session& s, const RunConfig& cfg) {
    const GradeTotals& totals = s.ledger.totals();
    const double credits = static_cast<double>(totals.credits);
    const double points = static_cast<double>(totals.points);

    double target = 0;
    auto t = prompt_number_or_back("Target CGPA", target, 0.01, GradeScale::standard().max_point());
    if (t == InputCtl::Back) return true;
    if (t == InputCtl::Exit) return false;

    std::cout << "  [1] Course-by-course   [2] Aggregate groups\n";
    int mode = 0;
    auto m = prompt_int_or_back("  MODE", mode, 1, 2);
    if (m == InputCtl::Back) return true;
    if (m == InputCtl::Exit) return false;

    int n = 0;
    auto c = prompt_int_or_back(mode == 1 ? "How many future courses" : "How many course groups", n, 1, 50);
    if (c == InputCtl::Back) return true;
    if (c == InputCtl::Exit) return false;

    std::vector<Bucket> buckets;
    auto b = prompt_buckets(mode == 1 ? "course" : "group", n, buckets);
    if (b == InputCtl::Back) return true;
    if (b == InputCtl::Exit) return false;

    PlannerOptions opts;
    opts.max_buckets = cfg.max_buckets;

    try {
        if (mode == 1) {
            // Required average only; the user predicts grades afterwards.
            TargetPlan plan;
            plan.required_average = required_average(target, credits, points, buckets);
            for (const auto& bk : buckets) plan.total_future_credits += bk.credits;
            show_plan(plan, buckets, target);

            auto y = confirm_or_back("Simulate predicted grades for these courses?");
            if (y == InputCtl::Exit) return false;
            if (y != InputCtl::Ok) return true;

            std::vector<Grade> predicted;
            for (const auto& bk : buckets) {
                Grade g = Grade::A;
                auto p = prompt_grade("Predicted grade for " + bk.label + " (S/A/B/C/D/E/F)", g, true);
                if (p == InputCtl::Back) return true;
                if (p == InputCtl::Exit) return false;
                predicted.push_back(g);
            }
            show_predicted(buckets, predicted, project_cgpa(credits, points, buckets, predicted));
            return true;
        }

        if (buckets.size() > opts.max_buckets) {
            auto y = confirm_or_back(std::to_string(buckets.size()) + " groups means checking 7^" +
                std::to_string(buckets.size()) + " combinations. Continue?");
            if (y == InputCtl::Exit) return false;
            if (y != InputCtl::Ok) return true;
            opts.allow_large = true;
        }
        show_plan(plan_target(target, credits, points, buckets, opts), buckets, target);
    }
    catch (const CgpaError& e) {
        std::cout << "Error: " << e.what() << "\n";
    }
    return true;
}

//-----------------------------------------
static int run(const RunConfig& given) {
    showWelcome();
    RunConfig cfg = given;

    // --- Transcript bootstrap -----------------------------------------------
    std::vector<CourseRecord> records;
    for (;;) {
        if (cfg.db_path.empty()) {
            auto r = prompt_until_valid_or_back("Path to the extracted transcript database", cfg.db_path,
                is_db_path, "Please enter a file path.");
            if (r != InputCtl::Ok) return 0;
        }
        if (load_ledger(cfg, records)) break;
        if (!given.db_path.empty()) return 1;   // path came from the command line
        cfg.db_path.clear();
    }

    Session s{ GradeLedger(std::move(records)) };
    show_summary(s.ledger);

    // --- Menu loop ----------------------------------------------------------
    bool running = true;
    while (running) {
        std::cout
            << "=====================================================\n"
            << "                      MAIN MENU                      \n"
            << "=====================================================\n"
            << "    Courses: " << s.ledger.records().size()
            << "   CGPA: " << fmt2(s.ledger.cgpa()) << "\n"
            << "-----------------------------------------------------\n"
            << "  [1]  Simulate grade improvement                    \n"
            << "  [2]  Simulate future courses                       \n"
            << "  [3]  Grade history                                 \n"
            << "  [4]  Grade distribution                            \n"
            << "  [5]  Plan to reach a target CGPA                   \n"
            << "  [6]  Academic summary                              \n"
            << "-----------------------------------------------------\n"
            << "  [x]  EXIT                                          \n"
            << "=====================================================\n";

        int choice = 0;
        auto r = prompt_int_or_back("  CHOICE", choice, 1, 6);
        if (r == InputCtl::Exit) break;
        if (r == InputCtl::Back) continue;

        switch (choice) {
        case 1: running = improvement_menu(s); break;
        case 2: running = future_menu(s); break;
        case 3: show_history(s.ledger.history()); break;
        case 4: running = distribution_menu(s); break;
        case 5: running = target_menu(s, cfg); break;
        case 6: show_summary(s.ledger); break;
        default: std::cout << "Unknown option.\n"; break;
        }
    }

    std::cout << "Exiting simulation. Thank you!\n";
    return 0;
}

int main(int argc, char** argv) {
    try {
        RunConfig cfg;
        for (int i = 1; i < argc; ++i) {
            const std::string arg(argv[i]);
            if (arg == "--db" && i + 1 < argc) {
                cfg.db_path = argv[++i];
            } else if (arg == "--table" && i + 1 < argc) {
                cfg.table = argv[++i];
            } else if (arg == "--max-buckets" && i + 1 < argc) {
                const std::string value(argv[++i]);
                auto n = parse_count(value, 1, kMaxPlanBuckets);
                if (!n) {
                    std::cerr << "Invalid --max-buckets '" << value << "': expected 1-" << kMaxPlanBuckets << "\n";
                    showUsage();
                    return 2;
                }
                cfg.max_buckets = *n;
            } else if (arg == "--help") {
                showUsage();
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                showUsage();
                return 2;
            }
        }
        return run(cfg);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << '\n';
        return 1;
    }
}
