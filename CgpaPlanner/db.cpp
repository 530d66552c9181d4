/*
-------------------------------------------------------------------------------
 db.cpp — SQLite reader for extracted transcript tables
-------------------------------------------------------------------------------
Purpose
  - Loads the raw cell text written by the PDF table extractor so the
    normalizer can work on plain rows.

Design notes
  - Read-only connection (SQLITE_OPEN_READONLY); the planner never persists
    anything.
  - Table names come from sqlite_master and are quoted as identifiers, since
    extractor names contain dashes ("page-1-table-1").
  - Reads use sqlite3_prepare_v2 / sqlite3_step loops; statements are always
    finalized, including on early returns.

Caveats
  - Numeric cells stored as INTEGER/REAL come back via sqlite3_column_text,
    so "4" stays "4" and 4.0 becomes "4.0"; the normalizer accepts both.
-------------------------------------------------------------------------------
*/

#include "db.hpp"
#include <iostream>
#include <utility>

// Quote an identifier for SQL: wrap in double quotes, double any inner quote.
static std::string quote_ident(const std::string& name) {
    std::string q = "\"";
    for (char ch : name) {
        if (ch == '"') q += "\"\"";
        else q += ch;
    }
    q += "\"";
    return q;
}

// Prepare a statement and report errors. Returns nullptr on failure.
static sqlite3_stmt* prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
        sqlite3_finalize(st);
        return nullptr;
    }
    return st;
}

// Open an existing database file without write access.
bool db_open_readonly(sqlite3*& db, const std::string& path) {
    db = nullptr;
    if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::cerr << "Failed to open DB: " << (db ? sqlite3_errmsg(db) : "out of memory") << "\n";
        sqlite3_close(db);
        db = nullptr;
        return false;
    }
    return true;
}

// Close the database handle if non-null.
void db_close(sqlite3* db) {
    if (db) sqlite3_close(db);
}

bool db_list_tables(sqlite3* db, std::vector<std::string>& out) {
    out.clear();
    sqlite3_stmt* st = prepare(db,
        "SELECT name FROM sqlite_master "
        "WHERE type='table' AND name NOT LIKE 'sqlite_%' ORDER BY rowid;");
    if (!st) return false;

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        const unsigned char* name = sqlite3_column_text(st, 0);
        out.push_back(name ? reinterpret_cast<const char*>(name) : "");
    }
    if (rc != SQLITE_DONE) std::cerr << "SQL error: " << sqlite3_errmsg(db) << "\n";
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

bool db_load_table(sqlite3* db, const std::string& table, RawTable& out) {
    sqlite3_stmt* st = prepare(db, "SELECT * FROM " + quote_ident(table) + " ORDER BY rowid;");
    if (!st) return false;

    const int ncols = sqlite3_column_count(st);
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        RawRow row;
        row.reserve(static_cast<std::size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            const unsigned char* text = sqlite3_column_text(st, c);
            row.push_back(text ? reinterpret_cast<const char*>(text) : "");
        }
        out.push_back(std::move(row));
    }
    if (rc != SQLITE_DONE)
        std::cerr << "SQL error while reading '" << table << "': " << sqlite3_errmsg(db) << "\n";
    sqlite3_finalize(st);
    return rc == SQLITE_DONE;
}

bool db_load_transcript(sqlite3* db, RawTable& out) {
    out.clear();
    std::vector<std::string> tables;
    if (!db_list_tables(db, tables)) return false;
    if (tables.empty()) {
        std::cerr << "No tables found in the database.\n";
        return false;
    }
    for (const auto& t : tables)
        if (!db_load_table(db, t, out)) return false;
    return true;
}
