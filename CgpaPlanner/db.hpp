#pragma once
#include <string>
#include <vector>
#include <sqlite3.h>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 db.hpp — Read raw transcript rows from an SQLite table export
-------------------------------------------------------------------------------

The PDF table extractor writes each detected table into an SQLite file (one
table per PDF table, e.g. "page-1-table-1", columns "0", "1", ... holding the
cell text). These functions read those tables back as RawTable rows for the
normalizer. The database is opened read-only; nothing here writes.

Design:
  - Each function returns `bool` to indicate success/failure and prints the
    SQLite message to std::cerr on failure.
  - Cells come back as text in column order; NULL cells become "".
  - Rows keep their insertion (rowid) order, tables their creation order.

Usage convention:
  - Call `db_open_readonly` once, then `db_load_transcript` (all tables) or
    `db_load_table` (one table).
  - Always call `db_close` afterwards.
-------------------------------------------------------------------------------
*/

/// Opens an existing SQLite file read-only.
/// Returns true on success, false on failure. On failure, `db` is set to nullptr.
bool db_open_readonly(sqlite3*& db, const std::string& path);

/// Close DB (safe if db==nullptr).
void db_close(sqlite3* db);

/// Names of the user tables, in creation order.
bool db_list_tables(sqlite3* db, std::vector<std::string>& out);

/// Append every row of `table` to `out`, every column as text.
bool db_load_table(sqlite3* db, const std::string& table, RawTable& out);

/// Clear `out` and load all tables one after another (multi-page transcripts
/// are split into one table per page).
bool db_load_transcript(sqlite3* db, RawTable& out);
