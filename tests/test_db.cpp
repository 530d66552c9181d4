#include <catch2/catch.hpp>

#include <cstdio>
#include <filesystem>
#include <string>

#include "db.hpp"
#include "normalizer.hpp"

namespace {

// In-memory database shaped like the table extractor's output.
struct MemoryDb {
    sqlite3* db = nullptr;

    MemoryDb() {
        REQUIRE(sqlite3_open(":memory:", &db) == SQLITE_OK);
    }
    ~MemoryDb() { db_close(db); }

    void exec(const std::string& sql) {
        char* err = nullptr;
        const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
        const std::string msg = err ? err : "";
        sqlite3_free(err);
        INFO(msg);
        REQUIRE(rc == SQLITE_OK);
    }
};

void create_pages(MemoryDb& m) {
    m.exec("CREATE TABLE \"page-1-table-1\" (\"0\" TEXT, \"1\" TEXT, \"2\" TEXT, \"3\" TEXT);");
    m.exec("INSERT INTO \"page-1-table-1\" VALUES ('Course Code', 'Course Title', 'Credits', 'Grade');");
    m.exec("INSERT INTO \"page-1-table-1\" VALUES ('CSE1001', 'Programming', '4', 'A');");
    m.exec("INSERT INTO \"page-1-table-1\" VALUES ('MAT1011', 'Calculus', 3, 'B');");

    m.exec("CREATE TABLE \"page-2-table-1\" (\"0\" TEXT, \"1\" TEXT, \"2\" TEXT, \"3\" TEXT);");
    m.exec("INSERT INTO \"page-2-table-1\" VALUES ('PHY1001', 'Physics', '4', 'S');");
    m.exec("INSERT INTO \"page-2-table-1\" VALUES ('ENG1011', NULL, '2', 'C');");
}

} // namespace

TEST_CASE("tables are listed in creation order", "[db]") {
    MemoryDb m;
    create_pages(m);
    m.exec("CREATE TABLE \"a-late-table\" (\"0\" TEXT);");

    std::vector<std::string> names;
    REQUIRE(db_list_tables(m.db, names));
    CHECK(names == std::vector<std::string>{ "page-1-table-1", "page-2-table-1", "a-late-table" });
}

TEST_CASE("a table loads as text rows with NULL as empty", "[db]") {
    MemoryDb m;
    create_pages(m);

    RawTable rows;
    REQUIRE(db_load_table(m.db, "page-2-table-1", rows));
    REQUIRE(rows.size() == 2);
    CHECK(rows[0] == RawRow{ "PHY1001", "Physics", "4", "S" });
    CHECK(rows[1] == RawRow{ "ENG1011", "", "2", "C" });
}

TEST_CASE("numeric cells come back as their text", "[db]") {
    MemoryDb m;
    create_pages(m);

    RawTable rows;
    REQUIRE(db_load_table(m.db, "page-1-table-1", rows));
    REQUIRE(rows.size() == 3);
    CHECK(rows[2][2] == "3");
}

TEST_CASE("loading a missing table fails", "[db]") {
    MemoryDb m;
    RawTable rows;
    CHECK_FALSE(db_load_table(m.db, "no-such-table", rows));
    CHECK(rows.empty());
}

TEST_CASE("table names with quotes are escaped", "[db]") {
    MemoryDb m;
    m.exec("CREATE TABLE \"odd\"\"name\" (\"0\" TEXT);");
    m.exec("INSERT INTO \"odd\"\"name\" VALUES ('x');");

    RawTable rows;
    REQUIRE(db_load_table(m.db, "odd\"name", rows));
    REQUIRE(rows.size() == 1);
    CHECK(rows[0][0] == "x");
}

TEST_CASE("transcript concatenates all pages", "[db]") {
    MemoryDb m;
    create_pages(m);

    RawTable rows = { { "stale" } };
    REQUIRE(db_load_transcript(m.db, rows));
    REQUIRE(rows.size() == 5);
    CHECK(rows[0][0] == "Course Code");
    CHECK(rows[3][0] == "PHY1001");
}

TEST_CASE("transcript needs at least one table", "[db]") {
    MemoryDb m;
    RawTable rows;
    CHECK_FALSE(db_load_transcript(m.db, rows));
}

TEST_CASE("loaded pages normalize into course records", "[db][normalizer]") {
    MemoryDb m;
    create_pages(m);

    RawTable rows;
    REQUIRE(db_load_transcript(m.db, rows));
    NormalizeStats stats;
    const auto recs = normalize_transcript(rows, &stats);

    // ENG1011 has no title and is dropped
    REQUIRE(recs.size() == 3);
    CHECK(recs[0].course_code == "CSE1001");
    CHECK(recs[1].credits == 3);
    CHECK(recs[2].grade == Grade::S);
    CHECK(stats.missing_fields == 1);
}

TEST_CASE("read-only open", "[db]") {
    const auto path = (std::filesystem::temp_directory_path() / "cgpa_planner_test.sqlite").string();
    std::remove(path.c_str());

    sqlite3* db = nullptr;
    CHECK_FALSE(db_open_readonly(db, path));
    CHECK(db == nullptr);

    sqlite3* writer = nullptr;
    REQUIRE(sqlite3_open(path.c_str(), &writer) == SQLITE_OK);
    REQUIRE(sqlite3_exec(writer, "CREATE TABLE t (\"0\" TEXT);", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(writer);

    REQUIRE(db_open_readonly(db, path));
    CHECK(sqlite3_exec(db, "INSERT INTO t VALUES ('x');", nullptr, nullptr, nullptr) != SQLITE_OK);
    std::vector<std::string> names;
    CHECK(db_list_tables(db, names));
    CHECK(names == std::vector<std::string>{ "t" });
    db_close(db);

    std::remove(path.c_str());
}
