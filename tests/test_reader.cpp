#include <tabula/csv/reader.hpp>

#include <catch2/catch_test_macros.hpp>

using tabula::csv::first_width_mismatch;
using tabula::csv::read_rows;
using tabula::csv::read_rows_detect;

TEST_CASE("read_rows splits on the given delimiter", "[csv][reader]") {
    auto rows = read_rows("a|b|c\n1|2|3\n", '|');
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0] == tabula::Row{"a", "b", "c"});
    REQUIRE(rows[1] == tabula::Row{"1", "2", "3"});
}

TEST_CASE("read_rows keeps ragged records", "[csv][reader]") {
    auto rows = read_rows("a,b,c\n1,2\n3,4,5,6\n", ',');
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].size() == 3);
    REQUIRE(rows[1].size() == 2);
    REQUIRE(rows[2].size() == 4);
}

TEST_CASE("read_rows honours quoting", "[csv][reader]") {
    SECTION("delimiter inside quotes") {
        auto rows = read_rows("id,name\n1,\"Smith, John\"\n", ',');
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[1] == tabula::Row{"1", "Smith, John"});
    }

    SECTION("doubled quotes are a literal quote") {
        auto rows = read_rows("msg\n\"say \"\"hello\"\"\"\n", ',');
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[1][0] == "say \"hello\"");
    }

    SECTION("line break inside quotes stays in the field") {
        auto rows = read_rows("a;b\n\"x\";\"two\nlines\"\n", ';');
        REQUIRE(rows.size() == 2);
        REQUIRE(rows[1][1] == "two\nlines");
    }
}

TEST_CASE("read_rows does not trim fields", "[csv][reader]") {
    auto rows = read_rows(" a , b \n", ',');
    REQUIRE(rows.size() == 1);
    REQUIRE(rows[0] == tabula::Row{" a ", " b "});
}

TEST_CASE("read_rows on an empty buffer yields no rows", "[csv][reader]") {
    REQUIRE(read_rows("", ';').empty());
}

TEST_CASE("first_width_mismatch", "[csv][reader]") {
    using tabula::Row;
    using tabula::Table;

    REQUIRE_FALSE(first_width_mismatch(Table{}).has_value());
    REQUIRE_FALSE(first_width_mismatch(Table{Row{"a", "b"}}).has_value());
    REQUIRE_FALSE(first_width_mismatch(Table{Row{"a", "b"}, Row{"c", "d"}}).has_value());

    auto mismatch = first_width_mismatch(
        Table{Row{"a", "b"}, Row{"c", "d"}, Row{"e"}, Row{"f", "g", "h"}});
    REQUIRE(mismatch.has_value());
    REQUIRE(*mismatch == 2);
}

TEST_CASE("read_rows_detect keeps consistent semicolon records", "[csv][reader]") {
    auto detected = read_rows_detect("a;b;c\n1;2;3\n4;5;6\n");
    REQUIRE(detected.delimiter == ';');
    REQUIRE(detected.rows.size() == 3);
    for (const auto& row : detected.rows) {
        REQUIRE(row.size() == 3);
    }
}

TEST_CASE("read_rows_detect keeps a single semicolon record", "[csv][reader]") {
    auto detected = read_rows_detect("a;b\n");
    REQUIRE(detected.delimiter == ';');
    REQUIRE(detected.rows.size() == 1);
    REQUIRE(detected.rows[0] == tabula::Row{"a", "b"});
}

TEST_CASE("read_rows_detect falls back to commas on a width mismatch", "[csv][reader]") {
    // 3 fields then 2 fields on ';'
    auto detected = read_rows_detect("a;b;c\nx,y;z\n");
    REQUIRE(detected.delimiter == ',');
    REQUIRE(detected.rows.size() == 2);
    REQUIRE(detected.rows[0] == tabula::Row{"a;b;c"});
    REQUIRE(detected.rows[1] == tabula::Row{"x", "y;z"});
}

TEST_CASE("read_rows_detect fallback accepts ragged comma records", "[csv][reader]") {
    auto detected = read_rows_detect("a,b;c\nd,e,f\ng\n");
    REQUIRE(detected.delimiter == ',');
    REQUIRE(detected.rows.size() == 3);
    REQUIRE(detected.rows[0].size() == 2);
    REQUIRE(detected.rows[1].size() == 3);
    REQUIRE(detected.rows[2].size() == 1);
}

TEST_CASE("read_rows_detect falls back to commas on an empty buffer", "[csv][reader]") {
    auto detected = read_rows_detect("");
    REQUIRE(detected.delimiter == ',');
    REQUIRE(detected.rows.empty());
}

TEST_CASE("read_rows_detect keeps semicolons for comma data without semicolons",
          "[csv][reader]") {
    // Every record is one field wide on ';', so the first attempt is consistent.
    auto detected = read_rows_detect("a,b\nc,d\n");
    REQUIRE(detected.delimiter == ';');
    REQUIRE(detected.rows.size() == 2);
    REQUIRE(detected.rows[0] == tabula::Row{"a,b"});
}
