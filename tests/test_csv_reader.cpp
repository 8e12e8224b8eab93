#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include "errors.hpp"
#include "io/csv_reader.hpp"

using namespace cohortcea;

TEST_CASE("CsvReader splits, trims and skips comments", "[csv]") {
    std::istringstream is(
        "Name, Value ,Note\r\n"
        "# comment line\n"
        "\n"
        "a, 1.5 ,\"x, y\"\n"
        "b,2,\"say \"\"hi\"\"\"\n");
    CsvReader reader(is);

    reader.read_header();
    REQUIRE(reader.column("name") == 0);
    REQUIRE(reader.column("value") == 1);
    REQUIRE(reader.column("missing") == -1);
    REQUIRE_THROWS_AS(reader.require_column("missing"), ValidationError);

    REQUIRE(reader.has_more());
    auto row = reader.read_row();
    REQUIRE(row.size() == 3);
    REQUIRE(row[0] == "a");
    REQUIRE(row[1] == "1.5");
    REQUIRE(row[2] == "x, y");
    REQUIRE(reader.line_number() == 4);

    row = reader.read_row();
    REQUIRE(row[2] == "say \"hi\"");
    REQUIRE_FALSE(reader.has_more());
}

TEST_CASE("Numeric cells", "[csv]") {
    REQUIRE(parse_double("0.25", "ctx") == 0.25);
    REQUIRE(parse_int("12", "ctx") == 12);
    REQUIRE_THROWS_AS(parse_double("abc", "ctx"), ValidationError);
    REQUIRE_THROWS_AS(parse_double("1.5x", "ctx"), ValidationError);
    REQUIRE_THROWS_AS(parse_int("1.5", "ctx"), ValidationError);
    REQUIRE_THROWS_AS(parse_double("", "ctx"), ValidationError);
}
