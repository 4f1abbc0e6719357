#include <recsql/core/format.hpp>
#include <recsql/core/time.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

using namespace recsql;

TEST_CASE("format_value renders every kind", "[core][format]") {
    REQUIRE(format_value(Value{}) == "null");
    REQUIRE(format_value(Value{true}) == "true");
    REQUIRE(format_value(Value{std::int64_t{-12}}) == "-12");
    REQUIRE(format_value(Value{0.1}) == "0.1");
    REQUIRE(format_value(Value{1.0}) == "1");
    REQUIRE(format_value(Value{std::numeric_limits<double>::quiet_NaN()}) == "nan");
    REQUIRE(format_value(Value{-std::numeric_limits<double>::infinity()}) == "-inf");
    REQUIRE(format_value(Value{std::string("plain text")}) == "plain text");
    REQUIRE(format_value(Value{Timestamp{1'500'000'000}}) == "1970-01-01 00:00:01.500000000");
    REQUIRE(format_value(Value{RecordSeq{}}) == "<seq>");

    Record nested{{"a", std::int64_t{1}}, {"b", std::string("x")}};
    REQUIRE(format_value(Value{nested}) == "{a: 1, b: x}");
    REQUIRE(format_record(Record{}) == "{}");

    ValueList list{std::vector<Value>{std::int64_t{1}, std::string("x"), Value{}}};
    REQUIRE(format_value(Value{list}) == "[1, x, null]");
}

TEST_CASE("timestamps parse and format", "[core][time]") {
    auto ts = parse_timestamp("2024-03-05T06:07:08.25Z");
    REQUIRE(ts.has_value());
    REQUIRE(format_timestamp(*ts) == "2024-03-05 06:07:08.250000000");

    REQUIRE(parse_timestamp("2024-03-05 06:07:08").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-02-30 00:00:00").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-03-05 25:00:00").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-03-05").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-03-05 06:07:08.").has_value());
}

TEST_CASE("timestamps outside the nanosecond range do not parse", "[core][time]") {
    REQUIRE_FALSE(parse_timestamp("9999-12-31 23:59:59").has_value());
    REQUIRE_FALSE(parse_timestamp("2262-04-11 23:47:16.854775808").has_value());
    REQUIRE_FALSE(parse_timestamp("1000-01-01 00:00:00").has_value());

    auto last = parse_timestamp("2262-04-11 23:47:16.854775807");
    REQUIRE(last.has_value());
    REQUIRE(last->nanos == std::numeric_limits<std::int64_t>::max());

    REQUIRE_FALSE(timestamp_from_seconds(1'700'000'000'000LL).has_value());
    REQUIRE_FALSE(timestamp_from_seconds(std::numeric_limits<std::int64_t>::min()).has_value());
    REQUIRE(timestamp_from_seconds(-60) == Timestamp{-60'000'000'000LL});
}

TEST_CASE("timestamps with a UTC offset normalize to UTC", "[core][time]") {
    auto utc = parse_timestamp("2024-03-05T06:07:08Z");
    REQUIRE(utc.has_value());
    REQUIRE(utc->nanos == 1'709'618'828LL * 1'000'000'000LL);

    REQUIRE(parse_timestamp("2024-03-05T08:07:08+02:00") == utc);
    REQUIRE(parse_timestamp("2024-03-05T00:37:08.000-05:30") == utc);
    REQUIRE(parse_timestamp("2024-03-05 06:07:08+00:00") == utc);

    REQUIRE_FALSE(parse_timestamp("2024-03-05T06:07:08+2:00").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-03-05T06:07:08+0200").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-03-05T06:07:08+24:00").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-03-05T06:07:08Z+01:00").has_value());
}

TEST_CASE("print lays out an aligned table", "[core][format]") {
    std::vector<Record> records = {
        Record{{"id", std::int64_t{1}}, {"name", std::string("Ada")}},
        Record{{"id", std::int64_t{22}}, {"dept", std::string("Eng")}},
    };

    std::ostringstream out;
    recsql::print(records, out);

    std::string expected =
        "id  name  dept\n"
        "--  ----  ----\n"
        "1   Ada       \n"
        "22        Eng \n";
    REQUIRE(out.str() == expected);
}

TEST_CASE("print reports an empty input", "[core][format]") {
    std::ostringstream out;
    recsql::print({}, out);
    REQUIRE(out.str() == "(no records)\n");
}
