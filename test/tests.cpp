#define CATCH_CONFIG_MAIN
#include <catch2/catch_all.hpp>

#include "pvl/pvl.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

using namespace Catch;

namespace {

    struct rng {
        std::mt19937_64 eng;

        rng() : eng(std::random_device{}()) {}

        size_t uniform_size(size_t min, size_t max) {
            std::uniform_int_distribution<size_t> dist(min, max);
            return dist(eng);
        }

        bool coin(double p = 0.5) {
            std::bernoulli_distribution dist(p);
            return dist(eng);
        }

        double uniform_double() {
            std::uniform_real_distribution dist(-1e6, 1e6);
            return dist(eng);
        }

        char letter(char first = 'a') {
            std::uniform_int_distribution<int> dist(0, 25);
            return static_cast<char>(first + dist(eng));
        }

        std::string random_word(size_t max_len = 8, char first = 'a') {
            size_t len = uniform_size(1, max_len);
            std::string s;
            s.reserve(len);
            for (size_t i = 0; i < len; i++)
                s.push_back(letter(first));
            return s;
        }

        // Words separated by single spaces survive whitespace folding.
        std::string random_text(size_t max_words = 4) {
            size_t n = uniform_size(0, max_words);
            std::string s;
            for (size_t i = 0; i < n; i++) {
                if (i) s.push_back(' ');
                s += random_word();
            }
            return s;
        }
    };

    // Keys are upper-case identifiers so that every dialect, PDS3
    // included, writes them back unchanged.
    std::string random_key(rng& r) {
        return "P" + r.random_word(10, 'A');
    }

    Pvl::value random_scalar(rng& r) {
        switch (r.uniform_size(0, 5)) {
            case 0: return Pvl::value{ static_cast<int64_t>(r.uniform_size(0, 1'000'000)) - 500'000 };
            case 1: return Pvl::value{ r.uniform_double() };
            case 2: return Pvl::value{ r.random_word() };
            case 3: {
                Pvl::date d{ static_cast<int32_t>(r.uniform_size(1900, 2100)),
                             static_cast<uint8_t>(r.uniform_size(1, 12)),
                             static_cast<uint8_t>(r.uniform_size(1, 28)) };
                return Pvl::value{ d };
            }
            case 4: {
                Pvl::time t;
                t.hour = static_cast<uint8_t>(r.uniform_size(0, 23));
                t.minute = static_cast<uint8_t>(r.uniform_size(0, 59));
                t.second = static_cast<uint8_t>(r.uniform_size(0, 59));
                t.utc_offset_minutes = 0;
                return Pvl::value{ t };
            }
            case 5: return Pvl::value{ Pvl::quantity{ Pvl::value{ static_cast<int64_t>(r.uniform_size(0, 999)) }, r.random_word(4, 'A') } };
        }
        return Pvl::value{ 0 };
    }

    Pvl::value random_value(rng& r) {
        switch (r.uniform_size(0, 5)) {
            case 0: {
                Pvl::sequence items;
                size_t n = r.uniform_size(1, 6);
                for (size_t i = 0; i < n; i++)
                    items.push_back(r.coin() ? Pvl::value{ static_cast<int64_t>(r.uniform_size(0, 99)) } : Pvl::value{ r.random_word() });
                return Pvl::value{ std::move(items) };
            }
            case 1: {
                Pvl::value_set items;
                size_t n = r.uniform_size(0, 5);
                for (size_t i = 0; i < n; i++)
                    (void)items.insert(Pvl::value{ static_cast<int64_t>(r.uniform_size(0, 20)) });
                return Pvl::value{ std::move(items) };
            }
            case 2: return Pvl::value{ r.random_text() };
            case 3: return Pvl::value{ r.coin() };
        }
        return random_scalar(r);
    }

    Pvl::container random_block(rng& r, Pvl::role type, int depth, int max_depth) {
        Pvl::container c{ type };
        size_t n = r.uniform_size(0, 8);
        for (size_t i = 0; i < n; i++) {
            if (depth < max_depth && r.coin(0.2)) {
                auto kind = r.coin() ? Pvl::role::group : Pvl::role::object;
                c.append(random_key(r), random_block(r, kind, depth + 1, max_depth));
            } else {
                c.append(random_key(r), random_value(r));
            }
        }
        return c;
    }

    static Pvl::ParseResult parse_str(std::string_view s, const Pvl::ParseOptions& opts = {}) {
        return Pvl::parse(s, opts);
    }

    static Pvl::container expect_ok(std::string_view s, const Pvl::ParseOptions& opts = {}) {
        auto r = parse_str(s, opts);
        if (!r) UNSCOPED_INFO(r.error().what());
        REQUIRE(r);
        return *std::move(r);
    }

    static void expect_fail(std::string_view s, Pvl::ParseError::code code, const Pvl::ParseOptions& opts = {}) {
        auto r = parse_str(s, opts);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().errc == code);
    }

    const Pvl::ParseOptions pvl_opts{ .dialect = Pvl::dialect_id::pvl };
    const Pvl::ParseOptions odl_opts{ .dialect = Pvl::dialect_id::odl };
    const Pvl::ParseOptions isis_opts{ .dialect = Pvl::dialect_id::isis };
    const Pvl::ParseOptions strict_opts{ .strict = true };
}


TEST_CASE("Parse Simple Assignments") {
    auto m = expect_ok("a = 1\nb = 2.5;\nc = Mars\nd = \"two words\"\ne = NULL\nf = true\nEND");

    REQUIRE(m.size() == 6);
    REQUIRE(m.get("a").as_integer() == 1);
    REQUIRE(m.get("b").as_real() == Approx(2.5));
    REQUIRE(m.get("c").as_string() == "Mars");
    REQUIRE(m.get("d").as_string() == "two words");
    REQUIRE(m.get("e").is_null());
    REQUIRE(m.get("f").as_bool());
    REQUIRE(m.errors().empty());
}

TEST_CASE("Repeated Keys Are Kept in Order") {
    auto m = expect_ok("a = 1\nb = 2\na = 3\nEND");

    REQUIRE(m.size() == 3);
    REQUIRE(m.count("a") == 2);
    REQUIRE(m[2].second.as_integer() == 3);
}

TEST_CASE("Empty Input Parses as an Empty Module") {
    REQUIRE(expect_ok("").empty());
    REQUIRE(expect_ok("  \n\t ").empty());
    REQUIRE(expect_ok("END").empty());
    REQUIRE(expect_ok("a = 1").size() == 1);
}

TEST_CASE("Statement Delimiters and Comments") {
    auto m = expect_ok("/* header */\na = 1; /* trailing */\nb = 2;\nEND;", pvl_opts);
    REQUIRE(m.size() == 2);
    REQUIRE(m.get("b").as_integer() == 2);

    auto omni = expect_ok("# note\na = 1 # trailing\nEND");
    REQUIRE(omni.get("a").as_integer() == 1);

    expect_fail("# note\na = 1;\nEND;", Pvl::ParseError::code::unexpected_token, pvl_opts);
}

TEST_CASE("Parse Aggregations") {
    auto m = expect_ok(
        "Object = Image\n"
        "  Lines = 100\n"
        "  Group = Sub\n"
        "    X = 1\n"
        "  End_Group\n"
        "End_Object = Image\n"
        "End");

    REQUIRE(m.size() == 1);
    const auto& image = m.get("Image").as_aggregation();
    REQUIRE(image.is_object());
    REQUIRE(image.get("Lines").as_integer() == 100);

    const auto& sub = image.get("Sub").as_aggregation();
    REQUIRE(sub.is_group());
    REQUIRE(sub.get("X").as_integer() == 1);
}

TEST_CASE("Begin Keywords Follow the Dialect") {
    auto m = expect_ok("BEGIN_GROUP = g;\n  x = 1;\nEND_GROUP = g;\nEND;", pvl_opts);
    REQUIRE(m.get("g").as_aggregation().is_group());

    expect_fail("Begin_Object = X\nEnd_Object\nEnd", Pvl::ParseError::code::unexpected_token, isis_opts);
}

TEST_CASE("Aggregation Names Must Match") {
    expect_fail("Group = A\nEnd_Group = B\nEnd", Pvl::ParseError::code::aggregation_name_mismatch);
    expect_ok("Group = A\nEnd_Group = a\nEnd");
}

TEST_CASE("Aggregation End Keyword Must Match the Begin Keyword") {
    expect_fail("Group = A\nEnd_Object\nEnd", Pvl::ParseError::code::unexpected_token);
    expect_fail("End_Group\nEnd", Pvl::ParseError::code::unexpected_token);
}

TEST_CASE("Unclosed Aggregations Are Rejected") {
    expect_fail("Group = A\nX = 1\n", Pvl::ParseError::code::unexpected_end_of_input);
    expect_fail("Group = A\nX = 1\nEnd", Pvl::ParseError::code::unexpected_token);
}

TEST_CASE("Parse Sets and Sequences") {
    auto m = expect_ok("s = (1, 2, 3)\nt = {a, b, a}\nn = ((1, 2), (3))\ne = ()\nEND");

    REQUIRE(m.get("s").as_sequence().size() == 3);
    REQUIRE(m.get("s").as_sequence()[2].as_integer() == 3);

    REQUIRE(m.get("t").is_set());
    REQUIRE(m.get("t").as_set().size() == 2);
    REQUIRE(m.get("t") == Pvl::value{ Pvl::value_set{ "b", "a" } });

    const auto& n = m.get("n").as_sequence();
    REQUIRE(n.size() == 2);
    REQUIRE(n[0].as_sequence().size() == 2);
    REQUIRE(n[1].as_sequence()[0].as_integer() == 3);

    REQUIRE(m.get("e").as_sequence().empty());
}

TEST_CASE("Malformed Collections Are Rejected") {
    expect_fail("s = (1 2)\nEND", Pvl::ParseError::code::unexpected_token);
    expect_fail("s = (1, 2", Pvl::ParseError::code::unexpected_end_of_input);
    expect_fail("s = {1; 2}\nEND", Pvl::ParseError::code::unexpected_token);
}

TEST_CASE("Parsed Collections Hold Only Their Elements") {
    auto m = expect_ok("a = {1, 1, 2}; b = (); c = {}; d = (1, 2) <m>; END;");

    const auto& a = m.get("a").as_set();
    REQUIRE(a.size() == 2);
    REQUIRE(a.contains(Pvl::value{ 1 }));
    REQUIRE(a.contains(Pvl::value{ 2 }));
    REQUIRE_FALSE(a.contains(Pvl::value{ true }));

    REQUIRE(m.get("b").as_sequence().empty());
    REQUIRE(m.get("c").as_set().empty());

    const auto& d = m.get("d").as_quantity();
    REQUIRE(d.units() == "m");
    REQUIRE(d.magnitude().as_sequence().size() == 2);
    REQUIRE(d.magnitude().as_sequence()[0].as_integer() == 1);

    auto text = Pvl::dump(m, { .dialect = Pvl::dialect_id::pvl });
    REQUIRE(text);
    REQUIRE(text->find("TRUE") == std::string::npos);
    REQUIRE(expect_ok(*text, pvl_opts) == m);
}

TEST_CASE("Parse Non-Decimal Numbers") {
    auto m = expect_ok("a = 2#0101#\nb = -16#98ef#\nc = 8#0107#\nEND");
    REQUIRE(m.get("a").as_integer() == 5);
    REQUIRE(m.get("b").as_integer() == -39151);
    REQUIRE(m.get("c").as_integer() == 71);

    auto odl = expect_ok("n = 16#-FF#\r\nEND\r\n", odl_opts);
    REQUIRE(odl.get("n").as_integer() == -255);

    expect_fail("a = 2#0121#\nEND", Pvl::ParseError::code::invalid_non_decimal);
}

TEST_CASE("Parse Dates and Times") {
    auto m = expect_ok("d = 2001-032\ndt = 1999-12-31T23:59:59Z\nt = 12:30\nEND");

    REQUIRE(m.get("d").as_date() == Pvl::date{ 2001, 2, 1 });
    REQUIRE(m.get("dt").as_datetime().date_part == Pvl::date{ 1999, 12, 31 });
    REQUIRE(m.get("dt").as_datetime().time_part.second == 59);
    REQUIRE(m.get("t").as_time().minute == 30);
    REQUIRE(m.get("t").as_time().is_utc());
}

TEST_CASE("Leap Seconds Depend on the Dialect") {
    auto m = expect_ok("t = 01:00:60\nEND");
    REQUIRE(m.get("t").is_time());
    REQUIRE(m.get("t").as_time().second == 60);

    auto odl = expect_ok("t = 01:00:60\r\nEND\r\n", odl_opts);
    REQUIRE(odl.get("t").is_string());
    REQUIRE(odl.get("t").as_string() == "01:00:60");
}

TEST_CASE("Numeric UTC Offsets") {
    auto m = expect_ok("t = 12:00+01\nEND");
    REQUIRE(m.get("t").as_time().utc_offset_minutes == 60);

    expect_fail("t = 12:00+01;\nEND;", Pvl::ParseError::code::unexpected_token, pvl_opts);
}

TEST_CASE("Quoted Strings Fold in ODL-Style Dialects") {
    auto omni = expect_ok("s = 'Line -\n  Continued'\nEND");
    REQUIRE(omni.get("s").as_string() == "Line Continued");

    auto odl = expect_ok("s = \"two\r\n   lines\"\r\nEND\r\n", odl_opts);
    REQUIRE(odl.get("s").as_string() == "two lines");

    auto pvl = expect_ok("s = 'Line -\n  Continued';\nEND;", pvl_opts);
    REQUIRE(pvl.get("s").as_string() == "Line -\n  Continued");
}

TEST_CASE("Dash Continuations Join Lines Before Lexing") {
    auto m = expect_ok("a = 12-\n  34\nEND");
    REQUIRE(m.get("a").as_integer() == 1234);
}

TEST_CASE("Lenient Parsing Recovers Missing Values") {
    auto m = expect_ok("foo = bar\nlife =\nmonty = python\nEnd");

    REQUIRE(m.size() == 3);
    REQUIRE(m.get("foo").as_string() == "bar");
    REQUIRE(m.get("life").is_empty());
    REQUIRE(m.get("life").as_empty().line == 2);
    REQUIRE(m.get("monty").as_string() == "python");
    REQUIRE(m.errors().size() == 1);
    REQUIRE(m.errors()[0] == 2);
}

TEST_CASE("Lenient Parsing Recovers Consecutive Missing Values") {
    auto m = expect_ok("a =\nb =\nc = 3\nEND");

    REQUIRE(m.size() == 3);
    REQUIRE(m.get("a").is_empty());
    REQUIRE(m.get("b").is_empty());
    REQUIRE(m.get("c").as_integer() == 3);
    REQUIRE(m.errors().size() == 2);
    REQUIRE(m.errors()[0] == 1);
    REQUIRE(m.errors()[1] == 2);
}

TEST_CASE("Strict Parsing Rejects Missing Values") {
    expect_fail("foo = bar\nlife =\nmonty = python\nEnd", Pvl::ParseError::code::unexpected_token, strict_opts);
    expect_fail("a = 1;\nb =", Pvl::ParseError::code::missing_value, pvl_opts);
    expect_fail("a =\nEND", Pvl::ParseError::code::missing_value, strict_opts);
}

TEST_CASE("Missing Value Before a Keyword or at End of Input") {
    auto eof = expect_ok("a = 1\nb =");
    REQUIRE(eof.get("b").is_empty());
    REQUIRE(eof.errors().size() == 1);
    REQUIRE(eof.errors()[0] == 2);

    auto keyword = expect_ok("Group = g\n  x =\nEnd_Group\nEnd");
    REQUIRE(keyword.get("g").as_aggregation().get("x").as_empty().line == 2);
    REQUIRE(keyword.errors().size() == 1);

    auto lenient_pvl = expect_ok("a =;\nEND;", { .dialect = Pvl::dialect_id::pvl, .strict = false });
    REQUIRE(lenient_pvl.get("a").is_empty());
}

TEST_CASE("Parsing Stops at the End Statement") {
    std::string text = "Object = IsisCube\n  Lines = 2\nEnd_Object\nEnd\n";
    text.append("\xff\x00\xfe\x01 garbage = = (", 16);

    auto m = expect_ok(text, isis_opts);
    REQUIRE(m.get("IsisCube").as_aggregation().get("Lines").as_integer() == 2);

    auto omni = expect_ok(text);
    REQUIRE(omni == m);
}

TEST_CASE("Lexical Errors Surface Through Parse") {
    expect_fail("a = \x01\nEND", Pvl::ParseError::code::illegal_character);
    expect_fail("a = \"caf\xc3\xa9\"\r\nEND", Pvl::ParseError::code::illegal_character, odl_opts);
    expect_fail("a = \"open\nEND", Pvl::ParseError::code::unterminated_quote);
    expect_fail("/* open\na = 1", Pvl::ParseError::code::unterminated_comment);
    expect_fail("a = 5 <m\nEND", Pvl::ParseError::code::unterminated_units);
}

TEST_CASE("Parse Units Expressions") {
    auto m = expect_ok("v = 34 <m/s>\nw = (1, 2) <km>\nu = 1 < m >\nEND");

    REQUIRE(m.get("v").as_quantity().units() == "m/s");
    REQUIRE(m.get("v").as_quantity().magnitude().as_integer() == 34);
    REQUIRE(m.get("w").as_quantity().magnitude().is_sequence());
    REQUIRE(m.get("u").as_quantity().units() == "m");

    expect_fail("v = 1 <a<b>\nEND", Pvl::ParseError::code::invalid_units);
    expect_fail("w = (1, 2) <km>\r\nEND\r\n", Pvl::ParseError::code::invalid_units, odl_opts);
    expect_fail("name = Mars <km>\r\nEND\r\n", Pvl::ParseError::code::invalid_units, odl_opts);
}

TEST_CASE("Max Depth Is Enforced") {
    std::string_view nested = "Group = a\nGroup = b\nX = 1\nEnd_Group\nEnd_Group\nEnd";

    expect_fail(nested, Pvl::ParseError::code::depth_limit_exceeded, { .max_depth = 1 });
    expect_ok(nested, { .max_depth = 2 });
    expect_ok(nested);

    expect_fail("a = ((1))\nEND", Pvl::ParseError::code::depth_limit_exceeded, { .max_depth = 1 });
}

TEST_CASE("Error Position in Range") {
    auto r = parse_str("a = 1\nb = 2\nc = = 3\nEND");
    REQUIRE_FALSE(r);
    REQUIRE(r.error().errc == Pvl::ParseError::code::unexpected_token);
    REQUIRE(r.error().line == 3);
    REQUIRE(r.error().column == 5);
    REQUIRE(r.error().offset == 16);
    REQUIRE_THAT(r.error().what(), Matchers::ContainsSubstring("line 3"));
}

TEST_CASE("Parse From Streams and Files") {
    std::istringstream is{ "a = 1\nEND" };
    auto r = Pvl::parse(is);
    REQUIRE(r);
    REQUIRE(r->get("a").as_integer() == 1);

    std::istringstream bad{ "a = 1" };
    bad.setstate(std::ios::failbit);
    auto failed = Pvl::parse(bad);
    REQUIRE_FALSE(failed);
    REQUIRE(failed.error().errc == Pvl::ParseError::code::io_error);

    auto missing = Pvl::parse_file(std::filesystem::temp_directory_path() / "pvl-no-such-label.lbl");
    REQUIRE_FALSE(missing);
    REQUIRE(missing.error().errc == Pvl::ParseError::code::io_error);

    auto path = std::filesystem::temp_directory_path() / "pvl-parse-file-test.lbl";
    {
        std::ofstream ofs(path, std::ios::binary);
        ofs << "PDS_VERSION_ID = PDS3\r\nLINES = 10\r\nEND\r\n";
    }
    auto file = Pvl::parse_file(path, odl_opts);
    std::filesystem::remove(path);
    REQUIRE(file);
    REQUIRE(file->get("LINES").as_integer() == 10);
}

TEST_CASE("Caller-Assembled Dialects") {
    auto lenient_pvl = Pvl::Dialect::preset(Pvl::dialect_id::pvl);
    lenient_pvl.parser.lenient = true;

    auto r = Pvl::parse("a =\nb = 2;\nEND;", lenient_pvl);
    REQUIRE(r);
    REQUIRE(r->get("a").is_empty());

    auto strict = Pvl::parse("a =\nb = 2;\nEND;", lenient_pvl, strict_opts);
    REQUIRE_FALSE(strict);
}

TEST_CASE("Dialect Names") {
    REQUIRE(Pvl::dialect_from_string("PDS3") == Pvl::dialect_id::pds3);
    REQUIRE(Pvl::dialect_from_string("omni") == Pvl::dialect_id::omni);
    REQUIRE_FALSE(Pvl::dialect_from_string("json"));
    REQUIRE(Pvl::to_string(Pvl::dialect_id::isis) == "isis");
}

TEST_CASE("Dump/Parse Round-Trip in Every Dialect") {
    Pvl::container module{ Pvl::role::module, {
        { "PDS_VERSION_ID", "PDS3" },
        { "LINES", 1024 },
        { "SCALE", 0.25 },
        { "TARGET", "MARS" },
        { "NOTE", "two words" },
        { "START_TIME", Pvl::datetime{ { 2020, 2, 29 }, { 23, 59, 1, 500'000'000, 0 } } },
        { "FILTERS", Pvl::sequence{ 1, 2, 3 } },
        { "BANDS", Pvl::value_set{ 4, 5 } },
        { "EXPOSURE", Pvl::quantity{ Pvl::value{ 12 }, "MS" } },
    } };
    module.append("IMAGE", Pvl::container{ Pvl::role::object, {
        { "LINE_SAMPLES", 512 },
        { "SAMPLE_TYPE", "MSB_INTEGER" },
    } });

    for (auto id : { Pvl::dialect_id::pvl, Pvl::dialect_id::odl, Pvl::dialect_id::pds3,
                     Pvl::dialect_id::isis, Pvl::dialect_id::omni }) {
        INFO(Pvl::to_string(id));
        auto text = Pvl::dump(module, { .dialect = id });
        REQUIRE(text);

        auto back = parse_str(*text, { .dialect = id });
        REQUIRE(back);
        REQUIRE(*back == module);

        auto again = Pvl::dump(*back, { .dialect = id });
        REQUIRE(again);
        REQUIRE(*again == *text);
    }
}

TEST_CASE("Dump/Parse Property on Random Modules") {
    rng r;

    for (int i = 0; i < 200; i++) {
        auto module = random_block(r, Pvl::role::module, 0, 2);

        for (auto id : { Pvl::dialect_id::pvl, Pvl::dialect_id::odl, Pvl::dialect_id::pds3,
                         Pvl::dialect_id::isis, Pvl::dialect_id::omni }) {
            auto text = Pvl::dump(module, { .dialect = id });
            if (!text) UNSCOPED_INFO(text.error().msg);
            REQUIRE(text);

            auto back = parse_str(*text, { .dialect = id });
            if (!back) UNSCOPED_INFO(back.error().what() << "\n" << *text);
            REQUIRE(back);
            REQUIRE(*back == module);
        }
    }
}

TEST_CASE("Trailing Dashes Survive the Omni Reader") {
    Pvl::container module{ Pvl::role::module, { { "A", "abc-" }, { "B", 1 } } };

    for (auto id : { Pvl::dialect_id::pvl, Pvl::dialect_id::odl, Pvl::dialect_id::pds3,
                     Pvl::dialect_id::isis, Pvl::dialect_id::omni }) {
        INFO(Pvl::to_string(id));
        auto text = Pvl::dump(module, { .dialect = id, .end_delimiter = false });
        REQUIRE(text);
        REQUIRE(text->find("abc-\n") == std::string::npos);
        REQUIRE(text->find("abc-\r") == std::string::npos);

        auto back = parse_str(*text);
        if (!back) UNSCOPED_INFO(back.error().what() << "\n" << *text);
        REQUIRE(back);
        REQUIRE(*back == module);
    }
}
