#include <catch2/catch_all.hpp>

#include "pvl/decoder.hpp"
#include "pvl/grammar.hpp"
#include "pvl/lexer.hpp"
#include "pvl/token.hpp"

#include <string>
#include <vector>

using namespace Catch;

namespace {

    std::vector<std::string> lex_all(std::string_view text, const Pvl::Decoder& d) {
        Pvl::Lexer lexer{ text, d };
        std::vector<std::string> out;
        while (true) {
            auto t = lexer.next();
            REQUIRE(t);
            if (!*t) break;
            out.emplace_back((*t)->text);
        }
        return out;
    }

    static void expect_lex_fail(std::string_view text, const Pvl::Decoder& d, Pvl::ParseError::code code) {
        Pvl::Lexer lexer{ text, d };
        while (true) {
            auto t = lexer.next();
            if (!t) {
                REQUIRE(t.error().errc == code);
                return;
            }
            REQUIRE(*t);
        }
    }
}


TEST_CASE("Grammar Keyword Tables") {
    const auto& pvl = Pvl::pvl_grammar();
    const auto& isis = Pvl::isis_grammar();

    REQUIRE(pvl.is_begin_group("begin_group"));
    REQUIRE(pvl.is_begin_object("Object"));
    REQUIRE(pvl.end_keyword_for("BEGIN_OBJECT") == "END_OBJECT");
    REQUIRE(pvl.end_keyword_for("group") == "END_GROUP");
    REQUIRE(pvl.is_reserved_keyword("End"));
    REQUIRE_FALSE(pvl.is_reserved_keyword("Ending"));

    REQUIRE_FALSE(isis.is_begin_group("BEGIN_GROUP"));
    REQUIRE(isis.group.preferred_begin == "Group");
    REQUIRE(isis.comment_starting_at("a # note", 2) != nullptr);
    REQUIRE(isis.comment_starting_at("a # note", 2)->close == "\n");
    REQUIRE(pvl.comment_starting_at("a # note", 2) == nullptr);
    REQUIRE(pvl.comment_starting_at("a /* note */", 2)->close == "*/");
    REQUIRE(pvl.comment_starting_at("a /* note */", 99) == nullptr);
}

TEST_CASE("Grammar Character Sets") {
    REQUIRE(Pvl::pvl_grammar().char_allowed(U'é'));
    REQUIRE_FALSE(Pvl::pvl_grammar().char_allowed(0x01));
    REQUIRE_FALSE(Pvl::pvl_grammar().char_allowed(0x85));
    REQUIRE_FALSE(Pvl::odl_grammar().char_allowed(U'é'));
    REQUIRE(Pvl::odl_grammar().char_allowed('\t'));
}

TEST_CASE("Non-Decimal Prefixes Follow the Sign Position") {
    REQUIRE(Pvl::pvl_grammar().is_non_decimal_prefix("-16#"));
    REQUIRE_FALSE(Pvl::pvl_grammar().is_non_decimal_prefix("16#-"));
    REQUIRE_FALSE(Pvl::pvl_grammar().is_non_decimal_prefix("10#"));
    REQUIRE(Pvl::odl_grammar().is_non_decimal_prefix("16#-"));
    REQUIRE_FALSE(Pvl::odl_grammar().is_non_decimal_prefix("-16#"));
    REQUIRE(Pvl::omni_grammar().is_non_decimal_prefix("10#"));
    REQUIRE_FALSE(Pvl::omni_grammar().is_non_decimal_prefix("-16#-"));
}

TEST_CASE("Decode Simple Values in Priority Order") {
    Pvl::Decoder d{ Pvl::pvl_grammar() };

    auto i = d.decode_simple_value("-42");
    REQUIRE(i);
    REQUIRE(i->as_integer() == -42);

    auto r = d.decode_simple_value("1.5e3");
    REQUIRE(r);
    REQUIRE(r->is_real());
    REQUIRE(r->as_real() == Approx(1500.0));

    auto big = d.decode_simple_value("123456789012345678901234567890");
    REQUIRE(big);
    REQUIRE(big->is_real());

    auto b = d.decode_simple_value("false");
    REQUIRE(b);
    REQUIRE(b->is_bool());
    REQUIRE_FALSE(b->as_bool());

    auto n = d.decode_simple_value("Null");
    REQUIRE(n);
    REQUIRE(n->is_null());

    auto q = d.decode_simple_value("\"42\"");
    REQUIRE(q);
    REQUIRE(q->as_string() == "42");

    auto s = d.decode_simple_value("Mars");
    REQUIRE(s);
    REQUIRE(s->as_string() == "Mars");

    REQUIRE_FALSE(d.decode_decimal("+-5"));
    REQUIRE_FALSE(d.decode_decimal("."));
    REQUIRE_FALSE(d.decode_unquoted_string("END"));
    REQUIRE_FALSE(d.decode_unquoted_string("a/*b"));
}

TEST_CASE("Decode Non-Decimal Numerals") {
    Pvl::Decoder pvl{ Pvl::pvl_grammar() };
    Pvl::Decoder odl{ Pvl::odl_grammar() };

    REQUIRE(pvl.decode_simple_value("2#0101#")->as_integer() == 5);
    REQUIRE(pvl.decode_simple_value("-16#98ef#")->as_integer() == -39151);
    REQUIRE(pvl.decode_simple_value("8#0107#")->as_integer() == 71);
    REQUIRE(odl.decode_simple_value("16#-FF#")->as_integer() == -255);
    REQUIRE(odl.decode_simple_value("7#16#")->as_integer() == 13);

    auto bad = pvl.decode_simple_value("2#0121#");
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error().errc == Pvl::DecodeError::code::invalid_digits);

    REQUIRE_FALSE(pvl.decode_non_decimal("7#16#"));
}

TEST_CASE("Decode Dates and Times") {
    Pvl::Decoder pvl{ Pvl::pvl_grammar() };

    auto d = pvl.decode_datetime("2001-01-31");
    REQUIRE(d);
    REQUIRE(d->as_date() == Pvl::date{ 2001, 1, 31 });

    auto ordinal = pvl.decode_datetime("2000-060");
    REQUIRE(ordinal);
    REQUIRE(ordinal->as_date() == Pvl::date{ 2000, 2, 29 });

    auto t = pvl.decode_datetime("12:30:15.25Z");
    REQUIRE(t);
    REQUIRE(t->as_time().hour == 12);
    REQUIRE(t->as_time().minute == 30);
    REQUIRE(t->as_time().second == 15);
    REQUIRE(t->as_time().nanosecond == 250'000'000u);
    REQUIRE(t->as_time().is_utc());

    auto dt = pvl.decode_datetime("1999-12-31T23:59");
    REQUIRE(dt);
    REQUIRE(dt->as_datetime().date_part == Pvl::date{ 1999, 12, 31 });
    REQUIRE(dt->as_datetime().time_part.minute == 59);

    REQUIRE_FALSE(pvl.decode_datetime("2001-02-30"));
    REQUIRE_FALSE(pvl.decode_datetime("24:00"));
}

TEST_CASE("Leap Second Is Preserved") {
    Pvl::Decoder pvl{ Pvl::pvl_grammar() };
    auto t = pvl.decode_datetime("01:00:60");
    REQUIRE(t);
    REQUIRE(t->as_time().second == 60);
    REQUIRE(t->as_time().minute == 0);
    REQUIRE(t->as_time().is_leap_second());

    Pvl::Decoder odl{ Pvl::odl_grammar(), { .fold_quoted_strings = true, .numeric_utc_offsets = true } };
    REQUIRE_FALSE(odl.decode_datetime("01:00:60"));
}

TEST_CASE("Numeric UTC Offsets Depend on the Rules") {
    Pvl::Decoder strict{ Pvl::pvl_grammar() };
    Pvl::Decoder numeric{ Pvl::pvl_grammar(), { .numeric_utc_offsets = true } };

    REQUIRE_FALSE(strict.decode_datetime("12:00+01"));

    auto t = numeric.decode_datetime("12:00-05:30");
    REQUIRE(t);
    REQUIRE(t->as_time().utc_offset_minutes == -330);

    auto h = numeric.decode_datetime("2020-01-01T00:00:00+7");
    REQUIRE(h);
    REQUIRE(h->as_datetime().time_part.utc_offset_minutes == 420);

    REQUIRE_FALSE(numeric.decode_datetime("12:00+15"));
}

TEST_CASE("Quoted String Folding") {
    Pvl::Decoder folding{ Pvl::odl_grammar(), { .fold_quoted_strings = true } };
    Pvl::Decoder literal{ Pvl::pvl_grammar() };

    auto f = folding.decode_quoted_string("'Line -\n Continued'");
    REQUIRE(f);
    REQUIRE(f->as_string() == "Line Continued");

    auto l = literal.decode_quoted_string("'Line -\n Continued'");
    REQUIRE(l);
    REQUIRE(l->as_string() == "Line -\n Continued");

    auto spaced = folding.decode_quoted_string("\"  a \t\n  b  \"");
    REQUIRE(spaced->as_string() == "a b");

    auto escaped = literal.decode_quoted_string("\"tab\\there\\\\\"");
    REQUIRE(escaped->as_string() == "tab\there\\");
}

TEST_CASE("Lexer Splits Statements") {
    Pvl::Decoder d{ Pvl::pvl_grammar() };

    REQUIRE(lex_all("a=1;", d) == std::vector<std::string>{ "a", "=", "1", ";" });
    REQUIRE(lex_all("  a /* note */ = (1,2) <m>", d)
            == std::vector<std::string>{ "a", "/* note */", "=", "(", "1", ",", "2", ")", "<m>" });
    REQUIRE(lex_all("s = \"two words\"", d) == std::vector<std::string>{ "s", "=", "\"two words\"" });
    REQUIRE(lex_all("", d).empty());
}

TEST_CASE("Lexer Keeps Numeric Literals Together") {
    Pvl::Decoder pvl{ Pvl::pvl_grammar() };
    REQUIRE(lex_all("-1.5e+3", pvl) == std::vector<std::string>{ "-1.5e+3" });
    REQUIRE(lex_all("x=-16#98ef#;", pvl) == std::vector<std::string>{ "x", "=", "-16#98ef#", ";" });

    Pvl::Decoder odl{ Pvl::odl_grammar(), { .numeric_utc_offsets = true } };
    REQUIRE(lex_all("t = 12:00+01", odl) == std::vector<std::string>{ "t", "=", "12:00+01" });
    REQUIRE(lex_all("n = 16#-FF#", odl) == std::vector<std::string>{ "n", "=", "16#-FF#" });
}

TEST_CASE("Lexer Line Comments End at Newline") {
    Pvl::Decoder d{ Pvl::isis_grammar() };

    REQUIRE(lex_all("# note\na = 1 # trailing", d) == std::vector<std::string>{ "# note\n", "a", "=", "1", "# trailing" });

    Pvl::TokenClassifier cls{ d };
    REQUIRE(cls.is_comment(Pvl::Token{ "# trailing", 0 }));
    REQUIRE(cls.is_wsc(Pvl::Token{ "/* x */", 0 }));
}

TEST_CASE("Lexer Errors") {
    Pvl::Decoder pvl{ Pvl::pvl_grammar() };

    expect_lex_fail("a = \"open", pvl, Pvl::ParseError::code::unterminated_quote);
    expect_lex_fail("/* open", pvl, Pvl::ParseError::code::unterminated_comment);
    expect_lex_fail("a = 5 <m", pvl, Pvl::ParseError::code::unterminated_units);
    expect_lex_fail("a = 16#FF", pvl, Pvl::ParseError::code::unterminated_non_decimal);
    expect_lex_fail("a = \x01", pvl, Pvl::ParseError::code::illegal_character);
    expect_lex_fail("a = \xff\xfe", pvl, Pvl::ParseError::code::illegal_character);

    Pvl::Decoder odl{ Pvl::odl_grammar() };
    expect_lex_fail("a = \"caf\xc3\xa9\"", odl, Pvl::ParseError::code::illegal_character);
}

TEST_CASE("Lexer Is Lazy") {
    Pvl::Decoder d{ Pvl::pvl_grammar() };
    std::string text = "a = 1\nEND\n";
    size_t payload = text.size();
    text.append("\xff\x00\xfe", 3);

    Pvl::Lexer lexer{ text, d };
    for (const char* expected : { "a", "=", "1", "END" }) {
        auto t = lexer.next();
        REQUIRE(t);
        REQUIRE(*t);
        REQUIRE((*t)->text == expected);
    }
    REQUIRE(lexer.position() < payload);
}

TEST_CASE("Token Stream Push Back") {
    Pvl::Decoder d{ Pvl::pvl_grammar() };
    Pvl::TokenStream ts{ "a = 1", d };

    auto peeked = ts.peek();
    REQUIRE(peeked);
    REQUIRE((*peeked)->text == "a");

    auto first = ts.next();
    REQUIRE(first);
    REQUIRE(**first == **peeked);

    auto second = ts.next();
    REQUIRE((*second)->text == "=");
    ts.push_back(**second);
    ts.push_back(**first);

    REQUIRE((*ts.next())->text == "a");
    REQUIRE((*ts.next())->text == "=");
    REQUIRE((*ts.next())->text == "1");

    auto done = ts.next();
    REQUIRE(done);
    REQUIRE_FALSE(*done);
}

TEST_CASE("Token Classification") {
    Pvl::Decoder d{ Pvl::pvl_grammar() };
    Pvl::TokenClassifier cls{ d };

    REQUIRE(cls.is_parameter_name(Pvl::Token{ "Lines", 0 }));
    REQUIRE_FALSE(cls.is_parameter_name(Pvl::Token{ "End_Object", 0 }));
    REQUIRE_FALSE(cls.is_parameter_name(Pvl::Token{ "12", 0 }));
    REQUIRE(cls.is_begin_aggregation(Pvl::Token{ "Begin_Object", 0 }));
    REQUIRE(cls.is_end_statement(Pvl::Token{ "end", 0 }));
    REQUIRE(cls.is_numeric(Pvl::Token{ "16#FF#", 0 }));
    REQUIRE(cls.is_datetime(Pvl::Token{ "2020-001", 0 }));
    REQUIRE(cls.is_quoted_string(Pvl::Token{ "'x'", 0 }));
    REQUIRE(cls.is_units(Pvl::Token{ "<km>", 0 }));
    REQUIRE(cls.is_delimiter(Pvl::Token{ ";", 0 }));
    REQUIRE_FALSE(cls.is_simple_value(Pvl::Token{ "{", 0 }));
}
