#include "pvl/pvl.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

#include "pvl/decoder.hpp"
#include "pvl/lexer.hpp"
#include "pvl/token.hpp"


namespace Pvl {

    namespace detail {
        ParseResult parse_impl(std::string_view text, const Dialect& dialect, const ParseOptions& opts);
        EncoderRules writer_rules(const Dialect& dialect, const WriteOptions& opts);
    } // namespace detail

    ParseResult parse(std::string_view input, const ParseOptions& opts) {
        return detail::parse_impl(input, Dialect::preset(opts.dialect), opts);
    }

    ParseResult parse(std::string_view input, const Dialect& dialect, const ParseOptions& opts) {
        return detail::parse_impl(input, dialect, opts);
    }

    ParseResult parse(std::istream& is, const ParseOptions& opts) {
        if (!is) return std::unexpected(ParseError::make(ParseError::code::io_error, 0, 1, 1, "Input stream is not readable"));
        std::ostringstream oss;
        oss << is.rdbuf();
        return detail::parse_impl(oss.str(), Dialect::preset(opts.dialect), opts);
    }

    ParseResult parse_file(const std::filesystem::path& path, const ParseOptions& opts) {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs) return std::unexpected(ParseError::make(ParseError::code::io_error, 0, 1, 1, "Cannot open " + path.string()));
        return parse(ifs, opts);
    }

    EncodeResult dump(const container& module, const WriteOptions& opts) {
        return dump(module, Dialect::preset(opts.dialect), opts);
    }

    EncodeResult dump(const container& module, const Dialect& dialect, const WriteOptions& opts) {
        Decoder decoder{ *dialect.grammar, dialect.decoder };
        Encoder encoder{ decoder, detail::writer_rules(dialect, opts) };
        return encoder.encode(module);
    }

    std::expected<void, EncodeError> dump(const container& module, std::ostream& os, const WriteOptions& opts) {
        auto text = dump(module, opts);
        if (!text) return std::unexpected(text.error());
        os << *text;
        if (!os) return std::unexpected(EncodeError::make(EncodeError::code::io_error, {}, "Output stream failed"));
        return {};
    }


#pragma region Parser
    // ================================
    // Internal parser implementation
    // ================================

    namespace detail {
        using expected_void = std::expected<void, ParseError>;
        template<typename T>
        using expected_t = std::expected<T, ParseError>;

        struct ParseState {
            TokenStream tokens;
            const Decoder& decoder;
            TokenClassifier cls;
            const Grammar& g;
            ParserRules rules;
            std::string_view doc;
            std::vector<size_t> errors;
            std::pmr::memory_resource* mem_res;
            size_t depth = 0;
            size_t max_depth = 0;

            // Value token of the most recent assignment in the current
            // block, if it was a single bare word. A stray '=' after it
            // means that word was really the next parameter name.
            std::optional<Token> last_word{};
            size_t last_equals = 0;

            ParseState(std::string_view text, const Decoder& d, ParserRules r, size_t max, std::pmr::memory_resource* res)
                : tokens{ text, d }, decoder{ d }, cls{ d }, g{ d.grammar() }, rules{ r }, doc{ text },
                  mem_res{ res }, max_depth{ max } {}

            [[nodiscard]] size_t line_of(size_t offset) const noexcept {
                size_t line = 1;
                for (size_t i = 0; i < offset && i < doc.size(); i++)
                    if (doc[i] == '\n') line++;
                return line;
            }

            ParseError make_error(ParseError::code code, size_t offset, std::string_view msg) const {
                return ParseError::at(code, doc, offset, msg);
            }

            ParseError make_eof_error(std::string_view msg) const {
                return ParseError::at(ParseError::code::unexpected_end_of_input, doc, doc.size(), msg);
            }
        };

        struct DepthGuard {
            ParseState& s;
            bool active = false;

            DepthGuard(ParseState& st) : s(st) {
                if (s.max_depth != 0 && s.depth + 1 > s.max_depth) return;
                s.depth++;
                active = true;
            }

            ~DepthGuard() {
                if (active) s.depth--;
            }

            bool ok() const {
                return active;
            }
        };

        expected_void parse_block(ParseState& s, container& c, const Token* begin, std::string_view name);
        expected_t<std::pair<Token, container>> parse_aggregation(ParseState& s, const Token& begin);
        expected_void parse_assignment(ParseState& s, const Token& name, container& c);
        expected_void parse_assignment_rest(ParseState& s, const Token& name, const Token& equals, container& c);
        expected_t<value> parse_assignment_value(ParseState& s, const Token& equals);
        expected_t<value> parse_value(ParseState& s);
        expected_t<value> parse_collection(ParseState& s, const Token& open);
        expected_t<value> parse_units(ParseState& s, value v, const Token& units);
        expected_void parse_statement_delimiter(ParseState& s);
        expected_t<std::optional<Token>> next_significant(ParseState& s);
        expected_t<std::optional<Token>> peek_significant(ParseState& s);

        expected_t<std::optional<Token>> next_significant(ParseState& s) {
            while (true) {
                auto t = s.tokens.next();
                if (!t) return std::unexpected(t.error());
                if (!*t || !s.cls.is_wsc(**t)) return *t;
            }
        }

        expected_t<std::optional<Token>> peek_significant(ParseState& s) {
            auto t = next_significant(s);
            if (t && *t) s.tokens.push_back(**t);
            return t;
        }

        bool is_single(const Token& t, char c) noexcept {
            return t.text.size() == 1 && t.text.front() == c;
        }

        value empty_at(ParseState& s, size_t equals_offset) {
            size_t line = s.line_of(equals_offset);
            s.errors.push_back(line);
            return value{ empty_value{ line }, s.mem_res };
        }

        expected_void parse_statement_delimiter(ParseState& s) {
            auto t = next_significant(s);
            if (!t) return std::unexpected(t.error());
            if (*t && !s.cls.is_delimiter(**t)) s.tokens.push_back(**t);
            return {};
        }

        expected_void parse_end_aggregation(ParseState& s, const Token& end, const Token& begin, std::string_view name) {
            if (!iequals(end.text, s.g.end_keyword_for(begin.text)))
                return std::unexpected(s.make_error(ParseError::code::unexpected_token, end.offset,
                                                    "\"" + std::string{ end.text } + "\" does not close \"" + std::string{ begin.text } + "\""));

            auto eq = peek_significant(s);
            if (!eq) return std::unexpected(eq.error());
            if (!*eq || !s.cls.is_assignment(**eq)) return parse_statement_delimiter(s);
            (void)s.tokens.next();

            auto block_name = next_significant(s);
            if (!block_name) return std::unexpected(block_name.error());
            if (!*block_name) return std::unexpected(s.make_eof_error("Expected a block name after \"" + std::string{ end.text } + " =\""));
            if (!iequals((*block_name)->text, name))
                return std::unexpected(s.make_error(ParseError::code::aggregation_name_mismatch, (*block_name)->offset,
                                                    "Block \"" + std::string{ name } + "\" closed as \"" + std::string{ (*block_name)->text } + "\""));
            return parse_statement_delimiter(s);
        }

        // Everything of an assignment after its '='.
        expected_void parse_assignment_rest(ParseState& s, const Token& name, const Token& equals, container& c) {
            s.last_equals = equals.offset;

            auto first = peek_significant(s);
            if (!first) return std::unexpected(first.error());

            auto v = parse_assignment_value(s, equals);
            if (!v) return std::unexpected(v.error());

            bool bare_word = *first && !v->is_empty() && !v->is_quantity() && !v->is_sequence() && !v->is_set();
            if (bare_word) s.last_word = **first;
            else s.last_word.reset();

            c.append(name.text, std::move(*v));
            return parse_statement_delimiter(s);
        }

        // A '=' where a statement should start. In lenient mode, when the
        // previous assignment's value was a bare word, that assignment was
        // empty and the word is the name for this '='.
        expected_void recover_stray_equals(ParseState& s, const Token& equals, container& c) {
            if (!s.rules.lenient || c.empty() || !s.last_word || !s.cls.is_parameter_name(*s.last_word))
                return std::unexpected(s.make_error(ParseError::code::unexpected_token, equals.offset,
                                                    "Expected an aggregation block, an assignment or an End statement, but found \"=\""));

            Token name = *s.last_word;
            string key = c.pop_last().first;
            c.append(key, empty_at(s, s.last_equals));
            return parse_assignment_rest(s, name, equals, c);
        }

        expected_void parse_block(ParseState& s, container& c, const Token* begin, std::string_view name) {
            s.last_word.reset();
            while (true) {
                auto next = next_significant(s);
                if (!next) return std::unexpected(next.error());
                if (!*next) {
                    if (begin) return std::unexpected(s.make_eof_error("Block \"" + std::string{ name } + "\" is not closed"));
                    return {};
                }
                Token t = **next;

                if (s.cls.is_end_statement(t)) {
                    if (begin)
                        return std::unexpected(s.make_error(ParseError::code::unexpected_token, t.offset,
                                                            "End statement inside block \"" + std::string{ name } + "\""));
                    // Nothing after the End statement is read; a binary
                    // payload may follow.
                    return {};
                }

                if (s.cls.is_end_aggregation(t)) {
                    if (!begin)
                        return std::unexpected(s.make_error(ParseError::code::unexpected_token, t.offset,
                                                            "\"" + std::string{ t.text } + "\" without a matching Begin"));
                    return parse_end_aggregation(s, t, *begin, name);
                }

                if (s.cls.is_begin_aggregation(t)) {
                    auto agg = parse_aggregation(s, t);
                    if (!agg) return std::unexpected(agg.error());
                    c.append(agg->first.text, value{ std::move(agg->second), s.mem_res });
                    s.last_word.reset();
                    continue;
                }

                if (s.cls.is_assignment(t)) {
                    if (auto r = recover_stray_equals(s, t, c); !r) return r;
                    continue;
                }

                if (s.cls.is_parameter_name(t)) {
                    if (auto r = parse_assignment(s, t, c); !r) return r;
                    continue;
                }

                return std::unexpected(s.make_error(ParseError::code::unexpected_token, t.offset,
                                                    "Expected an aggregation block, an assignment or an End statement, but found \""
                                                    + std::string{ t.text } + "\""));
            }
        }

        expected_t<std::pair<Token, container>> parse_aggregation(ParseState& s, const Token& begin) {
            DepthGuard guard{ s };
            if (!guard.ok()) return std::unexpected(s.make_error(ParseError::code::depth_limit_exceeded, begin.offset, "Maximum nesting depth exceeded"));

            auto eq = next_significant(s);
            if (!eq) return std::unexpected(eq.error());
            if (!*eq) return std::unexpected(s.make_eof_error("Expected \"=\" after \"" + std::string{ begin.text } + "\""));
            if (!s.cls.is_assignment(**eq))
                return std::unexpected(s.make_error(ParseError::code::unexpected_token, (*eq)->offset,
                                                    "Expected \"=\" after \"" + std::string{ begin.text } + "\""));

            auto name = next_significant(s);
            if (!name) return std::unexpected(name.error());
            if (!*name) return std::unexpected(s.make_eof_error("Expected a block name after \"" + std::string{ begin.text } + " =\""));
            if (!s.cls.is_parameter_name(**name))
                return std::unexpected(s.make_error(ParseError::code::unexpected_token, (*name)->offset,
                                                    "\"" + std::string{ (*name)->text } + "\" is not a valid block name"));

            if (auto r = parse_statement_delimiter(s); !r) return std::unexpected(r.error());

            container agg{ s.g.is_begin_group(begin.text) ? role::group : role::object, s.mem_res };
            if (auto r = parse_block(s, agg, &begin, (*name)->text); !r) return std::unexpected(r.error());
            return std::pair<Token, container>{ **name, std::move(agg) };
        }

        expected_void parse_assignment(ParseState& s, const Token& name, container& c) {
            auto eq = next_significant(s);
            if (!eq) return std::unexpected(eq.error());
            if (!*eq) return std::unexpected(s.make_eof_error("Expected \"=\" after \"" + std::string{ name.text } + "\""));
            if (!s.cls.is_assignment(**eq))
                return std::unexpected(s.make_error(ParseError::code::unexpected_token, (*eq)->offset,
                                                    "Expected \"=\" after \"" + std::string{ name.text } + "\", but found \""
                                                    + std::string{ (*eq)->text } + "\""));

            return parse_assignment_rest(s, name, **eq, c);
        }

        expected_t<value> parse_assignment_value(ParseState& s, const Token& equals) {
            auto next = peek_significant(s);
            if (!next) return std::unexpected(next.error());

            if (!*next) {
                if (s.rules.lenient) return empty_at(s, equals.offset);
                return std::unexpected(s.make_error(ParseError::code::missing_value, equals.offset, "Input ended before the value of an assignment"));
            }

            const Token& t = **next;
            if (s.cls.is_reserved_keyword(t) || s.cls.is_delimiter(t)) {
                if (s.rules.lenient) return empty_at(s, equals.offset);
                return std::unexpected(s.make_error(ParseError::code::missing_value, t.offset,
                                                    "Expected a value, but found \"" + std::string{ t.text } + "\""));
            }

            return parse_value(s);
        }

        expected_t<value> parse_value(ParseState& s) {
            auto next = next_significant(s);
            if (!next) return std::unexpected(next.error());
            if (!*next) return std::unexpected(s.make_eof_error("Expected a value"));
            Token t = **next;

            value v{ s.mem_res };
            if (is_single(t, s.g.set.open) || is_single(t, s.g.sequence.open)) {
                auto coll = parse_collection(s, t);
                if (!coll) return std::unexpected(coll.error());
                v = std::move(*coll);
            } else {
                auto decoded = s.decoder.decode_simple_value(t.text);
                if (!decoded) {
                    if (decoded.error().errc == DecodeError::code::invalid_digits)
                        return std::unexpected(s.make_error(ParseError::code::invalid_non_decimal, t.offset, decoded.error().msg));
                    return std::unexpected(s.make_error(ParseError::code::unexpected_token, t.offset,
                                                        "Expected a simple value, a set or a sequence, but found \""
                                                        + std::string{ t.text } + "\""));
                }
                v = std::move(*decoded);
            }

            auto units = peek_significant(s);
            if (!units) return std::unexpected(units.error());
            if (*units && s.cls.is_units(**units)) {
                (void)s.tokens.next();
                return parse_units(s, std::move(v), **units);
            }
            return v;
        }

        expected_t<value> parse_collection(ParseState& s, const Token& open) {
            DepthGuard guard{ s };
            if (!guard.ok()) return std::unexpected(s.make_error(ParseError::code::depth_limit_exceeded, open.offset, "Maximum nesting depth exceeded"));

            bool is_set = is_single(open, s.g.set.open);
            char close = is_set ? s.g.set.close : s.g.sequence.close;
            sequence items(allocator_type{ s.mem_res });

            auto first = peek_significant(s);
            if (!first) return std::unexpected(first.error());
            if (!*first) return std::unexpected(s.make_eof_error("Unterminated " + std::string{ is_set ? "set" : "sequence" }));
            if (is_single(**first, close)) {
                (void)s.tokens.next();
            } else {
                while (true) {
                    auto v = parse_value(s);
                    if (!v) return std::unexpected(v.error());
                    items.push_back(std::move(*v));

                    auto t = next_significant(s);
                    if (!t) return std::unexpected(t.error());
                    if (!*t) return std::unexpected(s.make_eof_error("Unterminated " + std::string{ is_set ? "set" : "sequence" }));
                    if (is_single(**t, close)) break;
                    if (!s.cls.is_separator(**t))
                        return std::unexpected(s.make_error(ParseError::code::unexpected_token, (*t)->offset,
                                                            "Expected \"" + std::string(1, s.g.separator) + "\" or \"" + std::string(1, close)
                                                            + "\", but found \"" + std::string{ (*t)->text } + "\""));
                }
            }

            if (!is_set) return value{ std::move(items), s.mem_res };
            value_set set(s.mem_res);
            for (auto& item : items) set.insert(std::move(item));
            return value{ std::move(set), s.mem_res };
        }

        expected_t<value> parse_units(ParseState& s, value v, const Token& units) {
            std::string_view text = units.text;
            if (text.size() < 2 || text.back() != s.g.units.close)
                return std::unexpected(s.make_error(ParseError::code::invalid_units, units.offset, "Units expression is not closed"));

            text = text.substr(1, text.size() - 2);
            if (text.find(s.g.units.open) != std::string_view::npos || text.find(s.g.units.close) != std::string_view::npos)
                return std::unexpected(s.make_error(ParseError::code::invalid_units, units.offset, "Units delimiter inside a units expression"));

            while (!text.empty() && s.g.is_whitespace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
            while (!text.empty() && s.g.is_whitespace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

            const value& magnitude = v.is_quantity() ? v.as_quantity().magnitude() : v;
            if (s.rules.units_on_numbers_only && !magnitude.is_number())
                return std::unexpected(s.make_error(ParseError::code::invalid_units, units.offset, "Units may only follow a numeric value"));

            return s.decoder.decode_quantity(std::move(v), text);
        }

        // Removes a dash at the end of a line together with the line break
        // and the whitespace that follows it.
        std::string join_dash_continuations(std::string_view text) {
            std::string out;
            out.reserve(text.size());
            for (size_t i = 0; i < text.size(); i++) {
                char c = text[i];
                if (c == '-' && i + 1 < text.size() && (text[i + 1] == '\n' || text[i + 1] == '\r' || text[i + 1] == '\f')) {
                    i++;
                    while (i + 1 < text.size() && std::string_view{ " \t\n\r\f\v" }.find(text[i + 1]) != std::string_view::npos) i++;
                    continue;
                }
                out.push_back(c);
            }
            return out;
        }

        ParseResult parse_impl(std::string_view text, const Dialect& dialect, const ParseOptions& opts) {
            std::pmr::memory_resource* res = std::pmr::get_default_resource();

            ParserRules rules = dialect.parser;
            if (opts.strict) rules.lenient = !*opts.strict;

            std::string joined;
            if (rules.join_dash_continuations) {
                joined = join_dash_continuations(text);
                text = joined;
            }

            Decoder decoder{ *dialect.grammar, dialect.decoder, res };
            ParseState s{ text, decoder, rules, opts.max_depth, res };

            container module{ role::module, res };
            if (auto r = parse_block(s, module, nullptr, {}); !r) return std::unexpected(r.error());
            module.set_errors(std::move(s.errors));
            return module;
        }
#pragma endregion
#pragma region Writer

        EncoderRules writer_rules(const Dialect& dialect, const WriteOptions& opts) {
            EncoderRules rules = dialect.encoder;
            rules.indent = opts.indent;
            rules.width = opts.width;
            rules.aggregation_end = opts.aggregation_end;
            if (opts.newline) rules.newline = *opts.newline;
            if (opts.end_delimiter) rules.end_delimiter = *opts.end_delimiter;
            if (rules.pds_groups) {
                rules.convert_group_to_object = opts.convert_group_to_object;
                rules.tab_replace = opts.tab_replace;
            }
            return rules;
        }
#pragma endregion

    } // namespace detail

} // namespace Pvl
