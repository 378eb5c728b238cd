#include "pvl/error.hpp"

#include <algorithm>
#include <string>


namespace Pvl {

    ParseError ParseError::make(code c, size_t o, size_t l, size_t col, std::string_view m) {
        ParseError e;
        e.errc = c;
        e.offset = o;
        e.line = l;
        e.column = col;
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    ParseError ParseError::at(code c, std::string_view doc, size_t offset, std::string_view m) {
        offset = std::min(offset, doc.size());
        auto before = doc.substr(0, offset);
        size_t line = static_cast<size_t>(std::count(before.begin(), before.end(), '\n')) + 1;
        size_t line_start = before.rfind('\n');
        size_t column = (line_start == std::string_view::npos) ? offset + 1 : offset - line_start;

        ParseError e = make(c, offset, line, column, m);

        size_t from = offset > 20 ? offset - 20 : 0;
        auto excerpt = doc.substr(from, 40);
        for (char ch : excerpt) {
            switch (ch) {
            case '\n': e.context += "\\n"; break;
            case '\r': e.context += "\\r"; break;
            case '\t': e.context += "\\t"; break;
            default: e.context.push_back(ch); break;
            }
        }
        return e;
    }

    std::string ParseError::what() const {
        std::string out = msg;
        out += ": line " + std::to_string(line) + " column " + std::to_string(column)
             + " (char " + std::to_string(offset) + ")";
        return out;
    }

    EncodeError EncodeError::make(code c, std::string_view key, std::string_view m) {
        EncodeError e;
        e.errc = c;
        e.key.assign(key.begin(), key.end());
        e.msg.assign(m.begin(), m.end());
        return e;
    }

    KeyNotFound::KeyNotFound(std::string_view key)
        : std::out_of_range{ "Pvl::container: key not found: " + std::string{ key } }, m_Key{ key } {}

    IndexOutOfRange::IndexOutOfRange(std::string_view key, size_t index, size_t count)
        : std::out_of_range{ "Pvl::container: occurrence " + std::to_string(index) + " of key \""
                             + std::string{ key } + "\" requested, but only " + std::to_string(count) + " exist" },
          m_Index{ index } {}

} // namespace Pvl
