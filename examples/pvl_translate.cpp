#include <iostream>
#include <string>

#include "pvl/pvl.hpp"

// Reads a label in one dialect and writes it in another:
//     pvl_translate <file> [in-dialect] [out-dialect]
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <file> [pvl|odl|pds3|isis|omni] [pvl|odl|pds3|isis|omni]\n";
        return 2;
    }

    auto in = Pvl::dialect_from_string(argc > 2 ? argv[2] : "omni");
    auto out = Pvl::dialect_from_string(argc > 3 ? argv[3] : "pvl");
    if (!in || !out) {
        std::cerr << "Unknown dialect\n";
        return 2;
    }

    auto r = Pvl::parse_file(argv[1], { .dialect = *in });
    if (!r) {
        std::cerr << "Parse error! -> " << r.error().what() << '\n';
        if (!r.error().context.empty()) std::cerr << "    near: " << r.error().context << '\n';
        return 1;
    }

    for (auto line : r->errors())
        std::cerr << "warning: assignment on line " << line << " has no value\n";

    auto written = Pvl::dump(*r, std::cout, { .dialect = *out });
    if (!written) {
        std::cerr << "Cannot write as " << Pvl::to_string(*out) << ": " << written.error().msg;
        if (!written.error().key.empty()) std::cerr << " (" << written.error().key << ")";
        std::cerr << '\n';
        return 1;
    }
    std::cout << '\n';
    return 0;
}
