#include "pvl/options.hpp"


namespace Pvl {

    Dialect Dialect::preset(dialect_id id) {
        Dialect d;
        d.id = id;

        switch (id) {
        case dialect_id::pvl:
            d.grammar = &pvl_grammar();
            break;

        case dialect_id::odl:
        case dialect_id::pds3:
            d.grammar = &odl_grammar();
            d.decoder.fold_quoted_strings = true;
            d.decoder.numeric_utc_offsets = true;
            d.parser.units_on_numbers_only = true;

            d.encoder.newline = "\r\n";
            d.encoder.end_delimiter = false;
            d.encoder.final_newline = true;
            d.encoder.fold_strings = true;
            d.encoder.identifier_keys = true;
            d.encoder.units_on_numbers_only = true;
            d.encoder.odl_units = true;
            d.encoder.scalar_collections = true;
            d.encoder.symbol_strings = true;
            d.encoder.zones = zone_style::odl;

            if (id == dialect_id::pds3) {
                d.encoder.upper_case_keys = true;
                d.encoder.pds_sets = true;
                d.encoder.pds_groups = true;
                d.encoder.tab_replace = 4;
                d.encoder.zones = zone_style::utc_only;
            }
            break;

        case dialect_id::isis:
            d.grammar = &isis_grammar();
            d.encoder.end_delimiter = false;
            break;

        case dialect_id::omni:
            d.grammar = &omni_grammar();
            d.decoder.fold_quoted_strings = true;
            d.decoder.numeric_utc_offsets = true;
            d.parser.lenient = true;
            d.parser.join_dash_continuations = true;
            d.encoder.fold_strings = true;
            d.encoder.zones = zone_style::odl;
            break;
        }
        return d;
    }

    std::string_view to_string(dialect_id id) noexcept {
        switch (id) {
        case dialect_id::pvl: return "pvl";
        case dialect_id::odl: return "odl";
        case dialect_id::pds3: return "pds3";
        case dialect_id::isis: return "isis";
        case dialect_id::omni: return "omni";
        }
        return "pvl";
    }

    std::optional<dialect_id> dialect_from_string(std::string_view name) noexcept {
        for (auto id : { dialect_id::pvl, dialect_id::odl, dialect_id::pds3, dialect_id::isis, dialect_id::omni }) {
            if (iequals(name, to_string(id))) return id;
        }
        return std::nullopt;
    }

} // namespace Pvl
