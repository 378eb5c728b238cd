#include "pvl/value.hpp"

#include <algorithm>
#include <stdexcept>


namespace Pvl {

#pragma region value_set

    value_set::value_set(std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Items{ allocator_type(res) } {}

    value_set::value_set(std::initializer_list<value> items, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Items{ allocator_type(res) } {
        for (const auto& v : items) insert(v);
    }

    value_set::value_set(const value_set& other)
        : m_MemRes{ other.m_MemRes }, m_Items{ other.m_Items, allocator_type(other.m_MemRes) } {}

    value_set::value_set(value_set&& other) noexcept = default;

    value_set& value_set::operator=(const value_set& other) {
        if (this == &other) return *this;
        m_Items = other.m_Items;
        return *this;
    }

    value_set& value_set::operator=(value_set&& other) {
        if (this == &other) return *this;
        m_Items = std::move(other.m_Items);
        return *this;
    }

    value_set::~value_set() = default;

    bool value_set::insert(value v) {
        if (contains(v)) return false;
        m_Items.emplace_back(std::move(v));
        return true;
    }

    bool value_set::contains(const value& v) const {
        return std::find(m_Items.begin(), m_Items.end(), v) != m_Items.end();
    }

    size_t value_set::size() const noexcept { return m_Items.size(); }
    bool value_set::empty() const noexcept { return m_Items.empty(); }
    value_set::const_iterator value_set::begin() const noexcept { return m_Items.begin(); }
    value_set::const_iterator value_set::end() const noexcept { return m_Items.end(); }

    bool operator==(const value_set& lhs, const value_set& rhs) {
        if (lhs.size() != rhs.size()) return false;
        return std::all_of(lhs.begin(), lhs.end(), [&](const value& v) { return rhs.contains(v); });
    }

#pragma endregion
#pragma region quantity

    quantity::quantity(value magnitude, std::string_view units)
        : m_Units{ units } {
        if (magnitude.is_quantity()) throw std::invalid_argument{ "Pvl::quantity: magnitude may not be a quantity" };
        m_Value = std::make_shared<const value>(std::move(magnitude));
    }

    const value& quantity::magnitude() const noexcept { return *m_Value; }

    bool operator==(const quantity& lhs, const quantity& rhs) {
        return lhs.m_Units == rhs.m_Units && *lhs.m_Value == *rhs.m_Value;
    }

#pragma endregion
#pragma region value

    value::value(std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(std::nullptr_t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::monostate{} } {}

    value::value(double d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::in_place_type<double>, d } {}

    value::value(const char* s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, s, res } {}

    value::value(std::string_view sv, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, sv.begin(), sv.end(), res } {}

    value::value(string s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<string>, std::move(s), res } {}

    value::value(date d, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::in_place_type<date>, d } {}

    value::value(time t, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::in_place_type<time>, t } {}

    value::value(datetime dt, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::in_place_type<datetime>, dt } {}

    value::value(sequence s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<sequence>, std::move(s), allocator_type{ res } } {}

    value::value(value_set s, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<value_set>, std::move(s) } {}

    value::value(container c, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<container>, std::move(c) } {}

    value::value(quantity q, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Storage{ std::in_place_type<quantity>, std::move(q) } {}

    value::value(empty_value e, std::pmr::memory_resource* res) noexcept
        : m_MemRes{ res }, m_Storage{ std::in_place_type<empty_value>, e } {}

    value::value(const value& other)
        : m_MemRes{ other.m_MemRes }, m_Storage{ clone_storage(other.m_Storage, other.m_MemRes) } {}

    value::value(value&& other) noexcept
        : m_MemRes{ other.m_MemRes }, m_Storage{ std::move(other.m_Storage) } {}

    value& value::operator=(const value& other) {
        if (this == &other) return *this;
        m_Storage = clone_storage(other.m_Storage, m_MemRes);
        return *this;
    }

    value& value::operator=(value&& other) {
        if (this == &other) return *this;
        if (m_MemRes == other.m_MemRes) m_Storage = std::move(other.m_Storage);
        else m_Storage = clone_storage(other.m_Storage, m_MemRes);
        return *this;
    }

    kind value::type() const noexcept {
        switch (m_Storage.index()) {
        case 0: return kind::null;
        case 1: return kind::boolean;
        case 2: return kind::integer;
        case 3: return kind::real;
        case 4: return kind::string;
        case 5: return kind::date;
        case 6: return kind::time;
        case 7: return kind::datetime;
        case 8: return kind::sequence;
        case 9: return kind::set;
        case 10: return kind::aggregation;
        case 11: return kind::quantity;
        case 12: return kind::empty;
        }
        return kind::null;
    }

    bool value::is_scalar() const noexcept {
        return !(is_sequence() || is_set() || is_aggregation());
    }

    bool value::as_bool() const { return std::get<bool>(m_Storage); }
    int64_t value::as_integer() const { return std::get<int64_t>(m_Storage); }
    double value::as_real() const { return std::get<double>(m_Storage); }

    double value::as_number() const {
        if (is_integer()) return static_cast<double>(as_integer());
        return as_real();
    }

    const string& value::as_string() const { return std::get<string>(m_Storage); }
    string& value::as_string() { return std::get<string>(m_Storage); }
    const date& value::as_date() const { return std::get<date>(m_Storage); }
    const time& value::as_time() const { return std::get<time>(m_Storage); }
    const datetime& value::as_datetime() const { return std::get<datetime>(m_Storage); }
    const sequence& value::as_sequence() const { return std::get<sequence>(m_Storage); }
    sequence& value::as_sequence() { return std::get<sequence>(m_Storage); }
    const value_set& value::as_set() const { return std::get<value_set>(m_Storage); }
    value_set& value::as_set() { return std::get<value_set>(m_Storage); }
    const container& value::as_aggregation() const { return std::get<container>(m_Storage); }
    container& value::as_aggregation() { return std::get<container>(m_Storage); }
    const quantity& value::as_quantity() const { return std::get<quantity>(m_Storage); }
    const empty_value& value::as_empty() const { return std::get<empty_value>(m_Storage); }

    bool operator==(const value& lhs, const value& rhs) {
        return lhs.m_Storage == rhs.m_Storage;
    }

    storage_t value::clone_storage(const storage_t& s, std::pmr::memory_resource* res) {
        switch (s.index()) {
        case 0: return std::monostate{};
        case 1: return storage_t{ std::in_place_type<bool>, std::get<bool>(s) };
        case 2: return storage_t{ std::in_place_type<int64_t>, std::get<int64_t>(s) };
        case 3: return storage_t{ std::in_place_type<double>, std::get<double>(s) };
        case 4: return storage_t{ std::in_place_type<string>, std::get<string>(s), res };
        case 5: return std::get<date>(s);
        case 6: return std::get<time>(s);
        case 7: return std::get<datetime>(s);
        case 8: {
            const auto& seq = std::get<sequence>(s);
            sequence copy(allocator_type{ res });
            copy.reserve(seq.size());
            for (const auto& v : seq) copy.emplace_back(v);
            return copy;
        }
        case 9: return std::get<value_set>(s);
        case 10: return std::get<container>(s);
        case 11: return std::get<quantity>(s);
        case 12: return std::get<empty_value>(s);
        }
        return std::monostate{};
    }

#pragma endregion

} // namespace Pvl
