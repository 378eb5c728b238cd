#include "pvl/value.hpp"
#include "pvl/error.hpp"

#include <algorithm>
#include <stdexcept>


namespace Pvl {

    container::container(role r, std::pmr::memory_resource* res)
        : m_MemRes{ res }, m_Role{ r }, m_Entries{ allocator_type(res) }, m_Errors{ allocator_type(res) } {}

    container::container(role r, init_list items, std::pmr::memory_resource* res)
        : container{ r, res } {
        m_Entries.reserve(items.size());
        for (const auto& [k, v] : items) append(k, v);
    }

    container::container(const container& other)
        : m_MemRes{ other.m_MemRes }, m_Role{ other.m_Role },
          m_Entries{ other.m_Entries, allocator_type(other.m_MemRes) },
          m_Errors{ other.m_Errors, allocator_type(other.m_MemRes) } {}

    container::container(container&& other) noexcept = default;

    container& container::operator=(const container& other) {
        if (this == &other) return *this;
        m_Role = other.m_Role;
        m_Entries = other.m_Entries;
        m_Errors = other.m_Errors;
        return *this;
    }

    container& container::operator=(container&& other) {
        if (this == &other) return *this;
        m_Role = other.m_Role;
        m_Entries = std::move(other.m_Entries);
        m_Errors = std::move(other.m_Errors);
        return *this;
    }

    container::~container() = default;

    const pmr_vector<size_t>& container::errors() const noexcept { return m_Errors; }

    void container::set_errors(std::vector<size_t> lines) {
        std::sort(lines.begin(), lines.end());
        m_Errors.assign(lines.begin(), lines.end());
    }

    void container::append(std::string_view key, value v) {
        m_Entries.emplace_back(string{ key.begin(), key.end(), m_MemRes }, std::move(v));
    }

    void container::set(std::string_view key, value v) {
        auto first = std::find_if(m_Entries.begin(), m_Entries.end(), [&](const entry& e) { return e.first == key; });
        if (first == m_Entries.end()) {
            append(key, std::move(v));
            return;
        }
        first->second = std::move(v);
        auto tail = std::remove_if(std::next(first), m_Entries.end(), [&](const entry& e) { return e.first == key; });
        m_Entries.erase(tail, m_Entries.end());
    }

    const value* container::find(std::string_view key) const {
        for (const auto& e : m_Entries) {
            if (e.first == key) return std::addressof(e.second);
        }
        return nullptr;
    }

    value* container::find(std::string_view key) {
        for (auto& e : m_Entries) {
            if (e.first == key) return std::addressof(e.second);
        }
        return nullptr;
    }

    const value& container::get(std::string_view key) const {
        if (auto* v = find(key)) return *v;
        throw KeyNotFound{ key };
    }

    value& container::get(std::string_view key) {
        if (auto* v = find(key)) return *v;
        throw KeyNotFound{ key };
    }

    sequence container::get_all(std::string_view key) const {
        sequence out{ allocator_type(m_MemRes) };
        for (const auto& e : m_Entries) {
            if (e.first == key) out.push_back(e.second);
        }
        return out;
    }

    bool container::contains(std::string_view key) const { return find(key) != nullptr; }

    size_t container::count(std::string_view key) const {
        return static_cast<size_t>(std::count_if(m_Entries.begin(), m_Entries.end(), [&](const entry& e) { return e.first == key; }));
    }

    size_t container::erase(std::string_view key) {
        return static_cast<size_t>(std::erase_if(m_Entries, [&](const entry& e) { return e.first == key; }));
    }

    container::iterator container::locate(std::string_view key, size_t occurrence) {
        size_t seen = 0;
        for (auto it = m_Entries.begin(); it != m_Entries.end(); ++it) {
            if (it->first != key) continue;
            if (seen == occurrence) return it;
            seen++;
        }
        if (seen == 0) throw KeyNotFound{ key };
        throw IndexOutOfRange{ key, occurrence, seen };
    }

    template<class Range>
    void container::splice(iterator pos, const Range& items) {
        entries staged{ allocator_type(m_MemRes) };
        for (const auto& [k, v] : items) staged.emplace_back(string{ k.begin(), k.end(), m_MemRes }, v);
        m_Entries.insert(pos, std::make_move_iterator(staged.begin()), std::make_move_iterator(staged.end()));
    }

    void container::insert_before(std::string_view key, size_t occurrence, init_list items) {
        splice(locate(key, occurrence), items);
    }

    void container::insert_before(std::string_view key, size_t occurrence, const container& items) {
        auto pos = locate(key, occurrence);
        if (&items == this) {
            container copy{ items };
            splice(pos, copy);
            return;
        }
        splice(pos, items);
    }

    void container::insert_after(std::string_view key, size_t occurrence, init_list items) {
        splice(std::next(locate(key, occurrence)), items);
    }

    void container::insert_after(std::string_view key, size_t occurrence, const container& items) {
        auto pos = std::next(locate(key, occurrence));
        if (&items == this) {
            container copy{ items };
            splice(pos, copy);
            return;
        }
        splice(pos, items);
    }

    container::entry container::pop_last() {
        if (m_Entries.empty()) throw std::out_of_range{ "Pvl::container::pop_last: container is empty" };
        entry last = std::move(m_Entries.back());
        m_Entries.pop_back();
        return last;
    }

    void container::clear() noexcept {
        m_Entries.clear();
        m_Errors.clear();
    }

    size_t container::size() const noexcept { return m_Entries.size(); }
    bool container::empty() const noexcept { return m_Entries.empty(); }

    const container::entry& container::operator[](size_t idx) const { return m_Entries[idx]; }
    container::entry& container::operator[](size_t idx) { return m_Entries[idx]; }

    container::iterator container::begin() noexcept { return m_Entries.begin(); }
    container::iterator container::end() noexcept { return m_Entries.end(); }
    container::const_iterator container::begin() const noexcept { return m_Entries.begin(); }
    container::const_iterator container::end() const noexcept { return m_Entries.end(); }

    bool operator==(const container& lhs, const container& rhs) {
        return lhs.m_Entries == rhs.m_Entries;
    }

} // namespace Pvl
