#pragma once


/*
    -----------------------------------------------------
    Pvl::value / Pvl::container - PVL document data model
    -----------------------------------------------------
    `Pvl::value` represents any PVL value:
        - null, boolean, integer, real, string
        - date, time, datetime
        - sequence (ordered list of values)
        - set (unordered, duplicate-free collection of values)
        - aggregation (a nested `container` in the group or object role)
        - quantity (a value paired with a units string)
        - empty (placeholder recorded by lenient parsing)

    `Pvl::container` is the ordered, multi-valued mapping that is both
    the result of parsing and the input of encoding. One representation
    serves three roles, distinguished by `Pvl::role`:
        - module: the document root; also owns the list of recovered
          error lines from lenient parsing
        - group, object: aggregation blocks

    -----------------
    Memory Management
    -----------------
    - `value` and `container` are allocator-aware and use
      `std::pmr::memory_resource` for strings, sequences, sets and entries
    - Copy construction:
        * The destination adopts the allocator of the source and performs
          a deep copy of the whole tree into that allocator
    - Move construction:
        * The destination steals the allocator and storage of the source
    - Copy and move assignment:
        * The destination keeps its own allocator, as `std::pmr` containers
          do. A move steals the storage only when both sides use the same
          resource; otherwise the elements are copied into the destination's
    - A `quantity` holds its magnitude through an immutable shared pointer;
      copies of a quantity share the magnitude

    ---------------------
    Container Semantics
    ---------------------
    - Insertion order is preserved by every operation
    - Keys may repeat; `get`/`find` return the first occurrence and
      `get_all` returns every occurrence in order
    - `set` replaces the first occurrence and removes the others
    - `insert_before`/`insert_after` address the n-th occurrence of a key
    - Key errors throw `Pvl::KeyNotFound`, occurrence errors throw
      `Pvl::IndexOutOfRange`

    --------
    Equality
    --------
    - Structural. Two containers are equal iff their ordered (key, value)
      sequences are equal; the role and the recovered-error list do not
      take part in the comparison
    - Sets compare equal regardless of element order
    - Kinds never compare equal across each other: `1` is not `1.0`

    -------------
    Thread-Safety
    -------------
    - Separate instances may be used from separate threads
    - Concurrent mutation of the same instance must be externally synchronized
*/

/// @defgroup Pvl Pvl Parameter Value Language Library
/// @brief Core types and functions for Pvl

/// @defgroup PvlValue Data Model
/// @ingroup Pvl

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "pvl/config.hpp"
#include "pvl/datetime.hpp"

namespace Pvl {
    /// @brief Enumerates the possible value kinds held by Pvl::value
    enum class kind : uint8_t {
        null,        ///< PVL NULL
        boolean,     ///< TRUE or FALSE
        integer,     ///< Integer (stored as `int64_t`)
        real,        ///< Real (stored as `double`)
        string,      ///< Quoted or unquoted string
        date,        ///< Calendar date
        time,        ///< Time of day
        datetime,    ///< Date and time
        sequence,    ///< `( ... )`
        set,         ///< `{ ... }`
        aggregation, ///< Nested group or object
        quantity,    ///< Value with units
        empty,       ///< Lenient-parse placeholder
    };

    template<class T>
    using pmr_vector = std::pmr::vector<T>;

    /// @ingroup PvlValue
    /// @brief String type used by Pvl::value (allocator-aware)
    using string = std::pmr::string;

    struct value;
    using allocator_type = std::pmr::polymorphic_allocator<value>;

    /// @ingroup PvlValue
    /// @brief Sequence type used by Pvl::value (ordered, duplicates kept)
    using sequence = pmr_vector<value>;

    /// @ingroup PvlValue
    /// @brief Unordered, duplicate-free collection of values.
    ///
    /// @details
    /// Elements keep their insertion order for iteration (so encoding is
    /// deterministic) but equality ignores it. `insert` drops a value that
    /// is structurally equal to one already present.
    class value_set {
    public:
        using const_iterator = sequence::const_iterator;

        PVL_API explicit value_set(std::pmr::memory_resource* res = std::pmr::get_default_resource());
        PVL_API value_set(std::initializer_list<value> items, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        PVL_API value_set(const value_set& other);
        PVL_API value_set(value_set&& other) noexcept;
        PVL_API value_set& operator=(const value_set& other);
        PVL_API value_set& operator=(value_set&& other);
        PVL_API ~value_set();

        /// @brief Adds @p v unless an equal value is already present.
        /// @return true if the set grew
        PVL_API bool insert(value v);

        [[nodiscard]] PVL_API bool contains(const value& v) const;
        [[nodiscard]] PVL_API std::size_t size() const noexcept;
        [[nodiscard]] PVL_API bool empty() const noexcept;
        [[nodiscard]] PVL_API const_iterator begin() const noexcept;
        [[nodiscard]] PVL_API const_iterator end() const noexcept;

        /// @brief Order-independent comparison.
        PVL_API friend bool operator==(const value_set& lhs, const value_set& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        sequence m_Items;
    };

    /// @ingroup PvlValue
    /// @brief Immutable pair of a value and a units string, `34 <m/s>`.
    ///
    /// @details
    /// The magnitude is never itself a quantity; the constructor throws
    /// `std::invalid_argument` if it is.
    class quantity {
    public:
        PVL_API quantity(value magnitude, std::string_view units);

        [[nodiscard]] PVL_API const value& magnitude() const noexcept;
        [[nodiscard]] const std::string& units() const noexcept { return m_Units; }

        PVL_API friend bool operator==(const quantity& lhs, const quantity& rhs);

    private:
        std::shared_ptr<const value> m_Value;
        std::string m_Units;
    };

    /// @ingroup PvlValue
    /// @brief Placeholder for an assignment that had no value.
    ///
    /// @details
    /// Produced only by lenient parsing. `line` is the 1-based line of the
    /// `=` of the broken assignment. It behaves as an empty string when
    /// encoded.
    struct empty_value {
        std::size_t line = 0;

        bool operator==(const empty_value&) const = default;
    };

    /// @ingroup PvlValue
    /// @brief The role a container plays in a document.
    enum class role : uint8_t {
        module, ///< Document root
        group,  ///< GROUP / BEGIN_GROUP block
        object, ///< OBJECT / BEGIN_OBJECT block
    };

    /// @ingroup PvlValue
    /// @brief Ordered multi-valued mapping of parameter names to values.
    class container {
    public:
        using entry = std::pair<string, value>;
        using entries = pmr_vector<entry>;
        using iterator = entries::iterator;
        using const_iterator = entries::const_iterator;
        using init_list = std::initializer_list<std::pair<std::string_view, value>>;

        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @ingroup PvlValue
        /// @brief Constructs an empty container in role @p r
        PVL_API explicit container(role r = role::module, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup PvlValue
        /// @brief Constructs a container in role @p r holding @p items in order
        ///
        /// Example:
        /// @code
        /// Pvl::container g{ Pvl::role::group, { {"a", 1}, {"b", "x"}, {"a", 3} } };
        /// @endcode
        PVL_API container(role r, init_list items, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        PVL_API container(const container& other);
        PVL_API container(container&& other) noexcept;
        PVL_API container& operator=(const container& other);
        PVL_API container& operator=(container&& other);
        PVL_API ~container();

        // ------------------------------------------------------------
        // Role and diagnostics
        // ------------------------------------------------------------

        [[nodiscard]] role type() const noexcept { return m_Role; }
        void set_type(role r) noexcept { m_Role = r; }
        [[nodiscard]] bool is_group() const noexcept { return m_Role == role::group; }
        [[nodiscard]] bool is_object() const noexcept { return m_Role == role::object; }

        /// @ingroup PvlValue
        /// @brief Lines of assignments recovered by lenient parsing, ascending.
        [[nodiscard]] PVL_API const pmr_vector<std::size_t>& errors() const noexcept;

        /// @ingroup PvlValue
        /// @brief Replaces the recovered-error list; the lines are sorted.
        PVL_API void set_errors(std::vector<std::size_t> lines);

        // ------------------------------------------------------------
        // Key-addressed operations
        // ------------------------------------------------------------

        /// @ingroup PvlValue
        /// @brief Adds a new trailing entry; never overwrites
        PVL_API void append(std::string_view key, value v);

        /// @ingroup PvlValue
        /// @brief Assigns @p v to @p key
        ///
        /// @details
        /// If @p key is absent this is `append`. Otherwise the first
        /// occurrence keeps its position and receives @p v, and every other
        /// occurrence is removed.
        PVL_API void set(std::string_view key, value v);

        /// @ingroup PvlValue
        /// @brief Returns the first value stored under @p key
        /// @throws KeyNotFound If @p key is absent
        [[nodiscard]] PVL_API const value& get(std::string_view key) const;
        [[nodiscard]] PVL_API value& get(std::string_view key);

        /// @ingroup PvlValue
        /// @brief Returns a pointer to the first value under @p key, or nullptr
        [[nodiscard]] PVL_API const value* find(std::string_view key) const;
        [[nodiscard]] PVL_API value* find(std::string_view key);

        /// @ingroup PvlValue
        /// @brief Returns every value stored under @p key in entry order (possibly empty)
        [[nodiscard]] PVL_API sequence get_all(std::string_view key) const;

        [[nodiscard]] PVL_API bool contains(std::string_view key) const;
        [[nodiscard]] PVL_API std::size_t count(std::string_view key) const;

        /// @ingroup PvlValue
        /// @brief Removes every occurrence of @p key
        /// @return The number of entries removed
        PVL_API std::size_t erase(std::string_view key);

        /// @ingroup PvlValue
        /// @brief Splices @p items immediately before the @p occurrence-th
        ///        (0-based) entry whose key is @p key
        ///
        /// @throws KeyNotFound If no entry has @p key
        /// @throws IndexOutOfRange If @p occurrence is not less than the
        ///         number of entries with @p key
        PVL_API void insert_before(std::string_view key, std::size_t occurrence, init_list items);
        PVL_API void insert_before(std::string_view key, std::size_t occurrence, const container& items);

        /// @ingroup PvlValue
        /// @brief Splices @p items immediately after the @p occurrence-th
        ///        (0-based) entry whose key is @p key
        ///
        /// @throws KeyNotFound, IndexOutOfRange As for `insert_before`
        PVL_API void insert_after(std::string_view key, std::size_t occurrence, init_list items);
        PVL_API void insert_after(std::string_view key, std::size_t occurrence, const container& items);

        // ------------------------------------------------------------
        // Positional operations
        // ------------------------------------------------------------

        /// @ingroup PvlValue
        /// @brief Removes and returns the final entry
        /// @throws std::out_of_range If the container is empty
        PVL_API entry pop_last();

        PVL_API void clear() noexcept;
        [[nodiscard]] PVL_API std::size_t size() const noexcept;
        [[nodiscard]] PVL_API bool empty() const noexcept;

        /// @ingroup PvlValue
        /// @brief Entry at position @p idx
        /// @pre `idx < size()`
        [[nodiscard]] PVL_API const entry& operator[](std::size_t idx) const;
        [[nodiscard]] PVL_API entry& operator[](std::size_t idx);

        [[nodiscard]] PVL_API iterator begin() noexcept;
        [[nodiscard]] PVL_API iterator end() noexcept;
        [[nodiscard]] PVL_API const_iterator begin() const noexcept;
        [[nodiscard]] PVL_API const_iterator end() const noexcept;

        /// @ingroup PvlValue
        /// @brief Structural equality; role and errors are ignored
        PVL_API friend bool operator==(const container& lhs, const container& rhs);

        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        role m_Role = role::module;
        entries m_Entries;
        pmr_vector<std::size_t> m_Errors;

        iterator locate(std::string_view key, std::size_t occurrence);
        template<class Range>
        void splice(iterator pos, const Range& items);
    };

    /// @ingroup PvlValue
    /// @brief Variant storage used internally by Pvl::value
    /// @details Exposed only for completeness; most users interact via
    ///          Pvl::value member functions instead of using this alias
    using storage_t = std::variant<
        std::monostate,
        bool,
        int64_t,
        double,
        string,
        date,
        time,
        datetime,
        sequence,
        value_set,
        container,
        quantity,
        empty_value
    >;

    /// @ingroup PvlValue
    /// @brief Dynamic PVL value.
    ///
    /// @details
    /// All nested allocations (strings, sequences, sets, aggregations) are
    /// performed using the `std::pmr::memory_resource` associated with the
    /// instance.
    struct value {
        // ------------------------------------------------------------
        // Constructors / assignment / destructor
        // ------------------------------------------------------------

        /// @ingroup PvlValue
        /// @brief Constructs a NULL value using the given memory resource
        PVL_API explicit value(std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        PVL_API value(std::nullptr_t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup PvlValue
        /// @brief Constructs a boolean value. Only an actual `bool` binds
        ///        here; pointers do not decay to TRUE
        template<std::same_as<bool> B>
        value(B b, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ std::in_place_type<bool>, b } {}

        /// @ingroup PvlValue
        /// @brief Constructs an integer value from any integral type but bool
        template<std::integral I>
            requires (!std::same_as<I, bool>)
        value(I i, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept
            : m_MemRes{ res }, m_Storage{ std::in_place_type<int64_t>, static_cast<int64_t>(i) } {}

        PVL_API value(double d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        PVL_API value(const char* s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        PVL_API value(std::string_view sv, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        PVL_API value(string s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        PVL_API value(date d, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        PVL_API value(time t, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;
        PVL_API value(datetime dt, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup PvlValue
        /// @brief Constructs a sequence value. May be moved from
        PVL_API value(sequence s, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        PVL_API value(value_set s, std::pmr::memory_resource* res = std::pmr::get_default_resource());

        /// @ingroup PvlValue
        /// @brief Constructs an aggregation value. The container's role
        ///        decides whether it is written as a group or an object
        PVL_API value(container c, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        PVL_API value(quantity q, std::pmr::memory_resource* res = std::pmr::get_default_resource());
        PVL_API value(empty_value e, std::pmr::memory_resource* res = std::pmr::get_default_resource()) noexcept;

        /// @ingroup PvlValue
        /// @brief Copy-constructs a value
        ///
        /// @details
        /// The new value adopts the allocator of @p other. The whole tree
        /// rooted at @p other is deeply copied using that allocator
        PVL_API value(const value& other);
        PVL_API value(value&& other) noexcept;
        PVL_API value& operator=(const value& other);
        PVL_API value& operator=(value&& other);

        // ------------------------------------------------------------
        // Introspection
        // ------------------------------------------------------------

        /// @ingroup PvlValue
        /// @brief Returns the kind of value currently stored
        [[nodiscard]] PVL_API kind type() const noexcept;

        [[nodiscard]] bool is_null()        const noexcept { return type() == kind::null;        }
        [[nodiscard]] bool is_bool()        const noexcept { return type() == kind::boolean;     }
        [[nodiscard]] bool is_integer()     const noexcept { return type() == kind::integer;     }
        [[nodiscard]] bool is_real()        const noexcept { return type() == kind::real;        }
        [[nodiscard]] bool is_number()      const noexcept { return is_integer() || is_real();   }
        [[nodiscard]] bool is_string()      const noexcept { return type() == kind::string;      }
        [[nodiscard]] bool is_date()        const noexcept { return type() == kind::date;        }
        [[nodiscard]] bool is_time()        const noexcept { return type() == kind::time;        }
        [[nodiscard]] bool is_datetime()    const noexcept { return type() == kind::datetime;    }
        [[nodiscard]] bool is_sequence()    const noexcept { return type() == kind::sequence;    }
        [[nodiscard]] bool is_set()         const noexcept { return type() == kind::set;         }
        [[nodiscard]] bool is_aggregation() const noexcept { return type() == kind::aggregation; }
        [[nodiscard]] bool is_quantity()    const noexcept { return type() == kind::quantity;    }
        [[nodiscard]] bool is_empty()       const noexcept { return type() == kind::empty;       }

        /// @ingroup PvlValue
        /// @brief True for every kind except sequence, set and aggregation
        [[nodiscard]] PVL_API bool is_scalar() const noexcept;

        // ------------------------------------------------------------
        // Accessors
        // ------------------------------------------------------------
        // These assume the current kind matches; a mismatch throws
        // std::bad_variant_access.

        [[nodiscard]] PVL_API bool as_bool() const;
        [[nodiscard]] PVL_API int64_t as_integer() const;
        [[nodiscard]] PVL_API double as_real() const;

        /// @ingroup PvlValue
        /// @brief Numeric value as double (integer or real)
        [[nodiscard]] PVL_API double as_number() const;

        [[nodiscard]] PVL_API const string& as_string() const;
        [[nodiscard]] PVL_API string& as_string();
        [[nodiscard]] PVL_API const date& as_date() const;
        [[nodiscard]] PVL_API const time& as_time() const;
        [[nodiscard]] PVL_API const datetime& as_datetime() const;
        [[nodiscard]] PVL_API const sequence& as_sequence() const;
        [[nodiscard]] PVL_API sequence& as_sequence();
        [[nodiscard]] PVL_API const value_set& as_set() const;
        [[nodiscard]] PVL_API value_set& as_set();
        [[nodiscard]] PVL_API const container& as_aggregation() const;
        [[nodiscard]] PVL_API container& as_aggregation();
        [[nodiscard]] PVL_API const quantity& as_quantity() const;
        [[nodiscard]] PVL_API const empty_value& as_empty() const;

        /// @ingroup PvlValue
        /// @brief Structural equality over the stored variant
        PVL_API friend bool operator==(const value& lhs, const value& rhs);

        /// @ingroup PvlValue
        /// @brief Returns the memory resource associated with this value
        [[nodiscard]] std::pmr::memory_resource* resource() const noexcept { return m_MemRes; }

        /// @ingroup PvlValue
        /// @brief Returns a const reference to the underlying variant storage
        [[nodiscard]] const storage_t& storage() const noexcept { return m_Storage; }

        /// @ingroup PvlValue
        /// @brief Returns a mutable reference to the underlying variant storage
        ///
        /// @details
        /// Bypasses the invariants the rest of the API maintains (for
        /// example, a quantity whose magnitude is a quantity). Use with care.
        [[nodiscard]] storage_t& storage() noexcept { return m_Storage; }

    private:
        std::pmr::memory_resource* m_MemRes{};
        storage_t m_Storage{};

        static storage_t clone_storage(const storage_t& s, std::pmr::memory_resource* res);
    };

} // namespace Pvl
