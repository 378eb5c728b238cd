#include <catch2/catch_all.hpp>

#include "pvl/pvl.hpp"

#include <memory_resource>
#include <stdexcept>
#include <type_traits>

using namespace Catch;

namespace {

    Pvl::container sample() {
        Pvl::container c;
        c.append("a", 1);
        c.append("b", 2);
        c.append("a", 3);
        return c;
    }

    std::vector<std::string> keys_of(const Pvl::container& c) {
        std::vector<std::string> out;
        for (const auto& [k, v] : c) out.emplace_back(k);
        return out;
    }
}


TEST_CASE("Append Preserves Order and Multiplicity") {
    auto c = sample();

    REQUIRE(c.size() == 3);
    REQUIRE(keys_of(c) == std::vector<std::string>{ "a", "b", "a" });
    REQUIRE(c.count("a") == 2);
    REQUIRE(c.count("z") == 0);
}

TEST_CASE("Get Returns the First Occurrence") {
    auto c = sample();

    REQUIRE(c.get("a").as_integer() == 1);
    REQUIRE(c.get("b").as_integer() == 2);

    auto all = c.get_all("a");
    REQUIRE(all.size() == 2);
    REQUIRE(all[0].as_integer() == 1);
    REQUIRE(all[1].as_integer() == 3);

    REQUIRE(c.get_all("missing").empty());
}

TEST_CASE("Get of a Missing Key Throws KeyNotFound") {
    auto c = sample();

    REQUIRE_THROWS_AS(c.get("missing"), Pvl::KeyNotFound);
    REQUIRE(c.find("missing") == nullptr);
    REQUIRE_FALSE(c.contains("missing"));

    try {
        (void)c.get("missing");
    } catch (const Pvl::KeyNotFound& e) {
        REQUIRE(e.key() == "missing");
    }
}

TEST_CASE("Set Collapses Multiplicity") {
    auto c = sample();
    c.set("a", 9);

    REQUIRE(c.size() == 2);
    REQUIRE(c[0].first == "a");
    REQUIRE(c[0].second.as_integer() == 9);
    REQUIRE(c[1].first == "b");
    REQUIRE(c[1].second.as_integer() == 2);

    c.set("new", "value");
    REQUIRE(c.size() == 3);
    REQUIRE(c[2].first == "new");
    REQUIRE(c[2].second.as_string() == "value");
}

TEST_CASE("Erase Removes Every Occurrence") {
    auto c = sample();

    REQUIRE(c.erase("a") == 2);
    REQUIRE(c.size() == 1);
    REQUIRE(c[0].first == "b");
    REQUIRE(c.erase("a") == 0);
}

TEST_CASE("Insert Before Addresses the N-th Occurrence") {
    auto c = sample();
    c.insert_before("a", 1, { { "a", 4 } });

    REQUIRE(keys_of(c) == std::vector<std::string>{ "a", "b", "a", "a" });
    REQUIRE(c[2].second.as_integer() == 4);
    REQUIRE(c[3].second.as_integer() == 3);
}

TEST_CASE("Insert After Splices Several Entries") {
    auto c = sample();
    c.insert_after("a", 0, { { "x", 10 }, { "y", 11 } });

    REQUIRE(keys_of(c) == std::vector<std::string>{ "a", "x", "y", "b", "a" });

    Pvl::container more{ Pvl::role::module, { { "z", 12 } } };
    c.insert_after("a", 1, more);
    REQUIRE(c.size() == 6);
    REQUIRE(c[5].first == "z");
}

TEST_CASE("Insert Addressing Errors") {
    auto c = sample();

    REQUIRE_THROWS_AS(c.insert_before("a", 5, { { "a", 4 } }), Pvl::IndexOutOfRange);
    REQUIRE_THROWS_AS(c.insert_after("a", 2, { { "a", 4 } }), Pvl::IndexOutOfRange);
    REQUIRE_THROWS_AS(c.insert_before("missing", 0, { { "a", 4 } }), Pvl::KeyNotFound);
    REQUIRE(c.size() == 3);

    try {
        c.insert_before("a", 5, { { "a", 4 } });
    } catch (const Pvl::IndexOutOfRange& e) {
        REQUIRE(e.index() == 5);
    }
}

TEST_CASE("Pop Last Removes the Final Entry") {
    auto c = sample();
    auto last = c.pop_last();

    REQUIRE(last.first == "a");
    REQUIRE(last.second.as_integer() == 3);
    REQUIRE(c.size() == 2);

    c.clear();
    REQUIRE(c.empty());
    REQUIRE_THROWS_AS(c.pop_last(), std::out_of_range);
}

TEST_CASE("Container Equality is Structural") {
    Pvl::container module{ Pvl::role::module, { { "a", 1 }, { "b", "x" } } };
    Pvl::container group{ Pvl::role::group, { { "a", 1 }, { "b", "x" } } };
    Pvl::container reordered{ Pvl::role::module, { { "b", "x" }, { "a", 1 } } };

    REQUIRE(module == group);
    REQUIRE(module != reordered);

    group.set_errors({ 4, 2 });
    REQUIRE(module == group);
    REQUIRE(group.errors().size() == 2);
    REQUIRE(group.errors()[0] == 2);
    REQUIRE(group.errors()[1] == 4);
}

TEST_CASE("Value Kinds Never Compare Across Each Other") {
    REQUIRE(Pvl::value{ 1 } != Pvl::value{ 1.0 });
    REQUIRE(Pvl::value{ "1" } != Pvl::value{ 1 });
    REQUIRE(Pvl::value{ nullptr } == Pvl::value{});
    REQUIRE(Pvl::value{ Pvl::empty_value{ 2 } } != Pvl::value{ Pvl::empty_value{ 3 } });
}

TEST_CASE("Sets Deduplicate and Ignore Order") {
    Pvl::value_set s{ 1, 2 };
    REQUIRE_FALSE(s.insert(1));
    REQUIRE(s.insert(3));
    REQUIRE(s.size() == 3);

    Pvl::value_set t{ 3, 2, 1 };
    REQUIRE(s == t);
    REQUIRE(Pvl::value{ s } == Pvl::value{ t });
}

TEST_CASE("Quantity Keeps Magnitude and Units") {
    Pvl::quantity q{ Pvl::value{ 34 }, "m/s" };
    REQUIRE(q.magnitude().as_integer() == 34);
    REQUIRE(q.units() == "m/s");

    Pvl::value v{ q };
    REQUIRE(v.is_quantity());
    REQUIRE(v.is_scalar());
    REQUIRE(v == Pvl::value{ Pvl::quantity{ Pvl::value{ 34 }, "m/s" } });
    REQUIRE(v != Pvl::value{ Pvl::quantity{ Pvl::value{ 34 }, "km/s" } });

    REQUIRE_THROWS_AS(Pvl::quantity(v, "m"), std::invalid_argument);
}

TEST_CASE("Nested Aggregations Compare Deeply") {
    Pvl::container inner{ Pvl::role::object, { { "x", 1 } } };
    Pvl::container a{ Pvl::role::module, { { "obj", inner } } };
    Pvl::container b = a;

    REQUIRE(a == b);
    b.get("obj").as_aggregation().append("y", 2);
    REQUIRE(a != b);
    REQUIRE(a.get("obj").as_aggregation().size() == 1);
}

TEST_CASE("Container Uses Provided memory_resource") {
    std::pmr::monotonic_buffer_resource pool;
    Pvl::container c{ Pvl::role::module, &pool };
    c.append("key", Pvl::value{ "a string long enough to need an allocation", &pool });

    REQUIRE(c.resource() == &pool);
    REQUIRE(c[0].first.get_allocator().resource() == &pool);

    Pvl::container copy{ c };
    REQUIRE(copy.resource() == &pool);
    REQUIRE(copy == c);
}

TEST_CASE("Assignment Keeps the Destination memory_resource") {
    std::pmr::monotonic_buffer_resource left;
    std::pmr::monotonic_buffer_resource right;

    Pvl::container src{ Pvl::role::group, &left };
    src.append("key", Pvl::value{ "a string long enough to need an allocation", &left });

    Pvl::container copied{ Pvl::role::module, &right };
    copied = src;
    REQUIRE(copied.resource() == &right);
    REQUIRE(copied[0].first.get_allocator().resource() == &right);
    REQUIRE(copied.type() == Pvl::role::group);
    REQUIRE(copied == src);

    Pvl::container moved{ Pvl::role::module, &right };
    moved = Pvl::container{ src };
    REQUIRE(moved.resource() == &right);
    REQUIRE(moved[0].first.get_allocator().resource() == &right);
    REQUIRE(moved == src);

    Pvl::value v{ &right };
    v = Pvl::value{ "another string long enough to need an allocation", &left };
    REQUIRE(v.resource() == &right);
    REQUIRE(v.as_string().get_allocator().resource() == &right);
    REQUIRE(v.as_string() == "another string long enough to need an allocation");
}

TEST_CASE("A memory_resource Pointer Is Never a Value") {
    STATIC_REQUIRE_FALSE(std::is_convertible_v<std::pmr::memory_resource*, Pvl::value>);
    STATIC_REQUIRE(std::is_convertible_v<bool, Pvl::value>);

    std::pmr::memory_resource* res = std::pmr::get_default_resource();
    Pvl::value_set set{ res };
    Pvl::sequence seq{ res };
    REQUIRE(set.empty());
    REQUIRE(seq.empty());

    REQUIRE(Pvl::value{ true }.is_bool());
    REQUIRE(Pvl::value{ 1 }.is_integer());
}
