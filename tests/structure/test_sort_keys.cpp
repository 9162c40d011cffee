#include <iostream>
#include <string>
#include <vector>

#include "twinkit/structure/transform.hpp"
#include "common/test_check.hpp"

using namespace twinkit;
using namespace twinkit::structure;

/*
================================================================================
Recursive Key Sorting: Unit Tests
================================================================================
*/

static std::vector<std::string> keys_of(const Value& v) {
    return v.get_if<Mapping>()->keys();
}

void test_sorts_every_level() {
    std::cout << "[TEST] keys sorted at every level..." << std::endl;

    const Value in = Mapping{
        {"b", 1},
        {"a", Mapping{{"z", 1}, {"y", 2}}},
        {"c", List{Mapping{{"k2", 0}, {"k1", 0}}, 3}},
    };

    Value out;
    TEST_CHECK(sort_keys_recursively(in, out) == Error::None);

    TEST_CHECK((keys_of(out) == std::vector<std::string>{"a", "b", "c"}));
    const Mapping& top = *out.get_if<Mapping>();
    TEST_CHECK((keys_of(*top.find("a")) == std::vector<std::string>{"y", "z"}));

    const List& list = *top.find("c")->get_if<List>();
    TEST_CHECK(list.items.size() == 2);
    TEST_CHECK((keys_of(list.items[0]) == std::vector<std::string>{"k1", "k2"}));
    TEST_CHECK(list.items[1] == Value(3));

    // same content, different order
    TEST_CHECK(out == in);

    std::cout << "[TEST] OK\n";
}

void test_preserves_container_kinds() {
    std::cout << "[TEST] container kinds and sequence order preserved..." << std::endl;

    const Value in = Mapping{
        {"tuple", Tuple{3, 1, 2}},
        {"set", Set{"x", "y"}},
        {"list", List{"b", "a"}},
        {"bytes", ByteString{0x01, 0x02}},
        {"none", nullptr},
    };

    Value out;
    TEST_CHECK(sort_keys_recursively(in, out) == Error::None);
    const Mapping& m = *out.get_if<Mapping>();

    TEST_CHECK(m.find("tuple")->kind() == Kind::Tuple);
    TEST_CHECK(*m.find("tuple") == Value(Tuple{3, 1, 2}));
    TEST_CHECK(m.find("set")->kind() == Kind::Set);
    TEST_CHECK(*m.find("set") == Value(Set{"y", "x"}));
    TEST_CHECK(*m.find("list") == Value(List{"b", "a"}));
    TEST_CHECK(m.find("bytes")->kind() == Kind::Bytes);
    TEST_CHECK(m.find("none")->is_null());

    std::cout << "[TEST] OK\n";
}

void test_idempotent() {
    std::cout << "[TEST] sorting is idempotent..." << std::endl;

    const Value in = Mapping{
        {"delta", Mapping{{"b", List{Mapping{{"d", 1}, {"c", 2}}}}, {"a", true}}},
        {"alpha", 1.5},
        {"Charlie", "upper sorts first"},
    };

    Value once, twice;
    TEST_CHECK(sort_keys_recursively(in, once) == Error::None);
    TEST_CHECK(sort_keys_recursively(once, twice) == Error::None);

    TEST_CHECK(once == twice);
    TEST_CHECK(keys_of(once) == keys_of(twice));
    TEST_CHECK((keys_of(once) == std::vector<std::string>{"Charlie", "alpha", "delta"}));

    std::cout << "[TEST] OK\n";
}

void test_top_level_sequence_and_scalar() {
    std::cout << "[TEST] top-level sequence sorted element-wise, scalar rejected..." << std::endl;

    const Value in = List{Mapping{{"b", 1}, {"a", 2}}, "text"};
    Value out;
    TEST_CHECK(sort_keys_recursively(in, out) == Error::None);
    const List& list = *out.get_if<List>();
    TEST_CHECK((keys_of(list.items[0]) == std::vector<std::string>{"a", "b"}));
    TEST_CHECK(list.items[1] == Value("text"));

    Value untouched = 7;
    TEST_CHECK(sort_keys_recursively(Value("scalar"), untouched) == Error::ValueError);
    TEST_CHECK(sort_keys_recursively(Value(3), untouched) == Error::ValueError);
    TEST_CHECK(untouched == Value(7));

    std::cout << "[TEST] OK\n";
}

void test_depth_limit() {
    std::cout << "[TEST] nesting beyond the depth limit is rejected..." << std::endl;

    Value deep = Mapping{{"leaf", 1}};
    for (int i = 0; i < 300; ++i) {
        deep = Mapping{{"n", deep}};
    }
    Value out;
    TEST_CHECK(sort_keys_recursively(deep, out) == Error::ValueError);

    Value shallow = Mapping{{"leaf", 1}};
    for (int i = 0; i < 100; ++i) {
        shallow = Mapping{{"n", shallow}};
    }
    TEST_CHECK(sort_keys_recursively(shallow, out) == Error::None);

    std::cout << "[TEST] OK\n";
}

int main() {
    test_sorts_every_level();
    test_preserves_container_kinds();
    test_idempotent();
    test_top_level_sequence_and_scalar();
    test_depth_limit();

    std::cout << "\n[TEST] ALL SORT KEYS TESTS PASSED!" << std::endl;
    return 0;
}
