#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <functional>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace twinkit::structure {

class Value;

/*
===============================================================================
Nested values
===============================================================================

A closed variant over the shapes the structural transformer understands:

  scalars     null, bool, int, float, string, bytes
  containers  Mapping (string keys, insertion ordered, unique),
              List and Tuple (ordered), Set (unordered, unique)

Mapping equality ignores key order; Set equality ignores element order.
Use Mapping::keys() when order matters.
===============================================================================
*/

enum class Kind : std::uint8_t {
    Null,
    Bool,
    Int,
    Float,
    String,
    Bytes,
    Mapping,
    List,
    Tuple,
    Set
};

[[nodiscard]]
inline constexpr std::string_view to_string(Kind k) noexcept {
    switch (k) {
        case Kind::Null:    return "null";
        case Kind::Bool:    return "bool";
        case Kind::Int:     return "int";
        case Kind::Float:   return "float";
        case Kind::String:  return "string";
        case Kind::Bytes:   return "bytes";
        case Kind::Mapping: return "mapping";
        case Kind::List:    return "list";
        case Kind::Tuple:   return "tuple";
        case Kind::Set:     return "set";
        default:            return "unknown";
    }
}

using ByteString = std::vector<std::uint8_t>;


// -----------------------------------------------------------------------------
// Mapping: insertion-ordered, unique string keys
// -----------------------------------------------------------------------------
//
// Entries live in a vector in insertion order; a hash index from key to
// position keeps set() and find() constant time.
// -----------------------------------------------------------------------------
class Mapping {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Mapping() = default;
    Mapping(std::initializer_list<Entry> init);

    // Assigns in place when the key exists, appends otherwise
    void set(std::string key, Value value);

    [[nodiscard]] const Value* find(std::string_view key) const noexcept;
    [[nodiscard]] Value* find(std::string_view key) noexcept;
    [[nodiscard]] bool contains(std::string_view key) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    void reserve(std::size_t n);

    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

    [[nodiscard]] std::vector<std::string> keys() const;

    friend bool operator==(const Mapping& a, const Mapping& b);

private:
    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view key) const noexcept {
            return std::hash<std::string_view>{}(key);
        }
    };

    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t, KeyHash, std::equal_to<>> index_;
};


// -----------------------------------------------------------------------------
// Sequences
// -----------------------------------------------------------------------------
struct List {
    std::vector<Value> items;

    List() = default;
    List(std::initializer_list<Value> init);
    explicit List(std::vector<Value> v);

    friend bool operator==(const List& a, const List& b);
};

struct Tuple {
    std::vector<Value> items;

    Tuple() = default;
    Tuple(std::initializer_list<Value> init);
    explicit Tuple(std::vector<Value> v);

    friend bool operator==(const Tuple& a, const Tuple& b);
};

// Unordered, duplicates dropped on insertion
class Set {
public:
    Set() = default;
    Set(std::initializer_list<Value> init);

    // Returns false when an equal element is already present
    bool insert(Value v);
    [[nodiscard]] bool contains(const Value& v) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] const std::vector<Value>& items() const noexcept { return items_; }

    friend bool operator==(const Set& a, const Set& b);

private:
    std::vector<Value> items_;
};


// -----------------------------------------------------------------------------
// Value
// -----------------------------------------------------------------------------
class Value {
public:
    // Alternative order matches Kind
    using Storage = std::variant<std::monostate, bool, std::int64_t, double,
                                 std::string, ByteString, Mapping, List, Tuple, Set>;

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool b) : v_(b) {}
    Value(int i) : v_(std::int64_t{i}) {}
    Value(std::int64_t i) : v_(i) {}
    Value(double d) : v_(d) {}
    Value(const char* s) : v_(std::string(s)) {}
    Value(std::string s) : v_(std::move(s)) {}
    Value(ByteString b) : v_(std::move(b)) {}
    Value(Mapping m) : v_(std::move(m)) {}
    Value(List l) : v_(std::move(l)) {}
    Value(Tuple t) : v_(std::move(t)) {}
    Value(Set s) : v_(std::move(s)) {}

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(v_.index()); }

    [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::Null; }

    // Mapping, List, Tuple or Set
    [[nodiscard]] bool is_container() const noexcept;

    // String or Bytes
    [[nodiscard]] bool is_string_like() const noexcept;

    // Empty containers/strings, zero numbers, false and null are falsy
    [[nodiscard]] bool truthy() const noexcept;

    template<class T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&v_); }

    template<class T>
    [[nodiscard]] T* get_if() noexcept { return std::get_if<T>(&v_); }

    [[nodiscard]] const Storage& storage() const noexcept { return v_; }

    friend bool operator==(const Value& a, const Value& b);

private:
    Storage v_;
};

} // namespace twinkit::structure
