#include "twinkit/structure/value.hpp"

#include <algorithm>

namespace twinkit::structure {

// ============================================================================
// Mapping
// ============================================================================

Mapping::Mapping(std::initializer_list<Entry> init) {
    reserve(init.size());
    for (const auto& [key, value] : init) {
        set(key, value);
    }
}

void Mapping::set(std::string key, Value value) {
    if (Value* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(value));
}

const Value* Mapping::find(std::string_view key) const noexcept {
    const auto it = index_.find(key);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

Value* Mapping::find(std::string_view key) noexcept {
    const auto it = index_.find(key);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

bool Mapping::contains(std::string_view key) const noexcept {
    return find(key) != nullptr;
}

std::size_t Mapping::size() const noexcept {
    return entries_.size();
}

bool Mapping::empty() const noexcept {
    return entries_.empty();
}

void Mapping::reserve(std::size_t n) {
    entries_.reserve(n);
    index_.reserve(n);
}

Mapping::const_iterator Mapping::begin() const noexcept {
    return entries_.begin();
}

Mapping::const_iterator Mapping::end() const noexcept {
    return entries_.end();
}

std::vector<std::string> Mapping::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

bool operator==(const Mapping& a, const Mapping& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, value] : a) {
        const Value* other = b.find(key);
        if (other == nullptr || !(*other == value)) {
            return false;
        }
    }
    return true;
}


// ============================================================================
// Sequences
// ============================================================================

List::List(std::initializer_list<Value> init) : items(init) {}
List::List(std::vector<Value> v) : items(std::move(v)) {}

bool operator==(const List& a, const List& b) {
    return a.items == b.items;
}

Tuple::Tuple(std::initializer_list<Value> init) : items(init) {}
Tuple::Tuple(std::vector<Value> v) : items(std::move(v)) {}

bool operator==(const Tuple& a, const Tuple& b) {
    return a.items == b.items;
}

Set::Set(std::initializer_list<Value> init) {
    items_.reserve(init.size());
    for (const auto& v : init) {
        insert(v);
    }
}

bool Set::insert(Value v) {
    if (contains(v)) {
        return false;
    }
    items_.push_back(std::move(v));
    return true;
}

bool Set::contains(const Value& v) const noexcept {
    return std::find(items_.begin(), items_.end(), v) != items_.end();
}

std::size_t Set::size() const noexcept {
    return items_.size();
}

bool operator==(const Set& a, const Set& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& v : a.items()) {
        if (!b.contains(v)) {
            return false;
        }
    }
    return true;
}


// ============================================================================
// Value
// ============================================================================

bool Value::is_container() const noexcept {
    switch (kind()) {
        case Kind::Mapping:
        case Kind::List:
        case Kind::Tuple:
        case Kind::Set:
            return true;
        default:
            return false;
    }
}

bool Value::is_string_like() const noexcept {
    return kind() == Kind::String || kind() == Kind::Bytes;
}

bool Value::truthy() const noexcept {
    switch (kind()) {
        case Kind::Null:    return false;
        case Kind::Bool:    return std::get<bool>(v_);
        case Kind::Int:     return std::get<std::int64_t>(v_) != 0;
        case Kind::Float:   return std::get<double>(v_) != 0.0;
        case Kind::String:  return !std::get<std::string>(v_).empty();
        case Kind::Bytes:   return !std::get<ByteString>(v_).empty();
        case Kind::Mapping: return !std::get<Mapping>(v_).empty();
        case Kind::List:    return !std::get<List>(v_).items.empty();
        case Kind::Tuple:   return !std::get<Tuple>(v_).items.empty();
        case Kind::Set:     return std::get<Set>(v_).size() != 0;
    }
    return false;
}

bool operator==(const Value& a, const Value& b) {
    return a.v_ == b.v_;
}

} // namespace twinkit::structure
