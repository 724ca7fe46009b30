#include <leptjson-cpp/value.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace leptjson_cpp {

namespace {

[[noreturn]] void throw_type_mismatch(Type expected, Type actual) {
    throw Exception{ErrorKind::type_mismatch,
                    "expected " + std::string{to_string_view(expected)} +
                    ", found " + std::string{to_string_view(actual)}};
}

[[noreturn]] void throw_out_of_range(std::size_t index, std::size_t size) {
    throw Exception{ErrorKind::out_of_range,
                    "index " + std::to_string(index) + " out of range for size " +
                    std::to_string(size)};
}

auto find_member(const Object& members, std::string_view key) -> Object::const_iterator {
    return std::ranges::find_if(members, [&](const Member& m) { return m.key == key; });
}

auto find_member(Object& members, std::string_view key) -> Object::iterator {
    return std::ranges::find_if(members, [&](const Member& m) { return m.key == key; });
}

}  // anonymous namespace

// -- Construction -------------------------------------------------------------

Value::Value() noexcept : data_{Null{}} {}
Value::Value(Null) noexcept : data_{Null{}} {}
Value::Value(bool b) noexcept : data_{b} {}
Value::Value(double n) noexcept : data_{n} {}
Value::Value(const char* s) : data_{std::string{s}} {}
Value::Value(std::string_view s) : data_{std::string{s}} {}
Value::Value(std::string s) noexcept : data_{std::move(s)} {}
Value::Value(Array a) noexcept : data_{std::move(a)} {}
Value::Value(Object o) noexcept : data_{std::move(o)} {}

auto Value::array(std::initializer_list<Value> elements) -> Value {
    return Value{Array(elements)};
}

auto Value::object(std::initializer_list<Member> members) -> Value {
    return Value{Object(members)};
}

Value::~Value() = default;

Value::Value(const Value& other) = default;

auto Value::operator=(const Value& other) -> Value& {
    if (this != &other) {
        // Clone first so that assigning a descendant of *this stays valid.
        auto copy = Storage{other.data_};
        data_ = std::move(copy);
    }
    return *this;
}

Value::Value(Value&& other) noexcept
    : data_{std::exchange(other.data_, Storage{Null{}})} {}

auto Value::operator=(Value&& other) noexcept -> Value& {
    if (this != &other) {
        // Detach before releasing: `other` may live inside our own subtree.
        auto taken = std::exchange(other.data_, Storage{Null{}});
        data_ = std::move(taken);
    }
    return *this;
}

// -- Typed access -------------------------------------------------------------

auto Value::as_bool() const -> bool {
    if (const auto* b = std::get_if<bool>(&data_)) return *b;
    throw_type_mismatch(Type::boolean, type());
}

auto Value::as_number() const -> double {
    if (const auto* n = std::get_if<double>(&data_)) return *n;
    throw_type_mismatch(Type::number, type());
}

auto Value::as_string() const -> const std::string& {
    if (const auto* s = std::get_if<std::string>(&data_)) return *s;
    throw_type_mismatch(Type::string, type());
}

auto Value::as_string() -> std::string& {
    if (auto* s = std::get_if<std::string>(&data_)) return *s;
    throw_type_mismatch(Type::string, type());
}

auto Value::as_array() const -> const Array& {
    if (const auto* a = std::get_if<Array>(&data_)) return *a;
    throw_type_mismatch(Type::array, type());
}

auto Value::as_array() -> Array& {
    if (auto* a = std::get_if<Array>(&data_)) return *a;
    throw_type_mismatch(Type::array, type());
}

auto Value::as_object() const -> const Object& {
    if (const auto* o = std::get_if<Object>(&data_)) return *o;
    throw_type_mismatch(Type::object, type());
}

auto Value::as_object() -> Object& {
    if (auto* o = std::get_if<Object>(&data_)) return *o;
    throw_type_mismatch(Type::object, type());
}

void Value::set_null() noexcept {
    data_ = Null{};
}

auto Value::size() const noexcept -> std::size_t {
    if (const auto* a = std::get_if<Array>(&data_)) return a->size();
    if (const auto* o = std::get_if<Object>(&data_)) return o->size();
    return 0;
}

// -- Array access -------------------------------------------------------------

auto Value::at(std::size_t index) -> Value& {
    auto& elements = as_array();
    if (index >= elements.size()) throw_out_of_range(index, elements.size());
    return elements[index];
}

auto Value::at(std::size_t index) const -> const Value& {
    const auto& elements = as_array();
    if (index >= elements.size()) throw_out_of_range(index, elements.size());
    return elements[index];
}

auto Value::push_back(Value v) -> Value& {
    if (is_null()) data_ = Array{};
    return as_array().emplace_back(std::move(v));
}

auto Value::insert(std::size_t index, Value v) -> Value& {
    auto& elements = as_array();
    if (index > elements.size()) throw_out_of_range(index, elements.size());
    auto pos = elements.begin() + static_cast<std::ptrdiff_t>(index);
    return *elements.insert(pos, std::move(v));
}

void Value::erase(std::size_t index) {
    auto& elements = as_array();
    if (index >= elements.size()) throw_out_of_range(index, elements.size());
    elements.erase(elements.begin() + static_cast<std::ptrdiff_t>(index));
}

// -- Object access ------------------------------------------------------------

auto Value::find(std::string_view key) noexcept -> Value* {
    auto* members = std::get_if<Object>(&data_);
    if (!members) return nullptr;
    auto it = find_member(*members, key);
    return it == members->end() ? nullptr : &it->value;
}

auto Value::find(std::string_view key) const noexcept -> const Value* {
    const auto* members = std::get_if<Object>(&data_);
    if (!members) return nullptr;
    auto it = find_member(*members, key);
    return it == members->end() ? nullptr : &it->value;
}

auto Value::at(std::string_view key) -> Value& {
    auto& members = as_object();
    auto it = find_member(members, key);
    if (it == members.end()) {
        throw Exception{ErrorKind::not_found, "no member named '" + std::string{key} + "'"};
    }
    return it->value;
}

auto Value::at(std::string_view key) const -> const Value& {
    const auto& members = as_object();
    auto it = find_member(members, key);
    if (it == members.end()) {
        throw Exception{ErrorKind::not_found, "no member named '" + std::string{key} + "'"};
    }
    return it->value;
}

auto Value::set(std::string_view key, Value v) -> Value& {
    if (is_null()) data_ = Object{};
    auto& members = as_object();
    auto it = find_member(members, key);
    if (it != members.end()) {
        it->value = std::move(v);
        return it->value;
    }
    return members.emplace_back(Member{std::string{key}, std::move(v)}).value;
}

auto Value::erase(std::string_view key) -> bool {
    auto& members = as_object();
    auto it = find_member(members, key);
    if (it == members.end()) return false;
    members.erase(it);
    return true;
}

auto Value::operator[](std::string_view key) -> Value& {
    if (auto* existing = find(key)) return *existing;
    return set(key, Value{});
}

// -- Equality -----------------------------------------------------------------

namespace {

// Every key of `a` must map to an equal first-match value in `b`.
auto covers(const Object& a, const Object& b) -> bool {
    for (const auto& member : a) {
        auto it = find_member(b, member.key);
        if (it == b.end() || !(find_member(a, member.key)->value == it->value)) return false;
    }
    return true;
}

auto objects_equal(const Object& a, const Object& b) -> bool {
    return a.size() == b.size() && covers(a, b) && covers(b, a);
}

}  // anonymous namespace

auto operator==(const Value& a, const Value& b) -> bool {
    if (a.type() != b.type()) return false;
    return std::visit(overload{
        [](const Null&, const Null&) { return true; },
        [](bool x, bool y) { return x == y; },
        [](double x, double y) { return x == y; },
        [](const std::string& x, const std::string& y) { return x == y; },
        [](const Array& x, const Array& y) {
            return std::equal(x.begin(), x.end(), y.begin(), y.end());
        },
        [](const Object& x, const Object& y) { return objects_equal(x, y); },
        [](const auto&, const auto&) { return false; },
    }, a.data_, b.data_);
}

}  // namespace leptjson_cpp
