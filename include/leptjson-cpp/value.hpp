/// @file value.hpp
/// @brief The JSON document model: Value, Array, Object, Member.

#pragma once

#include <leptjson-cpp/error.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace leptjson_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// The six JSON value types. Order matches Value::Storage.
enum class Type : std::uint8_t {
    null,
    boolean,
    number,
    string,
    array,
    object,
};

/// Convert a Type to its string representation.
constexpr auto to_string_view(Type type) noexcept -> std::string_view {
    switch (type) {
        case Type::null:    return "null";
        case Type::boolean: return "boolean";
        case Type::number:  return "number";
        case Type::string:  return "string";
        case Type::array:   return "array";
        case Type::object:  return "object";
    }
    return "unknown";
}

/// Container nesting limit used by default for parsing and diffing.
inline constexpr std::size_t default_max_depth = 1000;

class Value;
struct Member;

/// An ordered sequence of owned values.
using Array = std::vector<Value>;

/// An ordered sequence of owned members, kept in insertion order.
/// Duplicate keys are allowed; lookups return the first match.
using Object = std::vector<Member>;

/// A JSON value: a closed tagged union over the six JSON types.
///
/// A Value exclusively owns its whole subtree. Copying performs a deep
/// clone; moving transfers ownership and leaves the source Null.
///
/// @code
/// auto doc = Value::object({{"name", "Ada"}, {"tags", Value::array({1, 2})}});
/// doc["tags"].push_back(3);
/// auto n = doc.at("tags").size();  // 3
/// @endcode
class Value {
public:
    using Storage = std::variant<Null, bool, double, std::string, Array, Object>;

    /// Construct a Null value.
    Value() noexcept;
    Value(Null) noexcept;
    Value(bool b) noexcept;
    Value(double n) noexcept;

    /// Any other arithmetic type is stored as a double.
    template <typename T>
        requires std::is_arithmetic_v<T> &&
                 (!std::same_as<T, bool>) && (!std::same_as<T, double>)
    Value(T n) noexcept : Value{static_cast<double>(n)} {}

    Value(const char* s);
    Value(std::string_view s);
    Value(std::string s) noexcept;
    Value(Array a) noexcept;
    Value(Object o) noexcept;

    /// Build an array from a brace list of values.
    static auto array(std::initializer_list<Value> elements = {}) -> Value;

    /// Build an object from a brace list of members.
    static auto object(std::initializer_list<Member> members = {}) -> Value;

    ~Value();

    /// Deep copy. The copy shares nothing with the source.
    Value(const Value& other);
    /// Deep copy assignment. Releases the previous contents first.
    auto operator=(const Value& other) -> Value&;

    /// Ownership transfer. The source is left Null.
    Value(Value&& other) noexcept;
    /// Ownership transfer. Releases the previous contents; source becomes Null.
    auto operator=(Value&& other) noexcept -> Value&;

    // -- Type queries ---------------------------------------------------------

    auto type() const noexcept -> Type { return static_cast<Type>(data_.index()); }

    auto is_null() const noexcept -> bool { return type() == Type::null; }
    auto is_bool() const noexcept -> bool { return type() == Type::boolean; }
    auto is_number() const noexcept -> bool { return type() == Type::number; }
    auto is_string() const noexcept -> bool { return type() == Type::string; }
    auto is_array() const noexcept -> bool { return type() == Type::array; }
    auto is_object() const noexcept -> bool { return type() == Type::object; }

    // -- Typed access ---------------------------------------------------------

    /// @throws Exception (type_mismatch) if the value is not a boolean.
    auto as_bool() const -> bool;
    /// @throws Exception (type_mismatch) if the value is not a number.
    auto as_number() const -> double;
    /// @throws Exception (type_mismatch) if the value is not a string.
    auto as_string() const -> const std::string&;
    auto as_string() -> std::string&;
    /// @throws Exception (type_mismatch) if the value is not an array.
    auto as_array() const -> const Array&;
    auto as_array() -> Array&;
    /// @throws Exception (type_mismatch) if the value is not an object.
    auto as_object() const -> const Object&;
    auto as_object() -> Object&;

    /// Pointer to the held alternative, or nullptr on type mismatch.
    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data_); }

    /// The underlying variant, for std::visit.
    auto storage() const noexcept -> const Storage& { return data_; }

    /// Release the current contents and become Null.
    void set_null() noexcept;

    /// Element count for arrays, member count for objects, 0 otherwise.
    auto size() const noexcept -> std::size_t;
    auto empty() const noexcept -> bool { return size() == 0; }

    // -- Array access ---------------------------------------------------------

    /// @throws Exception (type_mismatch, out_of_range)
    auto at(std::size_t index) -> Value&;
    auto at(std::size_t index) const -> const Value&;

    /// Unchecked element access. Requires an array and `index < size()`.
    auto operator[](std::size_t index) -> Value& { return std::get<Array>(data_)[index]; }
    auto operator[](std::size_t index) const -> const Value& {
        return std::get<Array>(data_)[index];
    }

    /// Append to an array. A Null value becomes an empty array first.
    auto push_back(Value v) -> Value&;

    /// Insert before `index`; `index == size()` appends.
    /// @throws Exception (type_mismatch, out_of_range)
    auto insert(std::size_t index, Value v) -> Value&;

    /// @throws Exception (type_mismatch, out_of_range)
    void erase(std::size_t index);

    // -- Object access --------------------------------------------------------

    /// First member value with this key, or nullptr (also for non-objects).
    auto find(std::string_view key) noexcept -> Value*;
    auto find(std::string_view key) const noexcept -> const Value*;

    auto contains(std::string_view key) const noexcept -> bool {
        return find(key) != nullptr;
    }

    /// @throws Exception (type_mismatch, not_found)
    auto at(std::string_view key) -> Value&;
    auto at(std::string_view key) const -> const Value&;

    /// Replace the first member with this key, or append a new member.
    /// A Null value becomes an empty object first.
    /// @throws Exception (type_mismatch) for other non-objects.
    auto set(std::string_view key, Value v) -> Value&;

    /// Remove the first member with this key. Returns false if absent.
    /// @throws Exception (type_mismatch) if the value is not an object.
    auto erase(std::string_view key) -> bool;

    /// Member access that inserts Null when the key is absent.
    auto operator[](std::string_view key) -> Value&;

    void swap(Value& other) noexcept { data_.swap(other.data_); }

    friend void swap(Value& a, Value& b) noexcept { a.swap(b); }

    /// Structural equality. Arrays compare by position; objects compare as
    /// key-to-value mappings regardless of member order. With duplicate
    /// keys, each key maps to its first member, and the member counts must
    /// also match.
    friend auto operator==(const Value& a, const Value& b) -> bool;

private:
    Storage data_;
};

/// A single key/value pair inside an Object.
struct Member {
    std::string key;
    Value value;
};

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](double n) { std::printf("%g\n", n); },
///     [](auto&&) { std::printf("other\n"); },
/// }, value.storage());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace leptjson_cpp
