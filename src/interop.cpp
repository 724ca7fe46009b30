#include <leptjson-cpp/interop.hpp>

#include <cmath>
#include <span>
#include <string>
#include <utility>

namespace leptjson_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](double d) {
            if (std::isfinite(d)) {
                j = d;
            } else {
                j = nullptr;
            }
        },
        [&](const std::string& s) { j = s; },
        [&](const Array& elements) {
            j = nlohmann::json::array();
            for (const auto& element : elements) {
                auto element_j = nlohmann::json{};
                to_json(element_j, element);
                j.push_back(std::move(element_j));
            }
        },
        [&](const Object& members) {
            j = nlohmann::json::object();
            for (const auto& [key, value] : members) {
                if (j.contains(key)) continue;
                auto value_j = nlohmann::json{};
                to_json(value_j, value);
                j[key] = std::move(value_j);
            }
        },
    }, v.storage());
}

void from_json(const nlohmann::json& j, Value& v) {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            v = Null{};
            return;
        case nlohmann::json::value_t::boolean:
            v = j.get<bool>();
            return;
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned:
        case nlohmann::json::value_t::number_float:
            v = j.get<double>();
            return;
        case nlohmann::json::value_t::string:
            v = j.get<std::string>();
            return;
        case nlohmann::json::value_t::array: {
            auto elements = Array{};
            elements.reserve(j.size());
            for (const auto& element_j : j) {
                auto element = Value{};
                from_json(element_j, element);
                elements.push_back(std::move(element));
            }
            v = std::move(elements);
            return;
        }
        case nlohmann::json::value_t::object: {
            auto members = Object{};
            members.reserve(j.size());
            for (const auto& item : j.items()) {
                auto value = Value{};
                from_json(item.value(), value);
                members.push_back(Member{item.key(), std::move(value)});
            }
            v = std::move(members);
            return;
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    throw Exception{ErrorKind::type_mismatch,
                    "cannot convert JSON of type '" + std::string{j.type_name()} + "' to Value"};
}

void to_json(nlohmann::json& j, const Pointer& p) {
    j = p.to_string();
}

void from_json(const nlohmann::json& j, Pointer& p) {
    p = Pointer::parse(j.get<std::string>());
}

void to_json(nlohmann::json& j, const Operation& op) {
    auto document = to_value(std::span<const Operation>{&op, 1});
    to_json(j, document.at(0));
}

void from_json(const nlohmann::json& j, Operation& op) {
    auto ops = parse_patch(Value::array({import_json(j)}));
    op = std::move(ops.front());
}

// =============================================================================
// Document export / import
// =============================================================================

auto export_json(const Value& v) -> nlohmann::json {
    auto j = nlohmann::json{};
    to_json(j, v);
    return j;
}

auto import_json(const nlohmann::json& j) -> Value {
    auto v = Value{};
    from_json(j, v);
    return v;
}

}  // namespace leptjson_cpp
