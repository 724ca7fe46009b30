#include <leptjson-cpp/pointer.hpp>

#include <charconv>
#include <string>
#include <system_error>
#include <utility>

namespace leptjson_cpp {

// -- Pointer ------------------------------------------------------------------

auto Pointer::parse(std::string_view text) -> Pointer {
    if (text.empty()) return Pointer{};
    if (text.front() != '/') {
        throw Exception{ErrorKind::invalid_pointer,
                        "JSON Pointer must start with '/' or be empty: '" + std::string{text} + "'"};
    }

    auto tokens = std::vector<std::string>{};
    auto token = std::string{};
    for (std::size_t i = 1; i <= text.size(); ++i) {
        if (i == text.size() || text[i] == '/') {
            tokens.push_back(std::move(token));
            token.clear();
            continue;
        }
        if (text[i] != '~') {
            token.push_back(text[i]);
            continue;
        }
        auto next = i + 1 < text.size() ? text[i + 1] : '\0';
        if (next == '0') {
            token.push_back('~');
        } else if (next == '1') {
            token.push_back('/');
        } else {
            throw Exception{ErrorKind::invalid_pointer,
                            "invalid escape in JSON Pointer: '" + std::string{text} + "'"};
        }
        ++i;
    }
    return Pointer{std::move(tokens)};
}

auto Pointer::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& token : tokens_) {
        result.push_back('/');
        result += escape_token(token);
    }
    return result;
}

auto Pointer::back() const -> const std::string& {
    return tokens_.back();
}

auto Pointer::parent() const -> Pointer {
    return Pointer{std::vector<std::string>(tokens_.begin(), tokens_.end() - 1)};
}

auto Pointer::operator/(std::string_view token) const -> Pointer {
    auto tokens = tokens_;
    tokens.emplace_back(token);
    return Pointer{std::move(tokens)};
}

auto Pointer::operator/(std::size_t index) const -> Pointer {
    return *this / std::string_view{std::to_string(index)};
}

auto Pointer::is_prefix_of(const Pointer& other) const noexcept -> bool {
    if (tokens_.size() >= other.tokens_.size()) return false;
    for (std::size_t i = 0; i < tokens_.size(); ++i) {
        if (tokens_[i] != other.tokens_[i]) return false;
    }
    return true;
}

// -- Free functions -----------------------------------------------------------

auto escape_token(std::string_view token) -> std::string {
    auto result = std::string{};
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result.push_back(c);
        }
    }
    return result;
}

auto parse_array_index(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (token.size() > 1 && token[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), result);
    if (ec == std::errc{} && ptr == token.data() + token.size()) return result;
    return std::nullopt;
}

namespace {

// Descend one level. On failure returns nullptr and sets `error`.
template <typename V>
auto child(V& parent, const std::string& token, ErrorKind& error) noexcept -> V* {
    if (parent.is_object()) {
        auto* found = parent.find(token);
        if (!found) error = ErrorKind::not_found;
        return found;
    }
    if (auto* elements = parent.template get_if<Array>()) {
        auto index = parse_array_index(token);
        if (!index) {
            error = token == "-" ? ErrorKind::out_of_range : ErrorKind::invalid_index;
            return nullptr;
        }
        if (*index >= elements->size()) {
            error = ErrorKind::out_of_range;
            return nullptr;
        }
        return &(*elements)[*index];
    }
    error = ErrorKind::type_mismatch;
    return nullptr;
}

// Walk the pointer. On failure returns nullptr and reports how many tokens
// were consumed before the failing one.
template <typename V>
auto walk(V& root, const Pointer& pointer, ErrorKind& error, std::size_t& depth) noexcept -> V* {
    auto* current = &root;
    for (depth = 0; depth < pointer.size(); ++depth) {
        current = child(*current, pointer.tokens()[depth], error);
        if (!current) return nullptr;
    }
    return current;
}

[[noreturn]] void throw_resolve_error(ErrorKind kind, const Pointer& pointer, std::size_t depth) {
    const auto& token = pointer.tokens()[depth];
    auto where = Pointer{std::vector<std::string>(pointer.tokens().begin(),
                                                   pointer.tokens().begin() +
                                                       static_cast<std::ptrdiff_t>(depth))};
    auto message = std::string{};
    switch (kind) {
        case ErrorKind::not_found:
            message = "no member '" + token + "'";
            break;
        case ErrorKind::invalid_index:
            message = "invalid array index '" + token + "'";
            break;
        case ErrorKind::out_of_range:
            message = "array index '" + token + "' out of range";
            break;
        case ErrorKind::type_mismatch:
            message = "cannot descend into a scalar with '" + token + "'";
            break;
        default:
            message = std::string{to_string_view(kind)};
            break;
    }
    message += " at '" + where.to_string() + "' resolving '" + pointer.to_string() + "'";
    throw Exception{kind, std::move(message)};
}

}  // anonymous namespace

auto resolve(Value& root, const Pointer& pointer) -> Value& {
    auto error = ErrorKind::not_found;
    auto depth = std::size_t{0};
    auto* target = walk(root, pointer, error, depth);
    if (!target) throw_resolve_error(error, pointer, depth);
    return *target;
}

auto resolve(const Value& root, const Pointer& pointer) -> const Value& {
    auto error = ErrorKind::not_found;
    auto depth = std::size_t{0};
    const auto* target = walk(root, pointer, error, depth);
    if (!target) throw_resolve_error(error, pointer, depth);
    return *target;
}

auto find(Value& root, const Pointer& pointer) noexcept -> Value* {
    auto error = ErrorKind::not_found;
    auto depth = std::size_t{0};
    return walk(root, pointer, error, depth);
}

auto find(const Value& root, const Pointer& pointer) noexcept -> const Value* {
    auto error = ErrorKind::not_found;
    auto depth = std::size_t{0};
    return walk(root, pointer, error, depth);
}

}  // namespace leptjson_cpp
