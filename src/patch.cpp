#include <leptjson-cpp/patch.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace leptjson_cpp {

auto op_kind_from_string(std::string_view name) -> std::optional<OpKind> {
    for (auto kind : {OpKind::add, OpKind::remove, OpKind::replace,
                      OpKind::move, OpKind::copy, OpKind::test}) {
        if (to_string_view(kind) == name) return kind;
    }
    return std::nullopt;
}

PatchException::PatchException(ErrorKind kind, std::size_t index, std::string path,
                               const std::string& reason)
    : Exception{kind, "patch operation " + std::to_string(index) + " at '" + path + "': " + reason},
      index_{index},
      path_{std::move(path)} {}

// =============================================================================
// Wire form
// =============================================================================

namespace {

auto uses_from(OpKind kind) -> bool {
    return kind == OpKind::move || kind == OpKind::copy;
}

auto uses_value(OpKind kind) -> bool {
    return kind == OpKind::add || kind == OpKind::replace || kind == OpKind::test;
}

auto read_pointer(const Value& entry, std::string_view field, std::size_t index) -> Pointer {
    const auto* text = entry.find(field);
    if (!text || !text->is_string()) {
        throw PatchException{ErrorKind::invalid_patch, index, "",
                             "missing string field '" + std::string{field} + "'"};
    }
    try {
        return Pointer::parse(text->as_string());
    } catch (const Exception& e) {
        throw PatchException{e.kind(), index, text->as_string(), e.what()};
    }
}

}  // anonymous namespace

auto parse_patch(const Value& document) -> std::vector<Operation> {
    if (!document.is_array()) {
        throw PatchException{ErrorKind::invalid_patch, 0, "", "JSON Patch must be an array"};
    }

    auto ops = std::vector<Operation>{};
    ops.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i) {
        const auto& entry = document.at(i);
        if (!entry.is_object()) {
            throw PatchException{ErrorKind::invalid_patch, i, "", "operation must be an object"};
        }

        const auto* name = entry.find("op");
        if (!name || !name->is_string()) {
            throw PatchException{ErrorKind::invalid_patch, i, "", "missing string field 'op'"};
        }
        auto kind = op_kind_from_string(name->as_string());
        if (!kind) {
            throw PatchException{ErrorKind::invalid_patch, i, "",
                                 "unknown operation '" + name->as_string() + "'"};
        }

        auto op = Operation{
            .kind = *kind, .path = read_pointer(entry, "path", i), .from = {}, .value = {}};
        if (uses_from(*kind)) {
            op.from = read_pointer(entry, "from", i);
        }
        if (uses_value(*kind)) {
            const auto* value = entry.find("value");
            if (!value) {
                throw PatchException{ErrorKind::invalid_patch, i, op.path.to_string(),
                                     "missing field 'value'"};
            }
            op.value = *value;
        }
        ops.push_back(std::move(op));
    }
    return ops;
}

auto to_value(std::span<const Operation> ops) -> Value {
    auto document = Value::array();
    for (const auto& op : ops) {
        auto entry = Value::object();
        entry.set("op", to_string_view(op.kind));
        entry.set("path", op.path.to_string());
        if (uses_from(op.kind)) entry.set("from", op.from.to_string());
        if (uses_value(op.kind)) entry.set("value", op.value);
        document.push_back(std::move(entry));
    }
    return document;
}

// =============================================================================
// Pointer-level mutations
// =============================================================================

void add_at(Value& root, const Pointer& path, Value value) {
    if (path.empty()) {
        root = std::move(value);
        return;
    }

    auto& parent = resolve(root, path.parent());
    const auto& token = path.back();

    if (parent.is_object()) {
        parent.set(token, std::move(value));
        return;
    }
    if (parent.is_array()) {
        if (token == "-") {
            parent.push_back(std::move(value));
            return;
        }
        auto index = parse_array_index(token);
        if (!index) {
            throw Exception{ErrorKind::invalid_index,
                            "invalid array index '" + token + "' in '" + path.to_string() + "'"};
        }
        if (*index > parent.size()) {
            throw Exception{ErrorKind::out_of_range,
                            "array index " + token + " is past the end in '" + path.to_string() + "'"};
        }
        parent.insert(*index, std::move(value));
        return;
    }
    throw Exception{ErrorKind::type_mismatch,
                    "cannot add into a " + std::string{to_string_view(parent.type())} +
                    " at '" + path.parent().to_string() + "'"};
}

auto remove_at(Value& root, const Pointer& path) -> Value {
    if (path.empty()) {
        throw Exception{ErrorKind::invalid_patch, "cannot remove the document root"};
    }

    auto& parent = resolve(root, path.parent());
    const auto& token = path.back();

    if (parent.is_object()) {
        auto* target = parent.find(token);
        if (!target) {
            throw Exception{ErrorKind::not_found,
                            "no member '" + token + "' to remove at '" + path.to_string() + "'"};
        }
        auto removed = std::move(*target);
        parent.erase(token);
        return removed;
    }
    if (parent.is_array()) {
        auto index = parse_array_index(token);
        if (!index || *index >= parent.size()) {
            throw Exception{index || token == "-" ? ErrorKind::out_of_range : ErrorKind::invalid_index,
                            "no array element '" + token + "' to remove at '" + path.to_string() + "'"};
        }
        auto removed = std::move(parent.at(*index));
        parent.erase(*index);
        return removed;
    }
    throw Exception{ErrorKind::type_mismatch,
                    "cannot remove from a " + std::string{to_string_view(parent.type())} +
                    " at '" + path.parent().to_string() + "'"};
}

void replace_at(Value& root, const Pointer& path, Value value) {
    auto& target = resolve(root, path);
    target = std::move(value);
}

// =============================================================================
// Application
// =============================================================================

namespace {

void apply_operation(Value& doc, const Operation& op, std::size_t index) {
    switch (op.kind) {
        case OpKind::add:
            add_at(doc, op.path, op.value);
            return;

        case OpKind::remove:
            remove_at(doc, op.path);
            return;

        case OpKind::replace:
            replace_at(doc, op.path, op.value);
            return;

        case OpKind::move: {
            if (op.path == op.from || op.from.is_prefix_of(op.path)) {
                throw PatchException{ErrorKind::invalid_move, index, op.path.to_string(),
                                     "cannot move '" + op.from.to_string() +
                                     "' into itself or one of its descendants"};
            }
            auto value = Value{};
            try {
                value = remove_at(doc, op.from);
            } catch (const Exception& e) {
                throw PatchException{e.kind(), index, op.from.to_string(), e.what()};
            }
            add_at(doc, op.path, std::move(value));
            return;
        }

        case OpKind::copy: {
            auto value = Value{};
            try {
                value = resolve(doc, op.from);
            } catch (const Exception& e) {
                throw PatchException{e.kind(), index, op.from.to_string(), e.what()};
            }
            add_at(doc, op.path, std::move(value));
            return;
        }

        case OpKind::test:
            if (!(resolve(doc, op.path) == op.value)) {
                throw PatchException{ErrorKind::test_failed, index, op.path.to_string(),
                                     "value differs"};
            }
            return;
    }
}

}  // anonymous namespace

void apply_patch(Value& doc, std::span<const Operation> ops) {
    for (std::size_t i = 0; i < ops.size(); ++i) {
        try {
            apply_operation(doc, ops[i], i);
        } catch (const PatchException&) {
            throw;
        } catch (const Exception& e) {
            throw PatchException{e.kind(), i, ops[i].path.to_string(), e.what()};
        }
    }
}

void apply_patch(Value& doc, const Value& patch) {
    auto ops = parse_patch(patch);
    apply_patch(doc, ops);
}

void apply_patch_atomic(Value& doc, std::span<const Operation> ops) {
    auto working = doc;
    apply_patch(working, ops);
    doc = std::move(working);
}

// =============================================================================
// Generation
// =============================================================================

namespace {

auto has_duplicate_keys(const Object& members) -> bool {
    for (std::size_t i = 1; i < members.size(); ++i) {
        for (std::size_t j = 0; j < i; ++j) {
            if (members[i].key == members[j].key) return true;
        }
    }
    return false;
}

// Depth-bounded walk over two trees. The current location is kept as one
// token stack; a Pointer is only built when an operation is emitted.
class Differ {
public:
    explicit Differ(std::size_t max_depth) : max_depth_{max_depth} {}

    auto take() -> std::vector<Operation> { return std::move(ops_); }

    void walk(const Value& source, const Value& target) {
        if (source.type() != target.type()) {
            emit_replace(target);
            return;
        }
        switch (source.type()) {
            case Type::array:
                walk_arrays(source.as_array(), target.as_array());
                return;
            case Type::object:
                walk_objects(source, target);
                return;
            case Type::null:
            case Type::boolean:
            case Type::number:
            case Type::string:
                if (!(source == target)) emit_replace(target);
                return;
        }
    }

private:
    // Increments the nesting depth for the lifetime of a container walk.
    class DepthGuard {
    public:
        DepthGuard(std::size_t& depth, std::size_t max_depth, const std::vector<std::string>& tokens)
            : depth_{depth} {
            if (++depth_ > max_depth) {
                --depth_;
                throw Exception{ErrorKind::max_depth_exceeded,
                                "diff exceeds maximum depth " + std::to_string(max_depth) +
                                " at '" + Pointer{tokens}.to_string() + "'"};
            }
        }
        ~DepthGuard() { --depth_; }

        DepthGuard(const DepthGuard&) = delete;
        auto operator=(const DepthGuard&) -> DepthGuard& = delete;

    private:
        std::size_t& depth_;
    };

    void walk_arrays(const Array& source, const Array& target) {
        auto guard = DepthGuard{depth_, max_depth_, tokens_};
        const auto common = std::min(source.size(), target.size());
        for (std::size_t i = 0; i < common; ++i) {
            tokens_.push_back(std::to_string(i));
            walk(source[i], target[i]);
            tokens_.pop_back();
        }
        // Remove from the back so earlier indices stay valid.
        for (auto i = source.size(); i > target.size(); --i) {
            emit(OpKind::remove, std::to_string(i - 1), Value{});
        }
        for (auto i = source.size(); i < target.size(); ++i) {
            emit(OpKind::add, std::to_string(i), target[i]);
        }
    }

    void walk_objects(const Value& source, const Value& target) {
        auto guard = DepthGuard{depth_, max_depth_, tokens_};
        // Shadowed members are not addressable by pointer, so a member-wise
        // patch could never remove or restore them.
        if (has_duplicate_keys(source.as_object()) || has_duplicate_keys(target.as_object())) {
            if (!(source == target)) emit_replace(target);
            return;
        }
        for (const auto& member : target.as_object()) {
            if (const auto* before = source.find(member.key)) {
                tokens_.push_back(member.key);
                walk(*before, member.value);
                tokens_.pop_back();
            } else {
                emit(OpKind::add, member.key, member.value);
            }
        }
        for (const auto& member : source.as_object()) {
            if (!target.contains(member.key)) emit(OpKind::remove, member.key, Value{});
        }
    }

    void emit_replace(const Value& target) {
        ops_.push_back(Operation{
            .kind = OpKind::replace, .path = Pointer{tokens_}, .from = {}, .value = target});
    }

    void emit(OpKind kind, const std::string& token, Value value) {
        tokens_.push_back(token);
        ops_.push_back(Operation{
            .kind = kind, .path = Pointer{tokens_}, .from = {}, .value = std::move(value)});
        tokens_.pop_back();
    }

    std::size_t max_depth_;
    std::size_t depth_{0};
    std::vector<std::string> tokens_;
    std::vector<Operation> ops_;
};

}  // anonymous namespace

auto diff(const Value& source, const Value& target, std::size_t max_depth)
    -> std::vector<Operation> {
    auto differ = Differ{max_depth};
    differ.walk(source, target);
    return differ.take();
}

}  // namespace leptjson_cpp
