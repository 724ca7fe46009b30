#include <leptjson-cpp/merge_patch.hpp>

#include <utility>

namespace leptjson_cpp {

void merge_patch(Value& target, const Value& patch) {
    if (!patch.is_object()) {
        target = patch;
        return;
    }
    if (!target.is_object()) {
        target = Value::object();
    }

    for (const auto& [key, value] : patch.as_object()) {
        if (value.is_null()) {
            target.erase(key);
            continue;
        }
        auto* existing = target.find(key);
        if (existing && existing->is_object() && value.is_object()) {
            merge_patch(*existing, value);
        } else {
            target.set(key, value);
        }
    }
}

auto apply_merge_patch(const Value& target, const Value& patch) -> Value {
    auto result = target;
    merge_patch(result, patch);
    return result;
}

auto create_merge_patch(const Value& source, const Value& target) -> Value {
    if (!source.is_object() || !target.is_object()) {
        return target;
    }

    auto patch = Value::object();
    for (const auto& member : target.as_object()) {
        // Later duplicates are shadowed by the first member with the key.
        if (target.find(member.key) != &member.value) continue;

        const auto* before = source.find(member.key);
        if (!before) {
            patch.set(member.key, member.value);
        } else if (before->is_object() && member.value.is_object()) {
            auto nested = create_merge_patch(*before, member.value);
            if (!nested.empty()) patch.set(member.key, std::move(nested));
        } else if (!(*before == member.value)) {
            patch.set(member.key, member.value);
        }
    }
    for (const auto& member : source.as_object()) {
        if (!target.contains(member.key) && !patch.contains(member.key)) {
            patch.set(member.key, Null{});
        }
    }
    return patch;
}

}  // namespace leptjson_cpp
