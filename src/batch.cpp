#include <leptjson-cpp/parse.hpp>

#include "executor.hpp"

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace leptjson_cpp {

namespace {

// Below this many documents the scheduling overhead outweighs the work.
constexpr std::size_t parallel_threshold = 4;

}  // anonymous namespace

auto parse_many(std::span<const std::string_view> texts,
                const ParseOptions& options) -> std::vector<ParseResult> {
    auto results = std::vector<ParseResult>(texts.size());
    if (texts.size() < parallel_threshold) {
        for (std::size_t i = 0; i < texts.size(); ++i) {
            results[i] = parse(texts[i], options);
        }
        return results;
    }

    // Each task writes only its own slot; no Value crosses tasks.
    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, texts.size(), std::size_t{1},
                            [&](std::size_t i) { results[i] = parse(texts[i], options); });
    detail::global_executor().run(taskflow).get();
    return results;
}

}  // namespace leptjson_cpp
