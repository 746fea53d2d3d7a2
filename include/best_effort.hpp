#pragma once
#include <exception>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace code_context {

template <typename T>
struct Outcome {
    size_t index;
    T value;
};

struct Failure {
    size_t index;
    std::string error;
};

template <typename T>
struct BestEffortResult {
    std::vector<Outcome<T>> successes;
    std::vector<Failure> failures;

    bool all_succeeded() const { return failures.empty(); }
};

/**
 * @brief Applies fn to every item, collecting results and failures by position.
 *
 * An exception thrown for one item is recorded against that item's index and
 * never stops the remaining items. Only std::exception is caught.
 */
template <typename Container, typename Fn>
auto map_best_effort(Container& items, Fn&& fn)
    -> BestEffortResult<std::decay_t<std::invoke_result_t<Fn&, decltype(*std::begin(items))>>> {
    using Result = std::decay_t<std::invoke_result_t<Fn&, decltype(*std::begin(items))>>;

    BestEffortResult<Result> result;
    size_t index = 0;
    for (auto&& item : items) {
        try {
            result.successes.push_back({index, fn(item)});
        } catch (const std::exception& e) {
            result.failures.push_back({index, e.what()});
        }
        ++index;
    }
    return result;
}

} // namespace code_context
