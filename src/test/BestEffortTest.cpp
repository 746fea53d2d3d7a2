#include "TestSupport.hpp"

#include <stdexcept>

#include "best_effort.hpp"

using namespace code_context;
using code_context::testing::run;

int main() {
    run("every item succeeds", [] {
        std::vector<int> items{1, 2, 3};
        auto result = map_best_effort(items, [](int v) { return v * 10; });
        assert(result.all_succeeded());
        assert(result.successes.size() == 3);
        assert(result.successes[2].index == 2 && result.successes[2].value == 30);
    });

    run("a failing item is recorded and the rest continue", [] {
        std::vector<std::string> items{"ok", "bad", "fine", "bad"};
        int visited = 0;
        auto result = map_best_effort(items, [&](const std::string& s) {
            ++visited;
            if (s == "bad") throw std::runtime_error("rejected " + s);
            return s.size();
        });
        assert(visited == 4);
        assert(result.successes.size() == 2);
        assert(result.successes[0].index == 0 && result.successes[1].index == 2);
        assert(result.failures.size() == 2);
        assert(result.failures[0].index == 1 && result.failures[1].index == 3);
        assert(result.failures[0].error == "rejected bad");
        assert(!result.all_succeeded());
    });

    run("items can be mutated in place", [] {
        std::vector<int> items{1, 2};
        auto result = map_best_effort(items, [](int& v) { v += 1; return v; });
        assert(items[0] == 2 && items[1] == 3);
        assert(result.successes.size() == 2);
    });

    run("empty input yields empty result", [] {
        std::vector<int> items;
        auto result = map_best_effort(items, [](int v) { return v; });
        assert(result.successes.empty() && result.failures.empty());
    });

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
