#include "forkjoin/WorkStealingDeque.hpp"
#include <doctest/doctest.h>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace WP;

TEST_SUITE("forkjoin.deque") {
TEST_CASE("Owner pops LIFO, thieves steal FIFO") {
    WorkStealingDeque<int*> deque(8);
    int                     values[4] = {0, 1, 2, 3};
    for (auto& v : values)
        REQUIRE(deque.push(&v));
    CHECK(deque.size() == 4);

    CHECK(deque.pop() == &values[3]);
    CHECK(deque.steal() == &values[0]);
    CHECK(deque.pop() == &values[2]);
    CHECK(deque.steal() == &values[1]);
    CHECK(deque.empty());
    CHECK(deque.pop() == nullptr);
    CHECK(deque.steal() == nullptr);
}

TEST_CASE("Capacity rounds up to a power of two and push reports a full deque") {
    WorkStealingDeque<int*> deque(5);
    CHECK(deque.capacity() == 8);

    std::vector<int> values(9);
    for (int i = 0; i < 8; ++i)
        CHECK(deque.push(&values[i]));
    CHECK_FALSE(deque.push(&values[8]));

    // Freed slots are reusable after wrap-around.
    CHECK(deque.steal() == &values[0]);
    CHECK(deque.push(&values[8]));
    CHECK(deque.pop() == &values[8]);

    WorkStealingDeque<int*> tiny(0);
    CHECK(tiny.capacity() == 2);
}

TEST_CASE("Concurrent thieves and owner take every item exactly once") {
    constexpr int           itemCount = 20000;
    WorkStealingDeque<int*> deque(1024);
    std::vector<int>        items(itemCount);
    for (int i = 0; i < itemCount; ++i)
        items[i] = i;

    std::atomic<bool>             done{false};
    std::vector<std::vector<int>> stolen(3);
    std::vector<std::thread>      thieves;
    for (int t = 0; t < 3; ++t) {
        thieves.emplace_back([&, t] {
            while (!done.load(std::memory_order_acquire) || !deque.empty()) {
                if (auto* item = deque.steal())
                    stolen[t].push_back(*item);
            }
        });
    }

    std::vector<int> popped;
    int              next = 0;
    while (next < itemCount) {
        if (deque.push(&items[next])) {
            ++next;
            if (next % 3 == 0) {
                if (auto* item = deque.pop())
                    popped.push_back(*item);
            }
        } else if (auto* item = deque.pop()) {
            popped.push_back(*item);
        }
    }
    while (auto* item = deque.pop())
        popped.push_back(*item);
    done.store(true, std::memory_order_release);
    for (auto& thief : thieves)
        thief.join();

    std::set<int> seen(popped.begin(), popped.end());
    std::size_t   total = popped.size();
    for (auto const& part : stolen) {
        total += part.size();
        seen.insert(part.begin(), part.end());
    }
    CHECK(total == static_cast<std::size_t>(itemCount));
    CHECK(seen.size() == static_cast<std::size_t>(itemCount));
}
}
