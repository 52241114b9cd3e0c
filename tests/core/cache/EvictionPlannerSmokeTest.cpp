#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>
#include "agrocache/core/cache/eviction/EvictionPlanner.hpp"

using namespace agrocache::core::cache;

namespace {

EvictionCandidate candidate(const std::string& hash, size_t size, int created, int accessed,
                            uint64_t count, int expires, uint64_t seq, uint64_t accessSeq) {
    auto base = TimePoint(std::chrono::seconds(1700000000));
    EvictionCandidate c;
    c.keyHash = hash;
    c.sizeBytes = size;
    c.createdAt = base + std::chrono::seconds(created);
    c.accessedAt = base + std::chrono::seconds(accessed);
    c.expiresAt = base + std::chrono::seconds(expires);
    c.accessCount = count;
    c.insertSeq = seq;
    c.accessSeq = accessSeq;
    return c;
}

std::vector<EvictionCandidate> sample() {
    //            hash  size created accessed count expires seq accessSeq
    return {candidate("a", 100, 0, 30, 5, 500, 1, 6),
            candidate("b", 100, 10, 5, 1, 100, 2, 4),
            candidate("c", 100, 20, 20, 3, 50, 3, 5)};
}

} // namespace

void testOrdering() {
    std::cout << "Testing EvictionPlanner ordering per strategy...\n";

    EvictionPlanner planner;
    auto lru = planner.order(sample(), EvictionStrategy::LRU);
    assert(lru[0].keyHash == "b" && lru[1].keyHash == "c" && lru[2].keyHash == "a");

    auto lfu = planner.order(sample(), EvictionStrategy::LFU);
    assert(lfu[0].keyHash == "b" && lfu[1].keyHash == "c" && lfu[2].keyHash == "a");

    auto fifo = planner.order(sample(), EvictionStrategy::FIFO);
    assert(fifo[0].keyHash == "a" && fifo[1].keyHash == "b" && fifo[2].keyHash == "c");

    auto ttl = planner.order(sample(), EvictionStrategy::TTL);
    assert(ttl[0].keyHash == "c" && ttl[1].keyHash == "b" && ttl[2].keyHash == "a");

    std::cout << "[OK] EvictionPlanner ordering test\n";
}

void testTieBreakBySequence() {
    std::cout << "Testing EvictionPlanner tie-break...\n";

    EvictionPlanner planner;
    std::vector<EvictionCandidate> same = {candidate("late", 10, 0, 0, 0, 0, 9, 9),
                                           candidate("early", 10, 0, 0, 0, 0, 4, 4)};
    assert(planner.order(same, EvictionStrategy::LRU)[0].keyHash == "early");
    assert(planner.order(same, EvictionStrategy::FIFO)[0].keyHash == "early");

    std::cout << "[OK] EvictionPlanner tie-break test\n";
}

void testWallClockStepBack() {
    std::cout << "Testing EvictionPlanner ignores wall clock stepping back...\n";

    EvictionPlanner planner;
    // "recent" тронута позже, но часы к тому моменту ушли назад
    std::vector<EvictionCandidate> skewed = {candidate("recent", 10, 0, -3600, 2, 0, 1, 7),
                                             candidate("stale", 10, 0, 60, 2, 0, 2, 3)};
    assert(planner.order(skewed, EvictionStrategy::LRU)[0].keyHash == "stale");
    assert(planner.order(skewed, EvictionStrategy::LFU)[0].keyHash == "stale");

    std::cout << "[OK] EvictionPlanner wall clock test\n";
}

void testPlan() {
    std::cout << "Testing EvictionPlanner plan...\n";

    EvictionPlanner planner;
    auto nothing = planner.plan(sample(), EvictionStrategy::LRU, 0, 0);
    assert(nothing.satisfiable && nothing.victims.empty());

    auto bytes = planner.plan(sample(), EvictionStrategy::LRU, 150, 0);
    assert(bytes.satisfiable);
    assert(bytes.victims.size() == 2);
    assert(bytes.victims[0] == "b" && bytes.victims[1] == "c");
    assert(bytes.bytesFreed == 200);

    auto items = planner.plan(sample(), EvictionStrategy::FIFO, 0, 1);
    assert(items.satisfiable && items.victims.size() == 1 && items.victims[0] == "a");

    auto impossible = planner.plan(sample(), EvictionStrategy::LRU, 1000, 0);
    assert(!impossible.satisfiable);
    assert(impossible.victims.empty());

    auto empty = planner.plan({}, EvictionStrategy::LRU, 1, 0);
    assert(!empty.satisfiable);

    std::cout << "[OK] EvictionPlanner plan test\n";
}

int main() {
    try {
        testOrdering();
        testTieBreakBySequence();
        testWallClockStepBack();
        testPlan();
        std::cout << "All EvictionPlanner tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
