#include <gtest/gtest.h>
#include <hgreason/errors.hpp>
#include <hgreason/memory_store.hpp>
#include <hgreason/reasoner.hpp>
#include "test_helpers.hpp"
#include <map>
#include <random>
#include <set>

using namespace hgreason;
using test_utils::edge;
using test_utils::edge_strings;
using test_utils::expect_valid_chain;

class ReasonerTest : public ::testing::Test {
protected:
    // Chain a-b-c-d-e: each edge shares exactly one atom with the next
    MemoryStore chain_store() {
        return test_utils::create_test_store({
            "(r/P a/C b/C)",
            "(r/P2 b/C c/C)",
            "(r/P3 c/C d/C)",
            "(r/P4 d/C e/C)",
        });
    }

    static std::map<std::string, int> distances(const std::vector<ReasoningResult>& results) {
        std::map<std::string, int> out;
        for (const auto& r : results) out[r.edge_str()] = r.distance;
        return out;
    }
};

// === BASIC TRAVERSAL ===

TEST_F(ReasonerTest, SingleHopFromConcreteStart) {
    MemoryStore store = test_utils::create_test_store({"(likes/P b/C c/C)"});
    Reasoner reasoner(store);

    auto results = reasoner.reason(edge("(is/P a/C b/C)"), 1, 100);

    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].edge_str(), "(likes/P b/C c/C)");
    EXPECT_EQ(results[0].distance, 1);
    EXPECT_EQ(results[0].path, (std::vector<std::string>{"(is/P a/C b/C)"}));
}

TEST_F(ReasonerTest, ConcreteStartIsNotReported) {
    MemoryStore store = test_utils::create_test_store({"(is/P a/C b/C)", "(likes/P b/C c/C)"});
    Reasoner reasoner(store);

    auto results = reasoner.reason(edge("(is/P a/C b/C)"), 2, 100);
    EXPECT_EQ(edge_strings(results), (std::vector<std::string>{"(likes/P b/C c/C)"}));
}

TEST_F(ReasonerTest, DistancesFollowChain) {
    MemoryStore store = chain_store();
    Reasoner reasoner(store);

    auto results = reasoner.reason(edge("(r/P a/C b/C)"), 3, 100);
    // Connector atoms differ, so only the shared concept links consecutive edges
    EXPECT_EQ(distances(results), (std::map<std::string, int>{
        {"(r/P2 b/C c/C)", 1},
        {"(r/P3 c/C d/C)", 2},
        {"(r/P4 d/C e/C)", 3}}));
    for (const auto& r : results) {
        expect_valid_chain(r);
    }
    EXPECT_EQ(results[2].path, (std::vector<std::string>{
        "(r/P a/C b/C)", "(r/P2 b/C c/C)", "(r/P3 c/C d/C)"}));
}

TEST_F(ReasonerTest, HopBudgetBoundsDistance) {
    MemoryStore store = chain_store();
    Reasoner reasoner(store);

    auto results = reasoner.reason(edge("(r/P a/C b/C)"), 2, 100);
    ASSERT_EQ(results.size(), 2);
    for (const auto& r : results) {
        EXPECT_LE(r.distance, 2);
    }
}

TEST_F(ReasonerTest, ResultsAreOrderedByDistance) {
    MemoryStore store = test_utils::create_test_store({
        "(x/P hub/C one/C)", "(x/P hub/C two/C)", "(y/P one/C far/C)", "(y/P two/C farther/C)"});
    Reasoner reasoner(store);

    auto results = reasoner.reason(edge("(start/P hub/C)"), 3, 100);
    ASSERT_EQ(results.size(), 4);
    for (std::size_t i = 1; i < results.size(); ++i) {
        EXPECT_LE(results[i - 1].distance, results[i].distance);
    }
}

TEST_F(ReasonerTest, AttributesAreCarried) {
    MemoryStore store;
    store.add("(likes/P b/C c/C)", Attributes{{"layer", "user"}, {"source", "survey"}});
    Reasoner reasoner(store);

    auto results = reasoner.reason(edge("(is/P a/C b/C)"), 1, 10);
    ASSERT_EQ(results.size(), 1);
    EXPECT_EQ(results[0].attrs.layer(), "user");
    EXPECT_EQ(results[0].attrs.source(), "survey");
}

TEST_F(ReasonerTest, AtomStart) {
    MemoryStore store = chain_store();
    Reasoner reasoner(store);

    auto results = reasoner.reason(edge("c/C"), 1, 100);
    EXPECT_EQ(distances(results), (std::map<std::string, int>{
        {"(r/P2 b/C c/C)", 1},
        {"(r/P3 c/C d/C)", 1}}));
    for (const auto& r : results) {
        EXPECT_EQ(r.path, (std::vector<std::string>{"c/C"}));
    }
}

// === PATTERN STARTS ===

TEST_F(ReasonerTest, PatternMatchesFormDistanceZeroFrontier) {
    MemoryStore store = chain_store();
    Reasoner reasoner(store);

    auto results = reasoner.reason(edge("(r/P2 * *)"), 1, 100);
    EXPECT_EQ(distances(results), (std::map<std::string, int>{
        {"(r/P2 b/C c/C)", 0},
        {"(r/P a/C b/C)", 1},
        {"(r/P3 c/C d/C)", 1}}));
    for (const auto& r : results) {
        expect_valid_chain(r);
    }
    EXPECT_TRUE(results[0].path.empty());
}

TEST_F(ReasonerTest, PatternWithoutMatchesIsEmpty) {
    MemoryStore store = chain_store();
    Reasoner reasoner(store);

    EXPECT_TRUE(reasoner.reason(edge("(unknown/P * *)"), 2, 100).empty());
    EXPECT_TRUE(reasoner.reason(std::string("(r/P zzz/C ...)"), 2, 100).empty());
}

TEST_F(ReasonerTest, TextStartIsSanitized) {
    MemoryStore store = chain_store();
    Reasoner reasoner(store);

    EXPECT_EQ(reasoner.reason(std::string("(r/P a/C b/C)"), 1, 100).size(), 1);
    EXPECT_THROW(reasoner.reason(std::string("(r/P a/C b/C"), 1, 100), ParseError);

    std::string deep = "x/C";
    for (int i = 0; i < 12; ++i) deep = "(p/P " + deep + ")";
    EXPECT_THROW(reasoner.reason(deep, 1, 100), PatternError);
}

// === LIMITS ===

TEST_F(ReasonerTest, LimitCapsResults) {
    std::vector<std::string> edges;
    for (int i = 0; i < 20; ++i) {
        edges.push_back("(near/P hub/C n" + std::to_string(i) + "/C)");
        edges.push_back("(far/P n" + std::to_string(i) + "/C m" + std::to_string(i) + "/C)");
    }
    MemoryStore store = test_utils::create_test_store(edges);
    Reasoner reasoner(store);

    // Cut off in the middle of the first layer
    auto capped = reasoner.reason(edge("hub/C"), 2, 5);
    EXPECT_EQ(capped.size(), 5);
    for (const auto& r : capped) {
        EXPECT_EQ(r.distance, 1);
    }

    EXPECT_EQ(reasoner.reason(edge("hub/C"), 2, 1000).size(), 40);
}

TEST_F(ReasonerTest, LimitAppliesToDistanceZeroMatches) {
    MemoryStore store = chain_store();
    Reasoner reasoner(store);

    auto results = reasoner.reason(edge("(* ...)"), 3, 2);
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].distance, 0);
    EXPECT_EQ(results[1].distance, 0);
}

TEST_F(ReasonerTest, TraversalStopsEarlyOnLimit) {
    MemoryStore inner = chain_store();
    test_utils::CountingStore store(inner);
    Reasoner reasoner(store);

    reasoner.reason(edge("(r/P a/C b/C)"), 3, 1);
    EXPECT_EQ(store.neighbor_calls, 1);
}

TEST_F(ReasonerTest, DefaultsFromConfig) {
    MemoryStore store = chain_store();
    ReasonerConfig config;
    config.default_hops = 1;
    Reasoner reasoner(store, config);

    EXPECT_EQ(reasoner.reason(edge("(r/P a/C b/C)")).size(), 1);
    EXPECT_EQ(Reasoner(store).reason(edge("(r/P a/C b/C)")).size(), 2);
}

// === ERRORS ===

TEST_F(ReasonerTest, NonPositiveBoundsRejected) {
    MemoryStore store = chain_store();
    test_utils::CountingStore counting(store);
    Reasoner reasoner(counting);

    EXPECT_THROW(reasoner.reason(edge("(r/P a/C b/C)"), 0, 10), InvalidArgument);
    EXPECT_THROW(reasoner.reason(edge("(r/P a/C b/C)"), -1, 10), InvalidArgument);
    EXPECT_THROW(reasoner.reason(edge("(r/P a/C b/C)"), 1, 0), InvalidArgument);
    EXPECT_THROW(reasoner.reason(std::string("(r/P a/C b/C)"), 1, -5), InvalidArgument);
    EXPECT_THROW(reasoner.neighbors(edge("(r/P a/C b/C)"), 0, 10), InvalidArgument);
    EXPECT_EQ(counting.queries + counting.neighbor_calls, 0);
}

TEST_F(ReasonerTest, StoreErrorPropagates) {
    test_utils::FailingStore store;
    Reasoner reasoner(store);
    EXPECT_THROW(reasoner.reason(edge("(is/P a/C b/C)"), 1, 10), StoreError);
    EXPECT_THROW(reasoner.reason(edge("(is/P * *)"), 1, 10), StoreError);
}

// === NEIGHBORS ===

TEST_F(ReasonerTest, NeighborsMatchReasonWithoutPaths) {
    MemoryStore store = chain_store();
    Reasoner reasoner(store);

    auto found = reasoner.neighbors(edge("(r/P3 c/C d/C)"), 1, 100);
    std::map<std::string, int> by_edge;
    for (const auto& n : found) by_edge[n.edge.to_str()] = n.distance;
    EXPECT_EQ(by_edge, (std::map<std::string, int>{
        {"(r/P2 b/C c/C)", 1},
        {"(r/P4 d/C e/C)", 1}}));

    EXPECT_EQ(reasoner.neighbors(edge("(r/P3 c/C d/C)")).size(), 3);
}

// === RANDOMIZED PROPERTIES ===

TEST_F(ReasonerTest, RandomGraphsGiveShortestDistances) {
    std::mt19937 rng(1234);
    const int num_concepts = 12;

    for (int trial = 0; trial < 20; ++trial) {
        std::uniform_int_distribution<int> pick(0, num_concepts - 1);
        std::set<std::string> texts;
        while (texts.size() < 15) {
            int a = pick(rng);
            int b = pick(rng);
            if (a == b) continue;
            texts.insert("(rel" + std::to_string(texts.size()) + "/P k" +
                         std::to_string(a) + "/C k" + std::to_string(b) + "/C)");
        }
        MemoryStore store = test_utils::create_test_store(
            std::vector<std::string>(texts.begin(), texts.end()));
        std::vector<Hyperedge> all = store.all_edges();
        const Hyperedge& start = all.front();

        // Reference distances by exhaustive relaxation
        std::map<std::string, int> expected;
        expected[start.to_str()] = 0;
        bool changed = true;
        while (changed) {
            changed = false;
            for (const auto& from : all) {
                auto it = expected.find(from.to_str());
                if (it == expected.end()) continue;
                for (const auto& stored : store.neighbors_sharing_atom(from)) {
                    std::string key = stored.edge.to_str();
                    int candidate = it->second + 1;
                    auto found = expected.find(key);
                    if (found == expected.end() || found->second > candidate) {
                        expected[key] = candidate;
                        changed = true;
                    }
                }
            }
        }

        const int hops = 3;
        auto results = Reasoner(store).reason(start, hops, 1000);

        std::set<std::string> seen;
        for (const auto& r : results) {
            EXPECT_TRUE(seen.insert(r.edge_str()).second) << "duplicate " << r.edge_str();
            EXPECT_LE(r.distance, hops);
            ASSERT_TRUE(expected.count(r.edge_str()));
            EXPECT_EQ(r.distance, expected[r.edge_str()]) << r.edge_str();
            expect_valid_chain(r);
        }

        // Everything within the hop budget is reached
        std::size_t reachable = 0;
        for (const auto& [key, dist] : expected) {
            if (dist >= 1 && dist <= hops) ++reachable;
        }
        EXPECT_EQ(results.size(), reachable);
    }
}
