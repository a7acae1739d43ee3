#include <gtest/gtest.h>
#include <hgreason/errors.hpp>
#include <hgreason/memory_store.hpp>
#include <hgreason/rule_index.hpp>
#include "test_helpers.hpp"

using namespace hgreason;
using test_utils::edge;
using test_utils::layered;

class RuleIndexTest : public ::testing::Test {
protected:
    MemoryStore store;

    void SetUp() override {
        store.add("(contraindicated/P ibuprofen/C diabetes/C)", layered("foundation", true, 0.95));
        store.add("(treats/P ibuprofen/C pain/C)", layered("foundation", false, 0.8));
        store.add("(has_condition/P patient/C diabetes/C)", layered("user"));
        store.add("(prefers/P patient/C tablets/C)", layered("plan", false, 0.4));
        // No layer: a plain fact, never a rule
        store.add("(is/P ibuprofen/C nsaid/C)");
        // Not a predicate connector: outside the default pattern
        store.add("(+/B.ma pain/C relief/C)", layered("foundation"));
    }

    static std::vector<std::string> strings(const RuleList& rules) {
        std::vector<std::string> out;
        for (const auto& r : rules) out.push_back(r.edge.to_str());
        std::sort(out.begin(), out.end());
        return out;
    }
};

// === RULE PROJECTION ===

TEST_F(RuleIndexTest, FromStoredReadsReservedAttributes) {
    Attributes attrs = layered("foundation", true, 0.95);
    attrs.set(Attributes::SOURCE, "guideline-7");
    auto rule = Rule::from_stored(StoredEdge{edge("(contraindicated/P ibuprofen/C diabetes/C)"), attrs});

    ASSERT_TRUE(rule.has_value());
    EXPECT_EQ(rule->layer, "foundation");
    EXPECT_TRUE(rule->mandatory);
    EXPECT_DOUBLE_EQ(rule->confidence, 0.95);
    EXPECT_EQ(rule->source, "guideline-7");
    EXPECT_EQ(rule->connector(), edge("contraindicated/P"));
    ASSERT_EQ(rule->concepts.size(), 2);
    EXPECT_EQ(rule->concepts[0], Atom("ibuprofen", "C"));
    EXPECT_EQ(rule->concepts[1], Atom("diabetes", "C"));
}

TEST_F(RuleIndexTest, EdgeWithoutLayerIsNotARule) {
    EXPECT_FALSE(Rule::from_stored(StoredEdge{edge("(is/P a/C b/C)"), {}}).has_value());
}

TEST_F(RuleIndexTest, DefaultPattern) {
    EXPECT_EQ(RuleIndex::default_pattern().to_str(), "(*/P ...)");
}

// === SELECTION ===

TEST_F(RuleIndexTest, EmptyLayerSetSelectsNothing) {
    test_utils::CountingStore counting(store);
    RuleIndex index(counting);
    EXPECT_TRUE(index.active_rules({}).empty());
    EXPECT_EQ(counting.queries, 0);
}

TEST_F(RuleIndexTest, FiltersByLayer) {
    RuleIndex index(store);
    EXPECT_EQ(strings(index.active_rules({"foundation"})), (std::vector<std::string>{
        "(contraindicated/P ibuprofen/C diabetes/C)",
        "(treats/P ibuprofen/C pain/C)"}));
    EXPECT_EQ(strings(index.active_rules({"user", "plan"})), (std::vector<std::string>{
        "(has_condition/P patient/C diabetes/C)",
        "(prefers/P patient/C tablets/C)"}));
    EXPECT_TRUE(index.active_rules({"unknown-layer"}).empty());
}

TEST_F(RuleIndexTest, FiltersByConfidence) {
    RuleIndex index(store);
    LayerSet all{"foundation", "user", "plan"};
    EXPECT_EQ(index.active_rules(all).size(), 4);
    EXPECT_EQ(index.active_rules(all, 0.5).size(), 3);
    EXPECT_EQ(index.active_rules(all, 0.9).size(), 2);
    // Threshold is inclusive
    EXPECT_EQ(index.active_rules(all, 0.95).size(), 2);
    EXPECT_EQ(index.active_rules(all, 1.0).size(), 1);
}

TEST_F(RuleIndexTest, CustomPatternNarrowsSelection) {
    RuleIndex index(store);
    auto rules = index.active_rules({"foundation"}, 0.0, edge("(treats/P * *)"));
    ASSERT_EQ(rules.size(), 1);
    EXPECT_EQ(rules[0].edge.to_str(), "(treats/P ibuprofen/C pain/C)");

    // A pattern may reach edges the default pattern skips
    auto builders = index.active_rules({"foundation"}, 0.0, edge("(*/B ...)"));
    ASSERT_EQ(builders.size(), 1);
    EXPECT_EQ(builders[0].edge.to_str(), "(+/B.ma pain/C relief/C)");
}

TEST_F(RuleIndexTest, NothingIsCached) {
    RuleIndex index(store);
    EXPECT_EQ(index.active_rules({"user"}).size(), 1);
    store.add("(allergic_to/P patient/C penicillin/C)", layered("user"));
    EXPECT_EQ(index.active_rules({"user"}).size(), 2);
}

// === ERRORS ===

TEST_F(RuleIndexTest, ConfidenceOutOfRangeRejected) {
    RuleIndex index(store);
    EXPECT_THROW(index.active_rules({"foundation"}, -0.1), InvalidArgument);
    EXPECT_THROW(index.active_rules({"foundation"}, 1.1), InvalidArgument);
}

TEST_F(RuleIndexTest, MalformedReservedAttributePropagates) {
    store.add("(treats/P aspirin/C fever/C)", Attributes{{"layer", "foundation"}, {"confidence", "lots"}});
    RuleIndex index(store);
    EXPECT_THROW(index.active_rules({"foundation"}), AttributeError);
}

TEST_F(RuleIndexTest, StoreFailurePropagates) {
    test_utils::FailingStore failing;
    RuleIndex index(failing);
    EXPECT_THROW(index.active_rules({"foundation"}), StoreError);
}
