#include <gtest/gtest.h>
#include <hgreason/layer_registry.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace hgreason;

class LayerRegistryTest : public ::testing::Test {
protected:
    LayerRegistry registry;
};

TEST_F(LayerRegistryTest, StartsEmpty) {
    EXPECT_EQ(registry.size(), 0);
    EXPECT_TRUE(registry.active().empty());
    EXPECT_FALSE(registry.is_active("foundation"));
}

TEST_F(LayerRegistryTest, EnableAndDisableAreIdempotent) {
    registry.enable("foundation");
    registry.enable("foundation");
    EXPECT_EQ(registry.size(), 1);
    EXPECT_TRUE(registry.is_active("foundation"));

    registry.disable("foundation");
    registry.disable("foundation");
    registry.disable("never-enabled");
    EXPECT_EQ(registry.size(), 0);
}

TEST_F(LayerRegistryTest, ActiveReturnsSnapshotCopy) {
    registry.enable("foundation");
    registry.enable("user");
    LayerSet snapshot = registry.active();

    registry.disable("user");
    registry.enable("plan");

    EXPECT_EQ(snapshot, (LayerSet{"foundation", "user"}));
    EXPECT_EQ(registry.active(), (LayerSet{"foundation", "plan"}));
}

TEST_F(LayerRegistryTest, ToggleAndClear) {
    registry.toggle("user", true);
    registry.toggle("plan", true);
    registry.toggle("plan", false);
    EXPECT_EQ(registry.active(), (LayerSet{"user"}));

    registry.clear();
    EXPECT_EQ(registry.size(), 0);
}

TEST_F(LayerRegistryTest, InitialSetConstructor) {
    LayerRegistry seeded(LayerSet{"foundation", "user"});
    EXPECT_TRUE(seeded.is_active("foundation"));
    EXPECT_TRUE(seeded.is_active("user"));
    EXPECT_FALSE(seeded.is_active("plan"));
}

TEST_F(LayerRegistryTest, ConcurrentTogglesLeaveConsistentState) {
    const int num_threads = 8;
    const int iterations = 1000;
    std::vector<std::thread> threads;
    std::atomic<int> observed_sizes_out_of_range{0};

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            std::string layer = "layer" + std::to_string(t % 4);
            for (int i = 0; i < iterations; ++i) {
                registry.toggle(layer, i % 2 == 0);
                std::size_t size = registry.active().size();
                if (size > 5) ++observed_sizes_out_of_range;
            }
            registry.enable("stable");
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(observed_sizes_out_of_range.load(), 0);
    EXPECT_TRUE(registry.is_active("stable"));
    EXPECT_LE(registry.size(), 5);
}
