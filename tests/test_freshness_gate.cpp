#include "sync/freshness_gate.hpp"
#include "sync_fakes.hpp"

#include <gtest/gtest.h>

namespace reposync {

TEST(FreshnessGateTests, AllTokensMatchingMeansUnchanged) {
    testutil::MapProbe probe;
    probe.tokens = {{"https://a/repo.tar.gz", "\"a1\""}, {"https://b/repo.zip", "\"b1\""}};

    FreshnessGate gate(probe);
    EXPECT_TRUE(gate.AllUnchanged({{"a", "https://a/repo.tar.gz", "\"a1\""},
                                   {"b", "https://b/repo.zip", "\"b1\""}}));
    EXPECT_EQ(probe.probed.size(), 2u);
}

TEST(FreshnessGateTests, MissingCachedTokenMeansChangedWithoutProbing) {
    testutil::MapProbe probe;
    probe.tokens = {{"https://a", "t"}};

    FreshnessGate gate(probe);
    EXPECT_FALSE(gate.AllUnchanged({{"a", "https://a", ""}}));
    EXPECT_TRUE(probe.probed.empty());
}

TEST(FreshnessGateTests, StopsAtFirstDifferentToken) {
    testutil::MapProbe probe;
    probe.tokens = {{"https://a", "new"}, {"https://b", "b1"}};

    FreshnessGate gate(probe);
    EXPECT_FALSE(gate.AllUnchanged({{"a", "https://a", "old"}, {"b", "https://b", "b1"}}));
    ASSERT_EQ(probe.probed.size(), 1u);
    EXPECT_EQ(probe.probed[0], "https://a");
}

TEST(FreshnessGateTests, FailedProbeMeansChanged) {
    testutil::MapProbe probe;
    FreshnessGate gate(probe);
    EXPECT_FALSE(gate.AllUnchanged({{"a", "https://down", "t"}}));
}

TEST(FreshnessGateTests, EmptySetIsUnchanged) {
    testutil::MapProbe probe;
    FreshnessGate gate(probe);
    EXPECT_TRUE(gate.AllUnchanged({}));
}

TEST(DistinctByUriTests, KeepsFirstPerUriInOrder) {
    auto out = DistinctByUri({{"one", "u1", ""}, {"two", "u2", ""}, {"dup", "u1", "x"}, {"three", "u3", ""}});
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].name, "one");
    EXPECT_EQ(out[1].name, "two");
    EXPECT_EQ(out[2].name, "three");
}

} // namespace reposync
