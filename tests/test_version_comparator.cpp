#include <gtest/gtest.h>

#include "util/version_comparator.hpp"

using reposync::VersionComparator;

TEST(VersionComparatorTest, NumericComponentsCompareAsNumbers) {
    EXPECT_EQ(VersionComparator::Compare("1.10", "1.9"), 1);
    EXPECT_EQ(VersionComparator::Compare("1.2.3", "1.2.4"), -1);
    EXPECT_EQ(VersionComparator::Compare("2.0", "2.0"), 0);
}

TEST(VersionComparatorTest, MissingComponentsCountAsZero) {
    EXPECT_EQ(VersionComparator::Compare("1.4", "1.4.0"), 0);
    EXPECT_EQ(VersionComparator::Compare("1.4.1", "1.4"), 1);
}

TEST(VersionComparatorTest, LeadingVIsIgnored) {
    EXPECT_EQ(VersionComparator::Compare("v1.4", "1.4"), 0);
    EXPECT_EQ(VersionComparator::Compare("v1.34", "v1.4"), 1);
    EXPECT_EQ(VersionComparator::Compare("v1.35", "v1.34"), 1);
    EXPECT_EQ(VersionComparator::Compare("v1.0", "v1.34"), -1);
}
