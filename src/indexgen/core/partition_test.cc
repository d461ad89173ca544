#include <sstream>
#include <tuple>
#include <vector>

#include <gtest/gtest.h>

#include <indexgen/core/partition.hh>

using partition_array = std::vector<ixg::partition>;

TEST(partition, ten_by_three) {
    auto actual = ixg::make_partitions(10, 3);
    partition_array expected{
        ixg::partition(0,3),
        ixg::partition(3,3),
        ixg::partition(6,4)
    };
    EXPECT_EQ(expected, actual);
    EXPECT_EQ(3u, ixg::split_size(10, 3));
}

TEST(partition, empty_range) {
    EXPECT_TRUE(ixg::make_partitions(0, 1).empty());
    EXPECT_TRUE(ixg::make_partitions(0, 10).empty());
    EXPECT_TRUE(ixg::make_partitions(0, 0).empty());
}

TEST(partition, zero_hint) {
    partition_array expected{ixg::partition(0,7)};
    EXPECT_EQ(expected, ixg::make_partitions(7, 0));
    EXPECT_EQ(expected, ixg::make_partitions(7, 1));
}

TEST(partition, hint_greater_than_size) {
    auto actual = ixg::make_partitions(3, 100);
    partition_array expected{
        ixg::partition(0,1),
        ixg::partition(1,1),
        ixg::partition(2,1)
    };
    EXPECT_EQ(expected, actual);
    EXPECT_EQ(1u, ixg::split_size(3, 100));
}

TEST(partition, exact_division) {
    auto actual = ixg::make_partitions(12, 4);
    ASSERT_EQ(4u, actual.size());
    for (const auto& p : actual) { EXPECT_EQ(3u, p.length()); }
}

class partition_test:
public ::testing::TestWithParam<std::tuple<ixg::index_type,ixg::index_type>> {};

std::vector<std::tuple<ixg::index_type,ixg::index_type>> make_sizes() {
    std::vector<std::tuple<ixg::index_type,ixg::index_type>> result;
    for (ixg::index_type n : {1u, 2u, 3u, 7u, 10u, 64u, 100u, 1000u, 1001u, 65537u}) {
        for (ixg::index_type hint : {0u, 1u, 2u, 3u, 4u, 7u, 16u, 100u, 5000u}) {
            result.emplace_back(n, hint);
        }
    }
    return result;
}

TEST_P(partition_test, coverage) {
    ixg::index_type n = std::get<0>(GetParam());
    ixg::index_type hint = std::get<1>(GetParam());
    auto partitions = ixg::make_partitions(n, hint);
    ASSERT_FALSE(partitions.empty());
    ixg::index_type expected_start = 0;
    for (const auto& p : partitions) {
        EXPECT_EQ(expected_start, p.start());
        EXPECT_FALSE(p.empty());
        expected_start = p.end();
    }
    EXPECT_EQ(n, expected_start);
    const auto size = ixg::split_size(n, hint);
    EXPECT_EQ(n / size, partitions.size());
    for (std::size_t i=0; i+1<partitions.size(); ++i) {
        EXPECT_EQ(size, partitions[i].length());
    }
    EXPECT_GE(partitions.back().length(), size);
    EXPECT_LT(partitions.back().length(), 2*size);
    EXPECT_EQ(partitions, ixg::make_partitions(n, hint));
}

INSTANTIATE_TEST_CASE_P(
    _,
    partition_test,
    ::testing::ValuesIn(make_sizes())
);

TEST(partition, print) {
    std::stringstream tmp;
    tmp << ixg::partition(6,4);
    EXPECT_EQ("(6,4)", tmp.str());
}
