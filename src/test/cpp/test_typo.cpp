#include <cstddef>
#include <memory_resource>
#include <span>
#include <string_view>

#include <gtest/gtest.h>

#include "lamp/util/levenshtein.hpp"
#include "lamp/util/typo.hpp"

namespace lamp {
namespace {

TEST(Levenshtein, basics)
{
    std::pmr::monotonic_buffer_resource memory;

    EXPECT_EQ(levenshtein_distance(U"", U"", &memory), 0);
    EXPECT_EQ(levenshtein_distance(U"", U"box", &memory), 3);
    EXPECT_EQ(levenshtein_distance(U"style", U"style", &memory), 0);
    EXPECT_EQ(levenshtein_distance(U"style", U"stlye", &memory), 2);
    EXPECT_EQ(levenshtein_distance(U"config", U"conf", &memory), 2);
    EXPECT_EQ(levenshtein_distance(U"conf", U"config", &memory), 2);
}

TEST(Typo, empty)
{
    constexpr std::span<std::u8string_view> haystack;
    std::pmr::monotonic_buffer_resource memory;

    const Distant<std::size_t> actual = closest_match(haystack, u8"style", &memory);
    EXPECT_FALSE(actual);
    EXPECT_EQ(actual, Distant<std::size_t> {});
}

TEST(Typo, exact_match)
{
    constexpr std::u8string_view haystack[] { u8"box", u8"literal", u8"toc" };
    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 1, .distance = 0 };
    EXPECT_EQ(closest_match(haystack, u8"literal", &memory), expected);
}

TEST(Typo, fuzzy_match)
{
    constexpr std::u8string_view haystack[] { u8"config", u8"style" };
    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 1, .distance = 1 };
    EXPECT_EQ(closest_match(haystack, u8"styl", &memory), expected);
}

TEST(Typo, earlier_match_preferred)
{
    constexpr std::u8string_view haystack[] { u8"ab", u8"ac" };
    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 0, .distance = 1 };
    EXPECT_EQ(closest_match(haystack, u8"a", &memory), expected);
}

TEST(Typo, distance_in_code_points)
{
    constexpr std::u8string_view haystack[] { u8"grosse", u8"größe" };
    std::pmr::monotonic_buffer_resource memory;

    constexpr Distant<std::size_t> expected { .value = 1, .distance = 1 };
    EXPECT_EQ(closest_match(haystack, u8"gröe", &memory), expected);
}

} // namespace
} // namespace lamp
