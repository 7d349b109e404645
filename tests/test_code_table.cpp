#include "entropy/huffman.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

hufz::CodeTable codes_for(const hufz::FrequencyTable& ft) {
    return hufz::build_code_table(*hufz::build_huffman_tree(ft));
}

hufz::FrequencyTable table_of(const std::string& s) {
    return hufz::build_frequency_table(std::vector<uint8_t>(s.begin(), s.end()));
}

bool is_prefix(const hufz::Code& a, const hufz::Code& b) {
    return a.size() <= b.size() && std::equal(a.begin(), a.end(), b.begin());
}

void expect_prefix_free(const hufz::CodeTable& t) {
    for (uint32_t i = 0; i < hufz::kSymbolCount; ++i) {
        if (!t.has(i)) continue;
        for (uint32_t j = 0; j < hufz::kSymbolCount; ++j) {
            if (i == j || !t.has(j)) continue;
            EXPECT_FALSE(is_prefix(t.code(i), t.code(j)))
                << hufz::code_to_string(t.code(i)) << " prefixes " << hufz::code_to_string(t.code(j));
        }
    }
}

} // namespace

TEST(CodeTable, KnownCodesForSmallInput) {
    // a:2 b:2 eos:1 -> eos+a merge first, then b vs (eos,a)
    hufz::CodeTable t = codes_for(table_of("abab"));
    EXPECT_EQ(hufz::code_to_string(t.code('b')), "0");
    EXPECT_EQ(hufz::code_to_string(t.code(hufz::kEndOfStream)), "10");
    EXPECT_EQ(hufz::code_to_string(t.code('a')), "11");
}

TEST(CodeTable, UnobservedSymbolsHaveNoCode) {
    hufz::CodeTable t = codes_for(table_of("abab"));
    EXPECT_FALSE(t.has('c'));
    EXPECT_FALSE(t.has(0));
    EXPECT_FALSE(t.has(hufz::kSymbolCount));
    EXPECT_THROW(t.code('c'), std::logic_error);
}

TEST(CodeTable, SingleLeafRootGetsEmptyCode) {
    hufz::CodeTable t = codes_for(table_of(""));
    ASSERT_TRUE(t.has(hufz::kEndOfStream));
    EXPECT_TRUE(t.code(hufz::kEndOfStream).empty());
}

TEST(CodeTable, PrefixFreeForText) {
    expect_prefix_free(codes_for(table_of("It was the best of times, it was the worst of times.")));
}

TEST(CodeTable, PrefixFreeForAllByteValues) {
    hufz::FrequencyTable ft;
    for (uint32_t s = 0; s < hufz::kEndOfStream; ++s) ft[s] = (s * 7919u) % 97u + 1u;
    ft[hufz::kEndOfStream] = 1;
    hufz::CodeTable t = codes_for(ft);
    for (uint32_t s = 0; s < hufz::kSymbolCount; ++s) EXPECT_TRUE(t.has(s));
    expect_prefix_free(t);
}

TEST(CodeTable, FibonacciCountsGiveDeepButCompleteCode) {
    hufz::FrequencyTable ft;
    uint64_t a = 1, b = 1;
    for (uint32_t s = 0; s < 40; ++s) {
        ft[s] = a;
        const uint64_t next = a + b;
        a = b;
        b = next;
    }
    ft[hufz::kEndOfStream] = 1;
    hufz::CodeTable t = codes_for(ft);
    expect_prefix_free(t);

    // Kraft sum of a full binary tree is exactly 1
    size_t longest = 0;
    long double kraft = 0.0L;
    for (uint32_t s = 0; s < hufz::kSymbolCount; ++s) {
        if (!t.has(s)) continue;
        longest = std::max(longest, t.code(s).size());
        kraft += std::ldexp(1.0L, -static_cast<int>(t.code(s).size()));
    }
    EXPECT_GE(longest, 30u);
    EXPECT_NEAR(static_cast<double>(kraft), 1.0, 1e-12);
}

TEST(CodeTable, CodeToString) {
    EXPECT_EQ(hufz::code_to_string(hufz::Code{}), "");
    EXPECT_EQ(hufz::code_to_string(hufz::Code{true, false, false, true}), "1001");
}
