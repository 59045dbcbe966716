#include <gtest/gtest.h>
#include "hash/tip5.hpp"

using namespace zkverify;

class Tip5Test : public ::testing::Test {
protected:
    static std::vector<BFieldElement> sequence(size_t n, uint64_t start = 0) {
        std::vector<BFieldElement> out;
        for (size_t i = 0; i < n; ++i) out.push_back(BFieldElement(start + i));
        return out;
    }
};

TEST_F(Tip5Test, Constants) {
    EXPECT_EQ(Tip5::STATE_SIZE, 16u);
    EXPECT_EQ(Tip5::RATE, 10u);
    EXPECT_EQ(Tip5::CAPACITY, 6u);
    EXPECT_EQ(Tip5::LOOKUP_TABLE.size(), 256u);
    EXPECT_EQ(Tip5::ROUND_CONSTANTS.size(), Tip5::NUM_ROUNDS * Tip5::STATE_SIZE);
    EXPECT_EQ(Tip5::MDS_MATRIX_FIRST_COLUMN[0], 61402);
}

TEST_F(Tip5Test, PermutationChangesState) {
    Tip5 tip5;
    for (size_t i = 0; i < Tip5::STATE_SIZE; ++i) {
        tip5.state[i] = BFieldElement(i + 1);
    }
    auto original_state = tip5.state;
    tip5.permutation();
    EXPECT_NE(tip5.state, original_state);
}

TEST_F(Tip5Test, Hash10Deterministic) {
    std::array<BFieldElement, Tip5::RATE> input;
    for (size_t i = 0; i < Tip5::RATE; ++i) {
        input[i] = BFieldElement(i * 100 + 42);
    }
    EXPECT_EQ(Tip5::hash_10(input), Tip5::hash_10(input));
    input[9] = BFieldElement(0);
    EXPECT_NE(Tip5::hash_10(input), Tip5::hash_10({}));
}

TEST_F(Tip5Test, HashPairOrderMatters) {
    Digest a(BFieldElement(1), BFieldElement(2), BFieldElement(3), BFieldElement(4), BFieldElement(5));
    Digest b(BFieldElement(6), BFieldElement(7), BFieldElement(8), BFieldElement(9), BFieldElement(10));
    EXPECT_NE(Tip5::hash_pair(a, b), Tip5::hash_pair(b, a));
    EXPECT_EQ(Tip5::hash_pair(a, b), Tip5::hash_pair(a, b));
}

// Padding makes trailing zeros significant
TEST_F(Tip5Test, HashVarlenLengthSensitive) {
    auto input = sequence(9, 1);
    auto extended = input;
    extended.push_back(BFieldElement::zero());
    EXPECT_NE(Tip5::hash_varlen(input), Tip5::hash_varlen(extended));
    EXPECT_NE(Tip5::hash_varlen({}), Tip5::hash_varlen({BFieldElement::zero()}));
}

// Inputs spanning several rate blocks
TEST_F(Tip5Test, HashVarlenMultiBlock) {
    auto a = sequence(25);
    auto b = a;
    b[3] = BFieldElement(1000);
    EXPECT_EQ(Tip5::hash_varlen(a), Tip5::hash_varlen(sequence(25)));
    EXPECT_NE(Tip5::hash_varlen(a), Tip5::hash_varlen(b));
}
