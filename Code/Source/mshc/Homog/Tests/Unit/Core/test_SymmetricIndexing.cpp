/**
 * @file test_SymmetricIndexing.cpp
 * @brief Unit tests for symmetric index ordering
 */

#include <gtest/gtest.h>

#include "Homog/Core/SymmetricIndexing.h"
#include "Homog/Core/HomogException.h"

#include <vector>

using mshc::Homog::IndexPair;
using mshc::Homog::InvalidArgumentException;
using mshc::Homog::symmetry::checkDimension;
using mshc::Homog::symmetry::iterDimDim;
using mshc::Homog::symmetry::iterSym;
using mshc::Homog::symmetry::symIndex;
using mshc::Homog::symmetry::symPair;
using mshc::Homog::symmetry::symSize;

TEST(SymmetricIndexing, SymSize)
{
    EXPECT_EQ(symSize(1), 1);
    EXPECT_EQ(symSize(2), 3);
    EXPECT_EQ(symSize(3), 6);
    static_assert(symSize(3) == 6, "symSize must be usable at compile time");
}

TEST(SymmetricIndexing, IterSym2DDiagonalsFirst)
{
    const std::vector<IndexPair> expected{{0, 0}, {1, 1}, {0, 1}};
    EXPECT_EQ(iterSym(2), expected);
}

TEST(SymmetricIndexing, IterSym3DOffDiagonalsRowMajor)
{
    const std::vector<IndexPair> expected{{0, 0}, {1, 1}, {2, 2}, {0, 1}, {0, 2}, {1, 2}};
    EXPECT_EQ(iterSym(3), expected);
}

TEST(SymmetricIndexing, IterDimDimCoversFullRange)
{
    const auto pairs = iterDimDim(2);
    const std::vector<IndexPair> expected{{0, 0}, {0, 1}, {1, 0}, {1, 1}};
    EXPECT_EQ(pairs, expected);
    EXPECT_EQ(iterDimDim(3).size(), 9u);
}

TEST(SymmetricIndexing, SymIndexIsInverseOfSymPair)
{
    for (int dim = 1; dim <= 3; ++dim) {
        const auto pairs = iterSym(dim);
        for (int k = 0; k < symSize(dim); ++k) {
            const IndexPair p = symPair(dim, k);
            EXPECT_EQ(p, pairs[static_cast<std::size_t>(k)]);
            EXPECT_EQ(symIndex(dim, p.ir, p.ic), k);
            EXPECT_EQ(symIndex(dim, p.ic, p.ir), k);
        }
    }
}

TEST(SymmetricIndexing, ThrowsOnInvalidArguments)
{
    EXPECT_THROW(checkDimension(0), InvalidArgumentException);
    EXPECT_THROW(checkDimension(4), InvalidArgumentException);
    EXPECT_NO_THROW(checkDimension(3));
    EXPECT_THROW(symIndex(2, 0, 2), InvalidArgumentException);
    EXPECT_THROW(symPair(2, 3), InvalidArgumentException);
    EXPECT_THROW(iterSym(5), InvalidArgumentException);
}
