/**
 * @file test_DofLayout.cpp
 * @brief Unit tests for DofLayout
 */

#include <gtest/gtest.h>

#include "Homog/Correctors/DofLayout.h"
#include "Homog/Core/HomogException.h"

using mshc::Homog::FieldVector;
using mshc::Homog::HomogException;
using mshc::Homog::InvalidArgumentException;
using mshc::Homog::VariableLookupException;
using mshc::Homog::correctors::DofLayout;

TEST(DofLayout, AppendedFieldsAreContiguous)
{
    DofLayout layout;
    EXPECT_EQ(layout.addField("u", 8), 0);
    EXPECT_EQ(layout.addField("p", 4), 1);
    layout.finalize();

    EXPECT_TRUE(layout.isFinalized());
    EXPECT_EQ(layout.numFields(), 2u);
    EXPECT_EQ(layout.totalDofs(), 12);

    auto u = layout.range("u");
    EXPECT_EQ(u.first, 0);
    EXPECT_EQ(u.second, 8);
    auto p = layout.range("p");
    EXPECT_EQ(p.first, 8);
    EXPECT_EQ(p.second, 12);
    EXPECT_EQ(layout.fieldSize("p"), 4);
}

TEST(DofLayout, ExtractReturnsFieldBlock)
{
    DofLayout layout;
    layout.addField("p", 3, 5);
    layout.addField("u", 0, 3);
    layout.finalize();

    FieldVector state(5);
    state << 1.0, 2.0, 3.0, 4.0, 5.0;

    const FieldVector u = layout.extract(state, "u");
    ASSERT_EQ(u.size(), 3);
    EXPECT_DOUBLE_EQ(u(0), 1.0);
    EXPECT_DOUBLE_EQ(u(2), 3.0);

    const FieldVector p = layout.extract(state, "p");
    ASSERT_EQ(p.size(), 2);
    EXPECT_DOUBLE_EQ(p(0), 4.0);
    EXPECT_DOUBLE_EQ(p(1), 5.0);

    EXPECT_THROW((void)layout.extract(FieldVector::Zero(4), "p"), InvalidArgumentException);
}

TEST(DofLayout, UnknownFieldThrowsVariableLookup)
{
    DofLayout layout;
    layout.addField("u", 3);
    layout.finalize();

    EXPECT_FALSE(layout.has("w"));
    EXPECT_THROW((void)layout.range("w"), VariableLookupException);
    EXPECT_THROW((void)layout.extract(FieldVector::Zero(3), "w"), VariableLookupException);
}

TEST(DofLayout, RejectsInvalidDefinitions)
{
    DofLayout layout;
    layout.addField("u", 0, 4);

    EXPECT_THROW(layout.addField("u", 2), InvalidArgumentException);
    EXPECT_THROW(layout.addField("p", 3, 6), InvalidArgumentException);
    EXPECT_THROW(layout.addField("p", 0), InvalidArgumentException);
    EXPECT_THROW(layout.addField("", 2), InvalidArgumentException);

    layout.finalize();
    EXPECT_THROW(layout.addField("p", 2), HomogException);

    DofLayout empty;
    EXPECT_THROW(empty.finalize(), InvalidArgumentException);
}

TEST(DofLayout, EqualityIgnoresInsertionOrder)
{
    DofLayout a;
    a.addField("u", 0, 4);
    a.addField("p", 4, 6);

    DofLayout b;
    b.addField("p", 4, 6);
    b.addField("u", 0, 4);

    DofLayout c;
    c.addField("u", 0, 4);
    c.addField("p", 4, 7);

    EXPECT_TRUE(a == b);
    EXPECT_TRUE(a != c);
}
