/**
 * @file test_HomogException.cpp
 * @brief Unit tests for the exception hierarchy and throwing macros
 */

#include <gtest/gtest.h>

#include "Homog/Core/HomogException.h"

#include <string>

using mshc::Homog::HomogException;
using mshc::Homog::HomogStatus;
using mshc::Homog::IndexPair;
using mshc::Homog::InvalidArgumentException;
using mshc::Homog::MissingDependencyException;
using mshc::Homog::UnknownIndexPairException;
using mshc::Homog::VariableLookupException;

namespace {

void throwIfNegative(int value)
{
    using namespace mshc::Homog;
    HOMOG_CHECK_ARG(value >= 0, "value must be non-negative");
}

void throwMissing(const std::string& name)
{
    using namespace mshc::Homog;
    HOMOG_THROW_WITH(MissingDependencyException, name, "not resolved");
}

} // namespace

TEST(HomogException, CarriesStatusAndLocation)
{
    try {
        throwIfNegative(-1);
        FAIL() << "expected an exception";
    } catch (const InvalidArgumentException& e) {
        EXPECT_EQ(e.status(), HomogStatus::InvalidArgument);
        EXPECT_EQ(e.message(), "value must be non-negative");
        EXPECT_GT(e.line(), 0);
        EXPECT_NE(e.file().find("test_HomogException.cpp"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("Invalid argument"), std::string::npos);
    }
    EXPECT_NO_THROW(throwIfNegative(1));
}

TEST(HomogException, MissingDependencyKeepsName)
{
    try {
        throwMissing("corrs_rs");
        FAIL() << "expected an exception";
    } catch (const MissingDependencyException& e) {
        EXPECT_EQ(e.dependency(), "corrs_rs");
        EXPECT_EQ(e.status(), HomogStatus::MissingDependency);
        EXPECT_NE(std::string(e.what()).find("corrs_rs"), std::string::npos);
    }
}

TEST(HomogException, UnknownIndexPairReportsPairAndStep)
{
    const UnknownIndexPairException e("no state", IndexPair{1, 2}, 3);
    EXPECT_EQ(e.pair(), (IndexPair{1, 2}));
    EXPECT_EQ(e.step(), 3);
    EXPECT_EQ(e.status(), HomogStatus::UnknownIndexPair);
    EXPECT_NE(e.message().find("(1, 2)"), std::string::npos);
    EXPECT_NE(e.message().find("step: 3"), std::string::npos);
}

TEST(HomogException, VariableLookupIsAHomogException)
{
    const VariableLookupException e("U9", "unknown variable");
    const HomogException& base = e;
    EXPECT_EQ(base.status(), HomogStatus::VariableLookup);
    EXPECT_EQ(e.variable(), "U9");
}

TEST(HomogException, AddContextPrependsToWhat)
{
    HomogException e("inner failure", HomogStatus::AssemblyError);
    e.add_context("while computing 'E'");
    const std::string what = e.what();
    EXPECT_NE(what.find("while computing 'E'"), std::string::npos);
    EXPECT_NE(what.find("inner failure"), std::string::npos);
}
