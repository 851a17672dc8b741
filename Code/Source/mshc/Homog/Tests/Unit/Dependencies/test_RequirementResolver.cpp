/**
 * @file test_RequirementResolver.cpp
 * @brief Unit tests for RequirementResolver
 */

#include <gtest/gtest.h>

#include "Homog/Dependencies/RequirementResolver.h"
#include "Homog/Core/HomogException.h"
#include "HomogTestHelpers.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

using mshc::Homog::FieldVector;
using mshc::Homog::HomogException;
using mshc::Homog::HomogStatus;
using mshc::Homog::IndexPair;
using mshc::Homog::InvalidArgumentException;
using mshc::Homog::MissingDependencyException;
using mshc::Homog::correctors::PerturbationField;
using mshc::Homog::dependencies::DependencyMap;
using mshc::Homog::dependencies::DependencyValue;
using mshc::Homog::dependencies::PerturbationPtr;
using mshc::Homog::dependencies::RequirementResolver;

namespace test = mshc::Homog::test;

namespace {

/**
 * @brief Producer of a one-entry field; the value is the sum of its inputs plus one
 */
RequirementResolver::Producer countingProducer(const std::string& name,
                                               std::map<std::string, int>& calls)
{
    return [name, &calls](const DependencyMap& inputs) {
        ++calls[name];
        double sum = 1.0;
        for (const auto& dep : inputs.names()) {
            if (inputs.kind(dep) == mshc::Homog::dependencies::DependencyKind::PerturbationField) {
                sum += inputs.perturbation(dep).value(IndexPair{0, 0})(0);
            }
        }
        auto field = std::make_shared<PerturbationField>(name);
        field->set(IndexPair{0, 0}, FieldVector::Constant(1, sum));
        return DependencyValue{PerturbationPtr(field)};
    };
}

} // namespace

TEST(RequirementResolver, ResolvesInDependencyOrder)
{
    std::map<std::string, int> calls;
    RequirementResolver resolver;
    resolver.addProducer("a", {}, countingProducer("a", calls));
    resolver.addProducer("b", {"a"}, countingProducer("b", calls));
    resolver.addProducer("c", {"a", "b"}, countingProducer("c", calls));

    const auto data = resolver.resolve({"c"});

    ASSERT_TRUE(data.has("c"));
    EXPECT_FALSE(data.has("a"));
    // a = 1, b = 1 + a = 2, c = 1 + a + b = 4
    EXPECT_DOUBLE_EQ(data.perturbation("c").value(IndexPair{0, 0})(0), 4.0);
    EXPECT_TRUE(resolver.isCached("a"));
    EXPECT_TRUE(resolver.isCached("b"));
}

TEST(RequirementResolver, ComputesEachDependencyOnce)
{
    std::map<std::string, int> calls;
    RequirementResolver resolver;
    resolver.addProducer("pis", {}, countingProducer("pis", calls));
    resolver.addProducer("E", {"pis"}, countingProducer("E", calls));
    resolver.addProducer("B", {"pis"}, countingProducer("B", calls));

    (void)resolver.resolve({"E", "B", "pis"});
    (void)resolver.resolve({"E"});

    EXPECT_EQ(calls["pis"], 1);
    EXPECT_EQ(calls["E"], 1);
    EXPECT_EQ(calls["B"], 1);

    resolver.clearCache();
    (void)resolver.resolve({"E"});
    EXPECT_EQ(calls["pis"], 2);
    EXPECT_EQ(calls["E"], 2);
}

TEST(RequirementResolver, RegisteredValuesSurviveClearCache)
{
    RequirementResolver resolver;
    resolver.addValue("corrs_rs", test::makeCorrectors("corrs_rs"));

    resolver.clearCache();
    const auto data = resolver.resolve({"corrs_rs"});
    EXPECT_EQ(data.corrector("corrs_rs").name(), "corrs_rs");
    EXPECT_TRUE(resolver.requirementsOf("corrs_rs").empty());
}

TEST(RequirementResolver, DetectsCycles)
{
    std::map<std::string, int> calls;
    RequirementResolver resolver;
    resolver.addProducer("x", {"y"}, countingProducer("x", calls));
    resolver.addProducer("y", {"z"}, countingProducer("y", calls));
    resolver.addProducer("z", {"x"}, countingProducer("z", calls));

    try {
        (void)resolver.resolve({"x"});
        FAIL() << "expected a dependency cycle";
    } catch (const HomogException& e) {
        EXPECT_EQ(e.status(), HomogStatus::DependencyCycle);
        EXPECT_NE(e.message().find("x -> y -> z -> x"), std::string::npos);
    }
    EXPECT_TRUE(calls.empty());
}

TEST(RequirementResolver, UnknownNamesFail)
{
    std::map<std::string, int> calls;
    RequirementResolver resolver;
    resolver.addProducer("E", {"corrs_missing"}, countingProducer("E", calls));

    try {
        (void)resolver.resolve({"E"});
        FAIL() << "expected MissingDependencyException";
    } catch (const MissingDependencyException& e) {
        EXPECT_EQ(e.dependency(), "corrs_missing");
    }
    EXPECT_THROW((void)resolver.resolve({"nothing"}), MissingDependencyException);
    EXPECT_EQ(calls["E"], 0);
}

TEST(RequirementResolver, ProducerErrorsGainContext)
{
    RequirementResolver resolver;
    resolver.addProducer("bad", {}, [](const DependencyMap&) -> DependencyValue {
        throw InvalidArgumentException("bad input", __FILE__, __LINE__, __FUNCTION__);
    });

    try {
        (void)resolver.resolve({"bad"});
        FAIL() << "expected InvalidArgumentException";
    } catch (const InvalidArgumentException& e) {
        EXPECT_NE(e.message().find("while computing 'bad'"), std::string::npos);
    }
    EXPECT_FALSE(resolver.isCached("bad"));
}

TEST(RequirementResolver, RejectsDuplicateRegistration)
{
    std::map<std::string, int> calls;
    RequirementResolver resolver;
    resolver.addProducer("a", {}, countingProducer("a", calls));
    EXPECT_THROW(resolver.addProducer("a", {}, countingProducer("a", calls)),
                 InvalidArgumentException);
    EXPECT_THROW(resolver.addValue("a", test::makeCorrectors("a")), InvalidArgumentException);
    EXPECT_THROW(resolver.addProducer("e", {}, RequirementResolver::Producer{}),
                 InvalidArgumentException);
}
