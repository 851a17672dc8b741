/**
 * @file test_DiscreteFormProblem.cpp
 * @brief Unit tests for integrals over precomputed discrete forms
 */

#include <gtest/gtest.h>

#include "Homog/Problem/DiscreteFormProblem.h"
#include "Homog/Core/HomogException.h"

#include <Eigen/Sparse>

using mshc::Homog::FieldVector;
using mshc::Homog::InvalidArgumentException;
using mshc::Homog::VariableLookupException;
using mshc::Homog::problem::DiscreteFormProblem;
using mshc::Homog::problem::SubstitutionList;
using mshc::Homog::problem::VariableRegistry;

namespace {

DiscreteFormProblem makeProblem()
{
    VariableRegistry vars;
    vars.add({"v", "u", 2, 1, Eigen::MatrixXd()});
    vars.add({"w", "u", 2, 1, Eigen::MatrixXd()});
    vars.add({"q", "p", 3, 1, Eigen::MatrixXd()});

    DiscreteFormProblem problem(2, std::move(vars));

    Eigen::MatrixXd k(2, 2);
    k << 2.0, 1.0,
         1.0, 3.0;
    problem.addBilinearForm("a(v, w)", "v", "w", k.sparseView());

    Eigen::MatrixXd g(2, 3);
    g << 1.0, 0.0, 2.0,
         0.0, 1.0, 0.0;
    problem.addBilinearForm("b(v, q)", "v", "q", g.sparseView());

    FieldVector f(2);
    f << 4.0, -1.0;
    problem.addLinearForm("l(v)", "v", f);
    return problem;
}

} // namespace

TEST(DiscreteFormProblem, BilinearFormIsVtKu)
{
    const auto problem = makeProblem();

    FieldVector v(2);
    v << 1.0, 2.0;
    FieldVector w(2);
    w << 3.0, -1.0;

    // K w = [5, 0]; v . K w = 5
    const SubstitutionList subs{{"v", v}, {"w", w}};
    EXPECT_DOUBLE_EQ(problem.evaluateIntegral("a(v, w)", subs), 5.0);

    // Substitution order does not matter
    const SubstitutionList swapped{{"w", w}, {"v", v}};
    EXPECT_DOUBLE_EQ(problem.evaluateIntegral("a(v, w)", swapped), 5.0);
}

TEST(DiscreteFormProblem, RectangularAndLinearForms)
{
    const auto problem = makeProblem();

    FieldVector v(2);
    v << 1.0, 1.0;
    const FieldVector ones = FieldVector::Ones(3);

    EXPECT_DOUBLE_EQ(problem.evaluateIntegral("b(v, q)", {{"v", v}, {"q", ones}}), 4.0);
    EXPECT_DOUBLE_EQ(problem.evaluateIntegral("l(v)", {{"v", v}}), 3.0);
}

TEST(DiscreteFormProblem, ForwardsVariableMetadata)
{
    const auto problem = makeProblem();
    EXPECT_EQ(problem.dimension(), 2);
    EXPECT_EQ(problem.primaryVariableName("q"), "p");
    EXPECT_TRUE(problem.hasExpression("l(v)"));
    EXPECT_FALSE(problem.hasExpression("m(v)"));
}

TEST(DiscreteFormProblem, ErrorsOnBadEvaluation)
{
    const auto problem = makeProblem();
    FieldVector v = FieldVector::Ones(2);

    EXPECT_THROW((void)problem.evaluateIntegral("unknown", {{"v", v}}), InvalidArgumentException);
    EXPECT_THROW((void)problem.evaluateIntegral("a(v, w)", {{"v", v}}), VariableLookupException);
    EXPECT_THROW((void)problem.evaluateIntegral("l(v)", {{"v", FieldVector::Ones(5)}}),
                 InvalidArgumentException);
}

TEST(DiscreteFormProblem, RejectsMismatchedForms)
{
    auto problem = makeProblem();
    Eigen::SparseMatrix<double> wrong(3, 3);
    EXPECT_THROW(problem.addBilinearForm("c(v, w)", "v", "w", wrong), InvalidArgumentException);
    EXPECT_THROW(problem.addLinearForm("l(v)", "v", FieldVector::Ones(2)), InvalidArgumentException);
    EXPECT_THROW(problem.addLinearForm("l2(z)", "z", FieldVector::Ones(2)), VariableLookupException);
    EXPECT_THROW(DiscreteFormProblem(4, VariableRegistry{}), InvalidArgumentException);
}
