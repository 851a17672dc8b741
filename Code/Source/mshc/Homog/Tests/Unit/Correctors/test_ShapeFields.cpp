/**
 * @file test_ShapeFields.cpp
 * @brief Unit tests for PerturbationField and the shape-field builders
 */

#include <gtest/gtest.h>

#include "Homog/Correctors/PerturbationField.h"
#include "Homog/Correctors/ShapeFields.h"
#include "Homog/Core/HomogException.h"
#include "Homog/Core/SymmetricIndexing.h"
#include "Homog/Problem/DiscreteFormProblem.h"

using mshc::Homog::FieldVector;
using mshc::Homog::IndexPair;
using mshc::Homog::InvalidArgumentException;
using mshc::Homog::UnknownIndexPairException;
using mshc::Homog::correctors::PerturbationField;
using mshc::Homog::correctors::createShapeDim;
using mshc::Homog::correctors::createShapeDimDim;
using mshc::Homog::problem::DiscreteFormProblem;
using mshc::Homog::problem::VariableRegistry;
using mshc::Homog::symmetry::iterDimDim;

namespace {

Eigen::MatrixXd triangleNodes3D()
{
    Eigen::MatrixXd coors(3, 3);
    coors << 0.5, 1.0, 1.5,
             2.0, 2.5, 3.0,
             3.5, 4.0, 4.5;
    return coors;
}

DiscreteFormProblem makeProblem3D()
{
    const Eigen::MatrixXd coors = triangleNodes3D();
    VariableRegistry vars;
    vars.add({"u", "", 3, 3, coors});
    vars.add({"p", "", 3, 1, coors});
    return DiscreteFormProblem(3, std::move(vars));
}

} // namespace

TEST(PerturbationField, StoresEqualLengthFields)
{
    PerturbationField pis("pis");
    pis.set(IndexPair{0, 1}, FieldVector::Constant(3, 0.1));
    pis.set(IndexPair{1, 0}, FieldVector::Constant(3, 0.2));

    EXPECT_EQ(pis.size(), 2u);
    EXPECT_EQ(pis.fieldSize(), 3);
    EXPECT_TRUE(pis.has(IndexPair{0, 1}));
    EXPECT_DOUBLE_EQ(pis.value(IndexPair{1, 0})(2), 0.2);

    EXPECT_THROW(pis.set(IndexPair{1, 1}, FieldVector::Zero(4)), InvalidArgumentException);
    EXPECT_THROW((void)pis.value(IndexPair{1, 1}), UnknownIndexPairException);
}

TEST(ShapeFields, ShapeDimDimIsNodeMajorLinearField)
{
    const auto problem = makeProblem3D();
    const auto pis = createShapeDimDim(problem, "u");
    const Eigen::MatrixXd coors = triangleNodes3D();

    EXPECT_EQ(pis.size(), 9u);
    EXPECT_EQ(pis.fieldSize(), 9);

    for (const auto& pair : iterDimDim(3)) {
        const FieldVector& pi = pis.value(pair);
        for (int n = 0; n < 3; ++n) {
            for (int k = 0; k < 3; ++k) {
                const double expected = (k == pair.ir) ? coors(n, pair.ic) : 0.0;
                EXPECT_DOUBLE_EQ(pi(n * 3 + k), expected)
                    << "pair " << pair.ir << "," << pair.ic << " node " << n << " comp " << k;
            }
        }
    }
}

TEST(ShapeFields, ShapeDimUsesCoordinatesOfScalarField)
{
    const auto problem = makeProblem3D();
    const auto pis = createShapeDim(problem, "p");

    EXPECT_EQ(pis.size(), 3u);
    const FieldVector& pi = pis.value(IndexPair{2, 0});
    EXPECT_DOUBLE_EQ(pi(0), 1.5);
    EXPECT_DOUBLE_EQ(pi(1), 3.0);
    EXPECT_DOUBLE_EQ(pi(2), 4.5);
}

TEST(ShapeFields, RejectsWrongComponentCount)
{
    const auto problem = makeProblem3D();
    EXPECT_THROW((void)createShapeDimDim(problem, "p"), InvalidArgumentException);
    EXPECT_THROW((void)createShapeDim(problem, "u"), InvalidArgumentException);
}
