/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Correctors/ShapeFields.h"

#include "Core/SymmetricIndexing.h"

namespace mshc {
namespace Homog {
namespace correctors {

namespace {

const Eigen::MatrixXd& checkedCoordinates(const problem::ProblemContext& problem,
                                          const std::string& variable,
                                          int dim)
{
    const auto& info = problem.variable(variable);
    const auto& coors = problem.nodeCoordinates(variable);

    HOMOG_THROW_IF(coors.rows() != info.n_nod || coors.cols() != dim, InvalidArgumentException,
                   "shape fields: coordinates of '" + variable + "' are " +
                   std::to_string(coors.rows()) + "x" + std::to_string(coors.cols()) +
                   ", expected " + std::to_string(info.n_nod) + "x" + std::to_string(dim));
    return coors;
}

} // namespace

PerturbationField createShapeDimDim(const problem::ProblemContext& problem,
                                    const std::string& variable,
                                    const std::string& name)
{
    const int dim = problem.dimension();
    symmetry::checkDimension(dim);

    const auto& info = problem.variable(variable);
    HOMOG_THROW_IF(info.n_components != dim, InvalidArgumentException,
                   "createShapeDimDim: variable '" + variable + "' has " +
                   std::to_string(info.n_components) + " components, expected " +
                   std::to_string(dim));

    const auto& coors = checkedCoordinates(problem, variable, dim);
    const auto n_nod = static_cast<Eigen::Index>(info.n_nod);

    PerturbationField pis(name);
    for (const auto& pair : symmetry::iterDimDim(dim)) {
        FieldVector pi = FieldVector::Zero(n_nod * dim);
        for (Eigen::Index n = 0; n < n_nod; ++n) {
            pi(n * dim + pair.ir) = coors(n, pair.ic);
        }
        pis.set(pair, std::move(pi));
    }
    return pis;
}

PerturbationField createShapeDim(const problem::ProblemContext& problem,
                                 const std::string& variable,
                                 const std::string& name)
{
    const int dim = problem.dimension();
    symmetry::checkDimension(dim);

    const auto& info = problem.variable(variable);
    HOMOG_THROW_IF(info.n_components != 1, InvalidArgumentException,
                   "createShapeDim: variable '" + variable + "' must be scalar");

    const auto& coors = checkedCoordinates(problem, variable, dim);

    PerturbationField pis(name);
    for (int ir = 0; ir < dim; ++ir) {
        pis.set(IndexPair{ir, 0}, FieldVector(coors.col(ir)));
    }
    return pis;
}

} // namespace correctors
} // namespace Homog
} // namespace mshc
