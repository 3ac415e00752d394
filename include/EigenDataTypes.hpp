#ifndef EIGENDATATYPES_HPP
#define EIGENDATATYPES_HPP

#include <cstddef>

#include "Eigen/Dense"
#include "sundials/sundials_types.h"

// dynamic-sized Vector (parameter vectors, optimizer candidates)
using Vector = Eigen::Vector<realtype, Eigen::Dynamic>;
using VectorMap = Eigen::Map<Vector, 1>;
using ConstVectorMap = Eigen::Map<const Vector, 1>;

// dynamic-sized 2D Matrix, used for optimizer populations and simplices (one candidate per row)
using Matrix = Eigen::Matrix<realtype, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// dynamic-sized 2D Array, row‐major (one experimental run per row, one species per column)
using Array = Eigen::Array<realtype, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Column and row *array* types (elementwise semantics)
using ColVector = Eigen::Array<realtype, Eigen::Dynamic, 1>;
using RowVector = Eigen::Array<realtype, 1, Eigen::Dynamic>;

// Fixed-size state of the plug-flow reactor: [CO2, CO, H2, MeOH, H2O]
constexpr Eigen::Index n_species = 5;
using SpeciesVector = Eigen::Array<realtype, n_species, 1>;

// Net rates of the three modelled reactions: [MeOH synthesis, RWGS, MeOH from CO]
constexpr Eigen::Index n_reactions = 3;
using ReactionRates = Eigen::Array<realtype, n_reactions, 1>;

// Non-strided (contiguous) maps for the species state
using SpeciesVectorMap = Eigen::Map<SpeciesVector>;
using ConstSpeciesVectorMap = Eigen::Map<const SpeciesVector>;

#endif  // EIGENDATATYPES_HPP
