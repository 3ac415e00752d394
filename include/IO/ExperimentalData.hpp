#ifndef EXPERIMENTAL_DATA_HPP
#define EXPERIMENTAL_DATA_HPP

#include <sundials/sundials_types.h>

#include <cstddef>
#include <string>

#include "EigenDataTypes.hpp"

/**
 * @brief Measured operating points, one row per experimental run
 *
 * Species columns follow the state order [CO2, CO, H2, MeOH, H2O]. Pressures are stored in Pa.
 */
struct ExperimentalDataset {
    ColVector T;      // Temperature [K]
    ColVector u_s;    // Inlet superficial velocity [m/s]
    Array p_in;       // Inlet partial pressures [Pa], n_runs x 5
    Array p_out;      // Measured exit partial pressures [Pa], n_runs x 5
    ColVector r_MeOH; // Measured methanol formation rate [mol/(s·kg_cat)]
    ColVector r_H2O;  // Measured water formation rate [mol/(s·kg_cat)]

    Eigen::Index size() const { return T.size(); }

    // Resize all arrays to n runs (contents unspecified)
    void resize(Eigen::Index n);

    // Throws std::invalid_argument if the arrays are not parallel or contain invalid values
    void validate() const;
};

/**
 * @brief Reads an experimental CSV file with a header row
 *
 * Required columns (any order, extra columns ignored):
 *   T, u_s, p_in_<s>, p_out_<s> for s in CO2, CO, H2, MeOH, H2O, r_MeOH, r_H2O
 * Pressure columns are given in bar and converted to Pa. If n_runs > 0 only the first n_runs
 * rows are kept; requesting more rows than present throws ConfigurationError. Malformed rows
 * throw std::runtime_error naming the line.
 */
ExperimentalDataset loadExperimentalData(const std::string& path, std::size_t n_runs = 0);

#endif  // EXPERIMENTAL_DATA_HPP
