/**
 * @file NumpyIO.hpp
 * @brief Wrapper functions for saving result arrays to NumPy .npy and .npz files
 *
 * Thin layer over cnpy so that callers never include cnpy.h directly. The Eigen overloads
 * write row-major arrays with their natural (rows, cols) shape.
 */

#ifndef KINFIT_NUMPY_IO_HPP
#define KINFIT_NUMPY_IO_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "EigenDataTypes.hpp"

namespace KinFit {

/**
 * @brief Save data to a .npy file
 *
 * @param mode "w" to overwrite, "a" to append along the first axis
 */
template <typename T>
void npy_save(const std::string& filename,
              const T* data,
              const std::vector<size_t>& shape,
              const std::string& mode = "w");

/**
 * @brief Save data as variable varname of a .npz archive
 *
 * @param mode "w" to create/overwrite the archive, "a" to add a variable to it
 *
 * @example
 * KinFit::npz_save("exit_conditions.npz", "T", data.T.data(), {n_runs}, "w");
 * KinFit::npz_save("exit_conditions.npz", "p_out_model", p_model.data(), {n_runs, 5}, "a");
 */
template <typename T>
void npz_save(const std::string& zipname,
              const std::string& varname,
              const T* data,
              const std::vector<size_t>& shape,
              const std::string& mode = "w");

// Row-major 2D array, shape (rows, cols)
void npz_save(const std::string& zipname, const std::string& varname, const Array& data, const std::string& mode);

// Column array, shape (size,)
void npz_save(const std::string& zipname, const std::string& varname, const ColVector& data, const std::string& mode);

}  // namespace KinFit

#endif  // KINFIT_NUMPY_IO_HPP
