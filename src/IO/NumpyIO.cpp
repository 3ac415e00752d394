#include "IO/NumpyIO.hpp"

#include "cnpy.h"

namespace KinFit {

template <typename T>
void npy_save(const std::string& filename, const T* data, const std::vector<size_t>& shape, const std::string& mode) {
    cnpy::npy_save(filename, data, shape, mode);
}

template <typename T>
void npz_save(const std::string& zipname,
              const std::string& varname,
              const T* data,
              const std::vector<size_t>& shape,
              const std::string& mode) {
    cnpy::npz_save(zipname, varname, data, shape, mode);
}

void npz_save(const std::string& zipname, const std::string& varname, const Array& data, const std::string& mode) {
    npz_save<realtype>(zipname, varname, data.data(),
                       {static_cast<size_t>(data.rows()), static_cast<size_t>(data.cols())}, mode);
}

void npz_save(const std::string& zipname, const std::string& varname, const ColVector& data, const std::string& mode) {
    npz_save<realtype>(zipname, varname, data.data(), {static_cast<size_t>(data.size())}, mode);
}

template void npy_save<double>(const std::string&, const double*, const std::vector<size_t>&, const std::string&);

template void npz_save<double>(const std::string&,
                               const std::string&,
                               const double*,
                               const std::vector<size_t>&,
                               const std::string&);
template void npz_save<int>(const std::string&, const std::string&, const int*, const std::vector<size_t>&, const std::string&);

}  // namespace KinFit
