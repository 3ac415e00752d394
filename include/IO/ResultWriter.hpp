#ifndef RESULT_WRITER_HPP
#define RESULT_WRITER_HPP

#include <string>
#include <vector>

#include "EigenDataTypes.hpp"
#include "IO/ExperimentalData.hpp"
#include "Optimization/OptimizationResult.hpp"

/**
 * @brief Persists optimization results of one worker and the global ranking
 *
 * All files are written below the given directory, which is created if needed. Existing
 * files are overwritten.
 */
class ResultWriter {
   public:
    explicit ResultWriter(const std::string& directory);

    // summary_<id>.csv: one row with status, score, timing and the 14 parameters
    // best_parameters_<id>.npy: the parameter vector
    std::string writeSummary(const OptimizationResult& result) const;

    // exit_conditions_<id>.csv and .npz: model vs measured exit pressures [Pa] of every run,
    // model rows are NaN where the reactor failed
    std::string writeExitConditions(const std::string& combination_id,
                                    const ExperimentalDataset& data,
                                    const Array& p_exit_model) const;

    // ranking.csv: all results ordered by rankResults()
    std::string writeRanking(const std::vector<OptimizationResult>& results) const;

    const std::string& directory() const { return directory_; }

   private:
    std::string path(const std::string& filename) const;

    std::string directory_;
};

#endif  // RESULT_WRITER_HPP
