#include <catch2/catch.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "Dispatch/ResultExchange.hpp"
#include "IO/ResultWriter.hpp"
#include "Reactions/KineticRates.hpp"
#include "TestHelpers.hpp"

namespace {

OptimizationResult makeResult(const std::string& id, realtype score) {
    OptimizationResult result;
    result.combination_id = id;
    result.score = score;
    result.parameters = literatureParameters();
    return result;
}

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

}  // namespace

TEST_CASE("Results survive the fixed-size record", "[ResultExchange]") {
    OptimizationResult result = makeResult("3_2_1", 0.125);
    result.elapsed_minutes = 12.5;
    result.deadline_exceeded = true;
    result.success = false;
    result.refined = true;
    result.iterations = 321;
    result.evaluations = 98765;
    result.message = "not transported";

    const std::vector<double> record = result_exchange::pack(result);
    REQUIRE(record.size() == result_exchange::record_size);

    const OptimizationResult unpacked = result_exchange::unpack(record.data(), record.size());
    CHECK(unpacked.combination_id == "3_2_1");
    CHECK(unpacked.score == result.score);
    CHECK(unpacked.elapsed_minutes == result.elapsed_minutes);
    CHECK(unpacked.deadline_exceeded);
    CHECK_FALSE(unpacked.success);
    CHECK(unpacked.refined);
    CHECK(unpacked.iterations == 321);
    CHECK(unpacked.evaluations == 98765);
    CHECK(unpacked.message.empty());
    REQUIRE(unpacked.parameters.size() == kinetic_parameters::count);
    CHECK((unpacked.parameters - result.parameters).cwiseAbs().maxCoeff() == 0.0);
}

TEST_CASE("Results without parameters are packed with NaN", "[ResultExchange]") {
    OptimizationResult result;
    result.combination_id = "1_1_2";

    const std::vector<double> record = result_exchange::pack(result);
    const OptimizationResult unpacked = result_exchange::unpack(record.data(), record.size());
    CHECK(std::isinf(unpacked.score));
    CHECK(unpacked.parameters.array().isNaN().all());
}

TEST_CASE("Malformed records are rejected", "[ResultExchange]") {
    std::vector<double> record = result_exchange::pack(makeResult("1_1_1", 1.0));

    CHECK_THROWS_AS(result_exchange::unpack(record.data(), record.size() - 1), std::invalid_argument);

    record[0] = 24.0;
    CHECK_THROWS_AS(result_exchange::unpack(record.data(), record.size()), std::invalid_argument);
    record[0] = -1.0;
    CHECK_THROWS_AS(result_exchange::unpack(record.data(), record.size()), std::invalid_argument);
    record[0] = 2.5;
    CHECK_THROWS_AS(result_exchange::unpack(record.data(), record.size()), std::invalid_argument);
    record[0] = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS_AS(result_exchange::unpack(record.data(), record.size()), std::invalid_argument);

    CHECK_THROWS_AS(result_exchange::unpackAll(std::vector<double>(result_exchange::record_size + 3, 0.0)),
                    std::invalid_argument);
}

TEST_CASE("Gathered buffers split into one result per rank", "[ResultExchange]") {
    std::vector<double> buffer;
    for (const auto& [id, score] : std::vector<std::pair<std::string, realtype>>{{"1_1_1", 3.0}, {"4_2_3", 1.0}}) {
        const auto record = result_exchange::pack(makeResult(id, score));
        buffer.insert(buffer.end(), record.begin(), record.end());
    }

    const auto results = result_exchange::unpackAll(buffer);
    REQUIRE(results.size() == 2);
    CHECK(results[0].combination_id == "1_1_1");
    CHECK(results[1].combination_id == "4_2_3");
    CHECK(results[1].score == 1.0);
}

TEST_CASE("Ranking orders by score with failures last", "[ResultExchange]") {
    const realtype inf = std::numeric_limits<realtype>::infinity();
    const realtype nan = std::numeric_limits<realtype>::quiet_NaN();
    const std::vector<OptimizationResult> results = {
        makeResult("2_1_1", nan), makeResult("1_2_3", 5.0), makeResult("3_1_1", inf),
        makeResult("1_1_2", 0.5), makeResult("1_1_1", 5.0), makeResult("2_2_2", 1e10),
    };

    const auto ranked = rankResults(results);
    REQUIRE(ranked.size() == results.size());
    CHECK(ranked[0].combination_id == "1_1_2");
    CHECK(ranked[1].combination_id == "1_1_1");
    CHECK(ranked[2].combination_id == "1_2_3");
    CHECK(ranked[3].combination_id == "2_2_2");
    CHECK(ranked[4].combination_id == "2_1_1");
    CHECK(ranked[5].combination_id == "3_1_1");
}

TEST_CASE("Result files are written to the output directory", "[ResultExchange][ResultWriter]") {
    const auto dir = kinfit_test::makeTempDirectory("kinfit_results");
    const ResultWriter writer((dir / "nested").string());
    CHECK(std::filesystem::is_directory(dir / "nested"));

    SECTION("summary") {
        const std::string path = writer.writeSummary(makeResult("2_2_1", 0.75));
        CHECK(std::filesystem::path(path) == dir / "nested" / "summary_2_2_1.csv");
        CHECK(std::filesystem::exists(dir / "nested" / "best_parameters_2_2_1.npy"));

        const auto lines = readLines(path);
        REQUIRE(lines.size() == 2);
        CHECK(lines[0].rfind("combination_id,score", 0) == 0);
        CHECK(lines[1].rfind("2_2_1,0.75,", 0) == 0);
    }
    SECTION("exit conditions") {
        const ExperimentalDataset data = kinfit_test::referenceDataset(3);
        Array p_model = data.p_out;
        p_model.row(1).setConstant(std::numeric_limits<realtype>::quiet_NaN());

        const std::string path = writer.writeExitConditions("4_1_2", data, p_model);
        CHECK(std::filesystem::exists(dir / "nested" / "exit_conditions_4_1_2.npz"));
        CHECK(readLines(path).size() == 4);

        CHECK_THROWS_AS(writer.writeExitConditions("4_1_2", data, p_model.topRows(2)), std::invalid_argument);
    }
    SECTION("ranking") {
        const std::string path = writer.writeRanking(
            {makeResult("1_1_1", 2.0), makeResult("1_1_3", std::numeric_limits<realtype>::infinity()),
             makeResult("3_2_2", 1.0)});
        const auto lines = readLines(path);
        REQUIRE(lines.size() == 4);
        CHECK(lines[0].rfind("rank,combination_id", 0) == 0);
        CHECK(lines[1].rfind("1,3_2_2,", 0) == 0);
        CHECK(lines[2].rfind("2,1_1_1,", 0) == 0);
        CHECK(lines[3].rfind("3,1_1_3,", 0) == 0);
    }

    std::filesystem::remove_all(dir);
}
