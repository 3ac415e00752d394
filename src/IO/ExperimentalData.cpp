#include "IO/ExperimentalData.hpp"

#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "ConfigurationError.hpp"
#include "PhysicalConstants.hpp"
#include "Reactions/Species.hpp"

namespace {

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    // Trailing comma means an empty last field
    if (!line.empty() && line.back() == ',') fields.emplace_back();
    return fields;
}

realtype parseValue(const std::string& field, const std::string& column, std::size_t line_number,
                    const std::string& path) {
    std::size_t consumed = 0;
    realtype value = 0.0;
    try {
        value = std::stod(field, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != field.size()) {
        throw std::runtime_error(path + ":" + std::to_string(line_number) + ": cannot parse column '" + column +
                                 "' value '" + field + "'");
    }
    return value;
}

}  // namespace

void ExperimentalDataset::resize(Eigen::Index n) {
    T.resize(n);
    u_s.resize(n);
    p_in.resize(n, n_species);
    p_out.resize(n, n_species);
    r_MeOH.resize(n);
    r_H2O.resize(n);
}

void ExperimentalDataset::validate() const {
    const Eigen::Index n = size();
    if (u_s.size() != n || p_in.rows() != n || p_out.rows() != n || r_MeOH.size() != n || r_H2O.size() != n) {
        throw std::invalid_argument("Experimental dataset arrays have inconsistent numbers of runs");
    }
    if (p_in.cols() != n_species || p_out.cols() != n_species) {
        throw std::invalid_argument("Experimental pressures must have " + std::to_string(n_species) + " columns");
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        if (!(T(i) > 0.0) || !(u_s(i) > 0.0)) {
            throw std::invalid_argument("Run " + std::to_string(i) + ": temperature and velocity must be positive");
        }
        if (!p_in.row(i).allFinite() || !p_out.row(i).allFinite() || !std::isfinite(r_MeOH(i)) ||
            !std::isfinite(r_H2O(i))) {
            throw std::invalid_argument("Run " + std::to_string(i) + ": pressures and rates must be finite");
        }
        if ((p_in.row(i) < 0.0).any() || (p_out.row(i) < 0.0).any()) {
            throw std::invalid_argument("Run " + std::to_string(i) + ": partial pressures must be non-negative");
        }
    }
}

ExperimentalDataset loadExperimentalData(const std::string& path, std::size_t n_runs) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw ConfigurationError("Cannot open experimental data file '" + path + "'");
    }

    std::string line;
    std::size_t line_number = 0;

    // Header
    std::unordered_map<std::string, std::size_t> column_index;
    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) continue;
        const auto header = splitFields(line);
        for (std::size_t c = 0; c < header.size(); ++c) {
            column_index[header[c]] = c;
        }
        break;
    }
    if (column_index.empty()) {
        throw ConfigurationError("Experimental data file '" + path + "' has no header");
    }

    auto require = [&](const std::string& name) {
        auto it = column_index.find(name);
        if (it == column_index.end()) {
            throw ConfigurationError("Experimental data file '" + path + "' is missing column '" + name + "'");
        }
        return it->second;
    };

    const std::size_t col_T = require("T");
    const std::size_t col_u = require("u_s");
    std::vector<std::size_t> col_p_in(n_species), col_p_out(n_species);
    for (Eigen::Index s = 0; s < n_species; ++s) {
        col_p_in[s] = require(std::string("p_in_") + species::names[s]);
        col_p_out[s] = require(std::string("p_out_") + species::names[s]);
    }
    const std::size_t col_r_MeOH = require("r_MeOH");
    const std::size_t col_r_H2O = require("r_H2O");

    struct Row {
        realtype T, u_s;
        SpeciesVector p_in, p_out;
        realtype r_MeOH, r_H2O;
    };
    std::vector<Row> rows;

    while (std::getline(input, line)) {
        ++line_number;
        if (trim(line).empty()) continue;
        if (n_runs > 0 && rows.size() == n_runs) break;

        const auto fields = splitFields(line);
        if (fields.size() < column_index.size()) {
            throw std::runtime_error(path + ":" + std::to_string(line_number) + ": expected " +
                                     std::to_string(column_index.size()) + " fields, got " +
                                     std::to_string(fields.size()));
        }
        auto value = [&](std::size_t c, const char* column) { return parseValue(fields[c], column, line_number, path); };

        Row row;
        row.T = value(col_T, "T");
        row.u_s = value(col_u, "u_s");
        for (Eigen::Index s = 0; s < n_species; ++s) {
            row.p_in(s) = value(col_p_in[s], "p_in") * constants::pascal_per_bar;
            row.p_out(s) = value(col_p_out[s], "p_out") * constants::pascal_per_bar;
        }
        row.r_MeOH = value(col_r_MeOH, "r_MeOH");
        row.r_H2O = value(col_r_H2O, "r_H2O");
        rows.push_back(row);
    }

    if (n_runs > 0 && rows.size() < n_runs) {
        throw ConfigurationError("Requested " + std::to_string(n_runs) + " runs but '" + path + "' contains only " +
                                 std::to_string(rows.size()));
    }
    if (rows.empty()) {
        throw ConfigurationError("Experimental data file '" + path + "' contains no runs");
    }

    ExperimentalDataset data;
    data.resize(static_cast<Eigen::Index>(rows.size()));
    for (std::size_t i = 0; i < rows.size(); ++i) {
        const Eigen::Index r = static_cast<Eigen::Index>(i);
        data.T(r) = rows[i].T;
        data.u_s(r) = rows[i].u_s;
        data.p_in.row(r) = rows[i].p_in.transpose();
        data.p_out.row(r) = rows[i].p_out.transpose();
        data.r_MeOH(r) = rows[i].r_MeOH;
        data.r_H2O(r) = rows[i].r_H2O;
    }
    data.validate();
    return data;
}
