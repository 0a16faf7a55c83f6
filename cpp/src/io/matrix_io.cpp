#include "curdecomp/io/matrix_io.hpp"
#include "curdecomp/error.hpp"
#include "curdecomp/logging.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <vector>

namespace curdecomp {
namespace io {

Matrix MatrixIO::read(std::istream& in, const std::string& source) {
    std::vector<std::vector<double>> rows;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        for (char& c : line) {
            if (c == ',' || c == ';') c = ' ';
        }

        std::istringstream ss(line);
        std::string token;
        std::vector<double> row;
        while (ss >> token) {
            try {
                size_t used = 0;
                double value = std::stod(token, &used);
                if (used != token.size()) throw std::invalid_argument(token);
                row.push_back(value);
            } catch (const std::exception&) {
                throw IOError(ErrorCode::PARSE_ERROR,
                              "Bad number '" + token + "' at " + source + ":" + std::to_string(line_no),
                              __func__);
            }
        }
        if (row.empty()) continue;

        if (!rows.empty() && row.size() != rows.front().size()) {
            throw IOError(ErrorCode::PARSE_ERROR,
                          "Row at " + source + ":" + std::to_string(line_no) + " has " +
                          std::to_string(row.size()) + " values, expected " +
                          std::to_string(rows.front().size()),
                          __func__);
        }
        rows.push_back(std::move(row));
    }

    if (rows.empty()) {
        throw IOError(ErrorCode::PARSE_ERROR, "No matrix data in " + source, __func__);
    }

    Matrix M(static_cast<Index>(rows.size()), static_cast<Index>(rows.front().size()));
    for (Index i = 0; i < M.rows(); ++i) {
        for (Index j = 0; j < M.cols(); ++j) {
            M(i, j) = rows[static_cast<size_t>(i)][static_cast<size_t>(j)];
        }
    }
    return M;
}

Matrix MatrixIO::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IOError(ErrorCode::FILE_NOT_FOUND, "Cannot open matrix file: " + path, __func__);
    }
    Matrix M = read(file, path);
    LOG_INFO("Loaded ", M.rows(), "x", M.cols(), " matrix from ", path);
    return M;
}

void MatrixIO::write(std::ostream& out, const Matrix& M) {
    const auto precision = out.precision();
    out << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (Index i = 0; i < M.rows(); ++i) {
        for (Index j = 0; j < M.cols(); ++j) {
            if (j > 0) out << ' ';
            out << M(i, j);
        }
        out << '\n';
    }
    out.precision(precision);
}

void MatrixIO::save(const std::string& path, const Matrix& M) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw IOError(ErrorCode::FILE_NOT_FOUND, "Cannot open output file: " + path, __func__);
    }
    write(file, M);
    if (!file) {
        throw IOError(ErrorCode::FILE_NOT_FOUND, "Failed writing matrix to " + path, __func__);
    }
}

} // namespace io
} // namespace curdecomp
