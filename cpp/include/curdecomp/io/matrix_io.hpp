#pragma once

#include "curdecomp/types.hpp"

#include <iosfwd>
#include <string>

namespace curdecomp {
namespace io {

class MatrixIO {
public:
    /**
     * @brief Parses a dense matrix from text, one row per line.
     *
     * Values may be separated by whitespace, commas or semicolons. '#'
     * starts a comment that runs to the end of the line; blank and
     * comment-only lines are skipped. All rows must have the same number
     * of values.
     *
     * @throws IOError (PARSE_ERROR) on ragged rows, bad numbers or no data
     */
    static Matrix read(std::istream& in, const std::string& source = "<stream>");

    /**
     * @throws IOError (FILE_NOT_FOUND) if the file cannot be opened
     */
    static Matrix load(const std::string& path);

    /**
     * @brief Writes one row per line, values separated by a single space,
     * at full double precision.
     */
    static void write(std::ostream& out, const Matrix& M);

    static void save(const std::string& path, const Matrix& M);
};

} // namespace io
} // namespace curdecomp
