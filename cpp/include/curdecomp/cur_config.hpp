#pragma once

#include "curdecomp/config.hpp"
#include "curdecomp/cur.hpp"

#include <string>

namespace curdecomp {

/**
 * CurOptions filled from the configured defaults (method, rank,
 * regularization, symmetry tolerance).
 */
inline CurOptions options_from_config() {
    const Config& config = Config::getInstance();

    CurOptions options;
    options.pi_function = config.get<std::string>("selection.method", "svd");
    options.symmetry_tolerance = config.get<double>("cur.symmetry_tolerance", kDefaultSymmetryTolerance);
    options.params.rank = config.get<Index>("selection.rank", 1);
    options.params.regularization = config.get<double>("selection.regularization", kDefaultRegularization);
    return options;
}

} // namespace curdecomp
