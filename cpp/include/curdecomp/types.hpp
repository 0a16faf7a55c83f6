#pragma once

#include <Eigen/Dense>
#include <vector>

namespace curdecomp {

// Dense real matrices throughout; column-major as Eigen stores them
using Matrix = Eigen::MatrixXd;
using Vector = Eigen::VectorXd;
using Index = Eigen::Index;

// Ordered, duplicate-free list of selected column (or row) indices.
// Position in the list is selection order.
using Indices = std::vector<Index>;

} // namespace curdecomp
