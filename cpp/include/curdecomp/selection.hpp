#pragma once

/**
 * Greedy CUR column selection
 *
 * Both strategies share one loop shape:
 *   1. score every column of the working copy
 *   2. pick the best unselected column (lowest index wins ties)
 *   3. deflate the working copy along that column
 *
 * They differ only in the score:
 *   - SvdLeverageSelection: statistical leverage on the top-k right singular
 *     vectors of the working copy
 *   - PcovrSelection: weight on the top-k eigenvectors of the PCovR
 *     covariance, which also tracks how much of the property matrix Y the
 *     selected columns already explain
 *
 * Row selection is column selection on the transposed matrix.
 *
 * Selection is resumable: indices passed in `resume` are replayed (deflation
 * only) and the returned list always starts with them.
 */

#include "curdecomp/covariance.hpp"
#include "curdecomp/types.hpp"

#include <memory>
#include <optional>
#include <string>

namespace curdecomp {

/**
 * Per-call selection parameters. Constructed by the caller, passed by const
 * reference, never modified by a strategy.
 */
struct SelectionParams {
    Index rank = 1;                          // k: leading singular/eigen vectors used for scoring
    std::optional<Matrix> properties;        // Y, n_samples x n_properties (PCovR only)
    std::optional<double> alpha;             // PCovR mixing weight in [0, 1]
    // Rank-exhaustion floor, relative: selection stops once the residual
    // energy sigma_max(work)^2 is at most regularization * sigma_max(matrix)^2
    double regularization = kDefaultRegularization;
};

/**
 * Outcome of one select() call.
 *
 * `exhausted` is set when the working matrix ran out of information before
 * `requested` indices could be chosen; `indices` then holds everything
 * selected up to that point.
 */
struct SelectionResult {
    Indices indices;
    Index requested = 0;
    bool exhausted = false;

    bool complete() const { return static_cast<Index>(indices.size()) >= requested; }
};

/**
 * Selection strategy interface. Implementations must be stateless with
 * respect to select(): all working state lives in the call.
 */
class SelectionStrategy {
public:
    virtual ~SelectionStrategy() = default;

    virtual std::string name() const = 0;

    /**
     * Check that `params` can drive selection on `matrix` (columns are the
     * candidates). Called once by the orchestrator at construction.
     * @throws ConfigurationError
     */
    virtual void validate(const Matrix& matrix, const SelectionParams& params) const;

    /**
     * Select up to `count` column indices of `matrix`, extending `resume`.
     */
    virtual SelectionResult select(const Matrix& matrix, Index count,
                                   const Indices& resume,
                                   const SelectionParams& params) const = 0;
};

class SvdLeverageSelection : public SelectionStrategy {
public:
    std::string name() const override { return "svd"; }

    SelectionResult select(const Matrix& matrix, Index count,
                           const Indices& resume,
                           const SelectionParams& params) const override;
};

class PcovrSelection : public SelectionStrategy {
public:
    std::string name() const override { return "pcovr"; }

    /**
     * Requires params.properties with matrix.rows() rows and
     * params.alpha in [0, 1].
     */
    void validate(const Matrix& matrix, const SelectionParams& params) const override;

    SelectionResult select(const Matrix& matrix, Index count,
                           const Indices& resume,
                           const SelectionParams& params) const override;
};

/**
 * Index of the largest positive score not in `excluded`.
 * Equal maxima resolve to the lowest index. Returns -1 when no candidate
 * has a positive score.
 */
Index select_best_index(const Vector& scores, const Indices& excluded);

/**
 * Residual of Y after least-squares regression on the columns of X_c:
 * Y - X_c (X_c^T X_c)^+ X_c^T Y. Returns a new matrix.
 */
Matrix update_properties(const Matrix& Y, const Matrix& X_c);

} // namespace curdecomp
