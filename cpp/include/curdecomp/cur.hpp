#pragma once

/**
 * CUR Decomposition
 *
 * Approximates a dense matrix by A ~ A_c * S * A_r where A_c and A_r are
 * actual columns and rows of A, chosen greedily by a SelectionStrategy.
 *
 * Modes (fixed at construction):
 * - symmetric:      A is square and |A - A^T| < symmetry_tolerance entrywise.
 *                   Rows reuse the column selection, A_r = A_c^T.
 * - feature_select: only columns are selected, the full A is the row factor
 *                   and idx_r is [0, n_cols).
 * - general:        rows are selected on A^T, the caller must give n_r.
 *
 * Selected indices are cached and only ever extended: asking for more
 * columns resumes from the cached list, asking for fewer slices it.
 *
 * Not thread-safe: one writer per instance.
 *
 * References:
 * - M. W. Mahoney, P. Drineas, PNAS 106, 697 (2009)
 * - G. Imbalzano et al., J. Chem. Phys. 148, 241730 (2018)
 */

#include "curdecomp/approximation.hpp"
#include "curdecomp/selection.hpp"
#include "curdecomp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace curdecomp {

constexpr double kDefaultSymmetryTolerance = 1e-4;

struct CurOptions {
    // (n_c, n_r) to select during construction
    std::optional<std::pair<Index, Index>> precompute;
    bool feature_select = false;

    // Strategy by registry name; ignored when `strategy` is set
    std::string pi_function = "svd";
    std::shared_ptr<const SelectionStrategy> strategy;

    double symmetry_tolerance = kDefaultSymmetryTolerance;

    // Column selection parameters
    SelectionParams params;
    // Row selection parameters (selection on A^T); defaults to `params`
    std::optional<SelectionParams> row_params;

    static std::pair<Index, Index> precompute_count(Index n) { return {n, n}; }
};

struct IndexSelection {
    Indices idx_c;
    Indices idx_r;
    bool columns_complete = true;
    bool rows_complete = true;
};

class CUR {
public:
    /**
     * @throws InvalidArgumentError empty matrix or non-finite entries
     * @throws ConfigurationError   strategy and parameters do not fit
     */
    explicit CUR(Matrix matrix, CurOptions options = {});

    /**
     * Select (or extend the cache to) n_c columns and n_r rows.
     * The cache is updated and returned.
     * @throws ConfigurationError the strategy broke the cached prefix or
     *         returned duplicate or out-of-range indices
     */
    IndexSelection compute_idx(Index n_c, Index n_r);

    /**
     * Decompose with n_c columns and n_r rows.
     * n_r is ignored in feature-select mode and defaults to n_c for a
     * symmetric matrix.
     * @throws UsageError n_r missing for a non-symmetric matrix, or a count < 1
     * @throws RankDeficiencyError selection found no column (or row) at all
     */
    Decomposition compute(Index n_c, std::optional<Index> n_r = std::nullopt);

    /**
     * Compute and store the latent-space projector for the (n_c, n_r)
     * decomposition. Overwrites any earlier projector.
     */
    const Matrix& compute_P(Index n_c, std::optional<Index> n_r = std::nullopt);

    /**
     * Relative Frobenius reconstruction error for (n_c, n_r).
     */
    double loss(Index n_c, std::optional<Index> n_r = std::nullopt);

    const Matrix& matrix() const { return A_; }
    bool symmetric() const { return symmetric_; }
    bool feature_select() const { return feature_select_; }
    const SelectionStrategy& strategy() const { return *strategy_; }
    const Indices& idx_c() const { return idx_c_; }
    const Indices& idx_r() const { return idx_r_; }
    const std::optional<Matrix>& projector() const { return P_; }

    static bool is_symmetric(const Matrix& A, double tolerance);

private:
    const SelectionParams& row_params() const;
    Index resolve_rows(Index n_c, std::optional<Index> n_r) const;
    bool cache_covers(Index n_c, Index n_r) const;

    Matrix A_;
    bool symmetric_;
    bool feature_select_;
    std::shared_ptr<const SelectionStrategy> strategy_;
    SelectionParams params_;
    std::optional<SelectionParams> row_params_;

    Indices idx_c_;
    Indices idx_r_;
    bool columns_exhausted_ = false;
    bool rows_exhausted_ = false;

    std::optional<Matrix> P_;
};

} // namespace curdecomp
