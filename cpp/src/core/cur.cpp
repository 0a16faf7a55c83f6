#include "curdecomp/cur.hpp"
#include "curdecomp/error.hpp"
#include "curdecomp/linear_algebra.hpp"
#include "curdecomp/logging.hpp"
#include "curdecomp/strategy_registry.hpp"

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

namespace curdecomp {

namespace {

Indices head(const Indices& idx, Index n) {
    const size_t count = std::min(idx.size(), static_cast<size_t>(n));
    return Indices(idx.begin(), idx.begin() + static_cast<std::ptrdiff_t>(count));
}

void check_count(Index n, const char* what) {
    if (n < 1) {
        CURDECOMP_THROW_USAGE(std::string("Number of ") + what + " must be at least 1, got " +
                              std::to_string(n));
    }
}

// A strategy may only extend the cached list, with distinct in-range indices
void check_extension(const SelectionStrategy& strategy, const Indices& cached,
                     const Indices& selected, Index candidates) {
    const std::string who = "Selection strategy \"" + strategy.name() + "\"";
    CURDECOMP_CHECK_CONFIG(selected.size() >= cached.size() &&
                           std::equal(cached.begin(), cached.end(), selected.begin()),
        who + " did not keep the previously selected indices as its prefix",
        "select() must return `resume` followed by the new indices");

    std::vector<bool> seen(static_cast<size_t>(candidates), false);
    for (Index j : selected) {
        CURDECOMP_CHECK_CONFIG(j >= 0 && j < candidates,
            who + " returned index " + std::to_string(j) + " outside [0, " +
            std::to_string(candidates) + ")", "");
        CURDECOMP_CHECK_CONFIG(!seen[static_cast<size_t>(j)],
            who + " returned index " + std::to_string(j) + " more than once", "");
        seen[static_cast<size_t>(j)] = true;
    }
}

} // namespace

CUR::CUR(Matrix matrix, CurOptions options)
    : A_(std::move(matrix))
    , symmetric_(false)
    , feature_select_(options.feature_select)
    , params_(std::move(options.params))
    , row_params_(std::move(options.row_params)) {
    CURDECOMP_CHECK_ARGUMENT(A_.rows() > 0 && A_.cols() > 0, "CUR needs a non-empty matrix");
    CURDECOMP_CHECK_ARGUMENT(A_.allFinite(), "CUR matrix contains NaN or infinite entries");
    CURDECOMP_CHECK_CONFIG(options.symmetry_tolerance >= 0.0,
        "Symmetry tolerance must be non-negative", "");

    symmetric_ = is_symmetric(A_, options.symmetry_tolerance);
    strategy_ = options.strategy ? options.strategy
                                 : StrategyRegistry::instance().create(options.pi_function);

    // Fail fast on parameters the selection would reject later
    strategy_->validate(A_, params_);
    if (!symmetric_ && !feature_select_) {
        strategy_->validate(A_.transpose(), row_params());
    }

    LOG_DEBUG("CUR on ", A_.rows(), "x", A_.cols(), " matrix, strategy=", strategy_->name(),
              " symmetric=", symmetric_, " feature_select=", feature_select_);

    if (options.precompute) {
        compute_idx(options.precompute->first, options.precompute->second);
    }
}

bool CUR::is_symmetric(const Matrix& A, double tolerance) {
    if (A.rows() != A.cols()) return false;
    return (A - A.transpose()).cwiseAbs().maxCoeff() < tolerance;
}

const SelectionParams& CUR::row_params() const {
    return row_params_ ? *row_params_ : params_;
}

Index CUR::resolve_rows(Index n_c, std::optional<Index> n_r) const {
    if (feature_select_) {
        return A_.cols();
    }
    if (symmetric_) {
        if (n_r && *n_r != n_c) {
            LOG_WARN("Symmetric matrix: rows follow the ", n_c, " selected columns, n_r=", *n_r, " ignored");
        }
        return n_c;
    }
    if (!n_r) {
        throw UsageError("A row count n_r is required for a non-symmetric matrix", __func__,
                         "Pass n_r, or enable feature_select for column-only compression");
    }
    check_count(*n_r, "rows");
    return *n_r;
}

bool CUR::cache_covers(Index n_c, Index n_r) const {
    const bool columns = static_cast<Index>(idx_c_.size()) >= n_c || columns_exhausted_;
    if (!columns || idx_c_.empty()) return false;

    if (feature_select_) return static_cast<Index>(idx_r_.size()) == A_.cols();
    if (symmetric_) return true;
    return !idx_r_.empty() && (static_cast<Index>(idx_r_.size()) >= n_r || rows_exhausted_);
}

IndexSelection CUR::compute_idx(Index n_c, Index n_r) {
    check_count(n_c, "columns");

    if (static_cast<Index>(idx_c_.size()) < n_c && !columns_exhausted_) {
        SelectionResult columns = strategy_->select(A_, n_c, idx_c_, params_);
        check_extension(*strategy_, idx_c_, columns.indices, A_.cols());
        idx_c_ = std::move(columns.indices);
        columns_exhausted_ = columns.exhausted;
    }

    IndexSelection selection;
    selection.idx_c = head(idx_c_, n_c);
    selection.columns_complete = static_cast<Index>(selection.idx_c.size()) >= n_c;

    if (feature_select_) {
        idx_r_.resize(static_cast<size_t>(A_.cols()));
        std::iota(idx_r_.begin(), idx_r_.end(), Index{0});
        selection.idx_r = idx_r_;
    } else if (!symmetric_) {
        check_count(n_r, "rows");
        if (static_cast<Index>(idx_r_.size()) < n_r && !rows_exhausted_) {
            const Matrix At = A_.transpose();
            SelectionResult rows = strategy_->select(At, n_r, idx_r_, row_params());
            check_extension(*strategy_, idx_r_, rows.indices, At.cols());
            idx_r_ = std::move(rows.indices);
            rows_exhausted_ = rows.exhausted;
        }
        selection.idx_r = head(idx_r_, n_r);
        selection.rows_complete = static_cast<Index>(selection.idx_r.size()) >= n_r;
    } else {
        idx_r_ = idx_c_;
        rows_exhausted_ = columns_exhausted_;
        selection.idx_r = selection.idx_c;
        selection.rows_complete = selection.columns_complete;
    }

    return selection;
}

Decomposition CUR::compute(Index n_c, std::optional<Index> n_r) {
    check_count(n_c, "columns");
    const Index rows = resolve_rows(n_c, n_r);

    if (!cache_covers(n_c, rows)) {
        compute_idx(n_c, rows);
    }

    Decomposition d;
    d.idx_c = head(idx_c_, n_c);
    d.A_c = la::take_columns(A_, d.idx_c);

    if (feature_select_) {
        d.idx_r = idx_r_;
        d.A_r = A_;
    } else if (symmetric_) {
        d.idx_r = d.idx_c;
        d.A_r = d.A_c.transpose();
    } else {
        d.idx_r = head(idx_r_, rows);
        d.A_r = la::take_rows(A_, d.idx_r);
    }

    if (d.idx_c.empty() || d.idx_r.empty()) {
        throw RankDeficiencyError("Selection found no " +
                                  std::string(d.idx_c.empty() ? "columns" : "rows") +
                                  " carrying information in the matrix",
                                  __func__, "The matrix is zero or below the regularization floor");
    }

    d.S = middle_matrix(A_, d.A_c, d.A_r);
    d.complete = static_cast<Index>(d.idx_c.size()) == n_c &&
                 static_cast<Index>(d.idx_r.size()) == rows;
    if (!d.complete) {
        LOG_WARN("Selection exhausted: decomposition uses ", d.idx_c.size(), " of ", n_c,
                 " columns and ", d.idx_r.size(), " of ", rows, " rows");
    }
    return d;
}

const Matrix& CUR::compute_P(Index n_c, std::optional<Index> n_r) {
    const Decomposition d = compute(n_c, n_r);
    P_ = compute_projector(d.A_c, d.S, d.A_r);
    return *P_;
}

double CUR::loss(Index n_c, std::optional<Index> n_r) {
    const Decomposition d = compute(n_c, n_r);
    return relative_error(A_, d.reconstruct());
}

} // namespace curdecomp
