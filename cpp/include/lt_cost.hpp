// laptrack C++ Core — LAP cost matrices (frame linking, gap closing)
// Copyright (c) 2026 Nexellum d.o.o. — AGPL-3.0-or-later
#pragma once

#include "lt_core.hpp"

#include <functional>
#include <stdexcept>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace lt {

// Per-coordinate distance transform; link cost is its sum over coordinates
using DistanceFn = std::function<double(double)>;

inline double square(double x) { return x * x; }

// Track segment reduced to what gap closing looks at
struct SegmentData {
    VecX t;            // strictly increasing
    MatX pos;          // size() x ndims
    VecX intensity;    // size(), uniform when the table has none
};


// ============================================================
// AUGMENTED LAP LAYOUT
//   [ links (n0 x n1)   | death diag (n0 x n0) ]
//   [ birth diag (n1xn1)| links^T pattern       ]
// Inadmissible entries are INF_COST.
// ============================================================
inline MatX augment(const MatX& links) {
    const int n0 = (int)links.rows();
    const int n1 = (int)links.cols();
    const int n = n0 + n1;

    double max_c = -INF_COST, min_c = INF_COST;
    for (int i = 0; i < n0; ++i) {
        for (int j = 0; j < n1; ++j) {
            double c = links(i, j);
            if (!std::isfinite(c)) continue;
            max_c = std::max(max_c, c);
            min_c = std::min(min_c, c);
        }
    }
    // No admissible link, or only zero-cost ones
    double alt = (max_c > 0.0) ? ALT_COST_FACTOR * max_c : 1.0;
    if (!std::isfinite(min_c)) min_c = 0.0;

    MatX m = MatX::Constant(n, n, INF_COST);
    m.topLeftCorner(n0, n1) = links;
    for (int i = 0; i < n0; ++i) m(i, n1 + i) = alt;
    for (int j = 0; j < n1; ++j) m(n0 + j, j) = alt;
    for (int i = 0; i < n0; ++i)
        for (int j = 0; j < n1; ++j)
            if (std::isfinite(links(i, j))) m(n0 + j, n1 + i) = min_c;
    return m;
}


// ============================================================
// FRAME-TO-FRAME COST MATRIX
// ============================================================
// Rows: `from` positions (n0 x d). Columns: `to` positions (n1 x d).
// A link is admissible when the Euclidean distance is <= max_distance.
inline MatX build_cost_matrix(const MatX& from, const MatX& to,
                              double max_distance, const DistanceFn& dist_fn) {
    if (from.cols() != to.cols() && from.rows() > 0 && to.rows() > 0)
        throw std::invalid_argument("build_cost_matrix: dimension mismatch");

    const int n0 = (int)from.rows();
    const int n1 = (int)to.rows();
    MatX links = MatX::Constant(n0, n1, INF_COST);

    #pragma omp parallel for schedule(static) if(n0 * n1 > 20000)
    for (int i = 0; i < n0; ++i) {
        for (int j = 0; j < n1; ++j) {
            VecX diff = (to.row(j) - from.row(i)).transpose();
            if (!(diff.norm() <= max_distance)) continue;
            double c = 0.0;
            for (int k = 0; k < diff.size(); ++k) c += dist_fn(diff[k]);
            links(i, j) = c;
        }
    }
    return augment(links);
}


// ============================================================
// SEGMENT GAP-CLOSING COST MATRIX
// ============================================================
// Rows: segment ends. Columns: segment starts. Closing the end of A onto
// the start of B is admissible when 0 < gap <= window_gap and the jump is
// at most max_disp * gap. The cost is scaled by the intensity ratio
// rho = I_B / I_A as rho (rho >= 1) or 1 / rho^2 (rho < 1).
inline MatX build_segment_cost_matrix(const std::vector<SegmentData>& segments,
                                      double max_disp, double window_gap,
                                      const DistanceFn& dist_fn,
                                      bool gap_close_only = true) {
    if (!gap_close_only)
        throw std::invalid_argument("merge/split candidates are not supported");

    const int n = (int)segments.size();
    for (const auto& s : segments) {
        if (s.t.size() == 0 || s.pos.rows() != s.t.size() || s.intensity.size() != s.t.size())
            throw std::invalid_argument("build_segment_cost_matrix: malformed segment");
    }

    MatX links = MatX::Constant(n, n, INF_COST);

    #pragma omp parallel for schedule(dynamic) if(n > 500)
    for (int a = 0; a < n; ++a) {
        const auto& sa = segments[a];
        const int ea = (int)sa.t.size() - 1;
        for (int b = 0; b < n; ++b) {
            const auto& sb = segments[b];
            double gap = sb.t[0] - sa.t[ea];
            if (!(gap > 0.0) || gap > window_gap) continue;
            VecX diff = (sb.pos.row(0) - sa.pos.row(ea)).transpose();
            if (!(diff.norm() <= max_disp * gap)) continue;

            double c = 0.0;
            for (int k = 0; k < diff.size(); ++k) c += dist_fn(diff[k]);
            double ia = sa.intensity[ea], ib = sb.intensity[0];
            if (ia > 0.0 && ib > 0.0) {
                double rho = ib / ia;
                c *= (rho >= 1.0) ? rho : 1.0 / (rho * rho);
            }
            links(a, b) = c;
        }
    }
    return augment(links);
}

}  // namespace lt
