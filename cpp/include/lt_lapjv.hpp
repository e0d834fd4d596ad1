// laptrack C++ Core — sparse linear assignment (Jonker-Volgenant)
// Copyright (c) 2026 Nexellum d.o.o. — AGPL-3.0-or-later
#pragma once

#include "lt_core.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lt {

class InfeasibleAssignment : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};


// ============================================================
// SPARSE COST (COO triplets, infeasible entries absent)
// ============================================================
struct SparseCost {
    int n_rows = 0;
    int n_cols = 0;
    std::vector<int> rows;
    std::vector<int> cols;
    std::vector<double> costs;

    std::size_t nnz() const { return costs.size(); }
};

// Keep only the finite entries of a dense cost matrix
inline SparseCost to_sparse(const MatX& m) {
    SparseCost sp;
    sp.n_rows = (int)m.rows();
    sp.n_cols = (int)m.cols();
    for (int i = 0; i < sp.n_rows; ++i) {
        for (int j = 0; j < sp.n_cols; ++j) {
            double c = m(i, j);
            if (!std::isfinite(c)) continue;
            sp.rows.push_back(i);
            sp.cols.push_back(j);
            sp.costs.push_back(c);
        }
    }
    return sp;
}

struct Assignment {
    std::vector<int> row_to_col;
    std::vector<int> col_to_row;
    double cost = 0.0;
};

using Solver = std::function<Assignment(const SparseCost&)>;

// A pluggable solver must hand back a full permutation of size n
inline void check_assignment(const Assignment& a, int n) {
    if ((int)a.row_to_col.size() != n || (int)a.col_to_row.size() != n)
        throw InfeasibleAssignment("solver returned " + std::to_string(a.col_to_row.size()) +
                                   " columns for a problem of size " + std::to_string(n));
    for (int j = 0; j < n; ++j) {
        int i = a.col_to_row[j];
        if (i < 0 || i >= n || a.row_to_col[i] != j)
            throw InfeasibleAssignment("solver left column " + std::to_string(j) + " unmatched");
    }
}


// ============================================================
// LAPJV: shortest augmenting path on a sparse square matrix
// Column reduction, then Dijkstra augmentation with dual updates
// (Crouse 2016). Throws InfeasibleAssignment when no perfect
// matching exists over the admissible entries.
// ============================================================
namespace lapjv {

inline Assignment solve(const SparseCost& sp) {
    if (sp.n_rows != sp.n_cols)
        throw std::invalid_argument("lapjv::solve needs a square cost matrix");
    if (sp.rows.size() != sp.costs.size() || sp.cols.size() != sp.costs.size())
        throw std::invalid_argument("lapjv::solve: triplet arrays differ in length");

    const int n = sp.n_rows;
    Assignment out;
    out.row_to_col.assign(n, -1);
    out.col_to_row.assign(n, -1);
    if (n == 0) return out;

    // CSR layout
    std::vector<int> ptr(n + 1, 0);
    for (int r : sp.rows) {
        if (r < 0 || r >= n) throw std::out_of_range("lapjv::solve: row index out of range");
        ptr[r + 1]++;
    }
    for (int i = 0; i < n; ++i) ptr[i + 1] += ptr[i];
    std::vector<int> col(sp.nnz());
    std::vector<double> cost(sp.nnz());
    {
        std::vector<int> cursor(ptr.begin(), ptr.end() - 1);
        for (std::size_t e = 0; e < sp.nnz(); ++e) {
            int c = sp.cols[e];
            if (c < 0 || c >= n) throw std::out_of_range("lapjv::solve: column index out of range");
            int k = cursor[sp.rows[e]]++;
            col[k] = c;
            cost[k] = sp.costs[e];
        }
    }
    for (int i = 0; i < n; ++i)
        if (ptr[i] == ptr[i + 1])
            throw InfeasibleAssignment("row " + std::to_string(i) + " has no admissible entry");

    std::vector<int>& row_assign = out.row_to_col;
    std::vector<int>& col_assign = out.col_to_row;
    std::vector<double> u(n, 0.0), v(n, INF_COST);

    // Column reduction
    std::vector<int> min_row(n, -1);
    for (int i = 0; i < n; ++i) {
        for (int k = ptr[i]; k < ptr[i + 1]; ++k) {
            if (cost[k] < v[col[k]]) { v[col[k]] = cost[k]; min_row[col[k]] = i; }
        }
    }
    for (int j = 0; j < n; ++j) {
        if (min_row[j] < 0)
            throw InfeasibleAssignment("column " + std::to_string(j) + " has no admissible entry");
        int i = min_row[j];
        if (row_assign[i] < 0) {
            row_assign[i] = j;
            col_assign[j] = i;
        }
    }

    // Augmentation for unassigned rows
    std::vector<double> d(n);
    std::vector<int> pred(n);
    std::vector<char> scanned(n);
    std::vector<int> scanned_cols;
    scanned_cols.reserve(n);

    for (int i = 0; i < n; ++i) {
        if (row_assign[i] >= 0) continue;

        std::fill(d.begin(), d.end(), INF_COST);
        std::fill(pred.begin(), pred.end(), -1);
        std::fill(scanned.begin(), scanned.end(), 0);
        scanned_cols.clear();

        for (int k = ptr[i]; k < ptr[i + 1]; ++k) {
            double r = cost[k] - u[i] - v[col[k]];
            if (r < d[col[k]]) { d[col[k]] = r; pred[col[k]] = i; }
        }

        int j_sink = -1;
        double lowest = 0.0;
        while (j_sink < 0) {
            double min_d = INF_COST;
            int j_min = -1;
            for (int j = 0; j < n; ++j) {
                if (!scanned[j] && d[j] < min_d) { min_d = d[j]; j_min = j; }
            }
            if (j_min < 0)
                throw InfeasibleAssignment("no augmenting path from row " + std::to_string(i));

            scanned[j_min] = 1;
            scanned_cols.push_back(j_min);
            if (col_assign[j_min] < 0) {
                j_sink = j_min;
                lowest = min_d;
                break;
            }
            int i2 = col_assign[j_min];
            for (int k = ptr[i2]; k < ptr[i2 + 1]; ++k) {
                int j = col[k];
                if (scanned[j]) continue;
                double new_d = min_d + cost[k] - u[i2] - v[j];
                if (new_d < d[j]) { d[j] = new_d; pred[j] = i2; }
            }
        }

        // Dual update keeps reduced costs >= 0 and 0 on matched edges
        u[i] += lowest;
        for (int j : scanned_cols) {
            if (j == j_sink) continue;
            double delta = lowest - d[j];
            u[col_assign[j]] += delta;
            v[j] -= delta;
        }

        // Augment along path
        int j = j_sink;
        while (true) {
            int i2 = pred[j];
            col_assign[j] = i2;
            int prev_j = row_assign[i2];
            row_assign[i2] = j;
            if (i2 == i) break;
            j = prev_j;
        }
    }

    for (int r = 0; r < n; ++r) {
        for (int k = ptr[r]; k < ptr[r + 1]; ++k) {
            if (col[k] == row_assign[r]) { out.cost += cost[k]; break; }
        }
    }
    return out;
}

}  // namespace lapjv

}  // namespace lt
