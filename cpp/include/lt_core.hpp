// laptrack C++ Core — detection table, label generator, segments
// Copyright (c) 2026 Nexellum d.o.o. — AGPL-3.0-or-later
#pragma once

#include <Eigen/Dense>
#include <vector>
#include <cmath>
#include <cstdint>
#include <algorithm>
#include <numeric>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>

namespace lt {

// ============================================================
// TYPE ALIASES
// ============================================================
using Vec3  = Eigen::Vector3d;
using MatX  = Eigen::MatrixXd;
using VecX  = Eigen::VectorXd;
using Label = std::int64_t;

constexpr double INF_COST = std::numeric_limits<double>::infinity();
constexpr double ALT_COST_FACTOR = 1.05;  // birth/death cost vs. worst admissible link


// ============================================================
// DETECTION
// ============================================================
struct Detection {
    double t;
    Label label;
    Vec3 pos;            // z = 0 when ndims == 2
    double intensity;    // 1.0 when the table carries no intensity
};

// Half-open row range [begin, end) inside the table
struct RowRange {
    std::size_t begin = 0;
    std::size_t end = 0;
    std::size_t size() const { return end - begin; }
    bool empty() const { return begin == end; }
};

// Rows of one label, ordered by time
struct Segment {
    Label label;
    std::vector<std::size_t> rows;
    std::size_t size() const { return rows.size(); }
};


// ============================================================
// DETECTION TABLE (arena addressed by row index)
// ============================================================
// Rows are kept sorted by (t, label). Each row carries a primary label and
// a working label; linking writes the working column and commit() promotes
// it. Row indices are stable until the next commit/remove/reverse.
class DetectionTable {
public:
    DetectionTable() = default;

    DetectionTable(std::vector<Detection> rows, int ndims, bool has_intensity)
        : rows_(std::move(rows)), ndims_(ndims), has_intensity_(has_intensity) {
        if (ndims_ != 2 && ndims_ != 3)
            throw std::invalid_argument("ndims must be 2 or 3");
        if (!has_intensity_)
            for (auto& d : rows_) d.intensity = 1.0;
        if (ndims_ == 2)
            for (auto& d : rows_) d.pos[2] = 0.0;
        sort_rows();
        for (std::size_t i = 1; i < rows_.size(); ++i) {
            if (rows_[i].t == rows_[i-1].t && rows_[i].label == rows_[i-1].label)
                throw std::invalid_argument(
                    "duplicate detection at t=" + std::to_string(rows_[i].t) +
                    " label=" + std::to_string(rows_[i].label));
        }
        reset_working_labels();
        reindex();
    }

    // Column-wise construction: coords is N x ndims, intensity empty or N
    static DetectionTable from_columns(const std::vector<double>& t,
                                       const std::vector<Label>& label,
                                       const MatX& coords,
                                       const std::vector<double>& intensity = {}) {
        const std::size_t n = t.size();
        if (label.size() != n || (std::size_t)coords.rows() != n)
            throw std::invalid_argument("time, label and coordinate columns differ in length");
        if (coords.cols() != 2 && coords.cols() != 3)
            throw std::invalid_argument("coordinates must have 2 or 3 columns");
        const bool has_i = !intensity.empty();
        if (has_i && intensity.size() != n)
            throw std::invalid_argument("intensity column length mismatch");

        std::vector<Detection> rows(n);
        for (std::size_t i = 0; i < n; ++i) {
            Vec3 p = Vec3::Zero();
            for (int k = 0; k < coords.cols(); ++k) p[k] = coords(i, k);
            rows[i] = {t[i], label[i], p, has_i ? intensity[i] : 1.0};
        }
        return DetectionTable(std::move(rows), (int)coords.cols(), has_i);
    }

    // ---- shape ----
    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    int ndims() const { return ndims_; }
    bool has_intensity() const { return has_intensity_; }

    const Detection& row(std::size_t i) const { return rows_[i]; }
    const std::vector<Detection>& rows() const { return rows_; }

    // ---- time axis ----
    const std::vector<double>& times() const { return times_; }
    std::size_t n_times() const { return times_.size(); }

    std::size_t time_index(double t) const {
        auto it = std::lower_bound(times_.begin(), times_.end(), t);
        if (it == times_.end() || *it != t)
            throw std::out_of_range("time " + std::to_string(t) + " not in table");
        return (std::size_t)(it - times_.begin());
    }

    RowRange frame(std::size_t ti) const {
        return {frame_start_[ti], frame_start_[ti + 1]};
    }

    // ---- labels ----
    std::vector<Label> labels() const {
        std::vector<Label> out;
        out.reserve(rows_.size());
        for (const auto& d : rows_) out.push_back(d.label);
        std::sort(out.begin(), out.end());
        out.erase(std::unique(out.begin(), out.end()), out.end());
        return out;
    }

    // Largest label in either column, -1 for an empty table
    Label max_label() const {
        Label m = -1;
        for (std::size_t i = 0; i < rows_.size(); ++i)
            m = std::max({m, rows_[i].label, new_label_[i]});
        return m;
    }

    Label new_label(std::size_t i) const { return new_label_[i]; }
    void set_new_label(std::size_t i, Label l) { new_label_[i] = l; }

    void reset_working_labels() {
        new_label_.resize(rows_.size());
        for (std::size_t i = 0; i < rows_.size(); ++i) new_label_[i] = rows_[i].label;
    }

    // Promote the working column to the primary label and restore (t, label) order
    void commit_working_labels() {
        for (std::size_t i = 0; i < rows_.size(); ++i) rows_[i].label = new_label_[i];
        sort_rows();
        reset_working_labels();
    }

    // ---- positions ----
    // n x ndims block of the rows in `r`
    MatX positions(RowRange r) const {
        MatX out(r.size(), ndims_);
        for (std::size_t i = r.begin; i < r.end; ++i)
            out.row(i - r.begin) = rows_[i].pos.head(ndims_).transpose();
        return out;
    }

    MatX positions(const std::vector<std::size_t>& idx) const {
        MatX out(idx.size(), ndims_);
        for (std::size_t k = 0; k < idx.size(); ++k)
            out.row(k) = rows_[idx[k]].pos.head(ndims_).transpose();
        return out;
    }

    // ---- segments ----
    Segment segment(Label lbl) const {
        Segment s{lbl, {}};
        for (std::size_t i = 0; i < rows_.size(); ++i)
            if (rows_[i].label == lbl) s.rows.push_back(i);
        return s;
    }

    // One pass over the current labeling; labels ascending, rows by time
    std::vector<Segment> segments() const {
        auto lbls = labels();
        std::vector<Segment> out(lbls.size());
        for (std::size_t k = 0; k < lbls.size(); ++k) out[k].label = lbls[k];
        for (std::size_t i = 0; i < rows_.size(); ++i) {
            auto it = std::lower_bound(lbls.begin(), lbls.end(), rows_[i].label);
            out[it - lbls.begin()].rows.push_back(i);
        }
        return out;
    }

    // ---- mutation ----
    // Drop every segment with fewer than min_length rows; returns rows removed
    std::size_t remove_shorts(std::size_t min_length) {
        std::vector<Label> drop;
        for (const auto& s : segments())
            if (s.size() < min_length) drop.push_back(s.label);
        if (drop.empty()) return 0;

        std::vector<Detection> kept;
        std::vector<Label> kept_new;
        kept.reserve(rows_.size());
        kept_new.reserve(rows_.size());
        for (std::size_t i = 0; i < rows_.size(); ++i) {
            if (std::binary_search(drop.begin(), drop.end(), rows_[i].label)) continue;
            kept.push_back(rows_[i]);
            kept_new.push_back(new_label_[i]);
        }
        std::size_t removed = rows_.size() - kept.size();
        rows_ = std::move(kept);
        new_label_ = std::move(kept_new);
        reindex();
        return removed;
    }

    // t -> (t_min + t_max) - t. Applying it twice restores the exact time
    // values: each pass remembers which time every mirrored time came from.
    void reverse_time() {
        if (rows_.empty()) return;
        const double pivot = times_.front() + times_.back();
        std::map<double, double> back;
        for (auto& d : rows_) {
            const double from = d.t;
            auto it = mirror_.find(from);
            d.t = (it != mirror_.end()) ? it->second : pivot - from;
            back[d.t] = from;
        }
        mirror_ = std::move(back);

        std::vector<std::size_t> order(rows_.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            if (rows_[a].t != rows_[b].t) return rows_[a].t < rows_[b].t;
            return rows_[a].label < rows_[b].label;
        });
        permute(order);
        reindex();
    }

private:
    std::vector<Detection> rows_;
    std::vector<Label> new_label_;
    std::vector<double> times_;
    std::vector<std::size_t> frame_start_{0};
    std::map<double, double> mirror_;   // time after reverse_time -> time before
    int ndims_ = 3;
    bool has_intensity_ = false;

    void sort_rows() {
        std::stable_sort(rows_.begin(), rows_.end(), [](const Detection& a, const Detection& b) {
            if (a.t != b.t) return a.t < b.t;
            return a.label < b.label;
        });
    }

    void permute(const std::vector<std::size_t>& order) {
        std::vector<Detection> r(rows_.size());
        std::vector<Label> nl(rows_.size());
        for (std::size_t k = 0; k < order.size(); ++k) {
            r[k] = rows_[order[k]];
            nl[k] = new_label_[order[k]];
        }
        rows_ = std::move(r);
        new_label_ = std::move(nl);
    }

    void reindex() {
        times_.clear();
        frame_start_.assign(1, 0);
        for (std::size_t i = 0; i < rows_.size(); ++i) {
            if (times_.empty() || rows_[i].t != times_.back()) {
                if (!times_.empty()) frame_start_.push_back(i);
                times_.push_back(rows_[i].t);
            }
        }
        if (!times_.empty()) frame_start_.push_back(rows_.size());
    }
};


// ============================================================
// LABEL GENERATOR (monotonic, one per tracking session)
// ============================================================
class LabelGenerator {
public:
    LabelGenerator() = default;
    explicit LabelGenerator(Label max_in_use) : last_(max_in_use) {}

    Label next() { return ++last_; }
    Label last() const { return last_; }

    // Never hand out a label at or below `l`
    void reserve(Label l) { last_ = std::max(last_, l); }

private:
    Label last_ = -1;
};

}  // namespace lt
