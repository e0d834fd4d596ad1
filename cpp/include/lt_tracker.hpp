// laptrack C++ Core — LAP tracking session (frame linking + gap closing)
// Copyright (c) 2026 Nexellum d.o.o. — AGPL-3.0-or-later
#pragma once

#include "lt_core.hpp"
#include "lt_config.hpp"
#include "lt_cost.hpp"
#include "lt_lapjv.hpp"
#include "lt_log.hpp"
#include "lt_predict.hpp"

#include <map>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace lt {

// ============================================================
// SESSION STATISTICS
// ============================================================
struct TrackStats {
    int total_links = 0;         // frame-to-frame continuations
    int total_births = 0;        // fresh labels handed out by the linker
    int total_gap_closures = 0;  // segment ends stitched to a later start
    std::vector<std::pair<double, double>> infeasible_pairs;  // (t0, t1) degraded to all-birth
};


// ============================================================
// LAP TRACKER
// ============================================================
// Owns the detection table for one tracking session. Linking steps run in
// increasing time order and each one commits a full frame of working labels
// before the next reads them. The label generator is shared by linking and
// gap closing so no two births in a session collide.
class LAPTracker {
public:
    LAPTracker(DetectionTable table, const TrackerConfig& cfg = {},
               DistanceFn dist_fn = square, bool verbose = true)
        : cfg_(cfg), table_(std::move(table)), dist_fn_(std::move(dist_fn)),
          solver_(lapjv::solve),
          predictor_(std::make_shared<GaussianProcess>(cfg.gp)) {
        cfg_.validate();
        if (table_.ndims() < cfg_.ndims)
            throw ConfigError("table has " + std::to_string(table_.ndims()) +
                              " coordinates, config asks for " + std::to_string(cfg_.ndims));
        if (!dist_fn_) throw std::invalid_argument("distance function is empty");
        labels_.reserve(table_.max_label());
        Log::set_verbose(verbose);
    }

    LAPTracker(DetectionTable table, const ConfigMap& params,
               DistanceFn dist_fn, bool verbose = true)
        : LAPTracker(std::move(table), TrackerConfig::from_map(params), std::move(dist_fn), verbose) {}

    // ---- collaborators ----
    void set_solver(Solver solver) {
        if (!solver) throw std::invalid_argument("solver is empty");
        solver_ = std::move(solver);
    }

    void set_regressor(std::shared_ptr<const Regressor> reg) {
        predictor_ = PositionPredictor(std::move(reg));
    }

    // ---- accessors ----
    const TrackerConfig& config() const { return cfg_; }
    const DetectionTable& table() const { return table_; }
    const TrackStats& stats() const { return stats_; }
    const std::vector<double>& times() const { return table_.times(); }
    std::vector<Label> labels() const { return table_.labels(); }
    Label last_label() const { return labels_.last(); }

    Segment get_segment(Label lbl) const { return table_.segment(lbl); }
    std::vector<Segment> segments() const { return table_.segments(); }

    // ---- full linking pass ----
    void get_track(std::optional<bool> predict = std::nullopt) {
        if (predict) cfg_.predict = *predict;
        LT_LOG_INFO("Get track (predict={})", cfg_.predict);

        table_.reset_working_labels();
        labels_.reserve(table_.max_label());
        for (std::size_t k = 1; k < table_.n_times(); ++k)
            link(k - 1, k);
        table_.commit_working_labels();

        LT_LOG_INFO("Linked {} frames into {} labels ({} links, {} births)",
                    table_.n_times(), table_.labels().size(),
                    stats_.total_links, stats_.total_births);
    }

    // One frame linking step on working labels, t0 -> t1 consecutive
    void position_track(double t0, double t1) {
        std::size_t i0 = table_.time_index(t0);
        std::size_t i1 = table_.time_index(t1);
        if (i1 != i0 + 1)
            throw std::invalid_argument("position_track needs consecutive times");
        labels_.reserve(table_.max_label());
        link(i0, i1);
    }

    // Predicted t0 positions (and uncertainty) at t1, on working labels
    Prediction predict_positions(double t0, double t1) const {
        return predictor_.predict_positions(table_, table_.time_index(t0),
                                            table_.time_index(t1), cfg_.sigma);
    }

    // ---- gap closing ----
    std::optional<MatX> close_merge_split(bool return_mat = false) {
        auto segs = table_.segments();
        const int n = (int)segs.size();
        LT_LOG_INFO("Closing gaps over {} segments (window_gap={})", n, cfg_.window_gap);

        std::vector<SegmentData> data(n);
        for (int s = 0; s < n; ++s) {
            const auto& rows = segs[s].rows;
            data[s].t.resize(rows.size());
            data[s].intensity.resize(rows.size());
            for (std::size_t k = 0; k < rows.size(); ++k) {
                data[s].t[k] = table_.row(rows[k]).t;
                data[s].intensity[k] = table_.row(rows[k]).intensity;
            }
            data[s].pos = table_.positions(rows).leftCols(cfg_.ndims);
        }

        MatX lapmat = build_segment_cost_matrix(data, cfg_.max_disp, cfg_.window_gap,
                                                dist_fn_, true);
        Assignment a;
        try {
            a = solver_(to_sparse(lapmat));
            check_assignment(a, 2 * n);
        } catch (const InfeasibleAssignment& e) {
            LT_LOG_WARN("Gap closing skipped, labels left as linked: {}", e.what());
            if (return_mat) return lapmat;
            return std::nullopt;
        }

        // Chains resolve in start-time order: a predecessor always starts first
        std::vector<int> order(n);
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](int x, int y) {
            return data[x].t[0] < data[y].t[0];
        });

        std::vector<int> root(n);
        std::vector<int> chain_size(n, 0);
        std::vector<Label> chain_label(n);
        int closures = 0;
        for (int s : order) {
            int pred = a.col_to_row[s];
            if (pred < n && std::isfinite(lapmat(pred, s))) {
                root[s] = root[pred];
                ++closures;
            } else {
                root[s] = s;
                chain_label[s] = segs[s].label;
            }
            chain_size[root[s]]++;
            chain_label[root[s]] = std::min(chain_label[root[s]], segs[s].label);
        }
        stats_.total_gap_closures += closures;

        // Stitched chains keep their lowest label, lone segments are births
        labels_.reserve(table_.max_label());
        std::vector<Label> mapped(n);
        for (int s : order) {
            int r = root[s];
            if (chain_size[r] > 1) mapped[s] = chain_label[r];
            else mapped[s] = labels_.next();
        }

        std::map<Label, Label> remap;
        for (int s = 0; s < n; ++s) remap[segs[s].label] = mapped[s];
        for (std::size_t i = 0; i < table_.size(); ++i)
            table_.set_new_label(i, remap.at(table_.row(i).label));
        table_.commit_working_labels();

        LT_LOG_INFO("Gap closing stitched {} segment pairs, {} tracks left",
                    closures, table_.labels().size());
        if (return_mat) return lapmat;
        return std::nullopt;
    }

    // ---- segment utilities ----
    std::size_t remove_shorts(std::size_t min_length = 3) {
        std::size_t removed = table_.remove_shorts(min_length);
        LT_LOG_DEBUG("remove_shorts({}) dropped {} detections", min_length, removed);
        return removed;
    }

    void reverse_track() { table_.reverse_time(); }

private:
    TrackerConfig cfg_;
    DetectionTable table_;
    DistanceFn dist_fn_;
    Solver solver_;
    PositionPredictor predictor_;
    LabelGenerator labels_;
    TrackStats stats_;

    void link(std::size_t i0, std::size_t i1) {
        const double t0 = table_.times()[i0];
        const double t1 = table_.times()[i1];
        const RowRange r0 = table_.frame(i0);
        const RowRange r1 = table_.frame(i1);
        const int n0 = (int)r0.size();
        const int n1 = (int)r1.size();

        MatX pos1 = table_.positions(r1).leftCols(cfg_.ndims);
        MatX pos0;
        if (cfg_.predict)
            pos0 = predictor_.predict_positions(table_, i0, i1, cfg_.sigma).pos.leftCols(cfg_.ndims);
        else
            pos0 = table_.positions(r0).leftCols(cfg_.ndims);

        MatX lapmat = build_cost_matrix(pos0, pos1, cfg_.max_disp * (t1 - t0), dist_fn_);

        Assignment a;
        try {
            a = solver_(to_sparse(lapmat));
            check_assignment(a, n0 + n1);
        } catch (const InfeasibleAssignment& e) {
            LT_LOG_WARN("Something's amiss between points {} and {}: {}", t0, t1, e.what());
            stats_.infeasible_pairs.emplace_back(t0, t1);
            for (std::size_t k = r1.begin; k < r1.end; ++k) {
                table_.set_new_label(k, labels_.next());
                stats_.total_births++;
            }
            return;
        }

        // Resolve the whole frame before writing it back
        std::vector<Label> resolved(n1);
        int links = 0;
        for (int n = 0; n < n1; ++n) {
            int idx_in = a.col_to_row[n];
            if (idx_in >= n0) {
                resolved[n] = labels_.next();
            } else {
                resolved[n] = table_.new_label(r0.begin + idx_in);
                ++links;
            }
        }
        for (int n = 0; n < n1; ++n) table_.set_new_label(r1.begin + n, resolved[n]);

        stats_.total_links += links;
        stats_.total_births += n1 - links;
        LT_LOG_DEBUG("t={} -> t={}: {} links, {} births", t0, t1, links, n1 - links);
    }
};

}  // namespace lt
