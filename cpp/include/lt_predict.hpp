// laptrack C++ Core — trajectory-aware position prediction
// Copyright (c) 2026 Nexellum d.o.o. — AGPL-3.0-or-later
#pragma once

#include "lt_core.hpp"
#include "lt_config.hpp"
#include "lt_log.hpp"

#include <Eigen/Cholesky>
#include <Eigen/QR>
#include <memory>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace lt {

class RegressionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Estimate {
    double value = 0.0;
    double variance = 0.0;
};

// Point estimate + variance from irregular (time, value) samples
class Regressor {
public:
    virtual ~Regressor() = default;
    virtual Estimate predict(const VecX& times, const VecX& values,
                             double query, double sigma) const = 0;
};


// ============================================================
// GAUSSIAN PROCESS (universal kriging, fixed theta)
// ============================================================
// Inputs and outputs are normalized to zero mean / unit variance. Each
// sample gets the nugget (sigma / (|y| + sigma))^2, so small or noisy
// observations are trusted less as sigma grows.
class GaussianProcess : public Regressor {
public:
    GaussianProcess() = default;
    explicit GaussianProcess(const GPOptions& opt) : opt_(opt) {}

    const GPOptions& options() const { return opt_; }

    Estimate predict(const VecX& times, const VecX& values,
                     double query, double sigma) const override {
        const int n = (int)times.size();
        if (values.size() != n)
            throw std::invalid_argument("GaussianProcess: times and values differ in length");
        if (n == 0) throw RegressionError("GaussianProcess: no samples");

        // Normalization
        double x_mean = times.mean();
        double x_std = std::sqrt((times.array() - x_mean).square().mean());
        if (x_std == 0.0) x_std = 1.0;
        double y_mean = values.mean();
        double y_std = std::sqrt((values.array() - y_mean).square().mean());
        if (y_std == 0.0) y_std = 1.0;
        VecX xn = (times.array() - x_mean) / x_std;
        VecX yn = (values.array() - y_mean) / y_std;

        MatX F = basis(xn);
        const int p = (int)F.cols();
        if (n < p) throw RegressionError("GaussianProcess: least squares problem is undetermined");

        MatX R(n, n);
        for (int i = 0; i < n; ++i) {
            for (int j = 0; j < n; ++j) R(i, j) = corr(xn[i] - xn[j]);
            double nugget = sigma / (std::abs(values[i]) + sigma);
            R(i, i) = 1.0 + nugget * nugget;
        }

        Eigen::LLT<MatX> llt(R);
        if (llt.info() != Eigen::Success)
            throw RegressionError("GaussianProcess: correlation matrix is not positive definite");
        MatX C = llt.matrixL();
        auto L = C.triangularView<Eigen::Lower>();

        MatX Ft = L.solve(F);
        Eigen::HouseholderQR<MatX> qr(Ft);
        MatX Q = qr.householderQ() * MatX::Identity(n, p);
        MatX G = qr.matrixQR().topRows(p).triangularView<Eigen::Upper>();

        VecX g = G.diagonal().cwiseAbs();
        if (g.minCoeff() <= 1e-10 * std::max(g.maxCoeff(), 1.0))
            throw RegressionError("GaussianProcess: regression matrix is ill conditioned");

        VecX Yt = L.solve(yn);
        VecX beta = G.triangularView<Eigen::Upper>().solve(Q.transpose() * Yt);
        VecX rho = Yt - Ft * beta;
        double sigma2 = rho.squaredNorm() / n;
        VecX gamma = C.transpose().triangularView<Eigen::Upper>().solve(rho);

        // Prediction at query
        double xq = (query - x_mean) / x_std;
        VecX xqv = VecX::Constant(1, xq);
        VecX f = basis(xqv).row(0).transpose();
        VecX r(n);
        for (int i = 0; i < n; ++i) r[i] = corr(xq - xn[i]);

        double y = f.dot(beta) + r.dot(gamma);
        VecX rt = L.solve(r);
        VecX u = G.transpose().triangularView<Eigen::Lower>().solve(Ft.transpose() * rt - f);
        double mse = sigma2 * (1.0 - rt.squaredNorm() + u.squaredNorm());

        Estimate e;
        e.value = y_mean + y_std * y;
        e.variance = std::max(0.0, mse) * y_std * y_std;
        return e;
    }

private:
    GPOptions opt_;

    double corr(double d) const {
        const double theta = opt_.theta0;
        switch (opt_.corr) {
            case Correlation::ABSOLUTE_EXPONENTIAL:
                return std::exp(-theta * std::abs(d));
            case Correlation::SQUARED_EXPONENTIAL:
                return std::exp(-theta * d * d);
            case Correlation::CUBIC: {
                double x = std::min(theta * std::abs(d), 1.0);
                return 1.0 - 3.0 * x * x + 2.0 * x * x * x;
            }
        }
        return 0.0;
    }

    MatX basis(const VecX& x) const {
        const int p = (opt_.regr == Regression::CONSTANT) ? 1
                    : (opt_.regr == Regression::LINEAR)   ? 2 : 3;
        MatX F(x.size(), p);
        for (int i = 0; i < x.size(); ++i) {
            F(i, 0) = 1.0;
            if (p > 1) F(i, 1) = x[i];
            if (p > 2) F(i, 2) = x[i] * x[i];
        }
        return F;
    }
};


// ============================================================
// POSITION PREDICTOR
// ============================================================
struct Prediction {
    MatX pos;   // n0 x ndims, rows follow frame t0
    MatX mse;   // same shape, 0 where no extrapolation was done
};

class PositionPredictor {
public:
    explicit PositionPredictor(std::shared_ptr<const Regressor> reg) : reg_(std::move(reg)) {
        if (!reg_) throw std::invalid_argument("PositionPredictor needs a regressor");
    }

    // Expected positions at times()[i1] of the detections at times()[i0],
    // following working labels back through earlier frames.
    Prediction predict_positions(const DetectionTable& table, std::size_t i0, std::size_t i1,
                                 double sigma) const {
        const RowRange r0 = table.frame(i0);
        const int nd = table.ndims();
        Prediction out;
        out.pos = table.positions(r0);
        out.mse = MatX::Zero(r0.size(), nd);

        // Not enough global history yet
        if (i0 < 2) return out;

        const double t0 = table.times()[i0];
        const double t1 = table.times()[i1];

        std::unordered_map<Label, std::vector<std::size_t>> history;
        for (std::size_t k = r0.begin; k < r0.end; ++k) history[table.new_label(k)];
        for (std::size_t k = 0; k < r0.end; ++k) {
            auto it = history.find(table.new_label(k));
            if (it != history.end()) it->second.push_back(k);
        }

        const int n0 = (int)r0.size();
        #pragma omp parallel for schedule(dynamic) if(n0 > 64)
        for (int m = 0; m < n0; ++m) {
            const auto& rows = history.at(table.new_label(r0.begin + m));
            if (rows.size() < 3 || table.row(rows.back()).t != t0) continue;

            const int h = (int)rows.size();
            VecX times(h);
            MatX values(h, nd);
            for (int s = 0; s < h; ++s) {
                const Detection& d = table.row(rows[s]);
                times[s] = d.t;
                values.row(s) = d.pos.head(nd).transpose();
            }

            try {
                VecX pos(nd), mse(nd);
                for (int c = 0; c < nd; ++c) {
                    VecX col = values.col(c);
                    Estimate e = reg_->predict(times, col, t1, sigma);
                    pos[c] = e.value;
                    mse[c] = e.variance;
                }
                out.pos.row(m) = pos.transpose();
                out.mse.row(m) = mse.transpose();
            } catch (const RegressionError& err) {
                LT_LOG_DEBUG("label {}: keeping last position ({})",
                             table.new_label(r0.begin + m), err.what());
            }
        }
        return out;
    }

private:
    std::shared_ptr<const Regressor> reg_;
};

}  // namespace lt
