// laptrack C++ Core — Python Bindings
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>
#include "lt_tracker.hpp"

#include <cmath>
#include <string>

namespace py = pybind11;

namespace {

lt::ConfigMap to_config_map(const py::dict& params) {
    lt::ConfigMap out;
    for (auto item : params) {
        std::string key = py::str(item.first);
        py::handle v = item.second;
        // bool first: Python bools are ints too
        if (py::isinstance<py::bool_>(v))       out[key] = v.cast<bool>();
        else if (py::isinstance<py::int_>(v))   out[key] = v.cast<std::int64_t>();
        else if (py::isinstance<py::float_>(v)) out[key] = v.cast<double>();
        else if (py::isinstance<py::str>(v))    out[key] = v.cast<std::string>();
        else throw lt::ConfigError("option '" + key + "' has an unsupported type");
    }
    return out;
}

lt::DistanceFn distance_by_name(const std::string& name) {
    if (name == "square") return lt::square;
    if (name == "abs") return [](double x) { return std::abs(x); };
    throw lt::ConfigError("unknown distance function '" + name + "'");
}

const char* corr_name(lt::Correlation c) {
    switch (c) {
        case lt::Correlation::ABSOLUTE_EXPONENTIAL: return "absolute_exponential";
        case lt::Correlation::SQUARED_EXPONENTIAL:  return "squared_exponential";
        case lt::Correlation::CUBIC:                return "cubic";
    }
    return "unknown";
}

const char* regr_name(lt::Regression r) {
    switch (r) {
        case lt::Regression::CONSTANT:  return "constant";
        case lt::Regression::LINEAR:    return "linear";
        case lt::Regression::QUADRATIC: return "quadratic";
    }
    return "unknown";
}

}  // namespace

PYBIND11_MODULE(_lt_core, m) {
    m.doc() = "laptrack C++ Core — LAP particle tracking with gap closing";

    py::register_exception<lt::ConfigError>(m, "ConfigError", PyExc_ValueError);

    // TrackerConfig
    py::class_<lt::TrackerConfig>(m, "TrackerConfig")
        .def(py::init<>())
        .def(py::init([](const py::dict& params) {
            return lt::TrackerConfig::from_map(to_config_map(params));
        }), py::arg("params"))
        .def_readwrite("max_disp", &lt::TrackerConfig::max_disp)
        .def_readwrite("window_gap", &lt::TrackerConfig::window_gap)
        .def_readwrite("sigma", &lt::TrackerConfig::sigma)
        .def_readwrite("ndims", &lt::TrackerConfig::ndims)
        .def_readwrite("predict", &lt::TrackerConfig::predict)
        .def_property("gp_corr",
            [](const lt::TrackerConfig& c) { return std::string(corr_name(c.gp.corr)); },
            [](lt::TrackerConfig& c, const std::string& s) { c.gp.corr = lt::parse_correlation(s); })
        .def_property("gp_regr",
            [](const lt::TrackerConfig& c) { return std::string(regr_name(c.gp.regr)); },
            [](lt::TrackerConfig& c, const std::string& s) { c.gp.regr = lt::parse_regression(s); })
        .def_property("gp_theta0",
            [](const lt::TrackerConfig& c) { return c.gp.theta0; },
            [](lt::TrackerConfig& c, double v) { c.gp.theta0 = v; });

    // TrackStats
    py::class_<lt::TrackStats>(m, "TrackStats")
        .def_readonly("total_links", &lt::TrackStats::total_links)
        .def_readonly("total_births", &lt::TrackStats::total_births)
        .def_readonly("total_gap_closures", &lt::TrackStats::total_gap_closures)
        .def_readonly("infeasible_pairs", &lt::TrackStats::infeasible_pairs);

    // LAPTracker
    py::class_<lt::LAPTracker>(m, "LAPTracker")
        .def(py::init([](py::array_t<double, py::array::c_style | py::array::forcecast> t,
                         py::array_t<std::int64_t, py::array::c_style | py::array::forcecast> label,
                         const Eigen::MatrixXd& coords,
                         py::object intensity,
                         py::object params,
                         const std::string& dist_function,
                         bool verbose) {
            auto tb = t.request();
            auto lb = label.request();
            if (tb.ndim != 1 || lb.ndim != 1)
                throw std::runtime_error("t and label must be 1-D arrays");

            std::vector<double> tv((const double*)tb.ptr, (const double*)tb.ptr + tb.shape[0]);
            std::vector<lt::Label> lv((const std::int64_t*)lb.ptr,
                                      (const std::int64_t*)lb.ptr + lb.shape[0]);
            std::vector<double> iv;
            if (!intensity.is_none())
                iv = intensity.cast<std::vector<double>>();

            lt::TrackerConfig cfg;
            if (!params.is_none())
                cfg = lt::TrackerConfig::from_map(to_config_map(params.cast<py::dict>()));
            else
                cfg.ndims = (int)coords.cols();

            auto table = lt::DetectionTable::from_columns(tv, lv, coords, iv);
            return std::make_unique<lt::LAPTracker>(std::move(table), cfg,
                                                    distance_by_name(dist_function), verbose);
        }), py::arg("t"), py::arg("label"), py::arg("coords"),
            py::arg("intensity") = py::none(), py::arg("params") = py::none(),
            py::arg("dist_function") = "square", py::arg("verbose") = true)

        .def_property_readonly("config", &lt::LAPTracker::config)
        .def_property_readonly("stats", &lt::LAPTracker::stats)
        .def_property_readonly("times", &lt::LAPTracker::times)
        .def_property_readonly("labels", &lt::LAPTracker::labels)

        .def("get_track", &lt::LAPTracker::get_track, py::arg("predict") = py::none(),
             "Link every consecutive pair of frames and promote the new labels.")
        .def("position_track", &lt::LAPTracker::position_track, py::arg("t0"), py::arg("t1"))
        .def("predict_positions", [](const lt::LAPTracker& self, double t0, double t1) {
            auto p = self.predict_positions(t0, t1);
            return py::make_tuple(p.pos, p.mse);
        }, py::arg("t0"), py::arg("t1"), "Returns (positions[n0, ndims], mse[n0, ndims])")
        .def("close_merge_split", &lt::LAPTracker::close_merge_split,
             py::arg("return_mat") = false)
        .def("remove_shorts", &lt::LAPTracker::remove_shorts, py::arg("min_length") = 3)
        .def("reverse_track", &lt::LAPTracker::reverse_track)

        .def("get_segment", [](const lt::LAPTracker& self, lt::Label lbl) {
            auto seg = self.get_segment(lbl);
            const auto& table = self.table();
            py::array_t<double> times((py::ssize_t)seg.size());
            auto tb = times.mutable_unchecked<1>();
            for (std::size_t k = 0; k < seg.size(); ++k) tb(k) = table.row(seg.rows[k]).t;
            return py::make_tuple(times, Eigen::MatrixXd(table.positions(seg.rows)));
        }, py::arg("label"), "Returns (times[n], coords[n, ndims]) of one label")

        // Bulk table extraction
        .def("to_arrays", [](const lt::LAPTracker& self) {
            const auto& table = self.table();
            const py::ssize_t n = (py::ssize_t)table.size();
            py::array_t<double> t(n), intensity(n);
            py::array_t<std::int64_t> label(n);
            auto tb = t.mutable_unchecked<1>();
            auto ib = intensity.mutable_unchecked<1>();
            auto lb = label.mutable_unchecked<1>();
            for (py::ssize_t i = 0; i < n; ++i) {
                const auto& d = table.row(i);
                tb(i) = d.t;
                lb(i) = d.label;
                ib(i) = d.intensity;
            }
            lt::RowRange all{0, table.size()};
            return py::make_tuple(t, label, Eigen::MatrixXd(table.positions(all)), intensity);
        }, "Returns (t[N], label[N], coords[N, ndims], intensity[N]) ordered by (t, label)");

    m.attr("__version__") = "1.0.0";
}
