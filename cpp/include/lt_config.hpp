// laptrack C++ Core — tracker configuration
// Copyright (c) 2026 Nexellum d.o.o. — AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <variant>

namespace lt {

class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

using ConfigValue = std::variant<bool, std::int64_t, double, std::string>;
using ConfigMap   = std::map<std::string, ConfigValue>;


// ============================================================
// GAUSSIAN PROCESS OPTIONS (forwarded to the predictor)
// ============================================================
enum class Correlation : std::uint8_t { ABSOLUTE_EXPONENTIAL = 0, SQUARED_EXPONENTIAL = 1, CUBIC = 2 };
enum class Regression  : std::uint8_t { CONSTANT = 0, LINEAR = 1, QUADRATIC = 2 };

inline Correlation parse_correlation(const std::string& s) {
    if (s == "absolute_exponential") return Correlation::ABSOLUTE_EXPONENTIAL;
    if (s == "squared_exponential")  return Correlation::SQUARED_EXPONENTIAL;
    if (s == "cubic")                return Correlation::CUBIC;
    throw ConfigError("unknown GP correlation '" + s + "'");
}

inline Regression parse_regression(const std::string& s) {
    if (s == "constant")  return Regression::CONSTANT;
    if (s == "linear")    return Regression::LINEAR;
    if (s == "quadratic") return Regression::QUADRATIC;
    throw ConfigError("unknown GP regression '" + s + "'");
}

struct GPOptions {
    Correlation corr = Correlation::SQUARED_EXPONENTIAL;
    Regression  regr = Regression::QUADRATIC;
    double theta0 = 0.1;   // correlation length parameter, fixed (no ML fit)
};


// ============================================================
// TRACKER CONFIG
// ============================================================
struct TrackerConfig {
    double max_disp = 0.1;     // admissible displacement per unit time
    double window_gap = 10.0;  // largest time gap bridged by gap closing
    double sigma = 1.0;        // predictor noise scale (nugget)
    int ndims = 3;             // 2 -> (x, y), 3 -> (x, y, z)
    bool predict = false;      // link from predicted rather than raw positions
    GPOptions gp;

    void validate() const {
        if (!(max_disp > 0.0)) throw ConfigError("max_disp must be > 0");
        if (!(window_gap >= 0.0)) throw ConfigError("window_gap must be >= 0");
        if (!(sigma > 0.0)) throw ConfigError("sigma must be > 0");
        if (ndims != 2 && ndims != 3) throw ConfigError("ndims must be 2 or 3");
        if (!(gp.theta0 > 0.0)) throw ConfigError("gp_theta0 must be > 0");
    }

    // Keys not listed here are rejected. gp_* keys are the predictor options.
    static TrackerConfig from_map(const ConfigMap& params) {
        TrackerConfig cfg;
        for (const auto& [key, value] : params) {
            if      (key == "max_disp")   cfg.max_disp   = as_double(key, value);
            else if (key == "window_gap") cfg.window_gap = as_double(key, value);
            else if (key == "sigma")      cfg.sigma      = as_double(key, value);
            else if (key == "ndims")      cfg.ndims      = (int)as_int(key, value);
            else if (key == "predict")    cfg.predict    = as_bool(key, value);
            else if (key == "gp_corr")    cfg.gp.corr    = parse_correlation(as_string(key, value));
            else if (key == "gp_regr")    cfg.gp.regr    = parse_regression(as_string(key, value));
            else if (key == "gp_theta0")  cfg.gp.theta0  = as_double(key, value);
            else throw ConfigError("unknown tracker option '" + key + "'");
        }
        cfg.validate();
        return cfg;
    }

private:
    static double as_double(const std::string& key, const ConfigValue& v) {
        if (auto d = std::get_if<double>(&v)) return *d;
        if (auto i = std::get_if<std::int64_t>(&v)) return (double)*i;
        throw ConfigError("option '" + key + "' expects a number");
    }

    static std::int64_t as_int(const std::string& key, const ConfigValue& v) {
        if (auto i = std::get_if<std::int64_t>(&v)) return *i;
        throw ConfigError("option '" + key + "' expects an integer");
    }

    static bool as_bool(const std::string& key, const ConfigValue& v) {
        if (auto b = std::get_if<bool>(&v)) return *b;
        throw ConfigError("option '" + key + "' expects a boolean");
    }

    static std::string as_string(const std::string& key, const ConfigValue& v) {
        if (auto s = std::get_if<std::string>(&v)) return *s;
        throw ConfigError("option '" + key + "' expects a string");
    }
};

}  // namespace lt
