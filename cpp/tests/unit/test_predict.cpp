#include <gtest/gtest.h>

#include "lt_predict.hpp"

#include <memory>
#include <vector>

using namespace lt;

namespace {

VecX vec(std::initializer_list<double> v) {
    VecX out(v.size());
    int i = 0;
    for (double x : v) out[i++] = x;
    return out;
}

class ThrowingRegressor : public Regressor {
public:
    Estimate predict(const VecX&, const VecX&, double, double) const override {
        throw RegressionError("singular");
    }
};

}  // namespace

class GaussianProcessTest : public ::testing::Test {
protected:
    void SetUp() override { Log::set_verbose(false); }
    GaussianProcess gp;
};

TEST_F(GaussianProcessTest, DefaultOptions) {
    EXPECT_EQ(gp.options().corr, Correlation::SQUARED_EXPONENTIAL);
    EXPECT_EQ(gp.options().regr, Regression::QUADRATIC);
    EXPECT_DOUBLE_EQ(gp.options().theta0, 0.1);
}

TEST_F(GaussianProcessTest, ExtrapolatesLinearMotion) {
    VecX t = vec({0, 1, 2, 3, 4, 5});
    VecX x = 2.0 * t.array() + 1.0;
    Estimate e = gp.predict(t, x, 6.0, 1.0);
    EXPECT_NEAR(e.value, 13.0, 1e-6);
    EXPECT_GE(e.variance, 0.0);
}

TEST_F(GaussianProcessTest, ExtrapolatesQuadraticMotion) {
    VecX t = vec({0, 1, 2, 4});
    VecX x = t.array().square();
    Estimate e = gp.predict(t, x, 5.0, 1.0);
    EXPECT_NEAR(e.value, 25.0, 1e-6);
}

TEST_F(GaussianProcessTest, ConstantSeries) {
    VecX t = vec({0, 1, 2});
    VecX x = vec({3.5, 3.5, 3.5});
    Estimate e = gp.predict(t, x, 3.0, 1.0);
    EXPECT_NEAR(e.value, 3.5, 1e-9);
}

TEST_F(GaussianProcessTest, VarianceGrowsAwayFromSamples) {
    GPOptions opt;
    opt.regr = Regression::CONSTANT;
    opt.theta0 = 1.0;
    GaussianProcess g(opt);
    VecX t = vec({0, 1, 2, 3});
    VecX x = vec({0.0, 1.0, 0.5, 1.5});
    Estimate near = g.predict(t, x, 3.0, 1.0);
    Estimate far = g.predict(t, x, 30.0, 1.0);
    EXPECT_LT(near.variance, far.variance);
}

TEST_F(GaussianProcessTest, UnderdeterminedThrows) {
    VecX t = vec({0, 1});
    VecX x = vec({0, 1});
    EXPECT_THROW(gp.predict(t, x, 2.0, 1.0), RegressionError);
}

TEST_F(GaussianProcessTest, LengthMismatchThrows) {
    EXPECT_THROW(gp.predict(vec({0, 1, 2}), vec({0, 1}), 3.0, 1.0), std::invalid_argument);
}

TEST_F(GaussianProcessTest, OtherCorrelations) {
    VecX t = vec({0, 1, 2, 3});
    VecX x = 0.5 * t.array() - 2.0;
    for (Correlation c : {Correlation::ABSOLUTE_EXPONENTIAL, Correlation::CUBIC}) {
        GPOptions opt;
        opt.corr = c;
        opt.regr = Regression::LINEAR;
        GaussianProcess g(opt);
        EXPECT_NEAR(g.predict(t, x, 4.0, 1.0).value, 0.0, 1e-6);
    }
}


class PositionPredictorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Log::set_verbose(false);
        // label 0 moves +1 in x per frame, label 1 is static,
        // label 2 appears at t = 3
        std::vector<Detection> rows;
        for (int t = 0; t <= 4; ++t) {
            rows.push_back({(double)t, 0, Vec3((double)t, 0.0, 0.0), 1.0});
            rows.push_back({(double)t, 1, Vec3(50.0, 50.0, 0.0), 1.0});
        }
        rows.push_back({3.0, 2, Vec3(20.0, 0.0, 0.0), 1.0});
        rows.push_back({4.0, 2, Vec3(21.0, 0.0, 0.0), 1.0});
        table = DetectionTable(rows, 2, false);
    }

    DetectionTable table;
    PositionPredictor predictor{std::make_shared<GaussianProcess>()};
};

TEST_F(PositionPredictorTest, FirstTwoFramesUseRawPositions) {
    Prediction p = predictor.predict_positions(table, 1, 2, 1.0);
    ASSERT_EQ(p.pos.rows(), 2);
    EXPECT_DOUBLE_EQ(p.pos(0, 0), 1.0);
    EXPECT_TRUE(p.mse.isZero());
}

TEST_F(PositionPredictorTest, ExtrapolatesLongHistories) {
    Prediction p = predictor.predict_positions(table, 3, 4, 1.0);
    ASSERT_EQ(p.pos.rows(), 3);
    ASSERT_EQ(p.pos.cols(), 2);
    // Frame t = 3 rows: labels 0, 1, 2
    EXPECT_NEAR(p.pos(0, 0), 4.0, 1e-6);
    EXPECT_NEAR(p.pos(0, 1), 0.0, 1e-9);
    EXPECT_NEAR(p.pos(1, 0), 50.0, 1e-9);
    EXPECT_NEAR(p.pos(1, 1), 50.0, 1e-9);
}

TEST_F(PositionPredictorTest, ShortHistoryKeepsLastPosition) {
    Prediction p = predictor.predict_positions(table, 3, 4, 1.0);
    EXPECT_DOUBLE_EQ(p.pos(2, 0), 20.0);
    EXPECT_DOUBLE_EQ(p.mse(2, 0), 0.0);
    EXPECT_DOUBLE_EQ(p.mse(2, 1), 0.0);
}

TEST_F(PositionPredictorTest, FollowsWorkingLabels) {
    // Relabel label 2 at t = 3 into label 0's history: label 0 now ends at
    // t = 3 with x = 20, label 2 owns x = 3
    RowRange f3 = table.frame(3);
    table.set_new_label(f3.begin, 2);
    table.set_new_label(f3.begin + 2, 0);
    Prediction p = predictor.predict_positions(table, 3, 4, 1.0);
    EXPECT_DOUBLE_EQ(p.pos(0, 0), 3.0);   // short history for working label 2
    EXPECT_GT(p.pos(2, 0), 4.0);          // label 0 jumped to x = 20
}

TEST_F(PositionPredictorTest, RegressionFailureFallsBack) {
    PositionPredictor failing(std::make_shared<ThrowingRegressor>());
    Prediction p = failing.predict_positions(table, 3, 4, 1.0);
    EXPECT_DOUBLE_EQ(p.pos(0, 0), 3.0);
    EXPECT_TRUE(p.mse.isZero());
}

TEST(PositionPredictor, NullRegressorThrows) {
    EXPECT_THROW(PositionPredictor(nullptr), std::invalid_argument);
}
