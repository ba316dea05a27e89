#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "sectoropt/core/errors.hpp"
#include "sectoropt/risk/ledoit_wolf_shrinkage.hpp"
#include "sectoropt/risk/risk_model_factory.hpp"
#include "sectoropt/risk/sample_covariance.hpp"
#include <limits>
#include <random>

using namespace sectoropt;
using namespace sectoropt::risk;
using Catch::Matchers::WithinAbs;

namespace
{
    double compute_condition_number(const Eigen::MatrixXd &matrix)
    {
        Eigen::JacobiSVD<Eigen::MatrixXd> svd(matrix);
        double max_sv = svd.singularValues()(0);
        double min_sv = svd.singularValues()(svd.singularValues().size() - 1);
        return max_sv / min_sv;
    }
}

// Test fixture for shared test data
class RiskModelTestFixture
{
protected:
    // Simple 2x3 return matrix for hand-checked values
    Eigen::MatrixXd returns_2x3_;

    // Larger realistic return matrix (252 days, 10 assets)
    Eigen::MatrixXd returns_252x10_;

    RiskModelTestFixture()
    {
        returns_2x3_ = Eigen::MatrixXd(2, 3);
        returns_2x3_ << 0.01, 0.02, -0.01,
            0.02, -0.01, 0.01;

        returns_252x10_ = generate_synthetic_returns(252, 10, 42);
    }

    static Eigen::MatrixXd generate_synthetic_returns(int n_obs, int n_assets, unsigned seed)
    {
        std::mt19937 gen(seed);
        std::normal_distribution<double> market(0.0005, 0.01);
        std::normal_distribution<double> idio(0.0, 0.015);

        Eigen::MatrixXd returns(n_obs, n_assets);
        for (int t = 0; t < n_obs; ++t)
        {
            double m = market(gen);
            for (int j = 0; j < n_assets; ++j)
            {
                // One common factor so the sample correlations are non-trivial
                returns(t, j) = (0.5 + 0.1 * j) * m + idio(gen);
            }
        }
        return returns;
    }
};

TEST_CASE_METHOD(RiskModelTestFixture, "SampleCovariance basic functionality", "[RiskModel][SampleCovariance]")
{
    SECTION("Construct with default parameters")
    {
        SampleCovariance cov;
        REQUIRE(cov.uses_bias_correction() == true);
        REQUIRE(cov.get_name() == "SampleCovariance");
    }

    SECTION("Hand-computed values")
    {
        SampleCovariance cov(true);
        auto result = cov.estimate_covariance(returns_2x3_);

        REQUIRE(result.rows() == 3);
        REQUIRE(result.cols() == 3);
        REQUIRE_THAT(result(0, 0), WithinAbs(0.00005, 1e-15));
        REQUIRE_THAT(result(0, 1), WithinAbs(-0.00015, 1e-15));
        REQUIRE_THAT(result(1, 0), WithinAbs(-0.00015, 1e-15));
        REQUIRE_THAT(result(2, 2), WithinAbs(0.0002, 1e-15));
    }

    SECTION("Bias correction vs no bias correction")
    {
        SampleCovariance cov_biased(false);
        SampleCovariance cov_unbiased(true);

        auto biased = cov_biased.estimate_covariance(returns_252x10_);
        auto unbiased = cov_unbiased.estimate_covariance(returns_252x10_);

        double expected_ratio = 252.0 / 251.0;
        REQUIRE_THAT(unbiased(3, 3) / biased(3, 3), WithinAbs(expected_ratio, 1e-12));
        REQUIRE_THAT(unbiased(1, 4) / biased(1, 4), WithinAbs(expected_ratio, 1e-12));
    }
}

TEST_CASE_METHOD(RiskModelTestFixture, "Risk model input validation", "[RiskModel]")
{
    SampleCovariance cov;
    LedoitWolfShrinkage lw;

    SECTION("No asset columns")
    {
        Eigen::MatrixXd empty(5, 0);
        REQUIRE_THROWS_AS(cov.estimate_covariance(empty), std::invalid_argument);
    }

    SECTION("Single observation is insufficient data")
    {
        Eigen::MatrixXd single_obs(1, 3);
        single_obs << 0.01, 0.02, 0.03;
        REQUIRE_THROWS_AS(cov.estimate_covariance(single_obs), InsufficientDataError);
        REQUIRE_THROWS_AS(lw.estimate_covariance(single_obs), InsufficientDataError);
    }

    SECTION("Non-finite values")
    {
        Eigen::MatrixXd bad = returns_2x3_;
        bad(1, 2) = std::numeric_limits<double>::quiet_NaN();
        REQUIRE_THROWS_AS(lw.estimate_covariance(bad), std::invalid_argument);
    }
}

TEST_CASE_METHOD(RiskModelTestFixture, "LedoitWolfShrinkage basic functionality", "[RiskModel][LedoitWolfShrinkage]")
{
    SECTION("Result is symmetric and positive semi-definite")
    {
        LedoitWolfShrinkage lw;
        auto result = lw.estimate_covariance(returns_252x10_);

        REQUIRE(result.rows() == 10);
        REQUIRE_THAT((result - result.transpose()).norm(), WithinAbs(0.0, 1e-14));

        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(result);
        REQUIRE(solver.eigenvalues().minCoeff() >= -1e-12);
    }

    SECTION("Shrinkage intensity in valid range")
    {
        LedoitWolfShrinkage lw;
        lw.estimate_covariance(returns_252x10_);

        double shrinkage = lw.get_shrinkage_intensity();
        REQUIRE(shrinkage >= 0.0);
        REQUIRE(shrinkage <= 1.0);
    }

    SECTION("Trace of the sample covariance is preserved")
    {
        LedoitWolfShrinkage lw;
        auto shrunk = lw.estimate_covariance(returns_252x10_);
        auto sample = SampleCovariance(false).estimate_covariance(returns_252x10_);

        REQUIRE_THAT(shrunk.trace(), WithinAbs(sample.trace(), 1e-12));
    }

    SECTION("Fixed shrinkage override")
    {
        LedoitWolfShrinkage lw(0.5);
        auto result = lw.estimate_covariance(returns_252x10_);
        auto sample = SampleCovariance(false).estimate_covariance(returns_252x10_);
        double mu = sample.trace() / 10.0;

        REQUIRE_THAT(lw.get_shrinkage_intensity(), WithinAbs(0.5, 1e-15));
        REQUIRE_THAT(result(2, 5), WithinAbs(0.5 * sample(2, 5), 1e-15));
        REQUIRE_THAT(result(4, 4), WithinAbs(0.5 * sample(4, 4) + 0.5 * mu, 1e-15));
    }

    SECTION("Zero override reproduces the biased sample covariance")
    {
        LedoitWolfShrinkage lw(0.0);
        auto result = lw.estimate_covariance(returns_252x10_);
        auto sample = SampleCovariance(false).estimate_covariance(returns_252x10_);

        REQUIRE((result - sample).cwiseAbs().maxCoeff() < 1e-15);
    }

    SECTION("Invalid override throws")
    {
        REQUIRE_THROWS_AS(LedoitWolfShrinkage(1.5), std::invalid_argument);
        REQUIRE_THROWS_AS(LedoitWolfShrinkage(-0.5), std::invalid_argument);
    }

    SECTION("Single asset is not shrunk")
    {
        LedoitWolfShrinkage lw;
        auto result = lw.estimate_covariance(returns_252x10_.leftCols(1));
        REQUIRE(lw.get_shrinkage_intensity() == 0.0);
        REQUIRE(result.rows() == 1);
    }

    SECTION("Shrinkage improves conditioning")
    {
        // Small sample: T=20, N=10
        Eigen::MatrixXd small_sample = returns_252x10_.topRows(20);

        auto sample = SampleCovariance().estimate_covariance(small_sample);

        LedoitWolfShrinkage lw;
        auto shrunk = lw.estimate_covariance(small_sample);

        REQUIRE(lw.get_shrinkage_intensity() > 0.0);
        REQUIRE(compute_condition_number(shrunk) < compute_condition_number(sample));
    }
}

TEST_CASE("LedoitWolfShrinkage reference values", "[RiskModel][LedoitWolfShrinkage]")
{
    // Expected values from scikit-learn's LedoitWolf on the same matrix
    Eigen::MatrixXd returns(8, 4);
    returns << 0.012, -0.004, 0.007, 0.001,
        -0.008, 0.010, -0.002, 0.004,
        0.005, 0.003, 0.011, -0.006,
        0.015, -0.009, 0.004, 0.002,
        -0.011, 0.006, -0.007, 0.009,
        0.002, 0.001, 0.003, -0.003,
        0.009, -0.012, 0.008, 0.005,
        -0.004, 0.007, -0.010, -0.001;

    LedoitWolfShrinkage lw;
    Eigen::MatrixXd cov = lw.estimate_covariance(returns);

    REQUIRE_THAT(lw.get_shrinkage_intensity(), WithinAbs(0.1905929308501784, 1e-12));
    REQUIRE_THAT(cov(0, 1), WithinAbs(-4.583267529060865e-05, 1e-15));
    REQUIRE_THAT(cov(2, 2), WithinAbs(4.8800073270797016e-05, 1e-15));
    REQUIRE_THAT(cov(1, 3), WithinAbs(-1.8970478183198947e-06, 1e-15));
    REQUIRE_THAT(cov.trace() / 4.0, WithinAbs(5.033984375e-05, 1e-15));
}

TEST_CASE_METHOD(RiskModelTestFixture, "Correlation estimation", "[RiskModel]")
{
    SampleCovariance cov;
    auto corr = cov.estimate_correlation(returns_252x10_);

    for (Eigen::Index i = 0; i < corr.rows(); ++i)
    {
        REQUIRE_THAT(corr(i, i), WithinAbs(1.0, 1e-12));
        for (Eigen::Index j = 0; j < corr.cols(); ++j)
        {
            REQUIRE(corr(i, j) >= -1.0);
            REQUIRE(corr(i, j) <= 1.0);
        }
    }
}

TEST_CASE("RiskModelFactory", "[RiskModel][Factory]")
{
    SECTION("Default configuration builds Ledoit-Wolf")
    {
        auto model = RiskModelFactory::create(RiskModelConfig{});
        REQUIRE(model->get_name() == "LedoitWolfShrinkage");
    }

    SECTION("Type names are case-insensitive")
    {
        RiskModelConfig config;
        config.type = "Sample";
        config.bias_correction = false;

        auto model = RiskModelFactory::create(config);
        auto *sample = dynamic_cast<SampleCovariance *>(model.get());
        REQUIRE(sample != nullptr);
        REQUIRE_FALSE(sample->uses_bias_correction());
    }

    SECTION("Parameters from JSON")
    {
        auto model = RiskModelFactory::create("shrinkage", nlohmann::json{{"shrinkage_intensity", 0.3}});
        auto *lw = dynamic_cast<LedoitWolfShrinkage *>(model.get());
        REQUIRE(lw != nullptr);
        REQUIRE_THAT(lw->get_shrinkage_override(), WithinAbs(0.3, 1e-15));
    }

    SECTION("Unknown type throws")
    {
        RiskModelConfig config;
        config.type = "ewma";
        REQUIRE_THROWS_AS(RiskModelFactory::create(config), std::invalid_argument);
    }

    SECTION("Configuration round trip")
    {
        RiskModelConfig config;
        config.type = "sample";
        config.bias_correction = false;

        auto restored = RiskModelConfig::from_json(config.to_json());
        REQUIRE(restored.type == "sample");
        REQUIRE_FALSE(restored.bias_correction);
        REQUIRE(restored.shrinkage_intensity == -1.0);
    }
}
