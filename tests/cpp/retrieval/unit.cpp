// Unit tests for the optimal estimation retrieval: finite difference
// Jacobian, the iteration state machine, and the diagnostics

#include "../testing.h"

#include <common/errors.h>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

TEST_CASE("Jacobian")
{
    const oem::Axis x_axis { genNames("x", 2) };
    const oem::Axis y_axis { genNames("y", 2) };
    const oem::NamedVector x { x_axis, Eigen::Vector2d { 2.0, -3.0 } };
    const Eigen::Vector2d x_err { 1.0, 2.0 };
    const oem::ForwardModel identity { identityModel(y_axis) };
    const oem::NamedVector y { oem::callForwardModel(identity, x, y_axis) };

    SECTION("Identity, additive")
    {
        for (const double factor : { 1e-3, 0.1, 1.0 }) {
            const oem::JacobianEstimator estimator {
                x_axis,
                {},
                y_axis,
                x_err,
                oem::UniformDisturbance { factor },
                oem::DisturbanceMode::additive,
                identity
            };
            const auto [K_x, K_b] { estimator.compute(x, y) };
            CHECK(K_x.rows() == y_axis);
            CHECK(K_x.cols() == x_axis);
            CHECK(K_b.values().size() == 0);
            CHECK(K_x.values().isApprox(Eigen::Matrix2d::Identity(), 1e-9));
        }
    }

    SECTION("Identity, multiplicative")
    {
        const oem::JacobianEstimator estimator {
            x_axis,
            {},
            y_axis,
            x_err,
            oem::UniformDisturbance { 1.1 },
            oem::DisturbanceMode::multiplicative,
            identity
        };
        const auto [K_x, K_b] { estimator.compute(x, y) };
        CHECK(K_x.values().isApprox(Eigen::Matrix2d::Identity(), 1e-9));
        // Multiplicative disturbance of 0 is undefined
        const oem::NamedVector x_zero { x_axis, Eigen::Vector2d { 0.0, 1.0 } };
        const oem::NamedVector y_zero { oem::callForwardModel(
          identity, x_zero, y_axis) };
        CHECK_THROWS_AS(estimator.compute(x_zero, y_zero),
                        oem::ConfigurationError);
    }

    SECTION("State and parameters")
    {
        // y = 3 x + 2 b
        const oem::Axis b_axis { std::vector<std::string> { "b" } };
        const oem::Axis y1_axis { std::vector<std::string> { "y" } };
        const oem::ForwardModel model { linearModel(
          y1_axis, Eigen::RowVector2d { 3.0, 2.0 }) };
        const oem::NamedVector xb {
            { "x", "b" },
            Eigen::Vector2d { 1.0, 0.5 }
        };
        const oem::JacobianEstimator estimator {
            oem::Axis { std::vector<std::string> { "x" } },
            b_axis,
            y1_axis,
            Eigen::Vector2d { 1.0, 0.1 },
            oem::UniformDisturbance { 0.1 },
            oem::DisturbanceMode::additive,
            model
        };
        const auto [K_x, K_b] { estimator.compute(
          xb, oem::callForwardModel(model, xb, y1_axis)) };
        CHECK(K_b.cols() == b_axis);
        CHECK_THAT(K_x(0, 0), WithinRel(3.0, 1e-9));
        CHECK_THAT(K_b(0, 0), WithinRel(2.0, 1e-9));
    }

    SECTION("Disturbance per variable")
    {
        const oem::JacobianEstimator estimator {
            x_axis,
            {},
            y_axis,
            x_err,
            oem::PerVariableDisturbance { { { "x0", 0.01 }, { "x1", 0.5 } } },
            oem::DisturbanceMode::additive,
            identity
        };
        CHECK(estimator.getFactors()(1) == 0.5);
        const auto [K_x, K_b] { estimator.compute(x, y) };
        CHECK(K_x.values().isApprox(Eigen::Matrix2d::Identity(), 1e-9));
        // Each name exactly once
        CHECK_THROWS_AS(
          oem::JacobianEstimator(
            x_axis,
            {},
            y_axis,
            x_err,
            oem::PerVariableDisturbance { { { "x0", 0.1 } } },
            oem::DisturbanceMode::additive,
            identity),
          oem::ConfigurationError);
        CHECK_THROWS_AS(
          oem::JacobianEstimator(
            x_axis,
            {},
            y_axis,
            x_err,
            oem::PerVariableDisturbance {
              { { "x0", 0.1 }, { "x1", 0.1 }, { "x2", 0.1 } } },
            oem::DisturbanceMode::additive,
            identity),
          oem::ConfigurationError);
    }

    SECTION("Zero step")
    {
        const oem::JacobianEstimator estimator {
            x_axis,
            {},
            y_axis,
            x_err,
            oem::UniformDisturbance { 0.0 },
            oem::DisturbanceMode::additive,
            identity
        };
        CHECK_THROWS_AS(estimator.compute(x, y), oem::ConfigurationError);
    }

    SECTION("Non-finite derivatives")
    {
        // The model breaks down for x0 > 2.5
        const oem::ForwardModel model { [&y_axis](const oem::NamedVector& xb) {
            Eigen::VectorXd y_vals = xb.values();
            if (xb(0) > 2.5) {
                y_vals.setConstant(oem::fill::nan);
            }
            return oem::NamedVector { y_axis, y_vals };
        } };
        const oem::JacobianEstimator estimator {
            x_axis,
            {},
            y_axis,
            x_err,
            oem::UniformDisturbance { 1.0 },
            oem::DisturbanceMode::additive,
            model
        };
        const auto [K_x, K_b] { estimator.compute(x, y) };
        CHECK(K_x(0, 0) == 0.0);
        CHECK(K_x(1, 0) == 0.0);
        CHECK_THAT(K_x(1, 1), WithinRel(1.0, 1e-9));
    }

    SECTION("Misnamed model output")
    {
        const oem::ForwardModel model { [](const oem::NamedVector& xb) {
            return oem::NamedVector { genNames("z", 2), xb.values() };
        } };
        CHECK_THROWS_AS(oem::callForwardModel(model, x, y_axis),
                        std::invalid_argument);
    }
}

TEST_CASE("retrieval")
{
    const ScalarProblem p {};

    SECTION("Scalar problem")
    {
        oem::OptimalEstimation oe {
            p.x_a, p.S_a, p.y_obs, p.S_y, identityModel(p.y_axis)
        };
        CHECK(oe.status() == oem::RetrievalStatus::initialized);
        REQUIRE(oe.run(10));
        CHECK(oe.status() == oem::RetrievalStatus::converged);
        const oem::RetrievalResult& result { oe.result() };
        CHECK(result.converged);
        // One iteration to reach the solution, one to meet the
        // criterion and one to confirm it.
        CHECK(result.conv_i == 2);
        CHECK(oe.iterations().size() == 3);
        CHECK(oe.stateIterations().size() == 4);
        CHECK(oe.measurementIterations().size() == 4);
        CHECK_THAT(result.x_op.at("x"), WithinRel(2.0 / 1.01, 1e-9));
        CHECK_THAT(result.y_op.at("y"), WithinRel(2.0 / 1.01, 1e-9));
        CHECK_THAT(result.dgf, WithinRel(1.0 / 1.01, 1e-9));
        CHECK_THAT(result.dgf_x.at("x"), WithinRel(1.0 / 1.01, 1e-9));
        CHECK_THAT(result.S_op(0, 0), WithinRel(1.0 / 101.0, 1e-9));
        CHECK_THAT(result.x_op_err(0),
                   WithinRel(std::sqrt(1.0 / 101.0), 1e-9));
        CHECK_THAT(result.S_Ep(0, 0), WithinRel(0.01, 1e-12));
        // Shannon information content -1/2 ln(1 - dgf)
        CHECK_THAT(oe.iterations().back().H,
                   WithinRel(0.5 * std::log(101.0), 1e-9));
    }

    SECTION("Linear problem")
    {
        Eigen::MatrixXd H(3, 2);
        H << 1.0, 0.5, 0.2, 1.0, 1.0, 1.0;
        const oem::Axis x_axis { genNames("x", 2) };
        const oem::Axis y_axis { genNames("y", 3) };
        Eigen::Matrix2d S_a_vals {};
        S_a_vals << 0.5, 0.1, 0.1, 2.0;
        const Eigen::Vector2d x_a_vals { 1.0, 2.0 };
        const Eigen::Vector3d y_obs_vals { 2.1, 3.0, 3.9 };
        const Eigen::Matrix3d S_y_vals =
          Eigen::Vector3d { 0.01, 0.02, 0.04 }.asDiagonal();
        oem::OptimalEstimation oe { { x_axis, x_a_vals },
                                    { x_axis, S_a_vals },
                                    { y_axis, y_obs_vals },
                                    { y_axis, S_y_vals },
                                    linearModel(y_axis, H) };
        REQUIRE(oe.run(10));
        CHECK(oe.result().conv_i == 2);

        // Bayesian solution of a linear problem
        const Eigen::MatrixXd gain =
          S_a_vals * H.transpose()
          * (H * S_a_vals * H.transpose() + Eigen::MatrixXd(S_y_vals))
              .inverse();
        const Eigen::VectorXd x_expected =
          x_a_vals + gain * (y_obs_vals - H * x_a_vals);
        const Eigen::MatrixXd S_expected = S_a_vals - gain * H * S_a_vals;
        const oem::RetrievalResult& result { oe.result() };
        CHECK(result.x_op.values().isApprox(x_expected, 1e-8));
        CHECK(result.S_op.values().isApprox(S_expected, 1e-8));

        SECTION("Posterior covariance is symmetric and positive definite")
        {
            const Eigen::MatrixXd& S_op { result.S_op.values() };
            CHECK(S_op.isApprox(S_op.transpose(), 1e-10));
            const Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen {
                S_op
            };
            CHECK(eigen.eigenvalues().minCoeff() > -1e-5);
        }

        SECTION("Degrees of freedom do not depend on the order of names")
        {
            const oem::Axis x_swapped {
                std::vector<std::string> { "x1", "x0" }
            };
            const Eigen::PermutationMatrix<2> P { Eigen::Vector2i { 1, 0 } };
            const Eigen::Matrix2d S_a_swapped = P * S_a_vals * P.transpose();
            const Eigen::MatrixXd H_swapped = H * P.transpose();
            const oem::ForwardModel model { [&](const oem::NamedVector& xb) {
                return oem::NamedVector { y_axis, H_swapped * xb.values() };
            } };
            oem::OptimalEstimation oe_swapped { { x_swapped, P * x_a_vals },
                                                { x_swapped, S_a_swapped },
                                                { y_axis, y_obs_vals },
                                                { y_axis, S_y_vals },
                                                model };
            REQUIRE(oe_swapped.run(10));
            CHECK_THAT(oe_swapped.result().dgf,
                       WithinRel(result.dgf, 1e-10));
            CHECK_THAT(oe_swapped.result().x_op.at("x0"),
                       WithinRel(result.x_op.at("x0"), 1e-10));
        }

        SECTION("Linearity")
        {
            const oem::LinearityResult linearity { oem::linearityTest(oe) };
            REQUIRE(linearity.linearity.size() == 2);
            CHECK(linearity.linearity[0] >= linearity.linearity[1]);
            CHECK_THAT(linearity.linearity[0], WithinAbs(0.0, 1e-12));
            CHECK(std::isnan(linearity.true_linearity));
            CHECK(oem::linearityTest(oe, 1).linearity.size() == 1);
            CHECK(oem::linearityTest(oe, 0).linearity.size() == 2);
            CHECK_THROWS_AS(oem::linearityTest(oe, -1), std::invalid_argument);
        }
    }

    SECTION("First guess")
    {
        oem::OptimalEstimation oe {
            p.x_a, p.S_a, p.y_obs, p.S_y, identityModel(p.y_axis)
        };
        const oem::NamedVector x_0 { p.x_axis,
                                     Eigen::VectorXd::Constant(1, 1.0) };
        REQUIRE(oe.run(10, x_0));
        CHECK(oe.iterations().front().x.at("x") == 1.0);
        CHECK_THAT(oe.result().x_op.at("x"), WithinRel(2.0 / 1.01, 1e-9));
        // A repeated run starts over
        REQUIRE(oe.run(10));
        CHECK(oe.iterations().front().x.at("x") == 0.0);
        CHECK(oe.iterations().size() == 3);
    }

    SECTION("Bound violation")
    {
        // The unconstrained update would be 1.98
        oem::OptimalEstimation oe { p.x_a,
                                    p.S_a,
                                    p.y_obs,
                                    p.S_y,
                                    identityModel(p.y_axis),
                                    loadSettings("bounds: {upper: {x: 1.5}}") };
        CHECK_FALSE(oe.run(5));
        CHECK(oe.status() == oem::RetrievalStatus::max_iterations_reached);
        const auto& records { oe.iterations() };
        REQUIRE(records.size() == 5);
        for (const auto& record : records) {
            CHECK(record.x_next.at("x") == 0.0);
            CHECK(record.y_next.at("y") == 0.0);
        }
    }

    SECTION("Model without sensitivity")
    {
        const oem::ForwardModel constant { [&p](const oem::NamedVector&) {
            return oem::NamedVector { p.y_axis,
                                      Eigen::VectorXd::Constant(1, 5.0) };
        } };
        oem::OptimalEstimation oe { p.x_a, p.S_a, p.y_obs, p.S_y, constant };
        CHECK_FALSE(oe.run(10));
        CHECK(oe.status() == oem::RetrievalStatus::degenerate_stop);
        CHECK(oe.iterations().size() == 3);
        CHECK(oe.iterations().back().dgf == 0.0);
    }

    SECTION("Model that fails away from the prior")
    {
        const oem::ForwardModel model { [&p](const oem::NamedVector& xb) {
            const double x { xb(0) };
            const double y { x < 1.0 ? x : oem::fill::nan };
            return oem::NamedVector { p.y_axis,
                                      Eigen::VectorXd::Constant(1, y) };
        } };
        oem::OptimalEstimation oe { p.x_a, p.S_a, p.y_obs, p.S_y, model };
        CHECK_FALSE(oe.run(10));
        const auto& records { oe.iterations() };
        REQUIRE(records.size() == 4);
        // The NaN update of the second iteration is reset to the prior
        CHECK(records[1].x_next.at("x") == 0.0);
        CHECK(records[1].y_next.at("y") == 0.0);
        CHECK(records[1].dgf == 0.0);
        CHECK(oe.status() == oem::RetrievalStatus::degenerate_stop);
    }

    SECTION("Time limit")
    {
        oem::OptimalEstimation oe {
            p.x_a, p.S_a, p.y_obs, p.S_y, identityModel(p.y_axis)
        };
        CHECK_FALSE(oe.run(10, std::nullopt, -1.0));
        CHECK(oe.status() == oem::RetrievalStatus::time_exceeded);
        CHECK(oe.iterations().size() == 1);
    }

    SECTION("No iterations left to confirm convergence")
    {
        oem::OptimalEstimation oe {
            p.x_a, p.S_a, p.y_obs, p.S_y, identityModel(p.y_axis)
        };
        CHECK_FALSE(oe.run(2));
        CHECK(oe.status() == oem::RetrievalStatus::max_iterations_reached);
        const oem::RetrievalResult& result { oe.result() };
        CHECK(result.conv_i == oem::fill::i);
        CHECK(std::isnan(result.dgf));
        CHECK(result.x_op.axis() == p.x_axis);
        CHECK(result.x_op.hasNaN());
        CHECK(result.S_op.hasNaN());
    }

    SECTION("Iteration limit from the configuration")
    {
        oem::OptimalEstimation oe { p.x_a,
                                    p.S_a,
                                    p.y_obs,
                                    p.S_y,
                                    identityModel(p.y_axis),
                                    loadSettings("retrieval: {max_iter: 2}") };
        CHECK_FALSE(oe.run());
        CHECK(oe.iterations().size() == 2);
    }

    SECTION("Damping")
    {
        oem::OptimalEstimation oe { p.x_a,
                                    p.S_a,
                                    p.y_obs,
                                    p.S_y,
                                    identityModel(p.y_axis),
                                    loadSettings(
                                      "retrieval: {gamma_factor: [10]}") };
        REQUIRE(oe.run(10));
        const auto& records { oe.iterations() };
        CHECK(records[0].gamma == 10.0);
        CHECK(records[1].gamma == 1.0);
        // Damped first step: x_1 = 100 y_obs / (10 + 100)
        CHECK_THAT(records[0].x_next.at("x"), WithinRel(200.0 / 110.0, 1e-9));
        CHECK(oe.result().conv_i == 3);
        CHECK_THAT(oe.result().x_op.at("x"), WithinRel(2.0 / 1.01, 1e-9));
    }

    SECTION("Damping never converges")
    {
        oem::OptimalEstimation oe { p.x_a,
                                    p.S_a,
                                    p.y_obs,
                                    p.S_y,
                                    identityModel(p.y_axis),
                                    loadSettings("retrieval: {gamma_factor: "
                                                 "[10, 10, 10]}") };
        CHECK_FALSE(oe.run(3));
        CHECK(oe.status() == oem::RetrievalStatus::max_iterations_reached);
        // More damping factors than iterations
        CHECK_THROWS_AS(oe.run(2), oem::ConfigurationError);
    }

    SECTION("Singular normal equations")
    {
        // Only x0 is measured, with a sensitivity so large that
        // gamma S_a^-1 + K^T S_y^-1 K has a condition number of 1e26.
        const oem::Axis x_axis { genNames("x", 2) };
        const oem::NamedVector x_a { x_axis, Eigen::Vector2d { 1.0, 1.0 } };
        const oem::NamedMatrix S_a { x_axis, Eigen::Matrix2d::Identity() };
        Eigen::MatrixXd H(1, 2);
        H << 1e12, 0.0;
        const oem::ForwardModel model { linearModel(p.y_axis, H) };

        SECTION("Strict inversion")
        {
            oem::OptimalEstimation oe { x_a, S_a, p.y_obs, p.S_y, model };
            CHECK_THROWS_AS(oe.run(5), oem::NumericalDegeneracy);
            // The run was aborted
            CHECK(oe.status() == oem::RetrievalStatus::iterating);
            CHECK_FALSE(oe.converged());
            CHECK(oe.iterations().empty());
            CHECK(oe.result().x_op.hasNaN());
        }

        SECTION("Lenient inversion")
        {
            oem::OptimalEstimation oe {
                x_a,
                S_a,
                p.y_obs,
                p.S_y,
                model,
                loadSettings("retrieval: {strict_inversion: no}")
            };
            CHECK_FALSE(oe.getStrictInversion());
            CHECK_FALSE(oe.run(5));
            CHECK(oe.status() == oem::RetrievalStatus::max_iterations_reached);
            CHECK(oe.result().x_op.hasNaN());
            const auto& records { oe.iterations() };
            REQUIRE(records.size() == 5);
            // Every NaN update is reset to the prior
            for (const auto& record : records) {
                CHECK(record.S_aposterior.hasNaN());
                CHECK(record.x_next.values() == x_a.values());
                CHECK(record.y_next.at("y") == 1e12);
            }
        }
    }

    SECTION("Invalid run arguments")
    {
        oem::OptimalEstimation oe {
            p.x_a, p.S_a, p.y_obs, p.S_y, identityModel(p.y_axis)
        };
        CHECK_THROWS_AS(oe.run(0), std::invalid_argument);
        const oem::NamedVector x_nan {
            p.x_axis, Eigen::VectorXd::Constant(1, oem::fill::nan)
        };
        CHECK_THROWS_AS(oe.run(10, x_nan), oem::ConfigurationError);
        const oem::NamedVector x_misnamed {
            { "z" },
            Eigen::VectorXd::Constant(1, 0.0)
        };
        CHECK_THROWS_AS(oe.run(10, x_misnamed), std::invalid_argument);
        CHECK_THROWS_AS(oe.forwardModel(x_misnamed), std::invalid_argument);
        CHECK(oe.status() == oem::RetrievalStatus::initialized);
    }

    SECTION("Forward model at the prior")
    {
        const oem::OptimalEstimation oe {
            p.x_a, p.S_a, p.y_obs, p.S_y, identityModel(p.y_axis)
        };
        CHECK(oe.yPrior().at("y") == 0.0);
        CHECK(oe.getPriorError().at("x") == 1.0);
        CHECK(oe.getStrictInversion());
    }

    SECTION("Invalid input")
    {
        const oem::ForwardModel model { identityModel(p.y_axis) };
        // Well-conditioned input is accepted
        CHECK_NOTHROW(
          oem::OptimalEstimation(p.x_a, p.S_a, p.y_obs, p.S_y, model));
        // Singular prior covariance
        const oem::Axis x_axis { genNames("x", 2) };
        const oem::NamedVector x_a { x_axis, Eigen::Vector2d { 1.0, 2.0 } };
        const oem::NamedMatrix S_a_singular { x_axis,
                                              Eigen::MatrixXd::Ones(2, 2) };
        CHECK_THROWS_AS(
          oem::OptimalEstimation(x_a, S_a_singular, p.y_obs, p.S_y, model),
          oem::ConfigurationError);
        // Singular measurement covariance
        const oem::NamedMatrix S_y_zero { p.y_axis,
                                          Eigen::MatrixXd::Zero(1, 1) };
        CHECK_THROWS_AS(
          oem::OptimalEstimation(p.x_a, p.S_a, p.y_obs, S_y_zero, model),
          oem::ConfigurationError);
        // NaN in the measurement
        const oem::NamedVector y_nan {
            p.y_axis, Eigen::VectorXd::Constant(1, oem::fill::nan)
        };
        CHECK_THROWS_AS(
          oem::OptimalEstimation(p.x_a, p.S_a, y_nan, p.S_y, model),
          oem::ConfigurationError);
        // NaN in the prior
        const oem::NamedVector x_a_nan {
            p.x_axis, Eigen::VectorXd::Constant(1, oem::fill::nan)
        };
        CHECK_THROWS_AS(
          oem::OptimalEstimation(x_a_nan, p.S_a, p.y_obs, p.S_y, model),
          oem::ConfigurationError);
        const oem::NamedMatrix S_a_nan {
            p.x_axis, Eigen::MatrixXd::Constant(1, 1, oem::fill::nan)
        };
        CHECK_THROWS_AS(
          oem::OptimalEstimation(p.x_a, S_a_nan, p.y_obs, p.S_y, model),
          oem::ConfigurationError);
        // Parameters
        const oem::Axis b_axis { genNames("b", 2) };
        const oem::NamedVector b_ok { b_axis, Eigen::Vector2d { 1.0, 1.0 } };
        const oem::NamedMatrix S_b_ok { b_axis, Eigen::Matrix2d::Identity() };
        CHECK_NOTHROW(oem::OptimalEstimation(
          p.x_a, p.S_a, p.y_obs, p.S_y, model, {}, b_ok, S_b_ok));
        const oem::NamedMatrix S_b_singular { b_axis,
                                              Eigen::MatrixXd::Ones(2, 2) };
        CHECK_THROWS_AS(
          oem::OptimalEstimation(
            p.x_a, p.S_a, p.y_obs, p.S_y, model, {}, b_ok, S_b_singular),
          oem::ConfigurationError);
        const oem::NamedVector b_p_nan { b_axis,
                                         Eigen::Vector2d { 1.0,
                                                           oem::fill::nan } };
        CHECK_THROWS_AS(
          oem::OptimalEstimation(
            p.x_a, p.S_a, p.y_obs, p.S_y, model, {}, b_p_nan, S_b_ok),
          oem::ConfigurationError);
        Eigen::Matrix2d S_b_nan_vals = Eigen::Matrix2d::Identity();
        S_b_nan_vals(0, 1) = oem::fill::nan;
        const oem::NamedMatrix S_b_nan { b_axis, S_b_nan_vals };
        CHECK_THROWS_AS(
          oem::OptimalEstimation(
            p.x_a, p.S_a, p.y_obs, p.S_y, model, {}, b_ok, S_b_nan),
          oem::ConfigurationError);
        // Covariance of another vector
        CHECK_THROWS_AS(
          oem::OptimalEstimation(p.x_a, p.S_y, p.y_obs, p.S_y, model),
          oem::ConfigurationError);
        // A parameter with the name of a state vector element
        const oem::NamedVector b_p { p.x_axis, Eigen::VectorXd::Zero(1) };
        CHECK_THROWS_AS(oem::OptimalEstimation(
                          p.x_a, p.S_a, p.y_obs, p.S_y, model, {}, b_p, p.S_a),
                        oem::ConfigurationError);
        // Limit for an unknown element
        CHECK_THROWS_AS(
          oem::OptimalEstimation(p.x_a,
                                 p.S_a,
                                 p.y_obs,
                                 p.S_y,
                                 model,
                                 loadSettings("bounds: {lower: {z: 0}}")),
          oem::ConfigurationError);
        // Truth with other names
        const std::optional<oem::NamedVector> truth { oem::NamedVector {
          { "z" }, Eigen::VectorXd::Zero(1) } };
        CHECK_THROWS_AS(
          oem::OptimalEstimation(
            p.x_a, p.S_a, p.y_obs, p.S_y, model, {}, {}, {}, truth),
          oem::ConfigurationError);
    }
}

TEST_CASE("diagnostics")
{
    const ScalarProblem p {};
    // The four statistics of the scalar problem all equal 4/1.01
    constexpr double chi2_expected { 4.0 / 1.01 };
    constexpr double chi2_critical_1 { 3.841458820694124 };

    SECTION("Chi-square tests")
    {
        oem::OptimalEstimation oe {
            p.x_a, p.S_a, p.y_obs, p.S_y, identityModel(p.y_axis)
        };
        REQUIRE(oe.run(10));
        const oem::Chi2Results results { oem::chiSquareTest(oe) };
        for (const auto& result : results) {
            CHECK_THAT(result.chi2, WithinRel(chi2_expected, 1e-6));
            CHECK_THAT(result.chi2_critical, WithinRel(chi2_critical_1, 1e-9));
            CHECK_FALSE(result.passed);
        }
        const oem::ChiSquareResult x_test { oem::chiSquareTestXOptimalPrior(
          oe, 0.01) };
        // 6.63 at a significance of 1 %
        CHECK(x_test.passed);
        CHECK(oem::chi2TestToString(oem::Chi2Test::y_optimal_vs_observation)
              == "Y_Optimal_vs_Observation");
    }

    SECTION("Perfect agreement between measurement and prior")
    {
        oem::NamedVector x_a { p.x_axis, Eigen::VectorXd::Constant(1, 2.0) };
        oem::OptimalEstimation oe {
            x_a, p.S_a, p.y_obs, p.S_y, identityModel(p.y_axis)
        };
        REQUIRE(oe.run(10));
        const oem::ChiSquareResult result {
            oem::chiSquareTestYOptimalObservation(oe)
        };
        CHECK(result.chi2 == 0.0);
        CHECK(result.passed);
    }

    SECTION("Linearity with known truth")
    {
        const oem::NamedVector truth { p.x_axis,
                                       Eigen::VectorXd::Constant(1, 2.0) };
        oem::OptimalEstimation oe { p.x_a,
                                    p.S_a,
                                    p.y_obs,
                                    p.S_y,
                                    identityModel(p.y_axis),
                                    {},
                                    {},
                                    {},
                                    truth };
        REQUIRE(oe.run(10));
        const oem::LinearityResult linearity { oem::linearityTest(
          oe, oem::SettingsRetrieval {}) };
        REQUIRE(linearity.linearity.size() == 1);
        CHECK_THAT(linearity.linearity[0], WithinAbs(0.0, 1e-12));
        CHECK_THAT(linearity.true_linearity, WithinAbs(0.0, 1e-12));
        CHECK_THAT(linearity.true_linearity_chi2, WithinAbs(0.0, 1e-12));
        CHECK_THAT(linearity.true_linearity_chi2_critical,
                   WithinRel(chi2_critical_1, 1e-9));
    }

    SECTION("Retrieval did not converge")
    {
        oem::OptimalEstimation oe {
            p.x_a, p.S_a, p.y_obs, p.S_y, identityModel(p.y_axis)
        };
        REQUIRE_FALSE(oe.run(1));
        const oem::LinearityResult linearity { oem::linearityTest(oe) };
        REQUIRE(linearity.linearity.size() == 1);
        CHECK(std::isnan(linearity.linearity[0]));
        const oem::Chi2Results results { oem::chiSquareTest(
          oe, oem::SettingsRetrieval {}) };
        for (const auto& result : results) {
            CHECK(std::isnan(result.chi2));
            CHECK(std::isnan(result.chi2_critical));
            CHECK_FALSE(result.passed);
        }
    }
}
