#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "lifsim/v1/validation.hpp"
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lifsim::v1;
using Catch::Approx;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

// =============================================================================
// Analytical solution
// =============================================================================

TEST_CASE("LIFAnalytical - constant suprathreshold input", "[validation][analytical]") {
    const LIFAnalytical analytical{LIFParameters{}, 1.5, 0.0};

    CHECK(analytical.steady_state() == Approx(1.5));
    CHECK(analytical.voltage(0.0) == Approx(0.0));
    CHECK_THAT(analytical.voltage(20e-3), WithinRel(1.5 * (1.0 - std::exp(-1.0)), 1e-12));

    const auto t_first = analytical.first_spike_time();
    REQUIRE(t_first.has_value());
    CHECK_THAT(*t_first, WithinRel(20e-3 * std::log(3.0), 1e-12));
    CHECK_THAT(analytical.voltage(*t_first), WithinAbs(1.0, 1e-12));

    // v_reset == v_rest, so the inter-spike interval equals the first spike time
    const auto isi = analytical.interspike_interval();
    REQUIRE(isi.has_value());
    CHECK_THAT(*isi, WithinRel(*t_first, 1e-12));
    CHECK_THAT(analytical.firing_rate(), WithinRel(1.0 / *t_first, 1e-12));
}

TEST_CASE("LIFAnalytical - subthreshold input never fires", "[validation][analytical]") {
    const LIFAnalytical analytical{LIFParameters{}, 1.0, 0.0};  // v_inf == v_th
    CHECK_FALSE(analytical.first_spike_time().has_value());
    CHECK_FALSE(analytical.interspike_interval().has_value());
    CHECK(analytical.firing_rate() == 0.0);
}

TEST_CASE("LIFAnalytical - start above threshold fires immediately", "[validation][analytical]") {
    const LIFAnalytical analytical{LIFParameters{}, 0.0, 1.2};
    const auto t_first = analytical.first_spike_time();
    REQUIRE(t_first.has_value());
    CHECK(*t_first == 0.0);
}

TEST_CASE("LIFAnalytical - reset above threshold has no interval", "[validation][analytical]") {
    LIFParameters p;
    p.v_reset = 1.5;
    const LIFAnalytical analytical{p, 2.0, 0.0};
    CHECK(analytical.first_spike_time().has_value());
    CHECK_FALSE(analytical.interspike_interval().has_value());
    CHECK(analytical.firing_rate() == 0.0);
}

// =============================================================================
// Helpers
// =============================================================================

TEST_CASE("constant_current - sample count", "[validation][helpers]") {
    CHECK(constant_current(1.0, 1e-5, 1.5).size() == 100000);
    CHECK(constant_current(0.5, 1e-3, 1.5).size() == 500);
    CHECK(constant_current(1.0, 0.1e-3, 1.5).size() == 10000);
    CHECK(constant_current(1e-3, 2e-3, 1.5).size() == 0);

    const Vector input = constant_current(0.01, 1e-3, -0.7);
    REQUIRE(input.size() == 10);
    CHECK((input.array() == -0.7).all());

    CHECK(constant_current(1.0, 0.0, 1.0).size() == 0);
    CHECK(constant_current(-1.0, 1e-3, 1.0).size() == 0);
    CHECK(constant_current(1.0, std::numeric_limits<Real>::quiet_NaN(), 1.0).size() == 0);
}

TEST_CASE("sample_count - rejects counts outside Index range", "[validation][helpers]") {
    CHECK(sample_count(1.0, 1e-3) == Index{1000});
    CHECK(sample_count(1e-3, 2e-3) == Index{0});
    CHECK_FALSE(sample_count(1.0, 0.0).has_value());
    CHECK_FALSE(sample_count(std::numeric_limits<Real>::infinity(), 1e-3).has_value());

    // Finite ratios far beyond the largest Index
    CHECK_FALSE(sample_count(1.0, 1e-300).has_value());
    CHECK_FALSE(sample_count(1e300, 1.0).has_value());
    CHECK_FALSE(sample_count(1.0, 1e-19).has_value());
    CHECK(constant_current(1.0, 1e-300, 1.5).size() == 0);
    CHECK(constant_current(1e300, 1.0, 1.5).size() == 0);
}

TEST_CASE("spike_times - extracted from recorded spikes", "[validation][helpers]") {
    const Real dt = 1e-3;
    const auto result = simulate_exact(constant_current(0.1, dt, 1.5), SimulationOptions{});
    REQUIRE(result.success);

    const auto times = spike_times(result);
    REQUIRE(times.size() == static_cast<std::size_t>(result.spike_count));
    REQUIRE(times.size() == 4);  // indices 21, 43, 65, 87
    CHECK_THAT(times[0], WithinAbs(21 * dt, 1e-12));
    CHECK_THAT(times[3], WithinAbs(87 * dt, 1e-12));

    const auto first = first_spike_time(result);
    REQUIRE(first.has_value());
    CHECK(*first == times.front());

    const auto quiet = simulate_exact(constant_current(0.1, dt, 0.5), SimulationOptions{});
    CHECK(spike_times(quiet).empty());
    CHECK_FALSE(first_spike_time(quiet).has_value());
}

TEST_CASE("max_voltage_error - trace comparison", "[validation][helpers]") {
    SimulationOptions fine;
    fine.dt = 1e-3;
    const Vector input = constant_current(0.2, 1e-3, 0.8);

    const auto exact = simulate_exact(input, fine);
    const auto forward = simulate_forward(input, fine);
    CHECK(max_voltage_error(exact, exact) == 0.0);
    CHECK(max_voltage_error(exact, forward) > 0.0);
    CHECK(max_voltage_error(exact, forward) == max_voltage_error(forward, exact));

    const auto shorter = simulate_exact(constant_current(0.1, 1e-3, 0.8), fine);
    CHECK_THROWS_AS(max_voltage_error(exact, shorter), std::invalid_argument);

    CHECK(max_voltage_error(SimulationResult{}, SimulationResult{}) == 0.0);
}

// =============================================================================
// Convergence
// =============================================================================

TEST_CASE("Euler schemes converge to exact integration at first order", "[validation][convergence]") {
    // Subthreshold drive keeps every scheme on the smooth exponential approach
    const std::vector<Real> dt_values{5e-3, 2e-3, 1e-3, 0.5e-3, 0.1e-3};
    const Real current = 0.8;
    const Real duration = 0.2;

    for (const Integrator method : {Integrator::ForwardEuler, Integrator::BackwardEuler}) {
        INFO("integrator: " << to_string(method));
        std::vector<Real> errors;
        for (const Real dt : dt_values) {
            SimulationOptions opts;
            opts.dt = dt;
            const Vector input = constant_current(duration, dt, current);
            const auto approx = simulate(method, input, opts);
            const auto exact = simulate_exact(input, opts);
            REQUIRE(approx.success);
            REQUIRE(approx.spike_count == 0);
            errors.push_back(max_voltage_error(approx, exact));
        }

        for (std::size_t k = 1; k < errors.size(); ++k) {
            CHECK(errors[k] < errors[k - 1]);
        }

        // Ten-fold dt reduction gives roughly ten-fold error reduction
        const Real ratio = errors[0] / errors[3];
        CHECK(ratio > 5.0);
        CHECK(ratio < 20.0);
        CHECK(errors.back() < 2e-3);
    }
}

// =============================================================================
// dt sweep
// =============================================================================

TEST_CASE("compare_dt_errors - default sweep", "[validation][sweep]") {
    const DtSweepOptions options;
    const auto report = compare_dt_errors(options);

    REQUIRE(report.success);
    CHECK(report.message == "dt sweep completed");
    CHECK_THAT(report.reference_dt, WithinRel(1e-5, 1e-12));
    CHECK(report.reference_spike_count == 45);
    REQUIRE(report.reference_first_spike.has_value());
    CHECK_THAT(*report.reference_first_spike, WithinAbs(20e-3 * std::log(3.0), 1e-5));

    REQUIRE(report.rows.size() == 15);
    const Integrator expected_order[] = {
        Integrator::ForwardEuler, Integrator::BackwardEuler, Integrator::Exact};
    for (std::size_t m = 0; m < 3; ++m) {
        for (std::size_t k = 0; k < options.dt_values.size(); ++k) {
            const auto& row = report.rows[m * options.dt_values.size() + k];
            CHECK(row.method == expected_order[m]);
            CHECK(row.dt == options.dt_values[k]);
            CHECK_FALSE(row.diverged);
            CHECK(row.spike_count > 0);
            CHECK(row.spike_count_error == row.spike_count - report.reference_spike_count);
            CHECK(row.first_spike_error.has_value());
        }
    }

    SECTION("Exact rows carry zero voltage error and sub-step spike timing error") {
        const auto exact_rows = report.rows_for(Integrator::Exact);
        REQUIRE(exact_rows.size() == 5);
        for (const auto& row : exact_rows) {
            CHECK(row.max_voltage_error == 0.0);
            REQUIRE(row.first_spike_error.has_value());
            CHECK(std::abs(*row.first_spike_error) < row.dt);
        }
        CHECK(exact_rows.front().spike_count_error == 0);  // dt = 0.1 ms
    }

    SECTION("Euler rows carry nonzero voltage error") {
        for (const auto method : {Integrator::ForwardEuler, Integrator::BackwardEuler}) {
            for (const auto& row : report.rows_for(method)) {
                CHECK(row.max_voltage_error > 0.0);
                CHECK(std::isfinite(row.max_voltage_error));
            }
        }
    }
}

TEST_CASE("compare_dt_errors - forward divergence is reported per row", "[validation][sweep]") {
    DtSweepOptions options;
    options.dt_values = {1e-3, 0.1};  // dt / tau_m = 5 for the second entry
    options.duration = 1.0;
    options.current = -1.0;
    options.neuron.v_th = 1e9;

    const auto report = compare_dt_errors(options);
    REQUIRE(report.success);
    REQUIRE(report.rows.size() == 6);

    const auto forward = report.rows_for(Integrator::ForwardEuler);
    REQUIRE(forward.size() == 2);
    CHECK_FALSE(forward[0].diverged);
    CHECK(forward[1].diverged);
    CHECK(std::isinf(forward[1].max_voltage_error));
    CHECK(forward[1].message.find("out of bounds") != std::string::npos);

    for (const auto method : {Integrator::BackwardEuler, Integrator::Exact}) {
        for (const auto& row : report.rows_for(method)) {
            CHECK_FALSE(row.diverged);
            CHECK(std::isfinite(row.max_voltage_error));
        }
    }
}

TEST_CASE("compare_dt_errors - explicit reference dt", "[validation][sweep]") {
    DtSweepOptions options;
    options.dt_values = {1e-3};
    options.duration = 0.1;
    options.reference_dt = 0.5e-3;

    const auto report = compare_dt_errors(options);
    REQUIRE(report.success);
    CHECK(report.reference_dt == 0.5e-3);
    CHECK(report.rows.size() == 3);
}

TEST_CASE("compare_dt_errors - invalid sweep options", "[validation][sweep]") {
    SECTION("Empty dt list") {
        DtSweepOptions options;
        options.dt_values.clear();
        const auto report = compare_dt_errors(options);
        CHECK_FALSE(report.success);
        CHECK(report.rows.empty());
        CHECK(report.message.find("at least one dt") != std::string::npos);
    }

    SECTION("Non-positive dt") {
        DtSweepOptions options;
        options.dt_values = {1e-3, 0.0};
        CHECK_FALSE(compare_dt_errors(options).success);
    }

    SECTION("Non-positive duration") {
        DtSweepOptions options;
        options.duration = 0.0;
        CHECK_FALSE(compare_dt_errors(options).success);
    }

    SECTION("Malformed divergence bounds fail the report") {
        DtSweepOptions options;
        options.dt_values = {1e-3};
        options.duration = 0.1;
        options.bounds = DivergenceBounds{10.0, -10.0};
        const auto report = compare_dt_errors(options);
        CHECK_FALSE(report.success);
        CHECK(report.rows.empty());
        CHECK(report.message.find("forward run failed") != std::string::npos);
        CHECK(report.message.find("Invalid divergence bounds") != std::string::npos);
    }

    SECTION("Sample count beyond Index range") {
        DtSweepOptions options;
        options.dt_values = {1e-300};
        CHECK_FALSE(compare_dt_errors(options).success);

        DtSweepOptions tiny_reference;
        tiny_reference.dt_values = {1e-3};
        tiny_reference.reference_dt = 1e-300;
        const auto report = compare_dt_errors(tiny_reference);
        CHECK_FALSE(report.success);
        CHECK(report.message.find("reference dt") != std::string::npos);
    }

    SECTION("Non-finite reference dt") {
        DtSweepOptions options;
        options.reference_dt = std::numeric_limits<Real>::infinity();
        CHECK_FALSE(compare_dt_errors(options).success);
    }

    SECTION("Invalid neuron parameters fail the reference run") {
        DtSweepOptions options;
        options.neuron.tau_m = -1.0;
        const auto report = compare_dt_errors(options);
        CHECK_FALSE(report.success);
        CHECK(report.message.find("Reference simulation failed") != std::string::npos);
    }
}
