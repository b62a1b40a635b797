#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <array>
#include <cmath>
#include <limits>
#include <vector>

#include "JackknifeEstimator.h"
#include "Functionals.h"
#include "Resampling.h"

using namespace mkc_resampling;
using Catch::Approx;

// ----- helpers ---------------------------------------------------------------

static double sample_sd(const std::vector<double>& x)
{
  const double m = arithmeticMean(x);
  double ss = 0.0;
  for (double v : x)
    ss += (v - m) * (v - m);
  return std::sqrt(ss / static_cast<double>(x.size() - 1));
}

// Direct transcription of the delete-one formulas for any scalar functional
template <class StatFn>
static void manual_jackknife(const std::vector<double>& x, StatFn f,
			     double& estimate, double& se)
{
  const std::size_t n = x.size();
  std::vector<double> thetas;
  for (std::size_t i = 0; i < n; ++i)
    {
      std::vector<double> y;
      for (std::size_t j = 0; j < n; ++j)
	if (j != i)
	  y.push_back(x[j]);
      thetas.push_back(f(y));
    }

  double bar = 0.0;
  for (double t : thetas) bar += t;
  bar /= static_cast<double>(n);

  double ss = 0.0;
  for (double t : thetas) ss += (t - bar) * (t - bar);

  const double nd = static_cast<double>(n);
  estimate = nd * f(x) - (nd - 1.0) * bar;
  se = std::sqrt((nd - 1.0) / nd * ss);
}

// -----------------------------------------------------------------------------

TEST_CASE("Jackknife of the mean of 1..5", "[Jackknife]")
{
  const std::vector<double> x{1.0, 2.0, 3.0, 4.0, 5.0};
  JackknifeEstimator<> jk;

  SECTION("Leave-one-out means in deletion order")
    {
      const auto thetas = jk.replicates(x, arithmeticMean);
      REQUIRE(thetas.size() == 5);
      REQUIRE(thetas[0] == Approx(3.5));
      REQUIRE(thetas[1] == Approx(3.25));
      REQUIRE(thetas[2] == Approx(3.0));
      REQUIRE(thetas[3] == Approx(2.75));
      REQUIRE(thetas[4] == Approx(2.5));
    }

  SECTION("Estimate and standard error")
    {
      const EstimateResult r = jk.run(x, arithmeticMean);
      REQUIRE(r.estimate == Approx(3.0));
      REQUIRE(r.standardError == Approx(std::sqrt(0.5)));
      REQUIRE(r.fullStatistic == Approx(3.0));
      REQUIRE(r.replicateMean == Approx(3.0));
      REQUIRE(r.biasEstimate == Approx(0.0).margin(1e-12));
      REQUIRE(r.n == 5);
      REQUIRE(r.numResamples == 5);
    }

  SECTION("Free function gives the same result")
    {
      const EstimateResult r = jackknife(x, arithmeticMean);
      REQUIRE(r.estimate == Approx(3.0));
      REQUIRE(r.standardError == Approx(0.70710678));
    }
}

TEST_CASE("Jackknife of the squared mean removes first-order bias", "[Jackknife]")
{
  const std::vector<double> x{1.0, 2.0, 3.0, 4.0, 5.0};
  const auto squaredMean = makeMeanTransform([](double m) { return m * m; });

  const EstimateResult r = JackknifeEstimator<>().run(x, squaredMean);

  REQUIRE(r.fullStatistic == Approx(9.0));
  REQUIRE(r.replicateMean == Approx(9.125));
  REQUIRE(r.standardError == Approx(4.2478).epsilon(1e-4));
  REQUIRE(r.estimate == Approx(8.5));
  REQUIRE(r.biasEstimate == Approx(0.5));

  // 8.5 = mean^2 - s^2/n, the unbiased estimator of the squared expectation
  REQUIRE(r.estimate == Approx(9.0 - 2.5 / 5.0));
}

TEST_CASE("Jackknife with f = mean matches closed forms", "[Jackknife]")
{
  const std::vector<double> x{0.3, -1.7, 2.2, 5.9, 4.4, -0.8, 1.1, 3.3, 0.0, 7.25, -2.5};

  const EstimateResult r = JackknifeEstimator<>().run(x, arithmeticMean);

  REQUIRE(r.estimate == Approx(arithmeticMean(x)));
  REQUIRE(r.standardError == Approx(sample_sd(x) / std::sqrt(static_cast<double>(x.size()))));
}

TEST_CASE("Jackknife agrees with a direct computation for a non-linear functional", "[Jackknife]")
{
  const std::vector<double> x{2.0, 3.5, 1.25, 8.0, 4.0, 6.5, 0.5};
  auto f = [](const std::vector<double>& y) {
    double s = 0.0;
    for (double v : y) s += std::log(1.0 + v);
    return std::exp(s / static_cast<double>(y.size()));
  };

  double expectedEstimate = 0.0, expectedSe = 0.0;
  manual_jackknife(x, f, expectedEstimate, expectedSe);

  const EstimateResult r = JackknifeEstimator<>().run(x, f);
  REQUIRE(r.estimate == Approx(expectedEstimate));
  REQUIRE(r.standardError == Approx(expectedSe));
}

TEST_CASE("Jackknife standard error of a constant sample is exactly zero", "[Jackknife]")
{
  const std::vector<double> x(9, 0.1);

  const EstimateResult r = JackknifeEstimator<>().run(x, arithmeticMean);
  REQUIRE(r.standardError == 0.0);
  REQUIRE(r.estimate == Approx(0.1));
}

TEST_CASE("Jackknife with the smallest admissible sample", "[Jackknife]")
{
  const std::vector<double> x{1.0, 3.0};

  const EstimateResult r = JackknifeEstimator<>().run(x, arithmeticMean);
  REQUIRE(r.estimate == Approx(2.0));
  // thetas 3 and 1: sqrt(1/2 * 2) = 1
  REQUIRE(r.standardError == Approx(1.0));
}

TEST_CASE("Jackknife error conditions", "[Jackknife][Errors]")
{
  JackknifeEstimator<> jk;

  SECTION("Empty sample")
    {
      REQUIRE_THROWS_AS(jk.run(std::vector<double>{}, arithmeticMean), InsufficientSampleSizeException);
    }

  SECTION("Single observation")
    {
      REQUIRE_THROWS_AS(jk.run(std::vector<double>{4.2}, arithmeticMean), InsufficientSampleSizeException);
      REQUIRE_THROWS_AS(jk.replicates(std::vector<double>{4.2}, arithmeticMean), InsufficientSampleSizeException);
    }

  SECTION("Non-finite functional result")
    {
      const std::vector<double> x{1.0, 2.0, 3.0};
      auto bad = [](const std::vector<double>& y) {
	return y.size() == 3 ? 1.0 : std::numeric_limits<double>::infinity();
      };
      REQUIRE_THROWS_AS(jk.run(x, bad), InvalidFunctionalResultException);
    }

  SECTION("Finite replicates that overflow when combined")
    {
      // Replicates are -1e308, 1e308, 1e308, 1e308; their deviations exceed DBL_MAX
      const std::vector<double> x{1e308, -1e308, 1e308, -1e308};
      auto first = [](const std::vector<double>& y) { return y[0]; };

      REQUIRE_THROWS_AS(jk.run(x, first), InvalidFunctionalResultException);
    }

  SECTION("Errors derive from ResamplingException")
    {
      REQUIRE_THROWS_AS(jk.run(std::vector<double>{1.0}, arithmeticMean), ResamplingException);
    }
}

TEST_CASE("Jackknife on two-column observations", "[Jackknife][MultiColumn]")
{
  using Row = std::array<double, 2>;
  const auto product = makeColumnMeansTransform<2>([](const Row& m) { return m[0] * m[1]; });

  SECTION("Product with a constant column is linear, so no bias correction")
    {
      const std::vector<Row> rows{{1.0, 2.0}, {2.0, 2.0}, {3.0, 2.0}, {4.0, 2.0}};
      const EstimateResult r = JackknifeEstimator<Row>().run(rows, product);

      REQUIRE(r.fullStatistic == Approx(5.0));
      REQUIRE(r.estimate == Approx(5.0));
      // 2 * (jackknife SE of the mean of 1..4) = 2 * s / sqrt(n)
      REQUIRE(r.standardError == Approx(2.0 * std::sqrt(5.0 / 3.0) / 2.0));
    }

  SECTION("Rows are removed as a unit")
    {
      const std::vector<Row> rows{{1.0, 4.0}, {2.0, 3.0}, {3.0, 2.0}};
      const auto thetas = JackknifeEstimator<Row>().replicates(rows, product);

      REQUIRE(thetas.size() == 3);
      REQUIRE(thetas[0] == Approx(2.5 * 2.5));   // rows 1,2
      REQUIRE(thetas[1] == Approx(2.0 * 3.0));   // rows 0,2
      REQUIRE(thetas[2] == Approx(1.5 * 3.5));   // rows 0,1
    }
}
