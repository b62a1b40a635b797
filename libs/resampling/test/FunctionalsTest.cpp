#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <array>
#include <functional>
#include <vector>

#include "Functionals.h"

using namespace mkc_resampling;
using Catch::Approx;

TEST_CASE("arithmeticMean", "[Functionals]")
{
  REQUIRE(arithmeticMean({1.0, 2.0, 3.0, 4.0, 5.0}) == Approx(3.0));
  REQUIRE(arithmeticMean({-2.0}) == Approx(-2.0));
  REQUIRE(arithmeticMean({}) == 0.0);
}

TEST_CASE("makeMeanTransform", "[Functionals]")
{
  SECTION("Applies g to the mean")
    {
      const auto f = makeMeanTransform([](double m) { return m * m; });
      REQUIRE(f({1.0, 2.0, 3.0, 4.0, 5.0}) == Approx(9.0));
    }

  SECTION("Rejects an empty transform")
    {
      REQUIRE_THROWS_AS(makeMeanTransform(std::function<double(double)>()), InvalidParameterException);
    }
}

TEST_CASE("Column means", "[Functionals][MultiColumn]")
{
  using Row = std::array<double, 3>;
  const std::vector<Row> rows{{1.0, 10.0, -1.0}, {3.0, 20.0, -3.0}};

  SECTION("Per-column averages")
    {
      const Row m = columnMeans(rows);
      REQUIRE(m[0] == Approx(2.0));
      REQUIRE(m[1] == Approx(15.0));
      REQUIRE(m[2] == Approx(-2.0));
    }

  SECTION("Transform of the column means")
    {
      const auto f = makeColumnMeansTransform<3>([](const Row& m) { return m[0] * m[1] + m[2]; });
      REQUIRE(f(rows) == Approx(28.0));
    }

  SECTION("Rejects an empty transform")
    {
      REQUIRE_THROWS_AS(makeColumnMeansTransform<3>(std::function<double(const Row&)>()),
			InvalidParameterException);
    }
}
