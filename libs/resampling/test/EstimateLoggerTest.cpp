#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "EstimateLogger.h"
#include "Functionals.h"
#include "JackknifeEstimator.h"

using namespace mkc_resampling;

static bool contains(const std::string& haystack, const std::string& needle)
{
  return haystack.find(needle) != std::string::npos;
}

TEST_CASE("EstimateLogger result line", "[EstimateLogger]")
{
  const std::vector<double> x{1.0, 2.0, 3.0, 4.0, 5.0};
  const EstimateResult r = JackknifeEstimator<>().run(x, arithmeticMean);

  std::ostringstream os;
  EstimateLogger::logResultLine("jackknife", "mean", r, os);

  REQUIRE(os.str() == "jackknife mean 3 ± 0.7071067812\n");
}

TEST_CASE("EstimateLogger diagnostics", "[EstimateLogger]")
{
  const std::vector<double> x{1.0, 2.0, 3.0, 4.0, 5.0};
  const EstimateResult r = JackknifeEstimator<>().run(x, arithmeticMean);

  std::ostringstream os;
  EstimateLogger::logEstimate("jackknife", "mean", r, os);
  const std::string out = os.str();

  REQUIRE(contains(out, "Method:            jackknife"));
  REQUIRE(contains(out, "Sample size:       5"));
  REQUIRE(contains(out, "Resamples:         5"));
  REQUIRE(contains(out, "Replicate mean:    3"));

  // The result line comes last
  REQUIRE(out.size() >= std::string("jackknife mean 3 ± 0.7071067812\n").size());
  REQUIRE(out.substr(out.rfind("jackknife mean")) == "jackknife mean 3 ± 0.7071067812\n");
}

TEST_CASE("EstimateLogger summaries", "[EstimateLogger]")
{
  SECTION("Sample summary")
    {
      std::ostringstream os;
      EstimateLogger::logSampleSummary({2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}, os);
      const std::string out = os.str();

      REQUIRE(contains(out, "Sample summary"));
      REQUIRE(contains(out, "count:    8"));
      REQUIRE(contains(out, "mean:     5"));
      REQUIRE(contains(out, "min:      2"));
      REQUIRE(contains(out, "max:      9"));
    }

  SECTION("Replicate summary")
    {
      const std::vector<double> x{1.0, 2.0, 3.0, 4.0, 5.0};
      std::ostringstream os;
      EstimateLogger::logReplicates(JackknifeEstimator<>().replicates(x, arithmeticMean), os);
      const std::string out = os.str();

      REQUIRE(contains(out, "Replicate statistics"));
      REQUIRE(contains(out, "count:    5"));
      REQUIRE(contains(out, "min:      2.5"));
      REQUIRE(contains(out, "max:      3.5"));
    }

  SECTION("Empty input prints only the count")
    {
      std::ostringstream os;
      EstimateLogger::logReplicates({}, os);
      REQUIRE(contains(os.str(), "count:    0"));
      REQUIRE_FALSE(contains(os.str(), "mean:"));
    }
}

TEST_CASE("EstimateLogger leaves stream formatting alone", "[EstimateLogger]")
{
  std::ostringstream os;
  os.precision(3);
  EstimateLogger::logSampleSummary({1.0, 2.0}, os);
  REQUIRE(os.precision() == 3);
}
