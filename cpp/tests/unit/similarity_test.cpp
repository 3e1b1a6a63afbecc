#include "caserag/similarity.hpp"

#include "../test_fixtures.hpp"
#include "../test_logger.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>
#include <vector>

namespace {

using caserag::tests::Require;

void ScenarioZeroDistanceIsExactlyOne() {
  caserag::tests::Log("scenario: zero distance is exactly one");
  Require(caserag::DistanceToSimilarity(0.0) == 1.0, "similarity(0) must be exactly 1");
  Require(caserag::SimilarityToPercent(caserag::DistanceToSimilarity(0.0)) == 100.0, "percent of 1.0 must be 100");
}

void ScenarioMonotonicDecrease() {
  caserag::tests::Log("scenario: monotonic decrease");
  const std::vector<double> distances = {0.0, 1e-6, 0.1, 0.5, 1.0, 2.0, 10.0, 1e6};
  for (std::size_t i = 1; i < distances.size(); ++i) {
    const auto closer = caserag::DistanceToSimilarity(distances[i - 1]);
    const auto farther = caserag::DistanceToSimilarity(distances[i]);
    Require(closer > farther, "similarity must strictly decrease as distance grows");
    Require(farther > 0.0 && farther <= 1.0, "similarity must stay in (0, 1]");
  }
  Require(std::fabs(caserag::DistanceToSimilarity(0.1) - 1.0 / 1.1) < 1e-12, "similarity(0.1) mismatch");
  Require(caserag::DistanceToSimilarity(std::numeric_limits<double>::quiet_NaN()) == 1.0,
          "NaN distance is treated as zero");
}

void ScenarioPercentRounding() {
  caserag::tests::Log("scenario: percent rounding");
  Require(caserag::SimilarityToPercent(1.0 / 1.1) == 90.9, "0.90909 should round to 90.9");
  Require(caserag::SimilarityToPercent(0.5) == 50.0, "0.5 should map to 50.0");
  Require(caserag::SimilarityToPercent(1.0 / 3.0) == 33.3, "1/3 should round to 33.3");
}

void ScenarioSquaredL2() {
  caserag::tests::Log("scenario: squared l2");
  const std::vector<float> a = {1.0F, 2.0F, 3.0F};
  const std::vector<float> b = {1.0F, 0.0F, 1.0F};
  Require(caserag::SquaredL2Distance(a, b) == 8.0F, "squared distance mismatch");
  Require(caserag::SquaredL2Distance(a, a) == 0.0F, "distance to self must be zero");
}

void ScenarioTruncation() {
  caserag::tests::Log("scenario: truncation");
  const std::string short_text = "brief note";
  Require(caserag::TruncateWithMarker(short_text, 200) == short_text, "short text must be untouched");

  const std::string exact(200, 'a');
  Require(caserag::TruncateWithMarker(exact, 200) == exact, "text at the limit must not get a marker");

  const std::string long_text(250, 'b');
  const auto snippet = caserag::TruncateWithMarker(long_text, 200);
  Require(snippet == std::string(200, 'b') + "...", "long text must be cut to 200 chars plus marker");
  Require(caserag::TruncatePlain(long_text, 30) == std::string(30, 'b'), "plain truncation must not add a marker");

  const std::string accented = "\xC3\xA9\xC3\xA9\xC3\xA9";
  Require(caserag::TruncatePlain(accented, 2) == "\xC3\xA9\xC3\xA9", "truncation must not split code points");
}

void ScenarioBlankDetection() {
  caserag::tests::Log("scenario: blank detection");
  Require(caserag::IsBlank(""), "empty string is blank");
  Require(caserag::IsBlank(" \t\n "), "whitespace is blank");
  Require(!caserag::IsBlank("  x "), "text is not blank");
}

}  // namespace

int main() {
  try {
    caserag::tests::Log("similarity_test: start");
    ScenarioZeroDistanceIsExactlyOne();
    ScenarioMonotonicDecrease();
    ScenarioPercentRounding();
    ScenarioSquaredL2();
    ScenarioTruncation();
    ScenarioBlankDetection();
    caserag::tests::Log("similarity_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    caserag::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
