#include "caserag/similarity.hpp"

#include <cctype>
#include <cmath>
#include <cstddef>
#include <span>
#include <string>

namespace caserag {
namespace {

bool IsContinuationByte(unsigned char ch) {
  return (ch & 0xC0U) == 0x80U;
}

// Byte offset just past the first `max_chars` code points, or npos if the text is shorter.
std::size_t CodePointCutOffset(const std::string& text, std::size_t max_chars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (IsContinuationByte(static_cast<unsigned char>(text[i]))) {
      continue;
    }
    if (chars == max_chars) {
      return i;
    }
    ++chars;
  }
  return std::string::npos;
}

}  // namespace

double DistanceToSimilarity(double distance) {
  if (std::isnan(distance) || distance < 0.0) {
    distance = 0.0;
  }
  return 1.0 / (1.0 + distance);
}

double SimilarityToPercent(double similarity) {
  return std::round(similarity * 1000.0) / 10.0;
}

float SquaredL2Distance(std::span<const float> lhs, std::span<const float> rhs) {
  float sum = 0.0F;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const float delta = lhs[i] - rhs[i];
    sum += delta * delta;
  }
  return sum;
}

std::string TruncatePlain(const std::string& text, std::size_t max_chars) {
  const auto cut = CodePointCutOffset(text, max_chars);
  if (cut == std::string::npos) {
    return text;
  }
  return text.substr(0, cut);
}

std::string TruncateWithMarker(const std::string& text, std::size_t max_chars) {
  const auto cut = CodePointCutOffset(text, max_chars);
  if (cut == std::string::npos) {
    return text;
  }
  return text.substr(0, cut) + "...";
}

bool IsBlank(const std::string& text) {
  for (const unsigned char ch : text) {
    if (std::isspace(ch) == 0) {
      return false;
    }
  }
  return true;
}

}  // namespace caserag
