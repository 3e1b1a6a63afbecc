#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace caserag {

// similarity = 1 / (1 + distance). Negative or NaN distances are treated as 0.
double DistanceToSimilarity(double distance);

// 0-100 scale rounded to one decimal place.
double SimilarityToPercent(double similarity);

float SquaredL2Distance(std::span<const float> lhs, std::span<const float> rhs);

// Cuts at max_chars (never inside a UTF-8 sequence) and appends "..." when cut.
std::string TruncateWithMarker(const std::string& text, std::size_t max_chars);

// Cuts at max_chars without a marker.
std::string TruncatePlain(const std::string& text, std::size_t max_chars);

bool IsBlank(const std::string& text);

}  // namespace caserag
