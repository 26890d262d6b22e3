#pragma once

#include <optional>
#include <string>
#include <vector>

namespace talentmatch {

// Fuzzy title match in [0,1]: best of partial ratio and token-sort ratio over
// normalized titles. Symmetric. nullopt when either title is blank.
std::optional<double> title_similarity(const std::string& a, const std::string& b);

// Content-token overlap |A ∩ B| / max(|A|, |B|) of two free-text blobs.
// nullopt when either side has no usable tokens.
std::optional<double> semantic_similarity(const std::string& a, const std::string& b);

// Raw cosine in [-1,1]. nullopt on missing/empty vectors, mismatched
// dimensions or a zero-norm vector.
std::optional<double> cosine(const std::optional<std::vector<float>>& a,
                             const std::optional<std::vector<float>>& b);

// cosine mapped onto [0,1] via (cos+1)/2
std::optional<double> embedding_similarity(const std::optional<std::vector<float>>& a,
                                           const std::optional<std::vector<float>>& b);

}  // namespace talentmatch
