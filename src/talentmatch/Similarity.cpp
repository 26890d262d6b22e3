#include "talentmatch/Similarity.hpp"

#include <algorithm>
#include <cmath>

#include <rapidfuzz/fuzz.hpp>

#include "text/TextUtil.hpp"

namespace talentmatch {

static double clamp01(double x) {
    if (x < 0.0) return 0.0;
    if (x > 1.0) return 1.0;
    return x;
}

std::optional<double> title_similarity(const std::string& a, const std::string& b) {
    const std::string na = textutil::normalize(a);
    const std::string nb = textutil::normalize(b);
    if (na.empty() || nb.empty()) return std::nullopt;

    // partial_ratio catches "developer" inside "senior developer";
    // token_sort_ratio catches reordered titles like "developer, senior".
    const double partial = rapidfuzz::fuzz::partial_ratio(na, nb);
    const double sorted = rapidfuzz::fuzz::token_sort_ratio(na, nb);
    return clamp01(std::max(partial, sorted) / 100.0);
}

std::optional<double> semantic_similarity(const std::string& a, const std::string& b) {
    const auto ta = textutil::content_tokens(a);
    const auto tb = textutil::content_tokens(b);
    if (ta.empty() || tb.empty()) return std::nullopt;

    const auto& small = ta.size() <= tb.size() ? ta : tb;
    const auto& large = ta.size() <= tb.size() ? tb : ta;

    size_t inter = 0;
    for (const auto& t : small) {
        if (large.find(t) != large.end()) ++inter;
    }
    return static_cast<double>(inter) / static_cast<double>(large.size());
}

std::optional<double> cosine(const std::optional<std::vector<float>>& a,
                             const std::optional<std::vector<float>>& b) {
    if (!a || !b) return std::nullopt;
    if (a->empty() || a->size() != b->size()) return std::nullopt;

    double dot = 0.0, na = 0.0, nb = 0.0;
    for (size_t i = 0; i < a->size(); ++i) {
        const double x = (*a)[i];
        const double y = (*b)[i];
        dot += x * y;
        na += x * x;
        nb += y * y;
    }
    if (na == 0.0 || nb == 0.0) return std::nullopt;
    if (!std::isfinite(dot) || !std::isfinite(na) || !std::isfinite(nb)) return std::nullopt;

    const double c = dot / (std::sqrt(na) * std::sqrt(nb));
    return std::max(-1.0, std::min(1.0, c));
}

std::optional<double> embedding_similarity(const std::optional<std::vector<float>>& a,
                                           const std::optional<std::vector<float>>& b) {
    const auto c = cosine(a, b);
    if (!c) return std::nullopt;
    return clamp01((*c + 1.0) / 2.0);
}

}  // namespace talentmatch
