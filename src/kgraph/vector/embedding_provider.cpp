#include "kgraph/vector/embedding_provider.h"

#include <cctype>

#include "kgraph/vector/quantization.h"

namespace kgraph {
namespace vector {

core::Vector HashingEmbeddingProvider::embed_one(const std::string& text) const {
    core::Vector v(dim_, 0.0f);
    if (dim_ == 0) return v;

    std::string padded = "  ";
    for (unsigned char c : text) {
        padded.push_back(static_cast<char>(std::tolower(c)));
    }
    padded.push_back(' ');
    if (padded.size() <= 3) return v;

    for (size_t i = 0; i + 3 <= padded.size(); ++i) {
        uint32_t h = 2166136261u;
        for (size_t j = i; j < i + 3; ++j) {
            h ^= static_cast<unsigned char>(padded[j]);
            h *= 16777619u;
        }
        const float sign = (h & 0x80000000u) ? -1.0f : 1.0f;
        v[h % dim_] += sign;
    }
    return L2Normalize(v);
}

core::Result<std::vector<core::Vector>> HashingEmbeddingProvider::embed(const std::vector<std::string>& texts) {
    std::vector<core::Vector> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(embed_one(text));
    }
    return core::Result<std::vector<core::Vector>>(std::move(out));
}

} // namespace vector
} // namespace kgraph
