#include "docqa/embed/hashing_embedder.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace docqa::embed {

namespace {

auto fnv1a(std::string_view s) noexcept -> std::uint64_t {
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ull;
    }
    return h;
}

} // namespace

auto HashingEmbedder::model_name() const -> std::string {
    return "hashing-bow-" + std::to_string(dim_);
}

auto HashingEmbedder::embed_one(std::string_view text) const -> std::vector<float> {
    std::vector<float> vec(dim_, 0.0f);

    std::string token;
    auto flush = [&] {
        if (!token.empty()) {
            vec[fnv1a(token) % dim_] += 1.0f;
            token.clear();
        }
    };
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            flush();
        }
    }
    flush();

    float norm = 0.0f;
    for (float v : vec) norm += v * v;
    if (norm > 0.0f) {
        norm = std::sqrt(norm);
        for (float& v : vec) v /= norm;
    }
    return vec;
}

auto HashingEmbedder::embed(const std::vector<std::string>& texts)
    -> std::expected<std::vector<std::vector<float>>, core::error> {
    if (dim_ == 0) {
        return std::unexpected(core::error{core::error_code::embedding_failed, "dimension must be positive", "embed.hashing"});
    }
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(embed_one(t));
    return out;
}

} // namespace docqa::embed
