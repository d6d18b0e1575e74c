/** \file flat_index.cpp
 *  \brief Flat index implementation: append, exact search, rebuild-on-remove.
 */

#include "docqa/index/flat_index.hpp"
#include "docqa/kernels/distance.hpp"
#include "docqa/core/platform_utils.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <limits>

namespace docqa::index {

using core::error;
using core::error_code;

FlatIndex::FlatIndex(std::size_t dim) : dim_(dim) {}

auto FlatIndex::insert(std::vector<ChunkRecord> records) -> std::expected<std::size_t, error> {
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (records[i].vector.size() != dim_) {
            return std::unexpected(error{error_code::dimension_mismatch,
                "vector " + std::to_string(i) + " has dimension " + std::to_string(records[i].vector.size())
                + ", index expects " + std::to_string(dim_), "index.flat"});
        }
    }
    if (records_.size() + records.size() > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(error{error_code::precondition_failed,
            "index size would exceed 32-bit position limit required by Roaring", "index.flat"});
    }

    // Reserve first so the appends below cannot leave a partial batch behind.
    records_.reserve(records_.size() + records.size());
    const std::size_t n = records.size();
    for (auto& r : records) {
        r.key = next_key_++;
        records_.push_back(std::move(r));
    }
    return n;
}

auto FlatIndex::search(std::span<const float> query, std::uint32_t k) const
    -> std::expected<std::vector<SearchHit>, error> {
    if (k == 0) {
        return std::unexpected(error{error_code::invalid_argument, "k must be positive", "index.flat"});
    }
    if (query.size() != dim_) {
        return std::unexpected(error{error_code::dimension_mismatch,
            "query has dimension " + std::to_string(query.size()) + ", index expects " + std::to_string(dim_),
            "index.flat"});
    }

    const bool dbg = core::debug_enabled();
    const auto t0 = std::chrono::steady_clock::now();

    std::vector<SearchHit> out;
    out.reserve(records_.size());
    for (std::size_t i = 0; i < records_.size(); ++i) {
        out.push_back({i, records_[i].key, kernels::l2_sq(query, records_[i].vector)});
    }

    auto comp = [](const SearchHit& a, const SearchHit& b) {
        if (a.distance == b.distance) return a.position < b.position;
        return a.distance < b.distance;
    };
    const std::size_t kk = std::min<std::size_t>(k, out.size());
    if (out.size() > kk) {
        auto kth = out.begin() + static_cast<std::ptrdiff_t>(kk);
        std::nth_element(out.begin(), kth, out.end(), comp);
        std::sort(out.begin(), kth, comp);
        out.resize(kk);
    } else {
        std::sort(out.begin(), out.end(), comp);
    }

    if (dbg) {
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - t0).count();
        std::cerr << "[docqa][index] search n=" << records_.size() << " k=" << kk << " took " << us << "us" << std::endl;
    }
    return out;
}

auto FlatIndex::select(const RecordPredicate& pred) const -> std::expected<roaring::Roaring, error> {
    if (!pred) {
        return std::unexpected(error{error_code::invalid_argument, "empty predicate", "index.flat"});
    }
    roaring::Roaring bm;
    for (std::size_t i = 0; i < records_.size(); ++i) {
        if (pred(records_[i])) bm.add(static_cast<std::uint32_t>(i));
    }
    return bm;
}

auto FlatIndex::retain(const RecordPredicate& keep) -> std::expected<std::size_t, error> {
    auto survivors = select(keep);
    if (!survivors) return std::unexpected(survivors.error());
    return rebuild_from(*survivors);
}

auto FlatIndex::remove_if(const RecordPredicate& pred) -> std::expected<std::size_t, error> {
    auto doomed = select(pred);
    if (!doomed) return std::unexpected(doomed.error());
    if (doomed->isEmpty()) return std::size_t{0};

    roaring::Roaring survivors;
    survivors.addRange(0, records_.size());
    survivors -= *doomed;
    return rebuild_from(survivors);
}

auto FlatIndex::rebuild_from(const roaring::Roaring& survivors) -> std::size_t {
    const std::size_t before = records_.size();
    if (survivors.cardinality() == before) return 0;

    std::vector<ChunkRecord> rebuilt;
    rebuilt.reserve(static_cast<std::size_t>(survivors.cardinality()));
    for (std::uint32_t pos : survivors) {
        rebuilt.push_back(records_[pos]);
    }
    records_.swap(rebuilt);
    return before - records_.size();
}

auto FlatIndex::restore(std::size_t dim, std::vector<ChunkRecord> records, std::uint64_t next_key)
    -> std::expected<FlatIndex, error> {
    FlatIndex idx(dim);
    std::uint64_t max_key = 0;
    for (std::size_t i = 0; i < records.size(); ++i) {
        if (records[i].vector.size() != dim) {
            return std::unexpected(error{error_code::dimension_mismatch,
                "stored vector " + std::to_string(i) + " has dimension " + std::to_string(records[i].vector.size())
                + ", expected " + std::to_string(dim), "index.flat"});
        }
        max_key = std::max(max_key, records[i].key);
    }
    idx.records_ = std::move(records);
    idx.next_key_ = std::max(next_key, max_key + 1);
    return idx;
}

} // namespace docqa::index
