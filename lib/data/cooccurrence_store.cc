#include <cmath>
#include <utility>
#include <algorithm>

#include "glove/data/cooccurrence_store.hpp"

namespace glove {

static inline uint64_t pair_key(int i, int j)
{
    return ((uint64_t)(uint32_t)i << 32) | (uint64_t)(uint32_t)j;
}

CooccurrenceStore::CooccurrenceStore(int num_terms) :
    num_terms_(num_terms),
    finalized_(false)
{
    logger_ = GloveLogger().get_logger();
}

bool CooccurrenceStore::fail(const string& message)
{
    error_ = message;
    CRITICAL("{}", message);
    return false;
}

bool CooccurrenceStore::accumulate(int i, int j, double x)
{
    if (finalized_)
        return fail("Co-occurrence store is already finalized");
    if (i < 0 or i >= num_terms_ or j < 0 or j >= num_terms_)
        return fail(fmt::format("Term pair ({}, {}) out of range [0, {})", i, j, num_terms_));
    if (i == j)
        return fail(fmt::format("Term {} cannot be its own context", i));
    if (not (x > 0.0) or not std::isfinite(x))
        return fail(fmt::format("Weight {} for pair ({}, {}) is not positive", x, i, j));

    pending_[pair_key(i, j)] += x;
    return true;
}

bool CooccurrenceStore::finalize()
{
    if (finalized_)
        return fail("Co-occurrence store is already finalized");

    vector<pair<uint64_t, double>> entries(pending_.begin(), pending_.end());
    unordered_map<uint64_t, double>().swap(pending_);
    sort(entries.begin(), entries.end(),
         [](const pair<uint64_t, double>& a, const pair<uint64_t, double>& b) {
             return a.first < b.first;
         });

    rows_.resize(entries.size());
    cols_.resize(entries.size());
    vals_.resize(entries.size());
    for (size_t k=0; k < entries.size(); ++k) {
        rows_[k] = (int32_t)(entries[k].first >> 32);
        cols_[k] = (int32_t)(entries[k].first & 0xFFFFFFFFu);
        vals_[k] = (float)entries[k].second;
    }
    finalized_ = true;
    INFO("Co-occurrence store finalized: {} terms, {} entries", num_terms_, vals_.size());
    return true;
}

int64_t CooccurrenceStore::size() const
{
    if (finalized_)
        return (int64_t)vals_.size();
    return (int64_t)pending_.size();
}

float CooccurrenceStore::get(int i, int j) const
{
    if (not finalized_) {
        auto it = pending_.find(pair_key(i, j));
        return it == pending_.end() ? 0.0f : (float)it->second;
    }

    int64_t lo = 0, hi = (int64_t)vals_.size();
    while (lo < hi) {
        int64_t mid = lo + (hi - lo) / 2;
        if (rows_[mid] < i or (rows_[mid] == i and cols_[mid] < j))
            lo = mid + 1;
        else
            hi = mid;
    }
    if (lo < (int64_t)vals_.size() and rows_[lo] == i and cols_[lo] == j)
        return vals_[lo];
    return 0.0f;
}

double CooccurrenceStore::total_weight() const
{
    double total = 0.0;
    if (finalized_) {
        for (const float v : vals_)
            total += v;
    } else {
        for (const auto& kv : pending_)
            total += kv.second;
    }
    return total;
}

SparseMatrixType CooccurrenceStore::to_sparse() const
{
    SparseMatrixType X(num_terms_, num_terms_);
    if (not finalized_) {
        WARN0("Exporting a co-occurrence store that is not finalized");
        return X;
    }

    vector<Triplet<float>> triplets;
    triplets.reserve(vals_.size());
    for (size_t k=0; k < vals_.size(); ++k)
        triplets.emplace_back(rows_[k], cols_[k], vals_[k]);
    X.setFromTriplets(triplets.begin(), triplets.end());
    return X;
}

}
