#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>

#include <Eigen/Core>
#include <Eigen/SparseCore>

#include "glove/misc/log.hpp"

using namespace std;
using namespace Eigen;

namespace glove {

typedef SparseMatrix<float, RowMajor> SparseMatrixType;

// Sparse term-term co-occurrence table.
//
// While building, weights are summed per ordered pair (i, j) in a hash map,
// so memory follows the number of distinct pairs. finalize() freezes the
// table into three parallel arrays sorted by (i, j); that order is the
// iteration order seen by every reader. Both directions of a pair are kept
// as separate entries.
class CooccurrenceStore
{
public:
    explicit CooccurrenceStore(int num_terms);

    bool accumulate(int i, int j, double x);
    bool finalize();

    bool is_finalized() const { return finalized_; }
    int num_terms() const { return num_terms_; }
    int64_t size() const;

    int row(int64_t k) const { return rows_[k]; }
    int col(int64_t k) const { return cols_[k]; }
    float val(int64_t k) const { return vals_[k]; }

    float get(int i, int j) const;
    double total_weight() const;
    SparseMatrixType to_sparse() const;

    const string& last_error() const { return error_; }

    std::shared_ptr<spdlog::logger> logger_;

private:
    bool fail(const string& message);

    int num_terms_;
    bool finalized_;
    unordered_map<uint64_t, double> pending_;
    vector<int32_t> rows_, cols_;
    vector<float> vals_;
    string error_;
};

}
