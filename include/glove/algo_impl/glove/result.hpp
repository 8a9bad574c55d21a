#pragma once

#include "glove/algo.hpp"

namespace glove {

// Trained factors. `main` is V x D; `components` is the context factor
// transposed to D x V.
struct Result
{
    MatrixType main;
    MatrixType components;
    VectorType bias_main;
    VectorType bias_context;
};

enum class CombineMode { SUM, AVERAGE };

// main + components^T, or half of it for AVERAGE. Computed on every call.
MatrixType combined(const Result& result, CombineMode mode, int num_threads=1);

}
