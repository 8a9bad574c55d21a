#pragma once
#include <random>

#include <Eigen/Core>
#include <Eigen/Dense>

#include "glove/algo.hpp"

using namespace std;
using namespace Eigen;

namespace glove {

// Trainable parameters of one session: main and context vectors (V x D),
// their biases (V) and the matching AdaGrad squared-gradient sums.
struct EmbeddingState
{
    FactorTypeRowMajor W_main, W_context;
    VectorType b_main, b_context;

    FactorTypeRowMajor gradsq_W_main, gradsq_W_context;
    VectorType gradsq_b_main, gradsq_b_context;

    // Vectors are drawn from U(-0.5 / D, 0.5 / D); biases and squared
    // gradient sums start at zero.
    void initialize(int num_terms, int dim, mt19937& rng);
    void release();

    int num_terms() const { return (int)W_main.rows(); }
    int dim() const { return (int)W_main.cols(); }
};

}
