#include "glove/algo_impl/glove/embedding.hpp"

namespace glove {

void EmbeddingState::initialize(int num_terms, int dim, mt19937& rng)
{
    const float scale = 0.5f / dim;
    uniform_real_distribution<float> uniform(-scale, scale);

    W_main.resize(num_terms, dim);
    W_context.resize(num_terms, dim);
    // row-major fill order keeps the draw sequence independent of threading
    for (int i=0; i < num_terms; ++i)
        for (int d=0; d < dim; ++d)
            W_main(i, d) = uniform(rng);
    for (int i=0; i < num_terms; ++i)
        for (int d=0; d < dim; ++d)
            W_context(i, d) = uniform(rng);

    b_main = VectorType::Zero(num_terms);
    b_context = VectorType::Zero(num_terms);

    gradsq_W_main = FactorTypeRowMajor::Zero(num_terms, dim);
    gradsq_W_context = FactorTypeRowMajor::Zero(num_terms, dim);
    gradsq_b_main = VectorType::Zero(num_terms);
    gradsq_b_context = VectorType::Zero(num_terms);
}

void EmbeddingState::release()
{
    W_main.resize(0, 0);
    W_context.resize(0, 0);
    b_main.resize(0);
    b_context.resize(0);
    gradsq_W_main.resize(0, 0);
    gradsq_W_context.resize(0, 0);
    gradsq_b_main.resize(0);
    gradsq_b_context.resize(0);
}

}
