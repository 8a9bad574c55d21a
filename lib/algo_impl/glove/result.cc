#include "glove/algo_impl/glove/result.hpp"

namespace glove {

MatrixType combined(const Result& result, CombineMode mode, int num_threads)
{
    const int V = (int)result.main.rows();
    MatrixType out(V, result.main.cols());
    const float scale = mode == CombineMode::AVERAGE ? 0.5f : 1.0f;

    omp_set_num_threads(num_threads);
    #pragma omp parallel for schedule(static)
    for (int k=0; k < V; ++k) {
        out.row(k) = scale * (result.main.row(k) + result.components.col(k).transpose());
    }
    return out;
}

}
