#pragma once
#include <mutex>
#include <vector>
#include <string>
#include <random>

#include <Eigen/Core>
#include <Eigen/Dense>

#include "glove/algo.hpp"
#include "glove/data/cooccurrence_store.hpp"
#include "glove/algo_impl/glove/result.hpp"
#include "glove/algo_impl/glove/embedding.hpp"

using namespace std;
using namespace Eigen;

namespace glove {

enum class TrainState { UNINITIALIZED, READY, RUNNING, CONVERGED, EXHAUSTED };

const char* state_name(TrainState state);

// f(x) = (x / x_max)^alpha below x_max, 1 from x_max on.
double weighting(double x, double x_max, double alpha);


// GloVe training session.
//
// Hyperparameters are fixed by configure(). initialize_model() binds a
// finalized co-occurrence store and draws the initial parameters; it is the
// only call that (re)initializes them. Every fit() call continues from the
// current parameters and appends its epoch costs to the history, including
// calls made after the session reached CONVERGED or EXHAUSTED.
//
// Workers update main and context rows under per-term locks, so results
// differ across thread counts. A single worker with a fixed random_seed is
// bit-reproducible.
class CGloVe : public SGDAlgorithm {
public:
    CGloVe();
    ~CGloVe();

    bool configure(const Json& opt);
    bool initialize_model(const CooccurrenceStore& store);
    bool set_initial(const MatrixType& main, const MatrixType& context,
                     const VectorType& bias_main, const VectorType& bias_context);

    // Runs up to num_iters epochs. num_threads <= 0 falls back to the
    // num_workers option. Returns the number of completed epochs, or -1 on
    // invalid input.
    int fit(int num_iters, double convergence_tol, int num_threads=-1);

    void worker(int worker_id);

    TrainState get_state() const { return state_; }
    const vector<double>& get_history() const { return history_; }
    const EmbeddingState& get_embedding() const { return model_; }
    Result get_result() const;
    int dim() const { return dim_; }

private:
    double update_parameter(int64_t k, VectorType& grad_main, VectorType& grad_context);

    Json opt_;
    bool configured_;
    int dim_, num_workers_opt_;
    double x_max_, alpha_, lr_, lambda_;
    bool shuffle_;
    uint32_t random_seed_;

    const CooccurrenceStore* store_;
    EmbeddingState model_;
    vector<mutex> main_locks_, context_locks_;
    vector<int64_t> order_;
    mt19937 rng_;

    TrainState state_;
    vector<double> history_;
};

}
