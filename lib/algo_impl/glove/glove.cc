#include <cmath>
#include <numeric>
#include <algorithm>
#include <sys/time.h>

#include "json11.hpp"
#include "glove/misc/log.hpp"
#include "glove/misc/option.hpp"
#include "glove/algo_impl/glove/glove.hpp"


namespace glove {

const char* state_name(TrainState state)
{
    switch (state) {
        case TrainState::UNINITIALIZED: return "Uninitialized";
        case TrainState::READY: return "Ready";
        case TrainState::RUNNING: return "Running";
        case TrainState::CONVERGED: return "Converged";
        case TrainState::EXHAUSTED: return "Exhausted";
    }
    return "Unknown";
}

double weighting(double x, double x_max, double alpha)
{
    if (x < x_max)
        return std::pow(x / x_max, alpha);
    return 1.0;
}

static bool is_positive_integer(double v)
{
    return v >= 1 and v == std::floor(v);
}

CGloVe::CGloVe() :
    configured_(false),
    dim_(0), num_workers_opt_(0),
    x_max_(0.0), alpha_(0.0), lr_(0.0), lambda_(0.0),
    shuffle_(true), random_seed_(1),
    store_(nullptr),
    state_(TrainState::UNINITIALIZED)
{
}

CGloVe::~CGloVe()
{
    model_.release();
}

bool CGloVe::configure(const Json& opt)
{
    if (state_ != TrainState::UNINITIALIZED)
        return fail("Hyperparameters are fixed once the model is initialized");

    const Json::object defaults = {
        {"word_vectors_size", 0},
        {"x_max", 10.0},
        {"alpha", 0.75},
        {"learning_rate", 0.15},
        {"lambda", 0.0},
        {"shuffle", true},
        {"random_seed", 1},
        {"num_workers", 0},
        {"eps", 1e-8},
        {"verbose", 2},
    };
    string err;
    if (not merge_options(opt, defaults, opt_, err))
        return fail(err);

    double dim = opt_["word_vectors_size"].number_value();
    if (not is_positive_integer(dim))
        return fail(fmt::format("word_vectors_size must be a positive integer, got {}", dim));

    double x_max = opt_["x_max"].number_value();
    if (not (x_max > 0.0))
        return fail(fmt::format("x_max must be positive, got {}", x_max));

    double alpha = opt_["alpha"].number_value();
    if (not (alpha > 0.0 and alpha <= 1.0))
        return fail(fmt::format("alpha must be in (0, 1], got {}", alpha));

    double lr = opt_["learning_rate"].number_value();
    if (not (lr > 0.0))
        return fail(fmt::format("learning_rate must be positive, got {}", lr));

    double lambda = opt_["lambda"].number_value();
    if (not (lambda >= 0.0))
        return fail(fmt::format("lambda must be non-negative, got {}", lambda));

    double eps = opt_["eps"].number_value();
    if (not (eps > 0.0))
        return fail(fmt::format("eps must be positive, got {}", eps));

    double num_workers = opt_["num_workers"].number_value();
    if (num_workers < 0 or num_workers != std::floor(num_workers))
        return fail(fmt::format("num_workers must be a non-negative integer, got {}", num_workers));

    GloveLogger().set_log_level(opt_["verbose"].int_value());

    dim_ = (int)dim;
    x_max_ = x_max;
    alpha_ = alpha;
    lr_ = lr;
    lambda_ = lambda;
    eps_ = (float)eps;
    num_workers_opt_ = (int)num_workers;
    shuffle_ = opt_["shuffle"].bool_value();
    random_seed_ = (uint32_t)opt_["random_seed"].int_value();
    configured_ = true;
    DEBUG("D({}) x_max({}) alpha({}) learning_rate({}) lambda({})",
          dim_, x_max_, alpha_, lr_, lambda_);
    return true;
}

bool CGloVe::initialize_model(const CooccurrenceStore& store)
{
    if (not configured_)
        return fail("Options must be configured before initialize_model");
    if (state_ == TrainState::RUNNING)
        return fail("Cannot initialize the model while training is running");
    if (store.num_terms() <= 0)
        return fail("Vocabulary is empty");
    if (not store.is_finalized())
        return fail("Co-occurrence store must be finalized before training");
    if (store.size() == 0)
        return fail("Co-occurrence store has no entries");

    const int V = store.num_terms();
    store_ = &store;
    rng_.seed(random_seed_);
    model_.initialize(V, dim_, rng_);

    vector<mutex>(V).swap(main_locks_);
    vector<mutex>(V).swap(context_locks_);

    order_.resize(store.size());
    iota(order_.begin(), order_.end(), 0);

    history_.clear();
    state_ = TrainState::READY;
    INFO("W_main({} x {}) W_context({} x {}) Entries({})",
         model_.W_main.rows(), model_.W_main.cols(),
         model_.W_context.rows(), model_.W_context.cols(), store.size());
    return true;
}

bool CGloVe::set_initial(const MatrixType& main, const MatrixType& context,
                         const VectorType& bias_main, const VectorType& bias_context)
{
    if (state_ != TrainState::READY or not history_.empty())
        return fail("Initial parameters can only be set between initialize_model and the first fit");

    const int V = model_.num_terms();
    if (main.rows() != V or main.cols() != dim_
            or context.rows() != V or context.cols() != dim_)
        return fail(fmt::format("Initial vectors must be {} x {}", V, dim_));
    if (bias_main.size() != V or bias_context.size() != V)
        return fail(fmt::format("Initial biases must have length {}", V));

    model_.W_main = main;
    model_.W_context = context;
    model_.b_main = bias_main;
    model_.b_context = bias_context;
    return true;
}

int CGloVe::fit(int num_iters, double convergence_tol, int num_threads)
{
    if (state_ == TrainState::UNINITIALIZED) {
        fail("initialize_model must be called before fit");
        return -1;
    }
    if (num_iters <= 0) {
        fail(fmt::format("n_iter must be positive, got {}", num_iters));
        return -1;
    }
    if (not (convergence_tol >= 0.0)) {
        fail(fmt::format("convergence_tol must be non-negative, got {}", convergence_tol));
        return -1;
    }

    if (num_threads <= 0)
        num_threads = num_workers_opt_;
    if (num_threads <= 0)
        num_threads = omp_get_num_procs();

    const int64_t num_entries = store_->size();
    INFO("Training: Epochs({}) Workers({}) Entries({}) ConvergenceTol({})",
         num_iters, num_threads, num_entries, convergence_tol);

    launch_workers(num_threads);
    state_ = TrainState::RUNNING;

    bool converged = false;
    int completed = 0;
    struct timeval start_time, end_time;
    while (completed < num_iters) {
        gettimeofday(&start_time, NULL);
        if (shuffle_)
            std::shuffle(order_.begin(), order_.end(), rng_);

        add_jobs(num_entries, completed);
        pair<double, int64_t> epoch = wait_epoch();
        double cost = epoch.first / (double)num_entries;
        history_.push_back(cost);
        ++completed;

        gettimeofday(&end_time, NULL);
        double elapsed = ((end_time.tv_sec  - start_time.tv_sec) * 1000000u + end_time.tv_usec - start_time.tv_usec) / 1.e6;
        INFO("Epoch({}/{}): Cost({:.6f}) {} samples in {:.3f} secs",
             completed, num_iters, cost, epoch.second, elapsed);
        if (not std::isfinite(cost)) {
            WARN("Epoch({}) cost is not finite; learning_rate({}) may be too large",
                 completed, lr_);
        }

        const size_t h = history_.size();
        if (convergence_tol > 0.0 and h >= 2) {
            double prev = history_[h - 2];
            if ((prev - cost) / prev < convergence_tol) {
                converged = true;
                break;
            }
        }
    }

    join();
    state_ = converged ? TrainState::CONVERGED : TrainState::EXHAUSTED;
    INFO("{} after {} epochs, last cost {:.6f}",
         state_name(state_), completed, history_.back());
    return completed;
}

void CGloVe::worker(int worker_id)
{
    VectorType grad_main(dim_), grad_context(dim_);
    while(true)
    {
        job_t job = job_queue_.pop();
        if(job.size == -1)
            break;

        double loss = 0.0;
        for (int64_t it = job.begin; it < job.end; ++it)
            loss += update_parameter(order_[it], grad_main, grad_context);

        TRACE("Worker({}) epoch({}) [{}, {}) done", worker_id, job.epoch, job.begin, job.end);
        progress_queue_.push(progress_t(worker_id, job.end - job.begin, loss));
    }
}

double CGloVe::update_parameter(int64_t k, VectorType& grad_main, VectorType& grad_context)
{
    const int i = store_->row(k);
    const int j = store_->col(k);
    const float x = store_->val(k);
    const float fx = (float)weighting(x, x_max_, alpha_);

    // main lock is always taken before the context lock
    lock_guard<mutex> main_lock(main_locks_[i]);
    lock_guard<mutex> context_lock(context_locks_[j]);

    float diff = model_.W_main.row(i).dot(model_.W_context.row(j))
        + model_.b_main(i) + model_.b_context(j) - std::log(x);
    float fdiff = fx * diff;
    double cost = (double)fdiff * diff;

    grad_main.noalias() = fdiff * model_.W_context.row(j);
    grad_context.noalias() = fdiff * model_.W_main.row(i);
    if (lambda_ > 0.0) {
        const float lambda = (float)lambda_;
        cost += lambda_ * (model_.W_main.row(i).lpNorm<1>() + model_.W_context.row(j).lpNorm<1>());
        grad_main.array() += lambda * model_.W_main.row(i).array().sign();
        grad_context.array() += lambda * model_.W_context.row(j).array().sign();
    }

    update_adagrad(model_.W_main.row(i), model_.gradsq_W_main.row(i), grad_main, lr_, eps_);
    update_adagrad(model_.W_context.row(j), model_.gradsq_W_context.row(j), grad_context, lr_, eps_);
    update_adagrad(model_.b_main(i), model_.gradsq_b_main(i), fdiff, lr_, eps_);
    update_adagrad(model_.b_context(j), model_.gradsq_b_context(j), fdiff, lr_, eps_);
    return cost;
}

Result CGloVe::get_result() const
{
    Result result;
    result.main = model_.W_main;
    result.components = model_.W_context.transpose();
    result.bias_main = model_.b_main;
    result.bias_context = model_.b_context;
    return result;
}

}
