#include <cmath>
#include <string>
#include <algorithm>

#include "glove/algo.hpp"
#include "glove/misc/option.hpp"

using namespace std;
using namespace json11;

namespace glove {

Algorithm::Algorithm()
{
    logger_ = GloveLogger().get_logger();
}

bool Algorithm::init(string opt_path)
{
    Json j;
    if (not parse_option(opt_path, j))
        return false;
    return configure(j);
}

bool Algorithm::parse_option(string opt_path, Json& j)
{
    string err;
    if (not read_option_file(opt_path, j, err))
        return fail(err);
    return true;
}

bool Algorithm::fail(const string& message)
{
    error_ = message;
    CRITICAL("{}", message);
    return false;
}

SGDAlgorithm::SGDAlgorithm() :
    num_workers_(0)
{

}

SGDAlgorithm::~SGDAlgorithm()
{
    if (not workers_.empty())
        join();
}

void SGDAlgorithm::launch_workers(int num_workers)
{
    num_workers_ = num_workers;
    workers_.clear();
    job_queue_.set_max_size(2 * num_workers);
    for (int i=0; i < num_workers; ++i) {
        workers_.emplace_back(thread(&SGDAlgorithm::worker, this, i));
    }
    DEBUG("{} workers launched", num_workers);
}

// Splits [0, num_total_samples) into one contiguous chunk per worker.
void SGDAlgorithm::add_jobs(int64_t num_total_samples, int epoch)
{
    int64_t per_worker = num_total_samples / num_workers_;
    int64_t remainder = num_total_samples % num_workers_;
    int64_t beg = 0;
    for (int i=0; i < num_workers_; ++i) {
        int64_t end = beg + per_worker + (i < remainder ? 1 : 0);
        job_queue_.push(job_t(beg, end, epoch));
        beg = end;
    }
}

// Blocks until every chunk of the current epoch is reported back.
pair<double, int64_t> SGDAlgorithm::wait_epoch()
{
    double loss = 0.0;
    int64_t processed = 0;
    for (int i=0; i < num_workers_; ++i) {
        progress_t p = progress_queue_.pop();
        TRACE("Worker({}) processed {} samples, loss {}",
              p.worker_id, p.num_processed_samples, p.loss);
        loss += p.loss;
        processed += p.num_processed_samples;
    }
    return make_pair(loss, processed);
}

void SGDAlgorithm::update_adagrad(
        Ref<VectorType> param,
        Ref<VectorType> velocity,
        const Ref<const VectorType>& grad,
        double lr, double eps)
{
    velocity.array() += grad.array().square();
    param.array() -= (float)lr * grad.array() / (velocity.array() + (float)eps).sqrt();
}

void SGDAlgorithm::update_adagrad(
        float& param, float& velocity, float grad,
        double lr, double eps)
{
    velocity += grad * grad;
    param -= (float)lr * grad / std::sqrt(velocity + (float)eps);
}

void SGDAlgorithm::join()
{
    for (int i=0; i < num_workers_; ++i) {
        job_t job;
        job.size = -1;
        job_queue_.push(job);
    }

    for (auto& t : workers_) {
        t.join();
    }
    workers_.clear();
}

}
