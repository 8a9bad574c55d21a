#pragma once
#include <omp.h>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>
#include <utility>

#include <Eigen/Core>
#include <Eigen/Dense>

#include "json11.hpp"
#include "glove/misc/log.hpp"
#include "glove/concurrent_queue.hpp"

using namespace std;
using namespace json11;
using namespace Eigen;

namespace glove {

typedef Matrix<float, Dynamic, Dynamic, RowMajor> MatrixType;
typedef RowVectorXf VectorType;

typedef Matrix<float, Dynamic, Dynamic, RowMajor> FactorTypeRowMajor;

// A contiguous slice [begin, end) of the epoch's sample order.
// A job with size == -1 tells the worker to exit.
struct job_t
{
    int64_t begin;
    int64_t end;
    int64_t size;
    int epoch;

    job_t() : begin(0), end(0), size(0), epoch(0)
    {
    }

    job_t(int64_t b, int64_t e, int ep) :
        begin(b), end(e), size(e - b), epoch(ep)
    {
    }
};


struct progress_t
{
    int worker_id;
    int64_t num_processed_samples;
    double loss;

    progress_t() : worker_id(-1), num_processed_samples(0), loss(0.0)
    {
    }

    progress_t(int w, int64_t n, double l) :
        worker_id(w),
        num_processed_samples(n),
        loss(l) {
    }
};



class Algorithm
{
public:
    Algorithm();

    virtual ~Algorithm() {}
    bool init(string opt_path);
    virtual bool configure(const Json& opt) = 0;

    bool parse_option(string opt_path, Json& j);
    const string& last_error() const { return error_; }

protected:
    bool fail(const string& message);

public:
    float eps_ = 1e-8;
    std::shared_ptr<spdlog::logger> logger_;

protected:
    string error_;
};

class SGDAlgorithm : public Algorithm
{
public:
    SGDAlgorithm();
    ~SGDAlgorithm();

public:
    void launch_workers(int num_workers);
    void add_jobs(int64_t num_total_samples, int epoch);
    pair<double, int64_t> wait_epoch();
    void join();

    static void update_adagrad(
        Ref<VectorType> param,
        Ref<VectorType> velocity,
        const Ref<const VectorType>& grad,
        double lr, double eps);
    static void update_adagrad(
        float& param, float& velocity, float grad,
        double lr, double eps);

public:
    virtual void worker(int worker_id) = 0;

    int num_workers_;
    vector<thread> workers_;
    Queue<job_t> job_queue_;
    Queue<progress_t> progress_queue_;
};

}
