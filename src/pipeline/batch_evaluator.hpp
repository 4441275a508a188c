#pragma once

#include "data/data_access.hpp"
#include "ledger/wager_store.hpp"
#include "pipeline/orchestrator.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

// ---------------------------------------------------------------------------
// BatchEvaluator - runs independent requests in parallel. Each worker owns
// its Orchestrator; the DataAccess and the ledger are shared. The
// DataAccess must be safe for concurrent reads.
// ---------------------------------------------------------------------------
struct BatchEvaluatorParams {
    int parallelism = 4;  // worker threads
};

class BatchEvaluator {
public:
    using Params = BatchEvaluatorParams;

    BatchEvaluator(DataAccess& data, WagerStore* store, const OrchestratorConfig& cfg = {},
                   const Params& params = {})
        : data_(data), store_(store), cfg_(cfg), params_(params) {}

    // Results are returned in request order. Orchestrator::evaluate reports
    // failures in the result; anything else a worker throws is rethrown here
    // after all workers have joined.
    std::vector<EvaluationResult> run(const std::vector<EvaluationRequest>& requests) {
        std::vector<EvaluationResult> results(requests.size());
        if (requests.empty()) return results;

        SharedQueue queue(requests.size());
        size_t n_threads = std::min(requests.size(),
                                    static_cast<size_t>(std::max(1, params_.parallelism)));
        std::exception_ptr first_error;
        std::mutex error_mutex;
        std::vector<std::thread> threads;
        threads.reserve(n_threads);
        for (size_t t = 0; t < n_threads; ++t) {
            threads.emplace_back([&] {
                try {
                    Orchestrator orch(data_, store_, cfg_);
                    size_t i;
                    while (queue.request(i)) results[i] = orch.evaluate(requests[i]);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    queue.drain();
                }
            });
        }
        for (auto& th : threads) th.join();
        if (first_error) std::rethrow_exception(first_error);
        return results;
    }

private:
    class SharedQueue {
    public:
        explicit SharedQueue(size_t n) : n_(n) {}

        // Claims the next request index; false once all are taken.
        bool request(size_t& index) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (next_ >= n_) return false;
            index = next_++;
            return true;
        }

        // Hands out no further requests.
        void drain() {
            std::lock_guard<std::mutex> lock(mutex_);
            next_ = n_;
        }

    private:
        std::mutex mutex_;
        size_t next_ = 0;
        size_t n_;
    };

    DataAccess& data_;
    WagerStore* store_;
    OrchestratorConfig cfg_;
    Params params_;
};
