#pragma once

#include "pslearn/core/data.hpp"
#include "pslearn/core/iestimator.hpp"
#include "pslearn/core/scoring.hpp"

namespace pslearn::core {

    //--------------------------------------------------------------------------
    // Struct: TCandidate
    // Description: a decoded particle: estimator parameters and, in feature
    // selection mode, the columns of X it is restricted to
    //--------------------------------------------------------------------------
    struct TCandidate
    {
        ParamMap params;
        std::optional<std::vector<size_t>> features;   // empty optional = all columns
    };

    /**
     * @brief Turns decoded candidates into cross-validated fitness values
     *
     * A candidate whose construction, fit or scoring throws a std::exception,
     * or whose mean fold score is not finite, gets WORST_FITNESS. Any other
     * failure inside a worker aborts the batch with BackendError.
     * Identical candidates are evaluated once per evaluator (results are cached).
     */
    class FitnessEvaluator {
        public:
            FitnessEvaluator(const TDataset& data,
                             std::shared_ptr<const IEstimatorFactory> factory,
                             Scorer scorer,
                             std::vector<TFold> folds,
                             int nJobs,
                             int verbosity = 0);

            // mean fold score of one candidate (no caching, no parallelism)
            double evaluate(const TCandidate& candidate) const;

            // scores every candidate, in parallel over at most nJobs workers;
            // returns only after all of them are done
            std::vector<double> evaluateAll(const std::vector<TCandidate>& candidates);

            // out-of-fold class probabilities over the same folds, one column per
            // class of y in increasing order (0 for classes a training fold lacked);
            // empty if the estimator has no predict_proba
            Matrix heldOutProba(const TCandidate& candidate) const;

            // number of cross-validations actually run (cache hits excluded)
            size_t numEvaluations() const { return numEvaluations_; }

            size_t numFolds() const { return folds_.size(); }

        private:
            const Matrix& columnsFor(const TCandidate& candidate, Matrix& storage) const;

            const TDataset& data_;
            std::shared_ptr<const IEstimatorFactory> factory_;
            Scorer scorer_;
            std::vector<TFold> folds_;
            int nJobs_;
            int verbosity_;

            std::map<std::string, double> cache_;
            size_t numEvaluations_ = 0;
        };

    // number of worker threads for nJobs (-1 = all available); throws ConfigurationError otherwise
    int ResolveJobs(int nJobs);

} // namespace pslearn::core
