#include "pslearn/core/evaluator.hpp"
#include "pslearn/core/crossval.hpp"
#include "pslearn/core/errors.hpp"
#include "pslearn/core/space.hpp"
#include "pslearn/utils/io.hpp"

#include <omp.h>

namespace pslearn::core {

    // -----------------------------------------------------------------------------
    // Helpers
    // -----------------------------------------------------------------------------

    int ResolveJobs(int nJobs)
    {
        if (nJobs == -1) return omp_get_max_threads();
        if (nJobs < 1)
            throw ConfigurationError(std::format("n_jobs must be -1 or positive, got {}", nJobs));
        return nJobs;
    }

    // exact identity of a candidate, used as cache key; every name and value is length-prefixed
    static std::string CandidateKey(const TCandidate& candidate)
    {
        std::string key;
        for (const auto& [name, value] : candidate.params){
            std::string text = std::visit([](const auto& v) { return std::format("{}", v); }, value);
            key += std::format("{}:{}#{}:{}:{};", name.size(), name, value.index(), text.size(), text);
        }
        if (candidate.features){
            key += "|";
            for (size_t j : *candidate.features) key += std::format("{},", j);
        }
        return key;
    }

    // readable form of a candidate for the diagnostics
    static std::string DescribeCandidate(const TCandidate& candidate)
    {
        std::string text = "{";
        for (const auto& [name, value] : candidate.params)
            text += std::format(" {}={}", name, ToString(value));
        if (candidate.features){
            text += " features=[";
            for (size_t k = 0; k < candidate.features->size(); k++)
                text += std::format("{}{}", k ? "," : "", (*candidate.features)[k]);
            text += "]";
        }
        return text + " }";
    }

    // -----------------------------------------------------------------------------
    // FitnessEvaluator
    // -----------------------------------------------------------------------------

    FitnessEvaluator::FitnessEvaluator(const TDataset& data,
                                       std::shared_ptr<const IEstimatorFactory> factory,
                                       Scorer scorer,
                                       std::vector<TFold> folds,
                                       int nJobs,
                                       int verbosity)
        : data_(data), factory_(std::move(factory)), scorer_(std::move(scorer)),
          folds_(std::move(folds)), nJobs_(ResolveJobs(nJobs)), verbosity_(verbosity)
    {
        if (!factory_) throw ConfigurationError("estimator factory is missing");
        if (!scorer_) throw ConfigurationError("scorer is missing");
        if (folds_.empty()) throw ConfigurationError("no cross-validation folds");
    }

    const Matrix& FitnessEvaluator::columnsFor(const TCandidate& candidate, Matrix& storage) const
    {
        if (!candidate.features) return data_.X;
        storage = SelectColumns(data_.X, *candidate.features);
        return storage;
    }

    double FitnessEvaluator::evaluate(const TCandidate& candidate) const
    {
        try {
            if (candidate.features && candidate.features->empty())
                throw std::invalid_argument("empty feature set");

            Matrix storage;
            const Matrix& X = columnsFor(candidate, storage);

            double sum = 0.0;
            for (const TFold& fold : folds_)
            {
                std::unique_ptr<IEstimator> estimator = factory_->construct(candidate.params);
                if (!estimator) throw std::runtime_error("estimator factory returned null");

                estimator->fit(SelectRows(X, fold.train), SelectRows(data_.y, fold.train));
                sum += scorer_(*estimator, SelectRows(X, fold.test), SelectRows(data_.y, fold.test));
            }

            double mean = sum / static_cast<double>(folds_.size());
            if (!std::isfinite(mean)){
                utils::LogMessage(verbosity_, 2, std::format("candidate {} scored {}, discarded", DescribeCandidate(candidate), mean));
                return WORST_FITNESS;
            }
            utils::LogMessage(verbosity_, 2, std::format("candidate {} scored {:.6f}", DescribeCandidate(candidate), mean));
            return mean;
        }
        catch (const std::bad_alloc&) {
            throw;
        }
        catch (const std::exception& e) {
            utils::LogMessage(verbosity_, 2, std::format("candidate {} failed: {}", DescribeCandidate(candidate), e.what()));
            return WORST_FITNESS;
        }
    }

    std::vector<double> FitnessEvaluator::evaluateAll(const std::vector<TCandidate>& candidates)
    {
        const int n = static_cast<int>(candidates.size());
        std::vector<double> fitness(n, WORST_FITNESS);
        std::vector<std::string> keys(n);

        // split into cache hits, first occurrences and duplicates of this batch
        std::vector<int> pending;
        std::map<std::string, int> firstSeen;
        std::vector<int> sameAs(n, -1);

        for (int i = 0; i < n; i++){
            keys[i] = CandidateKey(candidates[i]);
            auto hit = cache_.find(keys[i]);
            if (hit != cache_.end()){
                fitness[i] = hit->second;
                continue;
            }
            auto [it, inserted] = firstSeen.emplace(keys[i], i);
            if (inserted) pending.push_back(i);
            else sameAs[i] = it->second;
        }

        // parallel phase: each worker writes only its own slot
        std::exception_ptr failure = nullptr;
        const int numPending = static_cast<int>(pending.size());

        #pragma omp parallel for num_threads(nJobs_) schedule(dynamic, 1)
        for (int k = 0; k < numPending; k++)
        {
            try {
                fitness[pending[k]] = evaluate(candidates[pending[k]]);
            }
            catch (...) {
                #pragma omp critical(pslearn_failure)
                {
                    if (!failure) failure = std::current_exception();
                }
            }
        }
        // barrier: the parallel region has joined

        if (failure){
            try {
                std::rethrow_exception(failure);
            }
            catch (const std::exception& e) {
                throw BackendError(std::format("evaluation worker failed: {}", e.what()));
            }
            catch (...) {
                throw BackendError("evaluation worker failed with a non-standard exception");
            }
        }

        for (int i : pending) cache_[keys[i]] = fitness[i];
        for (int i = 0; i < n; i++){
            if (sameAs[i] >= 0) fitness[i] = fitness[sameAs[i]];
        }
        numEvaluations_ += pending.size();

        return fitness;
    }

    Matrix FitnessEvaluator::heldOutProba(const TCandidate& candidate) const
    {
        Matrix storage;
        const Matrix& X = columnsFor(candidate, storage);

        // columns follow the sorted class set of the whole y; a class missing
        // from a training fold gets probability 0 for that fold's test rows
        std::vector<double> classes(data_.y.begin(), data_.y.end());
        std::sort(classes.begin(), classes.end());
        classes.erase(std::unique(classes.begin(), classes.end()), classes.end());

        Matrix proba(data_.numSamples(), std::vector<double>(classes.size(), 0.0));

        for (const TFold& fold : folds_)
        {
            std::unique_ptr<IEstimator> estimator = factory_->construct(candidate.params);
            if (!estimator) throw std::runtime_error("estimator factory returned null");
            if (!estimator->hasPredictProba()) return {};

            estimator->fit(SelectRows(X, fold.train), SelectRows(data_.y, fold.train));
            Matrix foldProba = estimator->predictProba(SelectRows(X, fold.test));
            std::vector<double> foldClasses = estimator->classes();

            if (foldProba.size() != fold.test.size())
                throw std::runtime_error(std::format("predict_proba returned {} rows for {} samples", foldProba.size(), fold.test.size()));

            std::vector<size_t> column(foldClasses.size());
            for (size_t c = 0; c < foldClasses.size(); c++){
                auto it = std::lower_bound(classes.begin(), classes.end(), foldClasses[c]);
                if (it == classes.end() || *it != foldClasses[c])
                    throw std::runtime_error(std::format("estimator reported class {} which is not in y", foldClasses[c]));
                column[c] = static_cast<size_t>(it - classes.begin());
            }

            for (size_t r = 0; r < fold.test.size(); r++){
                if (foldProba[r].size() != foldClasses.size())
                    throw std::runtime_error(std::format("predict_proba returned {} columns for {} classes", foldProba[r].size(), foldClasses.size()));
                for (size_t c = 0; c < foldClasses.size(); c++)
                    proba[fold.test[r]][column[c]] = foldProba[r][c];
            }
        }
        return proba;
    }

} // namespace pslearn::core
