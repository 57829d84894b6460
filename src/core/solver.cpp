#include "pslearn/core/solver.hpp"
#include "pslearn/core/evaluator.hpp"
#include "pslearn/core/errors.hpp"
#include "pslearn/utils/io.hpp"

namespace pslearn {

    using namespace pslearn::core;

    using CandidateDecoder = std::function<TCandidate(const std::vector<double>&)>;
    using ResultWriter = std::function<void(TSearchResult&, const TCandidate&)>;

    // -----------------------------------------------------------------------------
    // Validation
    // -----------------------------------------------------------------------------

    void ValidateDataset(const TDataset& data)
    {
        if (data.X.empty())
            throw ConfigurationError("X has no samples");
        if (data.y.size() != data.X.size())
            throw ConfigurationError(std::format("X has {} rows but y has {} targets", data.X.size(), data.y.size()));

        const size_t width = data.X.front().size();
        if (width == 0)
            throw ConfigurationError("X has no features");

        for (size_t i = 0; i < data.X.size(); i++){
            if (data.X[i].size() != width)
                throw ConfigurationError(std::format("row {} has {} features, expected {}", i, data.X[i].size(), width));
        }
        if (!data.featureNames.empty() && data.featureNames.size() != width)
            throw ConfigurationError(std::format("{} feature names given for {} columns", data.featureNames.size(), width));
    }

    static void ValidateFolds(const std::vector<TFold>& folds, size_t nSamples)
    {
        if (folds.empty())
            throw ConfigurationError("the splitter produced no folds");

        for (const TFold& fold : folds){
            if (fold.train.empty() || fold.test.empty())
                throw ConfigurationError("every fold needs training and test rows");

            auto outside = [nSamples](size_t r) { return r >= nSamples; };
            if (std::ranges::any_of(fold.train, outside) || std::ranges::any_of(fold.test, outside))
                throw ConfigurationError("a fold references a row outside X");
        }
    }

    // -----------------------------------------------------------------------------
    // Shared search flow
    // -----------------------------------------------------------------------------

    static TSearchResult RunSearch(const TSearchConfig& config, int dimension, const TDataset& data,
                                   const std::shared_ptr<const IEstimatorFactory>& estimator,
                                   const Scorer& scorerOverride, const FoldSplitter& splitterOverride,
                                   const GenerationObserver& observer, const UpdateFunc& strategy,
                                   SearchContext& context,
                                   const CandidateDecoder& decode, const ResultWriter& describe)
    {
        SwarmDriver driver(config, dimension);
        if (observer) driver.setObserver(observer);
        if (strategy) driver.setStrategy(strategy);

        Scorer scorer = scorerOverride ? scorerOverride : ResolveScorer(config.scoring);
        FoldSplitter splitter = splitterOverride ? splitterOverride : ResolveSplitter(config.cvStrategy, config.cv);

        std::vector<TFold> folds = splitter(data);
        ValidateFolds(folds, data.numSamples());

        FitnessEvaluator evaluator(data, estimator, scorer, std::move(folds), config.nJobs, config.verbosity);

        context.setSeed(config.seed);
        context.resetStopFlag();

        BatchFitness fitness = [&](const std::vector<TParticle>& particles) {
            std::vector<TCandidate> candidates;
            candidates.reserve(particles.size());
            for (const TParticle& p : particles) candidates.push_back(decode(p.rk));
            return evaluator.evaluateAll(candidates);
        };

        Finalizer finalize = [&](const TSwarm& swarm) {
            TSearchResult result;
            TCandidate best = decode(swarm.bestRk);
            describe(result, best);
            result.bestProba = evaluator.heldOutProba(best);
            return result;
        };

        TSearchResult result = driver.run(fitness, finalize, context);
        utils::LogMessage(config.verbosity, 1, std::format("Search finished after {} generations and {} cross-validations. Best score: {:.6f}",
                                                           result.numGenerations, evaluator.numEvaluations(), result.bestScore));
        return result;
    }

    // -----------------------------------------------------------------------------
    // ParticleSwarmSearchCV
    // -----------------------------------------------------------------------------

    ParticleSwarmSearchCV::ParticleSwarmSearchCV(TSearchConfig config, SearchSpace space,
                                                 std::shared_ptr<const IEstimatorFactory> estimator)
        : config_(std::move(config)), space_(std::move(space)), estimator_(std::move(estimator))
    {
        ValidateConfig(config_);
        if (space_.empty())
            throw ConfigurationError("search_space is empty");
        if (!estimator_)
            throw ConfigurationError("estimator is missing");
    }

    const TSearchResult& ParticleSwarmSearchCV::fit(const TDataset& data)
    {
        ValidateDataset(data);
        utils::LogMessage(config_.verbosity, 1, "Particle Swarm Search CV started.");

        CandidateDecoder decode = [this](const std::vector<double>& rk) {
            return TCandidate{space_.decode(rk), std::nullopt};
        };
        ResultWriter describe = [](TSearchResult& result, const TCandidate& best) {
            result.bestParams = best.params;
        };

        result_.reset();
        result_.emplace(RunSearch(config_, static_cast<int>(space_.size()), data, estimator_,
                                  scorer_, splitter_, observer_, strategy_, context_, decode, describe));
        return *result_;
    }

    const TSearchResult& ParticleSwarmSearchCV::result() const
    {
        if (!result_) throw std::logic_error("ParticleSwarmSearchCV is not fitted yet");
        return *result_;
    }

    // -----------------------------------------------------------------------------
    // ParticleSwarmFeatureSelectionCV
    // -----------------------------------------------------------------------------

    ParticleSwarmFeatureSelectionCV::ParticleSwarmFeatureSelectionCV(TSearchConfig config,
                                                                     std::shared_ptr<const IEstimatorFactory> estimator,
                                                                     ParamMap estimatorParams)
        : config_(std::move(config)), estimator_(std::move(estimator)), estimatorParams_(std::move(estimatorParams))
    {
        ValidateConfig(config_);
        if (!estimator_)
            throw ConfigurationError("estimator is missing");
    }

    const TSearchResult& ParticleSwarmFeatureSelectionCV::fit(const TDataset& data)
    {
        ValidateDataset(data);
        utils::LogMessage(config_.verbosity, 1, "Particle Swarm Feature Selection CV started.");

        CandidateDecoder decode = [this](const std::vector<double>& rk) {
            return TCandidate{estimatorParams_, SelectedFeatures(DecodeFeatureMask(rk))};
        };
        ResultWriter describe = [&data](TSearchResult& result, const TCandidate& best) {
            result.bestFeatures = *best.features;
            for (size_t j : result.bestFeatures){
                result.bestFeatureNames.push_back(data.featureNames.empty() ? std::to_string(j) : data.featureNames[j]);
            }
        };

        result_.reset();
        result_.emplace(RunSearch(config_, static_cast<int>(data.numFeatures()), data, estimator_,
                                  scorer_, splitter_, observer_, strategy_, context_, decode, describe));
        return *result_;
    }

    const TSearchResult& ParticleSwarmFeatureSelectionCV::result() const
    {
        if (!result_) throw std::logic_error("ParticleSwarmFeatureSelectionCV is not fitted yet");
        return *result_;
    }

} // namespace pslearn
