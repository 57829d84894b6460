/**
 * pslearn - Search Interface
 * Hyperparameter tuning and feature selection by particle swarm optimization
 * against a cross-validated score
 */

#pragma once

#include "pslearn/core/data.hpp"
#include "pslearn/core/space.hpp"
#include "pslearn/core/iestimator.hpp"
#include "pslearn/core/scoring.hpp"
#include "pslearn/core/crossval.hpp"
#include "pslearn/core/context.hpp"
#include "pslearn/core/driver.hpp"

namespace pslearn {

    /**
    * @brief Searches the estimator hyperparameters described by a SearchSpace
    *
    * Each particle holds one key per dimension; its fitness is the mean
    * cross-validated score of the estimator built from the decoded parameters.
    */
    class ParticleSwarmSearchCV {
    public:
        // throws ConfigurationError on an invalid configuration or an empty search space
        ParticleSwarmSearchCV(core::TSearchConfig config, core::SearchSpace space,
                              std::shared_ptr<const core::IEstimatorFactory> estimator);

        // -------------------------------------------------------------------------
        // OPTIONAL COLLABORATORS (default: resolved from the configuration)
        // -------------------------------------------------------------------------
        void setScorer(core::Scorer scorer) { scorer_ = std::move(scorer); }
        void setSplitter(core::FoldSplitter splitter) { splitter_ = std::move(splitter); }
        void setObserver(GenerationObserver observer) { observer_ = std::move(observer); }
        void setStrategy(UpdateFunc strategy) { strategy_ = std::move(strategy); }

        // -------------------------------------------------------------------------
        // PUBLIC INTERFACE
        // -------------------------------------------------------------------------

        // runs the whole search; throws NoViableCandidateError if every candidate failed
        const core::TSearchResult& fit(const core::TDataset& data);

        // asks a running fit to finish after the current generation
        void stop() { context_.signalStop(); }

        // -------------------------------------------------------------------------
        // ACCESSORS (throw std::logic_error before a successful fit)
        // -------------------------------------------------------------------------
        const core::TSearchResult& result() const;
        double bestScore() const { return result().bestScore; }
        const core::ParamMap& bestParams() const { return result().bestParams; }
        const core::Matrix& bestProba() const { return result().bestProba; }

        const core::SearchSpace& searchSpace() const { return space_; }

    private:
        core::TSearchConfig config_;
        core::SearchSpace space_;
        std::shared_ptr<const core::IEstimatorFactory> estimator_;

        core::Scorer scorer_;
        core::FoldSplitter splitter_;
        GenerationObserver observer_;
        UpdateFunc strategy_;

        core::SearchContext context_;
        std::optional<core::TSearchResult> result_;
    };

    /**
    * @brief Searches the subset of columns of X that maximizes the cross-validated score
    *
    * Each particle holds one inclusion key per column (kept when >= 0.5). The
    * estimator is built from the same fixed parameters for every candidate.
    */
    class ParticleSwarmFeatureSelectionCV {
    public:
        ParticleSwarmFeatureSelectionCV(core::TSearchConfig config,
                                        std::shared_ptr<const core::IEstimatorFactory> estimator,
                                        core::ParamMap estimatorParams = {});

        void setScorer(core::Scorer scorer) { scorer_ = std::move(scorer); }
        void setSplitter(core::FoldSplitter splitter) { splitter_ = std::move(splitter); }
        void setObserver(GenerationObserver observer) { observer_ = std::move(observer); }
        void setStrategy(UpdateFunc strategy) { strategy_ = std::move(strategy); }

        const core::TSearchResult& fit(const core::TDataset& data);

        void stop() { context_.signalStop(); }

        const core::TSearchResult& result() const;
        double bestScore() const { return result().bestScore; }
        const std::vector<size_t>& bestFeatures() const { return result().bestFeatures; }
        const std::vector<std::string>& bestFeatureNames() const { return result().bestFeatureNames; }
        const core::Matrix& bestProba() const { return result().bestProba; }

    private:
        core::TSearchConfig config_;
        std::shared_ptr<const core::IEstimatorFactory> estimator_;
        core::ParamMap estimatorParams_;

        core::Scorer scorer_;
        core::FoldSplitter splitter_;
        GenerationObserver observer_;
        UpdateFunc strategy_;

        core::SearchContext context_;
        std::optional<core::TSearchResult> result_;
    };

    // throws ConfigurationError if X is empty, ragged, or misaligned with y / feature names
    void ValidateDataset(const core::TDataset& data);

} // namespace pslearn
