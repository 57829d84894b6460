/**
 * pslearn - Swarm Driver
 * Generational loop shared by the hyperparameter and feature-selection searches
 */

#pragma once

#include "pslearn/core/data.hpp"
#include "pslearn/core/context.hpp"

namespace pslearn {

    // INIT -> EVALUATING -> UPDATING_BESTS -> APPLYING_DYNAMICS -> (EVALUATING ...)
    //      -> TERMINATED -> FINALIZING -> DONE
    enum class SearchState { Init, Evaluating, UpdatingBests, ApplyingDynamics, Terminated, Finalizing, Done };

    // variant strategy: positions/velocities of generation t+1 from the swarm at t
    using UpdateFunc = std::function<void(core::TSwarm&, const core::TPsoParams&, int iteration, int maxIter, std::mt19937&)>;

    // fitness of every particle's current position, same order, all complete on return
    using BatchFitness = std::function<std::vector<double>(const std::vector<core::TParticle>&)>;

    // decodes the final swarm into a result (parameters or features, probabilities)
    using Finalizer = std::function<core::TSearchResult(const core::TSwarm&)>;

    // called after the bests of each generation are updated
    using GenerationObserver = std::function<void(const core::TSwarm&)>;

    /**
    * @brief Runs the PSO generational loop over an abstract fitness
    *
    * Owns the swarm for the duration of run(). Fitness evaluation may be
    * parallel inside BatchFitness; the bests and dynamics are updated by this
    * single thread only after the whole batch returned.
    */
    class SwarmDriver {
    public:
        // throws ConfigurationError on invalid sizes, constants or strategy name
        SwarmDriver(const core::TSearchConfig& config, int dimension);

        core::TSearchResult run(const BatchFitness& fitness, const Finalizer& finalize,
                                core::SearchContext& context);

        void setObserver(GenerationObserver observer) { observer_ = std::move(observer); }

        // replaces the named strategy with an injected one
        void setStrategy(UpdateFunc strategy);

        SearchState state() const { return state_; }

        // "vanilla", "linear_inertia", "ring"
        static UpdateFunc resolveStrategy(const std::string& name);
        static std::vector<std::string> strategyNames();

    private:
        void initialize(core::TSwarm& swarm, std::mt19937& rng) const;
        bool updateBests(core::TSwarm& swarm) const;

        core::TSearchConfig config_;
        int dimension_;
        UpdateFunc strategy_;
        GenerationObserver observer_;
        SearchState state_ = SearchState::Init;
    };

    // validation shared by the driver and the configuration loader
    void ValidateConfig(const core::TSearchConfig& config);

} // namespace pslearn
