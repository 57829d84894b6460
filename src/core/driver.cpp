#include "pslearn/core/driver.hpp"
#include "pslearn/core/errors.hpp"
#include "pslearn/core/method.hpp"
#include "pslearn/utils/io.hpp"

// variant strategies
#include "pslearn/mh/pso.hpp"
#include "pslearn/mh/ldiw_pso.hpp"
#include "pslearn/mh/ring_pso.hpp"

namespace pslearn {

    using namespace pslearn::core;

    // -----------------------------------------------------------------------------
    // Strategy registry
    // -----------------------------------------------------------------------------

    static const std::map<std::string, UpdateFunc>& StrategyRegistry()
    {
        static const std::map<std::string, UpdateFunc> registry = {
            {"vanilla",        pslearn::mh::PSO},
            {"linear_inertia", pslearn::mh::LDIW_PSO},
            {"ring",           pslearn::mh::RING_PSO},
        };
        return registry;
    }

    UpdateFunc SwarmDriver::resolveStrategy(const std::string& name)
    {
        auto it = StrategyRegistry().find(name);
        if (it == StrategyRegistry().end())
            throw ConfigurationError(std::format("unknown pso strategy '{}'", name));
        return it->second;
    }

    std::vector<std::string> SwarmDriver::strategyNames()
    {
        std::vector<std::string> names;
        for (const auto& entry : StrategyRegistry()) names.push_back(entry.first);
        return names;
    }

    // -----------------------------------------------------------------------------
    // Validation
    // -----------------------------------------------------------------------------

    void ValidateConfig(const TSearchConfig& config)
    {
        if (config.nParticles <= 0)
            throw ConfigurationError(std::format("n_particles must be positive, got {}", config.nParticles));
        if (config.maxIter <= 0)
            throw ConfigurationError(std::format("max_iter must be positive, got {}", config.maxIter));
        if (config.nJobs == 0 || config.nJobs < -1)
            throw ConfigurationError(std::format("n_jobs must be -1 or positive, got {}", config.nJobs));
        if (config.cv < 2)
            throw ConfigurationError(std::format("cv must be at least 2, got {}", config.cv));
        if (config.nIterNoChange < 0)
            throw ConfigurationError(std::format("n_iter_no_change must be >= 0, got {}", config.nIterNoChange));

        const TPsoParams& pso = config.pso;
        const std::pair<const char*, double> constants[] = {
            {"w", pso.w}, {"c1", pso.c1}, {"c2", pso.c2}, {"w_start", pso.wStart}, {"w_end", pso.wEnd}
        };
        for (const auto& [name, value] : constants){
            if (!std::isfinite(value))
                throw ConfigurationError(std::format("pso.{} must be finite", name));
        }
        if (pso.c1 < 0.0 || pso.c2 < 0.0)
            throw ConfigurationError("pso.c1 and pso.c2 must be non-negative");
        if (!(pso.vMax > 0.0) || !std::isfinite(pso.vMax))
            throw ConfigurationError(std::format("pso.v_max must be positive, got {}", pso.vMax));
        if (pso.ringNeighbors < 1)
            throw ConfigurationError(std::format("pso.ring_neighbors must be at least 1, got {}", pso.ringNeighbors));
    }

    // -----------------------------------------------------------------------------
    // SwarmDriver
    // -----------------------------------------------------------------------------

    SwarmDriver::SwarmDriver(const TSearchConfig& config, int dimension)
        : config_(config), dimension_(dimension)
    {
        ValidateConfig(config_);
        if (dimension_ <= 0)
            throw ConfigurationError("the search has no dimensions");

        strategy_ = resolveStrategy(config_.pso.strategy);
    }

    void SwarmDriver::setStrategy(UpdateFunc strategy)
    {
        if (!strategy) throw ConfigurationError("strategy must be callable");
        strategy_ = std::move(strategy);
    }

    void SwarmDriver::initialize(TSwarm& swarm, std::mt19937& rng) const
    {
        swarm.particles.clear();
        swarm.particles.resize(config_.nParticles);

        for (TParticle& p : swarm.particles)
            CreateInitialParticle(p, dimension_, rng);

        // placeholder guide until a viable candidate is found
        swarm.bestRk = swarm.particles.front().rk;
        swarm.bestFitness = WORST_FITNESS;
        swarm.iteration = 0;
    }

    bool SwarmDriver::updateBests(TSwarm& swarm) const
    {
        // personal bests: strictly better only, the first one found is kept on ties
        for (TParticle& p : swarm.particles){
            if (p.fitness > p.bestFitness){
                p.bestFitness = p.fitness;
                p.bestRk = p.rk;
            }
        }

        std::vector<size_t> all(swarm.particles.size());
        std::iota(all.begin(), all.end(), 0);
        const TParticle& best = swarm.particles[BestOf(swarm.particles, all)];

        if (best.bestFitness > swarm.bestFitness){
            swarm.bestFitness = best.bestFitness;
            swarm.bestRk = best.bestRk;
            return true;
        }
        return false;
    }

    TSearchResult SwarmDriver::run(const BatchFitness& fitness, const Finalizer& finalize,
                                   SearchContext& context)
    {
        const int verbosity = config_.verbosity;
        std::mt19937& rng = context.getRng();

        state_ = SearchState::Init;
        TSwarm swarm;
        initialize(swarm, rng);
        utils::LogMessage(verbosity, 1, std::format("Swarm of {} particles over {} dimensions initialized ({} strategy).",
                                                    config_.nParticles, dimension_, config_.pso.strategy));

        std::vector<double> history;
        int stale = 0;

        for (int t = 0; t < config_.maxIter; t++)
        {
            if (context.shouldStop()){
                utils::LogMessage(verbosity, 1, std::format("Search cancelled before generation {}.", t));
                break;
            }

            state_ = SearchState::Evaluating;
            std::vector<double> scores = fitness(swarm.particles);
            if (scores.size() != swarm.particles.size())
                throw BackendError(std::format("evaluation returned {} scores for {} particles", scores.size(), swarm.particles.size()));

            for (size_t i = 0; i < scores.size(); i++)
                swarm.particles[i].fitness = scores[i];

            state_ = SearchState::UpdatingBests;
            bool improved = updateBests(swarm);
            swarm.iteration = t + 1;
            history.push_back(swarm.bestFitness);

            if (observer_) observer_(swarm);

            utils::LogMessage(verbosity, 1, std::format("Iteration {} is done. Best score: {:.6f}{}",
                                                        t, swarm.bestFitness, improved ? " (improved)" : ""));

            stale = improved ? 0 : stale + 1;
            if (config_.nIterNoChange > 0 && stale >= config_.nIterNoChange){
                utils::LogMessage(verbosity, 1, std::format("No improvement for {} generations, stopping early.", stale));
                break;
            }

            // the last generation is not moved: nothing would evaluate it
            if (t + 1 < config_.maxIter){
                state_ = SearchState::ApplyingDynamics;
                strategy_(swarm, config_.pso, t, config_.maxIter, rng);
            }
        }

        state_ = SearchState::Terminated;
        if (swarm.bestFitness == WORST_FITNESS)
            throw NoViableCandidateError(std::format("no viable candidate found in {} generations: every evaluation failed", swarm.iteration));

        state_ = SearchState::Finalizing;
        utils::LogMessage(verbosity, 1, "Decoding the global best.");
        TSearchResult result = finalize(swarm);
        result.bestScore = swarm.bestFitness;
        result.numGenerations = swarm.iteration;
        result.scoreHistory = std::move(history);

        state_ = SearchState::Done;
        return result;
    }

} // namespace pslearn
