#pragma once

#include "pslearn/core/common.hpp"

namespace pslearn::core {

    //--------------------------------------------------------------------------
    // Basic value types
    //--------------------------------------------------------------------------
    using ParamValue = std::variant<long long, double, std::string>;   // decoded hyperparameter value
    using ParamMap   = std::map<std::string, ParamValue>;              // parameter name -> value
    using Matrix     = std::vector<std::vector<double>>;               // row-major, rows = samples
    using Targets    = std::vector<double>;                            // one target per row

    //--------------------------------------------------------------------------
    // Struct: TDataset
    // Description: Tabular training data handed to fit(X, y)
    //--------------------------------------------------------------------------
    struct TDataset
    {
        Matrix X;                                 // feature matrix
        Targets y;                                // target vector aligned by row with X
        std::vector<std::string> featureNames;    // optional column names (empty = indexed columns)

        size_t numSamples() const { return X.size(); }
        size_t numFeatures() const { return X.empty() ? featureNames.size() : X.front().size(); }
    };

    //--------------------------------------------------------------------------
    // Struct: TParticle
    // Description: One candidate solution of the swarm. Coordinates live in [0,1].
    //--------------------------------------------------------------------------
    struct TParticle
    {
        std::vector<double> rk;                  // current position (one key per dimension)
        std::vector<double> velocity;            // current velocity (same shape as rk)
        std::vector<double> bestRk;              // personal-best position
        double bestFitness = WORST_FITNESS;      // personal-best fitness
        double fitness = WORST_FITNESS;          // fitness of the current position

        TParticle() = default;
    };

    //--------------------------------------------------------------------------
    // Struct: TSwarm
    // Description: Population state owned by the driver during one fit call
    //--------------------------------------------------------------------------
    struct TSwarm
    {
        std::vector<TParticle> particles;        // ordered population
        std::vector<double> bestRk;              // global-best position
        double bestFitness = WORST_FITNESS;      // global-best fitness
        int iteration = 0;                       // generations completed so far
    };

    //--------------------------------------------------------------------------
    // Struct: TPsoParams
    // Description: Constants of the velocity/position update rule
    //--------------------------------------------------------------------------
    struct TPsoParams
    {
        std::string strategy = "vanilla";        // name of the variant strategy
        double w = 0.7298;                       // inertia (vanilla, ring)
        double c1 = 1.49618;                     // cognitive coefficient
        double c2 = 1.49618;                     // social coefficient
        double vMax = 0.2;                       // per-axis velocity bound
        double wStart = 0.9;                     // initial inertia (linear decreasing inertia)
        double wEnd = 0.4;                       // final inertia (linear decreasing inertia)
        int ringNeighbors = 1;                   // neighbours on each side (ring local best)
    };

    //--------------------------------------------------------------------------
    // Struct: TSearchConfig
    // Description: Configuration variables for one search
    //--------------------------------------------------------------------------
    struct TSearchConfig
    {
        int nParticles = 10;                     // swarm population size
        int maxIter = 10;                        // generation budget
        int nJobs = 1;                           // evaluation workers (-1 = all threads)
        int cv = 5;                              // number of cross-validation folds
        std::string cvStrategy = "kfold";        // kfold | stratified
        std::string scoring = "accuracy";        // scorer name
        unsigned int seed = 0;                   // RNG seed
        int verbosity = 0;                       // 0 silent, 1 generations, 2 candidates
        int nIterNoChange = 0;                   // early stopping patience (0 = disabled)
        TPsoParams pso;                          // dynamics constants
    };

    //--------------------------------------------------------------------------
    // Struct: TFold
    // Description: Row indices of one cross-validation split
    //--------------------------------------------------------------------------
    struct TFold
    {
        std::vector<size_t> train;
        std::vector<size_t> test;
    };

    //--------------------------------------------------------------------------
    // Struct: TSearchResult
    // Description: Outcome of a fit call, assembled once at finalization
    //--------------------------------------------------------------------------
    struct TSearchResult
    {
        double bestScore = WORST_FITNESS;               // best cross-validated score
        ParamMap bestParams;                            // tuning mode
        std::vector<size_t> bestFeatures;               // selection mode, column indices
        std::vector<std::string> bestFeatureNames;      // selection mode, column names
        Matrix bestProba;                               // out-of-fold class probabilities
        int numGenerations = 0;                         // generations actually run
        std::vector<double> scoreHistory;               // global best after each generation
    };

} // namespace pslearn::core
