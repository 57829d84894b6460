/**
 * pslearn - Main Entry Point
 */

// CLI
#include <CLI/CLI.hpp>

#include "pslearn/core/config.hpp"
#include "pslearn/core/errors.hpp"
#include "pslearn/core/method.hpp"
#include "pslearn/core/solver.hpp"
#include "pslearn/models/knn.hpp"
#include "pslearn/utils/io.hpp"

int main(int argc, char *argv[])
{
    // -------------------------------------------------------------------------
    // 1. CLI11 SETUP
    // -------------------------------------------------------------------------
    CLI::App app{"pslearn - Particle Swarm hyperparameter search and feature selection"};

    std::string dataPath;
    std::string configPath;
    std::string mode = "tune";
    std::string outputPath;
    std::optional<unsigned int> seed;
    std::optional<int> maxIter;
    std::optional<int> nJobs;
    std::optional<int> verbosity;

    app.add_option("-d,--data", dataPath, "CSV dataset (header row, target in the last column)")
       ->required()
       ->check(CLI::ExistingFile);

    app.add_option("-c,--config", configPath, "YAML configuration file")
       ->required()
       ->check(CLI::ExistingFile);

    app.add_option("-m,--mode", mode, "tune (hyperparameters) or select (features)")
       ->check(CLI::IsMember({"tune", "select"}));

    app.add_option("-s,--seed", seed, "RNG seed (overrides search.seed)");
    app.add_option("-t,--max-iter", maxIter, "Generation budget (overrides search.max_iter)");
    app.add_option("-j,--jobs", nJobs, "Evaluation workers, -1 for all (overrides search.n_jobs)");
    app.add_option("-v,--verbosity", verbosity, "0 silent, 1 generations, 2 candidates");
    app.add_option("-o,--output", outputPath, "Append the result to this tab-separated file");

    CLI11_PARSE(app, argc, argv);

    // -------------------------------------------------------------------------
    // 2. LOAD CONFIGURATION AND DATA, RUN
    // -------------------------------------------------------------------------
    try {
        pslearn::core::TSearchSetup setup = pslearn::core::LoadSearchSetup(configPath);
        if (seed)      setup.config.seed = *seed;
        if (maxIter)   setup.config.maxIter = *maxIter;
        if (nJobs)     setup.config.nJobs = *nJobs;
        if (verbosity) setup.config.verbosity = *verbosity;

        pslearn::core::TDataset data = pslearn::utils::ReadDataset(dataPath);

        double start = pslearn::core::get_time_in_seconds();
        pslearn::core::TSearchResult result;

        if (mode == "tune"){
            pslearn::ParticleSwarmSearchCV search(setup.config, setup.space, pslearn::models::KNeighborsFactory());
            result = search.fit(data);
        }
        else {
            pslearn::ParticleSwarmFeatureSelectionCV search(setup.config, pslearn::models::KNeighborsFactory(),
                                                            setup.estimatorParams);
            result = search.fit(data);
        }

        double totalTime = pslearn::core::get_time_in_seconds() - start;

        pslearn::utils::WriteResultScreen(mode, dataPath, result, totalTime);
        if (!outputPath.empty())
            pslearn::utils::WriteResults(outputPath, mode, dataPath, result, totalTime);
    }
    catch (const pslearn::core::ConfigurationError& e) {
        pslearn::utils::LogError(std::format("configuration: {}", e.what()));
        return 2;
    }
    catch (const std::exception& e) {
        pslearn::utils::LogError(e.what());
        return 1;
    }

    return 0;
}
