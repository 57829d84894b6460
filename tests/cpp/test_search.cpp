#include <catch2/catch.hpp>
#include "pslearn/core/solver.hpp"
#include "pslearn/core/errors.hpp"
#include "pslearn/models/knn.hpp"
#include "fixtures.hpp"

using namespace pslearn;
using namespace pslearn::core;
using namespace pslearn::testing;

namespace {

    TSearchConfig SearchConfig(int nParticles, int maxIter) {
        TSearchConfig config;
        config.nParticles = nParticles;
        config.maxIter = maxIter;
        config.cv = 2;
        config.seed = 42;
        return config;
    }

    SearchSpace OneInteger() {
        SearchSpace space;
        space.add("x", Integer{1, 10, Scale::Linear});
        return space;
    }

    long long BestX(const ParticleSwarmSearchCV& search) {
        return std::get<long long>(search.bestParams().at("x"));
    }

    // score = -|x - 7|
    Scorer PeakAtSeven() {
        return ParamScorer([](const ParamMap& params) {
            return -std::abs(static_cast<double>(std::get<long long>(params.at("x"))) - 7.0);
        });
    }

    // score = [0 kept] + [2 kept] - [1 kept]
    Scorer PreferZeroAndTwo() {
        return ColumnScorer([](const std::vector<size_t>& cols) {
            double score = 0.0;
            for (size_t c : cols) score += (c == 1) ? -1.0 : 1.0;
            return score;
        });
    }

}

// ============================================================================
// Hyperparameter search
// ============================================================================

TEST_CASE("Search finds the peak of a one dimensional score", "[search]") {
    ParticleSwarmSearchCV search(SearchConfig(5, 20), OneInteger(), EchoFactory());
    search.setScorer(PeakAtSeven());

    const TSearchResult& result = search.fit(MarkerDataset(10, 1));

    REQUIRE(std::abs(BestX(search) - 7) <= 1);
    REQUIRE(result.bestScore >= -1.0);
    REQUIRE(result.numGenerations == 20);
    REQUIRE(std::is_sorted(result.scoreHistory.begin(), result.scoreHistory.end()));
    // the echo estimator has no class probabilities
    REQUIRE(search.bestProba().empty());
}

TEST_CASE("Best parameters lie in the declared domain", "[search]") {
    SearchSpace space;
    space.add("depth", Integer{2, 64, Scale::Exponential})
         .add("criterion", Categorical{{std::string("gini"), std::string("entropy")}})
         .add("alpha", Real{1e-4, 1.0, Scale::Exponential});

    ParticleSwarmSearchCV search(SearchConfig(6, 5), space, EchoFactory());
    search.setScorer(ParamScorer([](const ParamMap& params) { return GetParam<double>(params, "alpha", 0.0); }));
    search.fit(MarkerDataset(8, 2));

    for (const auto& [name, dim] : space.dimensions())
        REQUIRE(InDomain(dim, search.bestParams().at(name)));
}

TEST_CASE("Same seed reproduces the search, whatever the worker count", "[search][parallel]") {
    TSearchConfig sequential = SearchConfig(8, 10);
    TSearchConfig parallel = sequential;
    parallel.nJobs = 4;

    SearchSpace space;
    space.add("x", Integer{1, 10, Scale::Linear}).add("y", Real{-1.0, 1.0, Scale::Linear});

    Scorer bowl = ParamScorer([](const ParamMap& params) {
        double x = GetParam<double>(params, "x", 0.0);
        double y = GetParam<double>(params, "y", 0.0);
        return -(x - 3.0) * (x - 3.0) - y * y;
    });

    ParticleSwarmSearchCV a(sequential, space, EchoFactory());
    ParticleSwarmSearchCV b(parallel, space, EchoFactory());
    a.setScorer(bowl);
    b.setScorer(bowl);

    TSearchResult ra = a.fit(MarkerDataset(10, 1));
    TSearchResult rb = b.fit(MarkerDataset(10, 1));

    REQUIRE(ra.bestParams == rb.bestParams);
    REQUIRE(ra.scoreHistory == rb.scoreHistory);

    SECTION("refitting the same object starts over from the seed") {
        TSearchResult again = a.fit(MarkerDataset(10, 1));
        REQUIRE(again.scoreHistory == ra.scoreHistory);
    }
}

TEST_CASE("Failing candidates are skipped", "[search][errors]") {
    auto failsAboveFive = MakeFactory([](const ParamMap& params) -> std::unique_ptr<IEstimator> {
        if (std::get<long long>(params.at("x")) > 5) throw std::invalid_argument("x too large");
        return std::make_unique<ParamEchoEstimator>(params);
    });

    ParticleSwarmSearchCV search(SearchConfig(10, 15), OneInteger(), failsAboveFive);
    search.setScorer(ParamScorer([](const ParamMap& params) {
        return static_cast<double>(std::get<long long>(params.at("x")));
    }));
    search.fit(MarkerDataset(10, 1));

    REQUIRE(BestX(search) <= 5);
    REQUIRE(search.bestScore() <= 5.0);
}

TEST_CASE("A search where every candidate fails", "[search][errors]") {
    ParticleSwarmSearchCV search(SearchConfig(4, 3), OneInteger(), FailingFactory());
    search.setScorer(PeakAtSeven());

    REQUIRE_THROWS_AS(search.fit(MarkerDataset(10, 1)), NoViableCandidateError);
    REQUIRE_THROWS_AS(search.result(), std::logic_error);
}

TEST_CASE("Early stopping after n_iter_no_change flat generations", "[search]") {
    TSearchConfig config = SearchConfig(5, 20);
    config.nIterNoChange = 3;

    ParticleSwarmSearchCV search(config, OneInteger(), EchoFactory());
    search.setScorer(ParamScorer([](const ParamMap&) { return 1.0; }));

    const TSearchResult& result = search.fit(MarkerDataset(10, 1));
    REQUIRE(result.numGenerations == 4);
    REQUIRE(result.scoreHistory == std::vector<double>(4, 1.0));
}

TEST_CASE("Stopping a running search", "[search]") {
    ParticleSwarmSearchCV search(SearchConfig(5, 20), OneInteger(), EchoFactory());
    search.setScorer(PeakAtSeven());
    search.setObserver([&search](const TSwarm& swarm) {
        if (swarm.iteration == 2) search.stop();
    });

    const TSearchResult& result = search.fit(MarkerDataset(10, 1));
    REQUIRE(result.numGenerations == 2);
    REQUIRE(result.scoreHistory.size() == 2);
}

TEST_CASE("Every strategy completes a search", "[search]") {
    for (const std::string& strategy : SwarmDriver::strategyNames())
    {
        TSearchConfig config = SearchConfig(6, 8);
        config.pso.strategy = strategy;

        ParticleSwarmSearchCV search(config, OneInteger(), EchoFactory());
        search.setScorer(PeakAtSeven());
        REQUIRE(search.fit(MarkerDataset(10, 1)).numGenerations == 8);
    }
}

TEST_CASE("Invalid searches", "[search][errors]") {
    SECTION("empty search space") {
        REQUIRE_THROWS_AS(ParticleSwarmSearchCV(SearchConfig(5, 5), SearchSpace(), EchoFactory()), ConfigurationError);
    }

    SECTION("invalid configuration") {
        REQUIRE_THROWS_AS(ParticleSwarmSearchCV(SearchConfig(0, 5), OneInteger(), EchoFactory()), ConfigurationError);
    }

    SECTION("not fitted") {
        ParticleSwarmSearchCV search(SearchConfig(5, 5), OneInteger(), EchoFactory());
        REQUIRE_THROWS_AS(search.result(), std::logic_error);
        REQUIRE_THROWS_AS(search.bestParams(), std::logic_error);
    }

    SECTION("data") {
        ParticleSwarmSearchCV search(SearchConfig(5, 5), OneInteger(), EchoFactory());

        TDataset misaligned = MarkerDataset(10, 2);
        misaligned.y.pop_back();
        REQUIRE_THROWS_AS(search.fit(misaligned), ConfigurationError);

        TDataset ragged = MarkerDataset(10, 2);
        ragged.X[3].push_back(1.0);
        REQUIRE_THROWS_AS(search.fit(ragged), ConfigurationError);

        REQUIRE_THROWS_AS(search.fit(TDataset{}), ConfigurationError);

        // more folds than samples
        REQUIRE_THROWS_AS(search.fit(MarkerDataset(1, 2)), ConfigurationError);
    }

    SECTION("unknown scorer") {
        TSearchConfig config = SearchConfig(5, 5);
        config.scoring = "balanced_accuracy";
        ParticleSwarmSearchCV search(config, OneInteger(), EchoFactory());
        REQUIRE_THROWS_AS(search.fit(MarkerDataset(10, 1)), ConfigurationError);
    }
}

TEST_CASE("Search over a real estimator", "[search][knn]") {
    SearchSpace space;
    space.add("n_neighbors", Integer{1, 7, Scale::Linear})
         .add("weights", Categorical{{std::string("uniform"), std::string("distance")}});

    TSearchConfig config = SearchConfig(6, 5);
    config.cv = 3;
    config.cvStrategy = "stratified";

    ParticleSwarmSearchCV search(config, space, pslearn::models::KNeighborsFactory());
    TDataset data = BlobsDataset();
    search.fit(data);

    REQUIRE(search.bestScore() == Approx(1.0));
    REQUIRE(search.bestProba().size() == data.numSamples());
}

// ============================================================================
// Feature selection
// ============================================================================

TEST_CASE("Feature selection finds the best subset", "[selection]") {
    ParticleSwarmFeatureSelectionCV search(SearchConfig(20, 30), EchoFactory());
    search.setScorer(PreferZeroAndTwo());

    TDataset data = MarkerDataset(10, 3);
    data.featureNames = {"f0", "f1", "f2"};
    search.fit(data);

    REQUIRE(search.bestFeatures() == std::vector<size_t>{0, 2});
    REQUIRE(search.bestFeatureNames() == std::vector<std::string>{"f0", "f2"});
    REQUIRE(search.bestScore() == Approx(2.0));
}

TEST_CASE("Selected subsets are never empty", "[selection]") {
    ParticleSwarmFeatureSelectionCV search(SearchConfig(12, 20), EchoFactory());
    search.setObserver([](const TSwarm& swarm) {
        for (const TParticle& p : swarm.particles)
            REQUIRE(!SelectedFeatures(DecodeFeatureMask(p.rk)).empty());
    });
    // fewer columns always score better
    search.setScorer(ColumnScorer([](const std::vector<size_t>& cols) { return -static_cast<double>(cols.size()); }));

    search.fit(MarkerDataset(10, 5));

    REQUIRE(search.bestFeatures().size() == 1);
    REQUIRE(search.bestScore() == Approx(-1.0));
    // unnamed columns are reported by index
    REQUIRE(search.bestFeatureNames().front() == std::to_string(search.bestFeatures().front()));
}

TEST_CASE("Feature selection uses the fixed estimator parameters", "[selection]") {
    ParamMap fixed = {{"n_neighbors", 3LL}, {"weights", std::string("distance")}};

    ParticleSwarmFeatureSelectionCV search(SearchConfig(4, 2), EchoFactory(), fixed);
    search.setScorer(ParamScorer([fixed](const ParamMap& params) { return params == fixed ? 1.0 : 0.0; }));

    search.fit(MarkerDataset(10, 3));
    REQUIRE(search.bestScore() == Approx(1.0));
}

TEST_CASE("Feature selection out-of-fold probabilities", "[selection][knn]") {
    TSearchConfig config = SearchConfig(6, 4);
    config.cv = 3;

    ParticleSwarmFeatureSelectionCV search(config, pslearn::models::KNeighborsFactory(), ParamMap{{"n_neighbors", 3LL}});
    TDataset data = BlobsDataset();
    const TSearchResult& result = search.fit(data);

    REQUIRE(result.bestScore == Approx(1.0));
    REQUIRE(result.bestProba.size() == data.numSamples());
    for (const std::vector<double>& row : result.bestProba)
        REQUIRE(std::accumulate(row.begin(), row.end(), 0.0) == Approx(1.0));
    for (const std::string& name : result.bestFeatureNames)
        REQUIRE((name == "a" || name == "b"));
}
