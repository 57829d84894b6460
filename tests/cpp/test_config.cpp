#include <catch2/catch.hpp>
#include "pslearn/core/config.hpp"
#include "pslearn/core/errors.hpp"

using namespace pslearn::core;

TEST_CASE("Full configuration document", "[config]") {
    TSearchSetup setup = ParseSearchSetup(R"(
search:
  n_particles: 20
  max_iter: 30
  n_jobs: -1
  cv: 3
  cv_strategy: stratified
  scoring: neg_mean_squared_error
  seed: 7
  verbosity: 2
  n_iter_no_change: 5
pso:
  strategy: ring
  w: 0.6
  c1: 1.2
  c2: 1.8
  v_max: 0.1
  ring_neighbors: 2
space:
  weights: {type: categorical, values: [uniform, distance]}
  n_neighbors: {type: integer, low: 1, high: 50, scale: log}
  p: {type: real, low: 1.0, high: 3.0}
estimator:
  n_neighbors: 5
  weights: distance
)");

    const TSearchConfig& config = setup.config;
    REQUIRE(config.nParticles == 20);
    REQUIRE(config.maxIter == 30);
    REQUIRE(config.nJobs == -1);
    REQUIRE(config.cv == 3);
    REQUIRE(config.cvStrategy == "stratified");
    REQUIRE(config.scoring == "neg_mean_squared_error");
    REQUIRE(config.seed == 7);
    REQUIRE(config.verbosity == 2);
    REQUIRE(config.nIterNoChange == 5);

    REQUIRE(config.pso.strategy == "ring");
    REQUIRE(config.pso.w == Approx(0.6));
    REQUIRE(config.pso.c1 == Approx(1.2));
    REQUIRE(config.pso.c2 == Approx(1.8));
    REQUIRE(config.pso.vMax == Approx(0.1));
    REQUIRE(config.pso.ringNeighbors == 2);
    // unset keys keep their defaults
    REQUIRE(config.pso.wStart == Approx(0.9));

    SECTION("dimensions keep the document order") {
        const auto& dims = setup.space.dimensions();
        REQUIRE(dims.size() == 3);
        REQUIRE(dims[0].first == "weights");
        REQUIRE(dims[1].first == "n_neighbors");
        REQUIRE(dims[2].first == "p");

        const Integer* k = std::get_if<Integer>(&dims[1].second);
        REQUIRE(k != nullptr);
        REQUIRE(k->low == 1);
        REQUIRE(k->high == 50);
        REQUIRE(k->scale == Scale::Exponential);

        const Categorical* w = std::get_if<Categorical>(&dims[0].second);
        REQUIRE(w != nullptr);
        REQUIRE(w->values == std::vector<ParamValue>{std::string("uniform"), std::string("distance")});
    }

    SECTION("estimator parameters are typed") {
        REQUIRE(std::get<long long>(setup.estimatorParams.at("n_neighbors")) == 5);
        REQUIRE(std::get<std::string>(setup.estimatorParams.at("weights")) == "distance");
    }
}

TEST_CASE("Empty documents give the defaults", "[config]") {
    TSearchSetup setup = ParseSearchSetup("");
    REQUIRE(setup.config.nParticles == 10);
    REQUIRE(setup.config.pso.strategy == "vanilla");
    REQUIRE(setup.space.empty());
    REQUIRE(setup.estimatorParams.empty());
}

TEST_CASE("Invalid configuration documents", "[config][errors]") {
    SECTION("unknown key") {
        REQUIRE_THROWS_AS(ParseSearchSetup("search: {particles: 3}"), ConfigurationError);
    }
    SECTION("unknown section") {
        REQUIRE_THROWS_AS(ParseSearchSetup("metrics: {}"), ConfigurationError);
    }
    SECTION("value of the wrong type") {
        REQUIRE_THROWS_AS(ParseSearchSetup("search: {max_iter: many}"), ConfigurationError);
    }
    SECTION("out of range value") {
        REQUIRE_THROWS_AS(ParseSearchSetup("search: {n_particles: 0}"), ConfigurationError);
        REQUIRE_THROWS_AS(ParseSearchSetup("pso: {v_max: -0.1}"), ConfigurationError);
    }
    SECTION("unknown strategy") {
        REQUIRE_THROWS_AS(ParseSearchSetup("pso: {strategy: firefly}"), ConfigurationError);
    }
    SECTION("exponential dimension starting at zero") {
        REQUIRE_THROWS_AS(ParseSearchSetup("space: {C: {type: real, low: 0, high: 10, scale: exponential}}"),
                          ConfigurationError);
    }
    SECTION("dimension without bounds") {
        REQUIRE_THROWS_AS(ParseSearchSetup("space: {k: {type: integer, low: 1}}"), ConfigurationError);
    }
    SECTION("unknown dimension type") {
        REQUIRE_THROWS_AS(ParseSearchSetup("space: {k: {type: boolean}}"), ConfigurationError);
    }
    SECTION("syntax error") {
        REQUIRE_THROWS_AS(ParseSearchSetup("search: [unclosed"), ConfigurationError);
    }
    SECTION("keys that are not scalars") {
        REQUIRE_THROWS_AS(ParseSearchSetup("search: {[a]: 1}"), ConfigurationError);
        REQUIRE_THROWS_AS(ParseSearchSetup("pso: {{w: 1}: 2}"), ConfigurationError);
        REQUIRE_THROWS_AS(ParseSearchSetup("space: {[k]: {type: integer, low: 1, high: 2}}"), ConfigurationError);
        REQUIRE_THROWS_AS(ParseSearchSetup("estimator: {[k]: 3}"), ConfigurationError);
        REQUIRE_THROWS_AS(ParseSearchSetup("[search]: {}"), ConfigurationError);
    }
    SECTION("missing file") {
        REQUIRE_THROWS_AS(LoadSearchSetup("/nonexistent/pslearn.yaml"), ConfigurationError);
    }
}

TEST_CASE("Scalar parameter values", "[config]") {
    REQUIRE(std::get<long long>(ParseParamValue("12")) == 12);
    REQUIRE(std::get<long long>(ParseParamValue("-3")) == -3);
    REQUIRE(std::get<double>(ParseParamValue("0.5")) == Approx(0.5));
    REQUIRE(std::get<double>(ParseParamValue("1e-3")) == Approx(1e-3));
    REQUIRE(std::get<std::string>(ParseParamValue("gini")) == "gini");
    REQUIRE(std::get<std::string>(ParseParamValue("12abc")) == "12abc");
    REQUIRE(std::get<std::string>(ParseParamValue("")).empty());

    SECTION("non-finite numbers stay strings") {
        REQUIRE(std::get<std::string>(ParseParamValue("nan")) == "nan");
        REQUIRE(std::get<std::string>(ParseParamValue("inf")) == "inf");
        REQUIRE(std::get<std::string>(ParseParamValue("-inf")) == "-inf");
        REQUIRE(std::get<std::string>(ParseParamValue("infinity")) == "infinity");
    }
}
