#include <catch2/catch.hpp>
#include "pslearn/core/scoring.hpp"
#include "pslearn/core/errors.hpp"

using namespace pslearn::core;

namespace {

    // predicts a fixed vector, whatever the input
    class ConstantEstimator : public IEstimator {
    public:
        explicit ConstantEstimator(Targets predictions) : predictions_(std::move(predictions)) {}

        void fit(const Matrix&, const Targets&) override {}
        Targets predict(const Matrix&) const override { return predictions_; }

    private:
        Targets predictions_;
    };

}

TEST_CASE("Metrics", "[scoring]") {
    Targets yTrue = {1, 2, 3, 4};
    Targets yPred = {1, 2, 4, 2};

    REQUIRE(AccuracyScore(yTrue, yPred) == Approx(0.5));
    REQUIRE(MeanSquaredError(yTrue, yPred) == Approx(1.25));
    REQUIRE(MeanAbsoluteError(yTrue, yPred) == Approx(0.75));
    REQUIRE(R2Score(yTrue, yPred) == Approx(0.0));
    REQUIRE(R2Score(yTrue, yTrue) == Approx(1.0));

    SECTION("constant targets") {
        REQUIRE(R2Score({3, 3}, {3, 3}) == 1.0);
        REQUIRE(R2Score({3, 3}, {3, 4}) == 0.0);
    }

    SECTION("misaligned predictions") {
        REQUIRE_THROWS_AS(AccuracyScore({1, 2}, {1}), std::invalid_argument);
        REQUIRE_THROWS_AS(MeanSquaredError({}, {}), std::invalid_argument);
    }
}

TEST_CASE("Named scorers are maximized", "[scoring]") {
    ConstantEstimator estimator({0, 0, 2});
    Matrix X(3, std::vector<double>{0.0});
    Targets y = {0, 1, 1};

    REQUIRE(ResolveScorer("accuracy")(estimator, X, y) == Approx(1.0 / 3.0));
    REQUIRE(ResolveScorer("neg_mean_squared_error")(estimator, X, y) == Approx(-2.0 / 3.0));
    REQUIRE(ResolveScorer("neg_mean_absolute_error")(estimator, X, y) == Approx(-2.0 / 3.0));
    REQUIRE(ResolveScorer("r2")(estimator, X, y) == Approx(1.0 - 2.0 / (2.0 / 3.0)));

    REQUIRE_THROWS_AS(ResolveScorer("f1"), ConfigurationError);
}
