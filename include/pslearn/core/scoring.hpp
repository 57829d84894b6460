#pragma once

#include "pslearn/core/iestimator.hpp"

namespace pslearn::core {

    // Greater is better. Error metrics are negated so every score is maximized.
    using Scorer = std::function<double(const IEstimator& estimator, const Matrix& X, const Targets& y)>;

    /**
     * Method: ResolveScorer
     * Description: scorer by name: accuracy, neg_mean_squared_error,
     * neg_mean_absolute_error, r2. Throws ConfigurationError for unknown names.
     */
    Scorer ResolveScorer(const std::string& name);

    double AccuracyScore(const Targets& yTrue, const Targets& yPred);
    double MeanSquaredError(const Targets& yTrue, const Targets& yPred);
    double MeanAbsoluteError(const Targets& yTrue, const Targets& yPred);
    double R2Score(const Targets& yTrue, const Targets& yPred);

} // namespace pslearn::core
