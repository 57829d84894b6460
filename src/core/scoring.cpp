#include "pslearn/core/scoring.hpp"
#include "pslearn/core/errors.hpp"

namespace pslearn::core {

    static void CheckSizes(const Targets& yTrue, const Targets& yPred)
    {
        if (yTrue.size() != yPred.size() || yTrue.empty())
            throw std::invalid_argument(std::format("cannot score {} predictions against {} targets", yPred.size(), yTrue.size()));
    }

    double AccuracyScore(const Targets& yTrue, const Targets& yPred)
    {
        CheckSizes(yTrue, yPred);
        size_t hits = 0;
        for (size_t i = 0; i < yTrue.size(); i++){
            if (yTrue[i] == yPred[i]) hits++;
        }
        return static_cast<double>(hits) / static_cast<double>(yTrue.size());
    }

    double MeanSquaredError(const Targets& yTrue, const Targets& yPred)
    {
        CheckSizes(yTrue, yPred);
        double sum = 0.0;
        for (size_t i = 0; i < yTrue.size(); i++){
            double d = yTrue[i] - yPred[i];
            sum += d * d;
        }
        return sum / static_cast<double>(yTrue.size());
    }

    double MeanAbsoluteError(const Targets& yTrue, const Targets& yPred)
    {
        CheckSizes(yTrue, yPred);
        double sum = 0.0;
        for (size_t i = 0; i < yTrue.size(); i++)
            sum += std::abs(yTrue[i] - yPred[i]);
        return sum / static_cast<double>(yTrue.size());
    }

    double R2Score(const Targets& yTrue, const Targets& yPred)
    {
        CheckSizes(yTrue, yPred);
        double mean = std::accumulate(yTrue.begin(), yTrue.end(), 0.0) / static_cast<double>(yTrue.size());

        double ssRes = 0.0;
        double ssTot = 0.0;
        for (size_t i = 0; i < yTrue.size(); i++){
            ssRes += (yTrue[i] - yPred[i]) * (yTrue[i] - yPred[i]);
            ssTot += (yTrue[i] - mean) * (yTrue[i] - mean);
        }

        // constant target: perfect predictions score 1, anything else 0
        if (ssTot == 0.0) return (ssRes == 0.0) ? 1.0 : 0.0;
        return 1.0 - ssRes / ssTot;
    }

    Scorer ResolveScorer(const std::string& name)
    {
        using Metric = double (*)(const Targets&, const Targets&);

        static const std::map<std::string, std::pair<Metric, double>> registry = {
            {"accuracy",                {AccuracyScore,      1.0}},
            {"neg_mean_squared_error",  {MeanSquaredError,  -1.0}},
            {"neg_mean_absolute_error", {MeanAbsoluteError, -1.0}},
            {"r2",                      {R2Score,            1.0}},
        };

        auto it = registry.find(name);
        if (it == registry.end())
            throw ConfigurationError(std::format("unknown scoring '{}'", name));

        Metric metric = it->second.first;
        double sign = it->second.second;
        return [metric, sign](const IEstimator& estimator, const Matrix& X, const Targets& y) {
            return sign * metric(y, estimator.predict(X));
        };
    }

} // namespace pslearn::core
