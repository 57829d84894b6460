#include "pslearn/models/knn.hpp"

namespace pslearn::models {

    using namespace pslearn::core;

    KNeighborsClassifier::KNeighborsClassifier(const ParamMap& params)
        : nNeighbors_(GetParam<long long>(params, "n_neighbors", 5)),
          distanceWeights_(false),
          p_(GetParam<double>(params, "p", 2.0))
    {
        std::string weights = GetParam<std::string>(params, "weights", "uniform");
        if (weights == "distance") distanceWeights_ = true;
        else if (weights != "uniform")
            throw std::invalid_argument(std::format("weights must be uniform or distance, got '{}'", weights));

        if (nNeighbors_ < 1)
            throw std::invalid_argument(std::format("n_neighbors must be >= 1, got {}", nNeighbors_));
        if (!(p_ >= 1.0))
            throw std::invalid_argument(std::format("p must be >= 1, got {}", p_));
    }

    void KNeighborsClassifier::fit(const Matrix& X, const Targets& y)
    {
        if (X.size() != y.size() || X.empty())
            throw std::invalid_argument("X and y must be non-empty and aligned");
        if (static_cast<size_t>(nNeighbors_) > X.size())
            throw std::invalid_argument(std::format("n_neighbors ({}) exceeds the {} training samples", nNeighbors_, X.size()));

        X_ = X;
        y_ = y;
        classes_.assign(y.begin(), y.end());
        std::sort(classes_.begin(), classes_.end());
        classes_.erase(std::unique(classes_.begin(), classes_.end()), classes_.end());
    }

    double KNeighborsClassifier::distance(const std::vector<double>& a, const std::vector<double>& b) const
    {
        double sum = 0.0;
        for (size_t j = 0; j < a.size(); j++)
            sum += std::pow(std::abs(a[j] - b[j]), p_);
        return std::pow(sum, 1.0 / p_);
    }

    Matrix KNeighborsClassifier::predictProba(const Matrix& X) const
    {
        if (X_.empty()) throw std::logic_error("KNeighborsClassifier is not fitted");

        Matrix proba(X.size(), std::vector<double>(classes_.size(), 0.0));
        std::vector<std::pair<double, size_t>> dist(X_.size());

        for (size_t i = 0; i < X.size(); i++)
        {
            for (size_t r = 0; r < X_.size(); r++)
                dist[r] = {distance(X[i], X_[r]), r};

            // nearest first, lower training index first on equal distance
            std::partial_sort(dist.begin(), dist.begin() + nNeighbors_, dist.end());

            // with distance weights, exact matches take all the vote
            bool exact = distanceWeights_ && dist.front().first == 0.0;

            double total = 0.0;
            for (long long k = 0; k < nNeighbors_; k++){
                const auto& [d, r] = dist[k];
                double weight = 1.0;
                if (distanceWeights_) weight = exact ? (d == 0.0 ? 1.0 : 0.0) : 1.0 / d;

                size_t c = std::lower_bound(classes_.begin(), classes_.end(), y_[r]) - classes_.begin();
                proba[i][c] += weight;
                total += weight;
            }

            for (double& v : proba[i]) v /= total;
        }
        return proba;
    }

    Targets KNeighborsClassifier::predict(const Matrix& X) const
    {
        Matrix proba = predictProba(X);
        Targets labels(X.size());
        for (size_t i = 0; i < proba.size(); i++){
            // first class wins on ties
            size_t best = std::max_element(proba[i].begin(), proba[i].end()) - proba[i].begin();
            labels[i] = classes_[best];
        }
        return labels;
    }

    std::shared_ptr<IEstimatorFactory> KNeighborsFactory()
    {
        return MakeFactory([](const ParamMap& params) -> std::unique_ptr<IEstimator> {
            return std::make_unique<KNeighborsClassifier>(params);
        });
    }

} // namespace pslearn::models
