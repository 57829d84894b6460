#pragma once

#include "pslearn/core/iestimator.hpp"

namespace pslearn::models {

    /**
     * k-nearest-neighbours classifier used by the command-line tool.
     *
     * Parameters: n_neighbors (integer >= 1, default 5), weights ("uniform" or
     * "distance", default "uniform"), p (Minkowski power >= 1, default 2).
     * Invalid combinations throw std::invalid_argument.
     */
    class KNeighborsClassifier : public core::IEstimator {
        public:
            explicit KNeighborsClassifier(const core::ParamMap& params);

            void fit(const core::Matrix& X, const core::Targets& y) override;

            core::Targets predict(const core::Matrix& X) const override;

            bool hasPredictProba() const override { return true; }

            // one column per class seen in fit, classes in increasing order
            core::Matrix predictProba(const core::Matrix& X) const override;

            std::vector<double> classes() const override { return classes_; }

        private:
            double distance(const std::vector<double>& a, const std::vector<double>& b) const;

            long long nNeighbors_;
            bool distanceWeights_;
            double p_;

            core::Matrix X_;
            core::Targets y_;
            std::vector<double> classes_;
        };

    // factory building a KNeighborsClassifier per candidate
    std::shared_ptr<core::IEstimatorFactory> KNeighborsFactory();

} // namespace pslearn::models
