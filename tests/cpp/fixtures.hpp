#pragma once

#include "pslearn/core/iestimator.hpp"
#include "pslearn/core/scoring.hpp"

namespace pslearn::testing {

    using namespace pslearn::core;

    // ============================================================================
    // Remembers its parameters and the columns it was trained on
    // ============================================================================
    class ParamEchoEstimator : public IEstimator {
    public:
        explicit ParamEchoEstimator(ParamMap params) : params_(std::move(params)) {}

        void fit(const Matrix& X, const Targets& y) override {
            (void)y;
            // each column of the fixture data is filled with its own index
            columns_.clear();
            for (double marker : X.front()) columns_.push_back(static_cast<size_t>(marker));
        }

        Targets predict(const Matrix& X) const override { return Targets(X.size(), 0.0); }

        const ParamMap& params() const { return params_; }
        const std::vector<size_t>& columns() const { return columns_; }

    private:
        ParamMap params_;
        std::vector<size_t> columns_;
    };

    inline std::shared_ptr<IEstimatorFactory> EchoFactory() {
        return MakeFactory([](const ParamMap& params) -> std::unique_ptr<IEstimator> {
            return std::make_unique<ParamEchoEstimator>(params);
        });
    }

    inline std::shared_ptr<IEstimatorFactory> FailingFactory() {
        return MakeFactory([](const ParamMap&) -> std::unique_ptr<IEstimator> {
            throw std::runtime_error("cannot construct estimator");
        });
    }

    // score computed from the estimator's own parameters
    inline Scorer ParamScorer(std::function<double(const ParamMap&)> score) {
        return [score](const IEstimator& estimator, const Matrix&, const Targets&) {
            return score(dynamic_cast<const ParamEchoEstimator&>(estimator).params());
        };
    }

    // score computed from the columns the estimator was trained on
    inline Scorer ColumnScorer(std::function<double(const std::vector<size_t>&)> score) {
        return [score](const IEstimator& estimator, const Matrix&, const Targets&) {
            return score(dynamic_cast<const ParamEchoEstimator&>(estimator).columns());
        };
    }

    // rows x cols matrix whose column j holds j in every row; y alternates 0/1
    inline TDataset MarkerDataset(size_t rows, size_t cols) {
        TDataset data;
        data.X.assign(rows, std::vector<double>(cols));
        for (size_t i = 0; i < rows; i++){
            for (size_t j = 0; j < cols; j++) data.X[i][j] = static_cast<double>(j);
            data.y.push_back(static_cast<double>(i % 2));
        }
        return data;
    }

    // two well separated classes on two features
    inline TDataset BlobsDataset() {
        TDataset data;
        for (int i = 0; i < 12; i++){
            double offset = (i % 2 == 0) ? 0.0 : 10.0;
            data.X.push_back({offset + 0.1 * i, offset - 0.05 * i});
            data.y.push_back(i % 2 == 0 ? 0.0 : 1.0);
        }
        data.featureNames = {"a", "b"};
        return data;
    }

} // namespace pslearn::testing
