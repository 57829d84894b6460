#pragma once
#include "pslearn/core/data.hpp"

namespace pslearn::core {

    // Capability interface of the model being tuned. The search depends only on this.
    class IEstimator {
        public:
            virtual ~IEstimator() = default;

            virtual void fit(const Matrix& X, const Targets& y) = 0;

            virtual Targets predict(const Matrix& X) const = 0;

            // estimators without class probabilities keep the defaults
            virtual bool hasPredictProba() const { return false; }

            virtual Matrix predictProba(const Matrix& X) const {
                (void)X;
                throw std::logic_error("estimator does not support predict_proba");
            }

            // class label of each predictProba column, in column order (set by fit)
            virtual std::vector<double> classes() const { return {}; }
        };

    // Builds a fresh, independent estimator per candidate and fold.
    // construct() may throw for inconsistent parameter combinations.
    class IEstimatorFactory {
        public:
            virtual ~IEstimatorFactory() = default;

            virtual std::unique_ptr<IEstimator> construct(const ParamMap& params) const = 0;
        };

    using EstimatorBuilder = std::function<std::unique_ptr<IEstimator>(const ParamMap&)>;

    // Adapts a callable to IEstimatorFactory. The callable must be safe to call concurrently.
    class FunctionEstimatorFactory : public IEstimatorFactory {
        public:
            explicit FunctionEstimatorFactory(EstimatorBuilder builder)
                : builder_(std::move(builder)) {}

            std::unique_ptr<IEstimator> construct(const ParamMap& params) const override {
                return builder_(params);
            }

        private:
            EstimatorBuilder builder_;
        };

    inline std::shared_ptr<IEstimatorFactory> MakeFactory(EstimatorBuilder builder) {
        return std::make_shared<FunctionEstimatorFactory>(std::move(builder));
    }

    /**
     * Method: GetParam
     * Description: typed lookup of a decoded parameter with a fallback.
     * Integer values are accepted where a double is requested.
     */
    template<typename T>
    T GetParam(const ParamMap& params, const std::string& name, T fallback) {
        auto it = params.find(name);
        if (it == params.end()) return fallback;

        if (const T* v = std::get_if<T>(&it->second)) return *v;

        if constexpr (std::is_same_v<T, double>) {
            if (const long long* v = std::get_if<long long>(&it->second)) return static_cast<double>(*v);
        }
        throw std::invalid_argument("parameter '" + name + "' has an unexpected type");
    }

}
