#pragma once

#include "pslearn/core/data.hpp"

namespace pslearn::core {

    //--------------------------------------------------------------------------
    // Search dimensions
    // A dimension maps a key c in [0,1] to a value of its domain and back.
    //--------------------------------------------------------------------------
    enum class Scale { Linear, Exponential };

    struct Categorical
    {
        std::vector<ParamValue> values;         // ordered, finite, opaque
    };

    struct Integer
    {
        long long low = 0;
        long long high = 0;
        Scale scale = Scale::Linear;            // Exponential requires low > 0
    };

    struct Real
    {
        double low = 0.0;
        double high = 0.0;
        Scale scale = Scale::Linear;            // Exponential requires low > 0
    };

    using Dimension = std::variant<Categorical, Integer, Real>;

    /**
     * Method: ValidateDimension
     * Description: throws ConfigurationError if the domain is empty or its bounds are invalid
     */
    void ValidateDimension(const std::string& name, const Dimension& dim);

    /**
     * Method: ClampKey
     * Description: maps any double into [0,1]; NaN becomes 0
     */
    double ClampKey(double c);

    /**
     * Method: Decode
     * Description: pure, total mapping from a key to a value of the domain.
     * Out-of-range keys are clamped to [0,1] first.
     */
    ParamValue Decode(const Dimension& dim, double c);

    /**
     * Method: Encode
     * Description: key whose decode yields the given value (inverse of Decode for in-domain values)
     */
    double Encode(const Dimension& dim, const ParamValue& value);

    // true if value lies in the declared domain (value set or [low, high])
    bool InDomain(const Dimension& dim, const ParamValue& value);

    std::string ToString(const ParamValue& value);

    // "linear" | "exponential" (alias "log")
    Scale ParseScale(const std::string& name);

    //--------------------------------------------------------------------------
    // Class: SearchSpace
    // Description: ordered set of named dimensions used in tuning mode.
    // Immutable once handed to a search; shared read-only by the evaluator.
    //--------------------------------------------------------------------------
    class SearchSpace {
        public:
            SearchSpace() = default;

            // appends a dimension; throws ConfigurationError on duplicates or invalid domains
            SearchSpace& add(const std::string& name, Dimension dim);

            size_t size() const { return dims_.size(); }
            bool empty() const { return dims_.empty(); }

            const std::vector<std::pair<std::string, Dimension>>& dimensions() const { return dims_; }

            // decodes one key per dimension into a parameter mapping
            ParamMap decode(const std::vector<double>& rk) const;

        private:
            std::vector<std::pair<std::string, Dimension>> dims_;
    };

    //--------------------------------------------------------------------------
    // Feature selection (implicit binary-inclusion dimensions)
    //--------------------------------------------------------------------------

    /**
     * Method: DecodeFeatureMask
     * Description: feature j is kept when rk[j] >= 0.5. Never returns an empty mask:
     * if nothing is kept, the feature with the highest key (lowest index on ties) is forced in.
     */
    std::vector<bool> DecodeFeatureMask(const std::vector<double>& rk);

    // indices of the kept features, increasing
    std::vector<size_t> SelectedFeatures(const std::vector<bool>& mask);

} // namespace pslearn::core
