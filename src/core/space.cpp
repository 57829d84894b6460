#include "pslearn/core/space.hpp"
#include "pslearn/core/errors.hpp"

namespace pslearn::core {

    // -----------------------------------------------------------------------------
    // Helpers
    // -----------------------------------------------------------------------------

    // overload set for std::visit
    template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
    template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

    static double ScaleForward(double low, double high, Scale scale, double c)
    {
        if (scale == Scale::Exponential)
            return low * std::pow(high / low, c);
        return low + c * (high - low);
    }

    static double ScaleInverse(double low, double high, Scale scale, double v)
    {
        if (high == low) return 0.0;
        if (scale == Scale::Exponential)
            return std::log(v / low) / std::log(high / low);
        return (v - low) / (high - low);
    }

    double ClampKey(double c)
    {
        if (std::isnan(c)) return 0.0;
        return std::clamp(c, 0.0, 1.0);
    }

    // -----------------------------------------------------------------------------
    // Validation
    // -----------------------------------------------------------------------------

    void ValidateDimension(const std::string& name, const Dimension& dim)
    {
        std::visit(Overloaded{
            [&](const Categorical& d) {
                if (d.values.empty())
                    throw ConfigurationError(std::format("dimension '{}': categorical values are empty", name));
            },
            [&](const Integer& d) {
                if (d.low > d.high)
                    throw ConfigurationError(std::format("dimension '{}': low ({}) > high ({})", name, d.low, d.high));
                if (d.scale == Scale::Exponential && d.low <= 0)
                    throw ConfigurationError(std::format("dimension '{}': exponential scale requires low > 0", name));
            },
            [&](const Real& d) {
                if (!std::isfinite(d.low) || !std::isfinite(d.high))
                    throw ConfigurationError(std::format("dimension '{}': bounds must be finite", name));
                if (d.low > d.high)
                    throw ConfigurationError(std::format("dimension '{}': low ({}) > high ({})", name, d.low, d.high));
                if (d.scale == Scale::Exponential && d.low <= 0.0)
                    throw ConfigurationError(std::format("dimension '{}': exponential scale requires low > 0", name));
            }
        }, dim);
    }

    // -----------------------------------------------------------------------------
    // Decode / Encode
    // -----------------------------------------------------------------------------

    ParamValue Decode(const Dimension& dim, double c)
    {
        c = ClampKey(c);

        return std::visit(Overloaded{
            [c](const Categorical& d) -> ParamValue {
                long long last = static_cast<long long>(d.values.size()) - 1;
                long long idx = std::llround(c * static_cast<double>(last));
                return d.values[std::clamp(idx, 0LL, last)];
            },
            [c](const Integer& d) -> ParamValue {
                double v = ScaleForward((double)d.low, (double)d.high, d.scale, c);
                return std::clamp(std::llround(v), d.low, d.high);
            },
            [c](const Real& d) -> ParamValue {
                double v = ScaleForward(d.low, d.high, d.scale, c);
                return std::clamp(v, d.low, d.high);
            }
        }, dim);
    }

    double Encode(const Dimension& dim, const ParamValue& value)
    {
        if (!InDomain(dim, value))
            throw ConfigurationError(std::format("value {} is outside the dimension domain", ToString(value)));

        return std::visit(Overloaded{
            [&](const Categorical& d) -> double {
                auto it = std::find(d.values.begin(), d.values.end(), value);
                size_t idx = static_cast<size_t>(std::distance(d.values.begin(), it));
                if (d.values.size() == 1) return 0.0;
                return static_cast<double>(idx) / static_cast<double>(d.values.size() - 1);
            },
            [&](const Integer& d) -> double {
                double v = (double)std::get<long long>(value);
                return ClampKey(ScaleInverse((double)d.low, (double)d.high, d.scale, v));
            },
            [&](const Real& d) -> double {
                return ClampKey(ScaleInverse(d.low, d.high, d.scale, std::get<double>(value)));
            }
        }, dim);
    }

    bool InDomain(const Dimension& dim, const ParamValue& value)
    {
        return std::visit(Overloaded{
            [&](const Categorical& d) {
                return std::find(d.values.begin(), d.values.end(), value) != d.values.end();
            },
            [&](const Integer& d) {
                const long long* v = std::get_if<long long>(&value);
                return v != nullptr && *v >= d.low && *v <= d.high;
            },
            [&](const Real& d) {
                const double* v = std::get_if<double>(&value);
                return v != nullptr && *v >= d.low && *v <= d.high;
            }
        }, dim);
    }

    std::string ToString(const ParamValue& value)
    {
        return std::visit(Overloaded{
            [](long long v) { return std::to_string(v); },
            [](double v) { return std::format("{:.6g}", v); },
            [](const std::string& v) { return v; }
        }, value);
    }

    Scale ParseScale(const std::string& name)
    {
        if (name == "linear") return Scale::Linear;
        if (name == "exponential" || name == "log") return Scale::Exponential;
        throw ConfigurationError(std::format("unknown scale '{}' (expected linear or exponential)", name));
    }

    // -----------------------------------------------------------------------------
    // SearchSpace
    // -----------------------------------------------------------------------------

    SearchSpace& SearchSpace::add(const std::string& name, Dimension dim)
    {
        if (name.empty())
            throw ConfigurationError("dimension name must not be empty");

        bool exists = std::ranges::any_of(dims_, [&](const auto& entry) { return entry.first == name; });
        if (exists)
            throw ConfigurationError(std::format("dimension '{}' declared twice", name));

        ValidateDimension(name, dim);
        dims_.emplace_back(name, std::move(dim));
        return *this;
    }

    ParamMap SearchSpace::decode(const std::vector<double>& rk) const
    {
        if (rk.size() != dims_.size())
            throw std::invalid_argument(std::format("position has {} keys, search space has {} dimensions", rk.size(), dims_.size()));

        ParamMap params;
        for (size_t j = 0; j < dims_.size(); j++)
            params[dims_[j].first] = Decode(dims_[j].second, rk[j]);
        return params;
    }

    // -----------------------------------------------------------------------------
    // Feature mask
    // -----------------------------------------------------------------------------

    std::vector<bool> DecodeFeatureMask(const std::vector<double>& rk)
    {
        std::vector<bool> mask(rk.size(), false);
        bool any = false;

        for (size_t j = 0; j < rk.size(); j++){
            mask[j] = ClampKey(rk[j]) >= FEATURE_THRESHOLD;
            any = any || mask[j];
        }

        // force in the highest key, first one wins on ties
        if (!any && !rk.empty()){
            size_t best = 0;
            for (size_t j = 1; j < rk.size(); j++){
                if (ClampKey(rk[j]) > ClampKey(rk[best])) best = j;
            }
            mask[best] = true;
        }
        return mask;
    }

    std::vector<size_t> SelectedFeatures(const std::vector<bool>& mask)
    {
        std::vector<size_t> idx;
        for (size_t j = 0; j < mask.size(); j++){
            if (mask[j]) idx.push_back(j);
        }
        return idx;
    }

} // namespace pslearn::core
