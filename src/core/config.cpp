#include "pslearn/core/config.hpp"
#include "pslearn/core/errors.hpp"
#include "pslearn/core/driver.hpp"

#include <charconv>
#include <cmath>

#include <yaml-cpp/yaml.h>

namespace pslearn::core {

    // -----------------------------------------------------------------------------
    // Helpers
    // -----------------------------------------------------------------------------

    ParamValue ParseParamValue(const std::string& scalar)
    {
        const char* first = scalar.data();
        const char* last = scalar.data() + scalar.size();

        long long integer = 0;
        auto [endInt, errInt] = std::from_chars(first, last, integer);
        if (errInt == std::errc() && endInt == last && !scalar.empty()) return integer;

        // "nan" and "inf" stay strings: a non-finite value never compares equal to itself
        double real = 0.0;
        auto [endReal, errReal] = std::from_chars(first, last, real);
        if (errReal == std::errc() && endReal == last && !scalar.empty() && std::isfinite(real)) return real;

        return scalar;
    }

    template<typename T>
    static T Read(const YAML::Node& node, const std::string& section, const std::string& key)
    {
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            throw ConfigurationError(std::format("{}.{}: invalid value '{}'", section, key,
                                                 node.IsScalar() ? node.Scalar() : std::string("<non-scalar>")));
        }
    }

    static std::string ReadKey(const YAML::Node& key, const std::string& section)
    {
        if (!key.IsScalar())
            throw ConfigurationError(std::format("{}: keys must be scalars", section));
        return Read<std::string>(key, section, "<key>");
    }

    static void RequireMap(const YAML::Node& node, const std::string& section)
    {
        if (!node.IsMap())
            throw ConfigurationError(std::format("section '{}' must be a map", section));
    }

    // -----------------------------------------------------------------------------
    // Sections
    // -----------------------------------------------------------------------------

    static void LoadSearchSection(const YAML::Node& node, TSearchConfig& config)
    {
        RequireMap(node, "search");
        for (const auto& entry : node){
            std::string key = ReadKey(entry.first, "search");
            const YAML::Node& value = entry.second;

            if (key == "n_particles")           config.nParticles = Read<int>(value, "search", key);
            else if (key == "max_iter")         config.maxIter = Read<int>(value, "search", key);
            else if (key == "n_jobs")           config.nJobs = Read<int>(value, "search", key);
            else if (key == "cv")               config.cv = Read<int>(value, "search", key);
            else if (key == "cv_strategy")      config.cvStrategy = Read<std::string>(value, "search", key);
            else if (key == "scoring")          config.scoring = Read<std::string>(value, "search", key);
            else if (key == "seed")             config.seed = Read<unsigned int>(value, "search", key);
            else if (key == "verbosity")        config.verbosity = Read<int>(value, "search", key);
            else if (key == "n_iter_no_change") config.nIterNoChange = Read<int>(value, "search", key);
            else throw ConfigurationError(std::format("search: unknown key '{}'", key));
        }
    }

    static void LoadPsoSection(const YAML::Node& node, TPsoParams& pso)
    {
        RequireMap(node, "pso");
        for (const auto& entry : node){
            std::string key = ReadKey(entry.first, "pso");
            const YAML::Node& value = entry.second;

            if (key == "strategy")            pso.strategy = Read<std::string>(value, "pso", key);
            else if (key == "w")              pso.w = Read<double>(value, "pso", key);
            else if (key == "c1")             pso.c1 = Read<double>(value, "pso", key);
            else if (key == "c2")             pso.c2 = Read<double>(value, "pso", key);
            else if (key == "v_max")          pso.vMax = Read<double>(value, "pso", key);
            else if (key == "w_start")        pso.wStart = Read<double>(value, "pso", key);
            else if (key == "w_end")          pso.wEnd = Read<double>(value, "pso", key);
            else if (key == "ring_neighbors") pso.ringNeighbors = Read<int>(value, "pso", key);
            else throw ConfigurationError(std::format("pso: unknown key '{}'", key));
        }
    }

    static Dimension LoadDimension(const std::string& name, const YAML::Node& node)
    {
        const std::string section = "space." + name;
        RequireMap(node, section);

        if (!node["type"])
            throw ConfigurationError(std::format("{}: missing 'type'", section));
        std::string type = Read<std::string>(node["type"], section, "type");

        Scale scale = Scale::Linear;
        if (node["scale"]) scale = ParseScale(Read<std::string>(node["scale"], section, "scale"));

        if (type == "categorical"){
            if (!node["values"] || !node["values"].IsSequence())
                throw ConfigurationError(std::format("{}: categorical needs a 'values' list", section));

            Categorical dim;
            for (const auto& v : node["values"])
                dim.values.push_back(ParseParamValue(Read<std::string>(v, section, "values")));
            return dim;
        }

        if (!node["low"] || !node["high"])
            throw ConfigurationError(std::format("{}: {} needs 'low' and 'high'", section, type));

        if (type == "integer")
            return Integer{Read<long long>(node["low"], section, "low"), Read<long long>(node["high"], section, "high"), scale};
        if (type == "real")
            return Real{Read<double>(node["low"], section, "low"), Read<double>(node["high"], section, "high"), scale};

        throw ConfigurationError(std::format("{}: unknown type '{}' (expected categorical, integer or real)", section, type));
    }

    static void LoadSpaceSection(const YAML::Node& node, SearchSpace& space)
    {
        RequireMap(node, "space");
        // yaml-cpp keeps document order, which becomes the dimension order
        for (const auto& entry : node){
            std::string name = ReadKey(entry.first, "space");
            space.add(name, LoadDimension(name, entry.second));
        }
    }

    static void LoadEstimatorSection(const YAML::Node& node, ParamMap& params)
    {
        RequireMap(node, "estimator");
        for (const auto& entry : node){
            std::string key = ReadKey(entry.first, "estimator");
            params[key] = ParseParamValue(Read<std::string>(entry.second, "estimator", key));
        }
    }

    static TSearchSetup LoadRoot(const YAML::Node& root)
    {
        TSearchSetup setup;
        if (root.IsNull()) return setup;
        RequireMap(root, "<root>");

        for (const auto& entry : root){
            std::string key = ReadKey(entry.first, "<root>");
            if (key == "search")         LoadSearchSection(entry.second, setup.config);
            else if (key == "pso")       LoadPsoSection(entry.second, setup.config.pso);
            else if (key == "space")     LoadSpaceSection(entry.second, setup.space);
            else if (key == "estimator") LoadEstimatorSection(entry.second, setup.estimatorParams);
            else throw ConfigurationError(std::format("unknown section '{}'", key));
        }

        ValidateConfig(setup.config);
        SwarmDriver::resolveStrategy(setup.config.pso.strategy);
        return setup;
    }

    // -----------------------------------------------------------------------------
    // Public entry points
    // -----------------------------------------------------------------------------

    TSearchSetup LoadSearchSetup(const std::string& path)
    {
        try {
            return LoadRoot(YAML::LoadFile(path));
        } catch (const YAML::BadFile&) {
            throw ConfigurationError(std::format("cannot open configuration file {}", path));
        } catch (const YAML::ParserException& e) {
            throw ConfigurationError(std::format("syntax error in {}: {}", path, e.what()));
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(std::format("invalid configuration {}: {}", path, e.what()));
        }
    }

    TSearchSetup ParseSearchSetup(const std::string& yamlText)
    {
        try {
            return LoadRoot(YAML::Load(yamlText));
        } catch (const YAML::ParserException& e) {
            throw ConfigurationError(std::format("syntax error in configuration: {}", e.what()));
        } catch (const YAML::Exception& e) {
            throw ConfigurationError(std::format("invalid configuration: {}", e.what()));
        }
    }

} // namespace pslearn::core
