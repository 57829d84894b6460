#pragma once

#include "pslearn/core/data.hpp"
#include "pslearn/core/space.hpp"

namespace pslearn::core {

    //--------------------------------------------------------------------------
    // Struct: TSearchSetup
    // Description: everything a YAML configuration file describes
    //--------------------------------------------------------------------------
    struct TSearchSetup
    {
        TSearchConfig config;        // "search" and "pso" sections
        SearchSpace space;           // "space" section (tuning mode)
        ParamMap estimatorParams;    // "estimator" section (fixed parameters)
    };

    /**
     * Method: LoadSearchSetup
     * Description: reads a YAML configuration file. Missing sections keep their
     * defaults; unknown keys, bad values and parse errors raise ConfigurationError.
     *
     *   search: {n_particles: 20, max_iter: 30, n_jobs: -1, cv: 5, cv_strategy: kfold,
     *            scoring: accuracy, seed: 42, verbosity: 1, n_iter_no_change: 0}
     *   pso:    {strategy: vanilla, w: 0.7298, c1: 1.49618, c2: 1.49618, v_max: 0.2,
     *            w_start: 0.9, w_end: 0.4, ring_neighbors: 1}
     *   space:
     *     n_neighbors: {type: integer, low: 1, high: 30, scale: linear}
     *     weights:     {type: categorical, values: [uniform, distance]}
     *   estimator: {n_neighbors: 5}
     */
    TSearchSetup LoadSearchSetup(const std::string& path);

    // same as LoadSearchSetup, from an in-memory YAML document
    TSearchSetup ParseSearchSetup(const std::string& yamlText);

    // "12" -> long long, "0.5" -> double, anything else -> string
    ParamValue ParseParamValue(const std::string& scalar);

} // namespace pslearn::core
