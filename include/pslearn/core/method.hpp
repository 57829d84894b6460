#pragma once

#include "pslearn/core/data.hpp"

namespace pslearn::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------
    double randomico(std::mt19937& rng, double min, double max);
    double get_time_in_seconds();

    // -----------------------------------------------------------------------------
    // Particle Management
    // -----------------------------------------------------------------------------

    /**
     * Method: RandomKey
     * Description: uniform draw from [0,1), the initial coordinate of any dimension
     */
    double RandomKey(std::mt19937& rng);

    /**
     * Method: CreateInitialParticle
     * Description: random position, zero velocity, personal best at the worst sentinel
     */
    void CreateInitialParticle(TParticle& p, const int n, std::mt19937& rng);

    /**
     * Method: MoveParticle
     * Description: one velocity/position step towards the personal best and a guide
     * position (global or neighbourhood best) with inertia w.
     * Velocity is clamped to [-vMax, vMax]; position to [0,1]. An axis whose new
     * position had to be clamped gets its velocity zeroed (wall-clamp policy).
     * Draws r1 then r2 per axis, in axis order.
     */
    void MoveParticle(TParticle& p, const std::vector<double>& guide, double w,
                      const TPsoParams& params, std::mt19937& rng);

    // index with the best personal-best fitness among the given indices (first one wins on ties)
    size_t BestOf(const std::vector<TParticle>& particles, const std::vector<size_t>& indices);

} // namespace pslearn::core
