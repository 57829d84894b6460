#pragma once

#include "pslearn/core/data.hpp"

namespace pslearn::mh {

    /**
     * Method: LinearInertia
     * Description: w_t = w_start - (w_start - w_end) * t / (max_iter - 1), t the 0-based
     * generation index; w_start when max_iter <= 1
     */
    double LinearInertia(const core::TPsoParams &params, int iteration, int maxIter);

    /**
     * Method: LDIW_PSO
     * Description: global-best update whose inertia decreases linearly over the run
     * (Shi & Eberhart, 1998): broad exploration first, exploitation at the end.
     */
    void LDIW_PSO(core::TSwarm &swarm, const core::TPsoParams &params,
                  int iteration, int maxIter, std::mt19937 &rng);

} // namespace pslearn::mh
