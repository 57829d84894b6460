#pragma once

#include "pslearn/core/data.hpp"

namespace pslearn::mh {

    /**
     * Method: PSO
     * Description: canonical global-best update with constant inertia w.
     * Every particle moves towards its personal best and the swarm-wide best.
     */
    void PSO(core::TSwarm &swarm, const core::TPsoParams &params,
             int iteration, int maxIter, std::mt19937 &rng);

} // namespace pslearn::mh
