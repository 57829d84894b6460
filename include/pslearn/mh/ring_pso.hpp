#pragma once

#include "pslearn/core/data.hpp"

namespace pslearn::mh {

    /**
     * Method: RingNeighbours
     * Description: particle i followed by i-1, i+1, ..., i-k, i+k (indices modulo the swarm size)
     */
    std::vector<size_t> RingNeighbours(size_t i, size_t swarmSize, int k);

    /**
     * Method: RING_PSO
     * Description: local-best update on a ring topology (Kennedy & Mendes, 2002).
     * The social term pulls towards the best personal best among the ring
     * neighbours instead of the swarm-wide best; constant inertia w.
     */
    void RING_PSO(core::TSwarm &swarm, const core::TPsoParams &params,
                  int iteration, int maxIter, std::mt19937 &rng);

} // namespace pslearn::mh
