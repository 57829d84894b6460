#include "pslearn/mh/pso.hpp"

#include "pslearn/core/method.hpp"

namespace pslearn::mh {

    using namespace pslearn::core;

    void PSO(TSwarm &swarm, const TPsoParams &params,
             int iteration, int maxIter, std::mt19937 &rng)
    {
        (void)iteration;
        (void)maxIter;

        for (TParticle &p : swarm.particles)
            MoveParticle(p, swarm.bestRk, params.w, params, rng);
    }

} // namespace pslearn::mh
