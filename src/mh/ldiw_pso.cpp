#include "pslearn/mh/ldiw_pso.hpp"

#include "pslearn/core/method.hpp"

namespace pslearn::mh {

    using namespace pslearn::core;

    double LinearInertia(const TPsoParams &params, int iteration, int maxIter)
    {
        if (maxIter <= 1) return params.wStart;

        double ratio = std::clamp((double)iteration / (double)(maxIter - 1), 0.0, 1.0);
        return params.wStart - (params.wStart - params.wEnd) * ratio;
    }

    void LDIW_PSO(TSwarm &swarm, const TPsoParams &params,
                  int iteration, int maxIter, std::mt19937 &rng)
    {
        double w = LinearInertia(params, iteration, maxIter);

        for (TParticle &p : swarm.particles)
            MoveParticle(p, swarm.bestRk, w, params, rng);
    }

} // namespace pslearn::mh
