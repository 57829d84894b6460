#include "pslearn/mh/ring_pso.hpp"

#include "pslearn/core/method.hpp"

namespace pslearn::mh {

    using namespace pslearn::core;

    std::vector<size_t> RingNeighbours(size_t i, size_t swarmSize, int k)
    {
        std::vector<size_t> neighbours;
        neighbours.push_back(i);
        for (int j = 1; j <= k; j++){
            neighbours.push_back((i + swarmSize - (j % swarmSize)) % swarmSize);
            neighbours.push_back((i + j) % swarmSize);
        }
        return neighbours;
    }

    void RING_PSO(TSwarm &swarm, const TPsoParams &params,
                  int iteration, int maxIter, std::mt19937 &rng)
    {
        (void)iteration;
        (void)maxIter;

        const size_t n = swarm.particles.size();

        // neighbourhood bests are taken from the personal bests of this generation,
        // before any particle moves
        std::vector<size_t> guide(n);
        for (size_t i = 0; i < n; i++)
            guide[i] = BestOf(swarm.particles, RingNeighbours(i, n, params.ringNeighbors));

        // personal bests are not written by a move, so the guides stay valid
        for (size_t i = 0; i < n; i++)
            MoveParticle(swarm.particles[i], swarm.particles[guide[i]].bestRk, params.w, params, rng);
    }

} // namespace pslearn::mh
