#include "pslearn/core/method.hpp"

namespace pslearn::core {

    // -----------------------------------------------------------------------------
    // General Utilities
    // -----------------------------------------------------------------------------

    double randomico(std::mt19937& rng, double min, double max)
    {
        return std::uniform_real_distribution<double>(min, max)(rng);
    }

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    // -----------------------------------------------------------------------------
    // Particle Management
    // -----------------------------------------------------------------------------

    double RandomKey(std::mt19937& rng)
    {
        return randomico(rng, 0.0, 1.0);
    }

    void CreateInitialParticle(TParticle& p, const int n, std::mt19937& rng)
    {
        p.rk.resize(n);
        for (int j = 0; j < n; j++){
            p.rk[j] = RandomKey(rng);   // random value between [0,1)
        }

        p.velocity.assign(n, 0.0);
        p.bestRk = p.rk;
        p.bestFitness = WORST_FITNESS;
        p.fitness = WORST_FITNESS;
    }

    void MoveParticle(TParticle& p, const std::vector<double>& guide, double w,
                      const TPsoParams& params, std::mt19937& rng)
    {
        const size_t n = p.rk.size();

        for (size_t j = 0; j < n; j++)
        {
            double r1 = randomico(rng, 0, 1);
            double r2 = randomico(rng, 0, 1);

            // update v[j]
            double v = w * p.velocity[j]
                     + params.c1 * r1 * (p.bestRk[j] - p.rk[j])
                     + params.c2 * r2 * (guide[j] - p.rk[j]);
            v = std::clamp(v, -params.vMax, params.vMax);

            // update x[j]
            double x = p.rk[j] + v;
            if (x < 0.0 || x > 1.0){
                x = std::clamp(x, 0.0, 1.0);
                v = 0.0;
            }

            p.rk[j] = x;
            p.velocity[j] = v;
        }
    }

    size_t BestOf(const std::vector<TParticle>& particles, const std::vector<size_t>& indices)
    {
        size_t best = indices.front();
        for (size_t i : indices){
            if (particles[i].bestFitness > particles[best].bestFitness) best = i;
        }
        return best;
    }

} // namespace pslearn::core
