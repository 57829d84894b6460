/**
 * pslearn - Search Context
 * Holds the mutable state of one fit call: the random generator and the stop flag.
 */

#pragma once

#include <random>
#include <atomic>

namespace pslearn {
    namespace core {

    /**
    * @brief Per-run state owned by the driver and passed by reference
    *
    * The generator is only consumed by the initialization and dynamics steps,
    * sequentially, so a fixed seed reproduces the whole run.
    */
    class SearchContext {
      public:
          explicit SearchContext(unsigned int seed = 0)
              : rng_(seed), stopExecution_(false)
          {}

          SearchContext(const SearchContext&) = delete;
          SearchContext& operator=(const SearchContext&) = delete;

          // -------------------------------------------------------------------------
          // RANDOMNESS
          // -------------------------------------------------------------------------

          std::mt19937& getRng() { return rng_; }

          void setSeed(unsigned int seed) { rng_.seed(seed); }

          // -------------------------------------------------------------------------
          // COOPERATIVE CANCELLATION (checked at the top of each generation)
          // -------------------------------------------------------------------------

          void signalStop() { stopExecution_.store(true); }

          void resetStopFlag() { stopExecution_.store(false); }

          bool shouldStop() const { return stopExecution_.load(); }

      private:
          std::mt19937 rng_;
          std::atomic<bool> stopExecution_;
      };

    } // namespace core
} // namespace pslearn
