#pragma once

#include <cstddef>
#include <cstdint>
#include <thread>
#include <utility>
#include <vector>

#include "sim/canvas.h"
#include "sim/distribution.h"
#include "sim/faucet_set.h"
#include "sim/force_field.h"
#include "sim/simulation_config.h"
#include "sim/stream_integrator.h"

namespace rivulet {
namespace sim {

struct SimulationStats {
    std::uint64_t streams = 0;
    std::uint64_t out_of_bounds = 0;
    std::uint64_t decayed = 0;
    std::uint64_t total_steps = 0;
    std::uint64_t longest_stream = 0;

    void record(const StreamOutcome& outcome);
    void merge(const SimulationStats& other);
};

// Owns a set of worker threads and joins every one of them on destruction, including during unwinding.
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { join(); }

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    void reserve(std::size_t count) { threads_.reserve(count); }

    template <typename Fn>
    void spawn(Fn&& fn) {
        threads_.emplace_back(std::forward<Fn>(fn));
    }

    // Waits for every started thread. Safe to call more than once.
    void join();

    std::size_t size() const { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

// Independent random sub-stream for one stream, derived from the run seed and the stream index.
Rng stream_rng(std::uint64_t seed, std::size_t stream_index);

class Simulation {
public:
    // Validates the configuration and draws the force field and faucets from `seed`.
    // Throws ConfigurationError before any stream runs.
    explicit Simulation(SimulationConfig config);

    // Integrates every stream and returns the summed canvas. Repeated calls give identical grids.
    Grid run();

    // Integrates streams [begin, end) into `canvas`.
    void run_streams(std::size_t begin, std::size_t end, Canvas& canvas, SimulationStats& stats) const;

    // Initial state of stream `stream_index`, as run() would spawn it.
    StreamState spawn_stream(std::size_t stream_index) const;

    const SimulationConfig& config() const { return config_; }
    const ForceField& force_field() const { return field_; }
    const FaucetSet& faucets() const { return faucets_; }
    const SimulationStats& stats() const { return stats_; }

private:
    SimulationConfig config_;
    ForceField field_;
    FaucetSet faucets_;
    SimulationStats stats_;
};

} // namespace sim
} // namespace rivulet
