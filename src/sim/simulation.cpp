#include "sim/simulation.h"

#include <algorithm>
#include <thread>
#include <utility>
#include <vector>

namespace rivulet {
namespace sim {
namespace {

SimulationConfig validated(SimulationConfig config) {
    validate(config);
    return config;
}

std::uint32_t low_word(std::uint64_t value) {
    return static_cast<std::uint32_t>(value & 0xFFFFFFFFu);
}

std::uint32_t high_word(std::uint64_t value) {
    return static_cast<std::uint32_t>(value >> 32u);
}

} // namespace

void SimulationStats::record(const StreamOutcome& outcome) {
    ++streams;
    if (outcome.status == StreamStatus::OutOfBounds) {
        ++out_of_bounds;
    } else if (outcome.status == StreamStatus::Decayed) {
        ++decayed;
    }
    total_steps += outcome.steps_taken;
    longest_stream = std::max(longest_stream, outcome.steps_taken);
}

void SimulationStats::merge(const SimulationStats& other) {
    streams += other.streams;
    out_of_bounds += other.out_of_bounds;
    decayed += other.decayed;
    total_steps += other.total_steps;
    longest_stream = std::max(longest_stream, other.longest_stream);
}

void WorkerGroup::join() {
    for (std::thread& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

Rng stream_rng(std::uint64_t seed, std::size_t stream_index) {
    const auto index = static_cast<std::uint64_t>(stream_index);
    std::seed_seq seq{low_word(seed), high_word(seed), low_word(index), high_word(index)};
    return Rng(seq);
}

Simulation::Simulation(SimulationConfig config) : config_(validated(std::move(config))) {
    Rng rng(config_.seed);
    field_ = ForceField::generate(config_, rng);
    faucets_ = FaucetSet::generate(config_, rng);
}

Grid Simulation::run() {
    stats_ = SimulationStats{};

    const auto num_streams = static_cast<std::size_t>(config_.num_streams);
    const std::size_t workers =
        std::max<std::size_t>(1, std::min(static_cast<std::size_t>(config_.threads), num_streams));

    if (workers <= 1) {
        Canvas canvas(config_.size);
        run_streams(0, num_streams, canvas, stats_);
        return std::move(canvas).finalize();
    }

    // Contiguous stream blocks, one canvas per worker, merged in worker order.
    const std::size_t chunk = (num_streams + workers - 1) / workers;
    std::vector<Canvas> canvases;
    canvases.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        canvases.emplace_back(config_.size);
    }
    std::vector<SimulationStats> worker_stats(workers);

    {
        WorkerGroup pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            const std::size_t begin = std::min(num_streams, w * chunk);
            const std::size_t end = std::min(num_streams, begin + chunk);
            pool.spawn([this, begin, end, &canvases, &worker_stats, w]() {
                run_streams(begin, end, canvases[w], worker_stats[w]);
            });
        }
        pool.join();
    }

    Canvas& total = canvases.front();
    stats_.merge(worker_stats.front());
    for (std::size_t w = 1; w < workers; ++w) {
        total.merge(canvases[w]);
        stats_.merge(worker_stats[w]);
    }
    return std::move(total).finalize();
}

void Simulation::run_streams(std::size_t begin,
                             std::size_t end,
                             Canvas& canvas,
                             SimulationStats& stats) const {
    const StreamIntegrator integrator(config_, field_);
    for (std::size_t i = begin; i < end; ++i) {
        Rng rng = stream_rng(config_.seed, i);
        StreamState state = integrator.spawn(faucets_.faucet_for_stream(i), rng);
        stats.record(integrator.integrate(state, canvas));
    }
}

StreamState Simulation::spawn_stream(std::size_t stream_index) const {
    Rng rng = stream_rng(config_.seed, stream_index);
    const StreamIntegrator integrator(config_, field_);
    return integrator.spawn(faucets_.faucet_for_stream(stream_index), rng);
}

} // namespace sim
} // namespace rivulet
