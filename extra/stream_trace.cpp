#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

#include "config.h"
#include "sim/canvas.h"
#include "sim/simulation.h"
#include "sim/stream_integrator.h"

// Prints the trajectory of one stream: stream_trace [config.toml] [stream index] [max rows]
int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "rivulet.toml";
    const std::size_t stream_index = argc > 2 ? std::strtoull(argv[2], nullptr, 10) : 0;
    const std::uint64_t max_rows = argc > 3 ? std::strtoull(argv[3], nullptr, 10) : 200;

    const rivulet::ConfigLoadResult loaded = rivulet::load_app_config(config_path);
    for (const std::string& warning : loaded.warnings) {
        std::cerr << "[config] " << warning << std::endl;
    }

    try {
        const rivulet::sim::Simulation simulation(loaded.config.simulation);
        const rivulet::sim::SimulationConfig& config = simulation.config();
        if (stream_index >= static_cast<std::size_t>(config.num_streams)) {
            std::cerr << "Stream index " << stream_index << " out of range (" << config.num_streams << " streams)"
                      << std::endl;
            return 1;
        }

        const rivulet::sim::StreamIntegrator integrator(config, simulation.force_field());
        rivulet::sim::Canvas canvas(config.size);
        rivulet::sim::StreamState state = simulation.spawn_stream(stream_index);

        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Faucet: " << simulation.faucets().faucet_index_for_stream(stream_index) << "\n";
        std::cout << "Decay factor: " << state.decay_factor << " (budget " << state.age_budget << " px)\n";
        std::cout << "step\tx\ty\tvx\tvy\tr\tg\tb\tage\n";

        while (true) {
            if (state.steps_taken < max_rows) {
                std::cout << state.steps_taken << '\t' << state.position.x << '\t' << state.position.y << '\t'
                          << state.velocity.x << '\t' << state.velocity.y << '\t' << state.color.r << '\t'
                          << state.color.g << '\t' << state.color.b << '\t' << state.age << "\n";
            }
            if (!state.active()) {
                break;
            }
            integrator.advance(state, canvas);
        }

        std::cout << "Terminated: " << rivulet::sim::to_string(state.status) << " after " << state.steps_taken
                  << " steps\n";
    } catch (const rivulet::ConfigurationError& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
