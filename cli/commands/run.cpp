#include "commands/commands.h"

#include <exception>
#include <iostream>

#include "looptrim/engine/external_engine.h"
#include "looptrim/errors/looptrim_error.h"

namespace looptrim {
namespace commands {

int run(const pipeline::PipelineConfig& config, const std::string& engine_command,
        const std::string& score_file) {
    try {
        engine::EngineConfig engine_config;
        engine_config.command_template = engine_command;
        engine_config.score_file = score_file;
        engine::ExternalCommandEngine engine(engine_config);

        pipeline::PipelineResult result = pipeline::run_pipeline(config, engine, std::cout);

        print_success("Loop trimming complete");
        print_field("Best model", result.ranked.top().name);
        print_field("Models renumbered", result.renumbered.size());
        if (result.ranked.num_rejected() > 0) {
            print_field("Models rejected", result.ranked.num_rejected());
        }
        return 0;
    } catch (const errors::LooptrimError& e) {
        std::cerr << e.formatted() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}

}  // namespace commands
}  // namespace looptrim
