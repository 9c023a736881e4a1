#include "commands/commands.h"

#include <exception>
#include <iostream>

#include "looptrim/errors/looptrim_error.h"

namespace looptrim {
namespace commands {

int prepare(const pipeline::PipelineConfig& config) {
    try {
        pipeline::PreparedInputs inputs = pipeline::prepare_inputs(config);

        if (info_enabled()) {
            pipeline::print_mapping_summary(inputs, std::cout);
        }
        print_success("Alignment written");
        print_field("Alignment", inputs.alignment_path);
        print_field("Selection", inputs.selection_path);
        print_field("Target residues built", inputs.alignment.retained_length());
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
