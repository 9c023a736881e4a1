#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "looptrim/common/logging.h"
#include "looptrim/modules/pipeline/loop_pipeline.h"

namespace looptrim {
namespace commands {

// Global flags shared across all commands
struct GlobalFlags {
    bool quiet = false;    // Errors only
    bool verbose = false;  // Debug events from every stage
};

// Set the log threshold from the global flags; --quiet wins over --verbose
void apply_global_flags(const GlobalFlags& flags);

inline bool info_enabled() {
    return common::Logger::instance().enabled(common::LogLevel::Info);
}

inline void print_success(const std::string& message) {
    if (info_enabled()) {
        std::cout << "[OK] " << message << std::endl;
    }
}

template <typename T>
inline void print_field(const std::string& name, const T& value) {
    if (info_enabled()) {
        std::cout << "  " << name << ": " << value << std::endl;
    }
}

// Write <id>.ali and <id>.sel and print the mapping summary
// Usage: looptrim prepare <fasta> <id> <pdb> --loop S:E --keep N:C [--chain A] [--out-dir DIR]
int prepare(const pipeline::PipelineConfig& config);

// Prepare, build models with an external engine, rank and renumber
// Usage: looptrim run <fasta> <id> <pdb> --loop S:E --keep N:C --engine-cmd CMD [--models N]
int run(const pipeline::PipelineConfig& config, const std::string& engine_command,
        const std::string& score_file);

// Renumber existing model files onto template numbering
// Usage: looptrim renumber <alignment.ali> <template.pdb> <models...> [--out-dir DIR]
int renumber(const std::string& alignment_path, const std::string& template_path,
             const std::vector<std::string>& model_paths, const std::string& output_dir);

// Usage: looptrim version
int version();

}  // namespace commands
}  // namespace looptrim
