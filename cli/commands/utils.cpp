#include "commands/commands.h"

#include <iostream>

// Set by the build from the project version
#ifndef LOOPTRIM_VERSION
#define LOOPTRIM_VERSION "0.1.0"
#endif

namespace looptrim {
namespace commands {

void apply_global_flags(const GlobalFlags& flags) {
    auto& logger = common::Logger::instance();
    if (flags.quiet) {
        logger.set_level(common::LogLevel::Error);
    } else if (flags.verbose) {
        logger.set_level(common::LogLevel::Debug);
    } else {
        logger.set_level(common::LogLevel::Info);
    }
}

int version() {
    std::cout << "looptrim " << LOOPTRIM_VERSION << std::endl;
    std::cout << "Build: C++ CLI" << std::endl;
#ifdef __VERSION__
    std::cout << "Compiler: " << __VERSION__ << std::endl;
#endif
    return 0;
}

}  // namespace commands
}  // namespace looptrim
