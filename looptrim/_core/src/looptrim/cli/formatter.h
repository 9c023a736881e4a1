#pragma once

#include <string>
#include <vector>

namespace looptrim {
namespace cli {

class App;
class Option;

/**
 * Builds the text printed for "looptrim --help" and "looptrim <cmd> --help":
 *
 *   USAGE:
 *     looptrim prepare <fasta> <id> <pdb> --loop START:END --keep N:C [options]
 *
 * followed by SUBCOMMANDS, ARGUMENTS and OPTIONS sections. Option rows carry
 * the validator description and [REQUIRED] for mandatory named options.
 */
class HelpFormatter {
public:
    static std::string format(const App& app);

private:
    static std::string format_usage(const App& app);
    static std::string format_positionals(const std::vector<const Option*>& positionals);
    static std::string format_options(const std::vector<const Option*>& options);
    static std::string format_subcommands(const App& app);
    static std::string format_row(const Option& opt);
};

}  // namespace cli
}  // namespace looptrim
