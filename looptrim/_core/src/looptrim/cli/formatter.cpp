#include "formatter.h"
#include "app.h"
#include "option.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace looptrim {
namespace cli {

namespace {
constexpr int kSignatureWidth = 26;
}

std::string HelpFormatter::format(const App& app) {
    std::ostringstream oss;

    oss << app.path();
    if (!app.description().empty()) {
        oss << " - " << app.description();
    }
    oss << "\n\n" << format_usage(app) << "\n\n";

    if (!app.get_subcommands().empty()) {
        oss << format_subcommands(app) << "\n\n";
    }

    if (!app.get_positionals().empty()) {
        std::vector<const Option*> positionals;
        for (const auto& pos : app.get_positionals()) {
            positionals.push_back(pos.get());
        }
        oss << format_positionals(positionals) << "\n";
    }

    std::vector<const Option*> options;
    for (const auto& opt : app.get_options()) {
        options.push_back(opt.get());
    }
    oss << format_options(options);

    return oss.str();
}

std::string HelpFormatter::format_usage(const App& app) {
    std::ostringstream oss;
    oss << "USAGE:\n  " << app.path();

    if (!app.get_subcommands().empty()) {
        oss << " <subcommand>";
    }
    for (const auto& pos : app.get_positionals()) {
        oss << " <" << pos->names() << ">" << (pos->consumes_remaining() ? "..." : "");
    }
    for (const auto& opt : app.get_options()) {
        if (opt->is_required()) {
            oss << " " << opt->signature();
        }
    }
    oss << " [options]";

    return oss.str();
}

std::string HelpFormatter::format_row(const Option& opt) {
    std::ostringstream oss;
    oss << "  " << std::left << std::setw(kSignatureWidth) << opt.signature();
    oss << opt.description();

    for (const auto& validator : opt.validators()) {
        oss << " (" << validator.description << ")";
    }
    if (opt.is_required() && !opt.is_positional()) {
        oss << " [REQUIRED]";
    }
    oss << "\n";
    return oss.str();
}

std::string HelpFormatter::format_positionals(const std::vector<const Option*>& positionals) {
    std::ostringstream oss;
    oss << "ARGUMENTS:\n";
    for (const auto* pos : positionals) {
        oss << format_row(*pos);
    }
    return oss.str();
}

std::string HelpFormatter::format_options(const std::vector<const Option*>& options) {
    std::ostringstream oss;
    oss << "OPTIONS:\n";
    for (const auto* opt : options) {
        oss << format_row(*opt);
    }
    oss << "  " << std::left << std::setw(kSignatureWidth) << "-h,--help"
        << "Show this help message and exit\n";
    return oss.str();
}

std::string HelpFormatter::format_subcommands(const App& app) {
    const auto& subcommands = app.get_subcommands();

    size_t max_len = 0;
    for (const auto& sub : subcommands) {
        max_len = std::max(max_len, sub->name().size());
    }

    std::ostringstream oss;
    oss << "SUBCOMMANDS:\n";
    for (const auto& sub : subcommands) {
        oss << "  " << std::left << std::setw(static_cast<int>(max_len + 4)) << sub->name();
        oss << sub->description() << "\n";
    }
    oss << "\nUse \"" << app.path() << " <subcommand> --help\" for more information about a subcommand.";

    return oss.str();
}

}  // namespace cli
}  // namespace looptrim
