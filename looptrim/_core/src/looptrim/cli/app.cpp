#include "app.h"
#include "formatter.h"
#include <iostream>

namespace looptrim {
namespace cli {

App::App(const std::string& name, const std::string& description)
    : name_(name), description_(description) {
}

App* App::add_subcommand(const std::string& name, const std::string& desc) {
    auto sub = std::make_unique<App>(name, desc);
    sub->parent_ = this;
    auto* ptr = sub.get();
    subcommands_.push_back(std::move(sub));
    return ptr;
}

void App::require_subcommand(bool value) {
    require_subcommand_ = value;
}

App* App::get_subcommand(const std::string& name) {
    for (auto& sub : subcommands_) {
        if (sub->name_ == name) {
            return sub.get();
        }
    }
    return nullptr;
}

const App* App::get_subcommand(const std::string& name) const {
    for (const auto& sub : subcommands_) {
        if (sub->name_ == name) {
            return sub.get();
        }
    }
    return nullptr;
}

Option* App::find_option(const std::string& arg) {
    for (App* app = this; app != nullptr; app = app->parent_) {
        for (auto& opt : app->options_) {
            if (opt->matches(arg)) {
                return opt.get();
            }
        }
    }
    return nullptr;
}

void App::parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    parse(args);
}

void App::parse(const std::vector<std::string>& args) {
    size_t i = 0;
    size_t positional_index = 0;

    while (i < args.size()) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            throw CallForHelp();
        }

        // The subcommand takes over the remaining arguments
        if (positional_index == 0) {
            if (auto* sub = get_subcommand(arg)) {
                active_subcommand_ = sub;
                std::vector<std::string> remaining(args.begin() + i + 1, args.end());
                sub->parse(remaining);
                return;
            }
        }

        if (auto* opt = find_option(arg)) {
            if (opt->is_flag()) {
                opt->set_flag();
            } else if (auto embedded = opt->extract_value(arg)) {
                opt->parse(*embedded);
            } else {
                if (i + 1 >= args.size()) {
                    throw MissingArgument("Option " + arg + " requires a value");
                }
                opt->parse(args[++i]);
            }
            ++i;
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-') {
            throw UnknownArgument("Unknown option: " + arg);
        }

        if (positional_index < positionals_.size()) {
            auto* positional = positionals_[positional_index].get();
            positional->parse(arg);
            if (!positional->consumes_remaining()) {
                ++positional_index;
            }
            ++i;
        } else {
            throw UnknownArgument("Unexpected argument: " + arg);
        }
    }

    for (const auto& opt : options_) {
        if (!opt->is_satisfied()) {
            throw MissingArgument("Required option missing: " + opt->names());
        }
    }

    for (const auto& pos : positionals_) {
        if (!pos->is_satisfied()) {
            throw MissingArgument("Required argument missing: " + pos->names());
        }
    }

    if (require_subcommand_ && !active_subcommand_) {
        throw ParseError("Subcommand required. Use --help to see available subcommands.");
    }
}

std::string App::help() const {
    return HelpFormatter::format(*this);
}

std::string App::path() const {
    return parent_ ? parent_->path() + " " + name_ : name_;
}

int App::exit(const Error& e) const {
    // Errors are raised by the innermost app that was parsing
    const App* target = this;
    while (target->active_subcommand_) {
        target = target->active_subcommand_;
    }

    if (dynamic_cast<const CallForHelp*>(&e)) {
        std::cout << target->help() << std::endl;
    } else {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Run '" << target->path() << " --help' for usage." << std::endl;
    }
    return e.get_exit_code();
}

}  // namespace cli
}  // namespace looptrim
