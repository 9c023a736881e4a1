#pragma once

// Small command-line parser for the looptrim tool
//
// Features:
// - One level of subcommands (looptrim <prepare|run|renumber|version>)
// - Positional arguments, the last one optionally collecting the rest
// - Named options, repeatable when bound to std::vector<std::string>
// - Boolean flags that take no value (--quiet)
// - Options of the parent app are accepted after the subcommand
// - Validators (ExistingFile, Range, ColonPair)
// - Generated help text
//
// Not supported: config files, environment variables, nested subcommands,
// combined short flags (-qv).

#include "errors.h"
#include "types.h"
#include "validators.h"
#include "option.h"
#include "app.h"
#include "formatter.h"

namespace looptrim {
namespace cli {

// Parse argv, or print help / the error and return its exit code
#define LOOPTRIM_PARSE(app, argc, argv)       \
    try {                                     \
        (app).parse(argc, argv);              \
    } catch (const looptrim::cli::Error& e) { \
        return (app).exit(e);                 \
    }

}  // namespace cli
}  // namespace looptrim
