#pragma once

// Minimal command-line parsing for the protscope executable
//
// Features:
// - Subcommands (1 level: protscope <analyze|compare|batch|labels>)
// - Positional arguments, optionally consuming the remainder
// - Named options (--output FILE, --output=FILE) and valueless flags (--quiet)
// - Global options accepted after the subcommand name
// - Type parsing (string, int, size_t, float, bool)
// - Validators (ExistingFile, Range, OddNumber)
// - Automatic help generation

#include "errors.h"
#include "types.h"
#include "validators.h"
#include "option.h"
#include "app.h"
#include "formatter.h"

namespace protscope {
namespace cli {

// Parse + error handling for main()
#define PROTSCOPE_PARSE(app, argc, argv)       \
    try {                                      \
        app.parse(argc, argv);                 \
    } catch (const protscope::cli::Error& e) { \
        return app.exit(e);                    \
    }

}  // namespace cli
}  // namespace protscope
