#pragma once

#include <string>

namespace protscope {
namespace cli {

class App;

// Renders --help text
class HelpFormatter {
public:
    static std::string format(const App& app);

private:
    static std::string format_usage(const App& app);
    static std::string format_subcommands(const App& app);
    static std::string format_positionals(const App& app);
    static std::string format_options(const App& app);
};

}  // namespace cli
}  // namespace protscope
