#include "formatter.h"
#include "app.h"
#include "option.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace protscope {
namespace cli {

namespace {

constexpr int kNameColumn = 28;

void write_row(std::ostringstream& oss, const std::string& left, const std::string& right) {
    oss << "  " << std::left << std::setw(kNameColumn) << left;
    if (left.size() >= static_cast<size_t>(kNameColumn)) {
        oss << "\n  " << std::string(kNameColumn, ' ');
    }
    oss << right << "\n";
}

}  // namespace

std::string HelpFormatter::format(const App& app) {
    std::ostringstream oss;

    oss << app.full_name();
    if (!app.description().empty()) {
        oss << " - " << app.description();
    }
    oss << "\n\n" << format_usage(app) << "\n";

    if (!app.get_subcommands().empty()) {
        oss << "\n" << format_subcommands(app);
    }
    if (!app.get_positionals().empty()) {
        oss << "\n" << format_positionals(app);
    }
    oss << "\n" << format_options(app);

    return oss.str();
}

std::string HelpFormatter::format_usage(const App& app) {
    std::ostringstream oss;
    oss << "USAGE:\n  " << app.full_name();

    if (!app.get_subcommands().empty()) {
        oss << " <subcommand>";
    }
    for (const auto& pos : app.get_positionals()) {
        oss << " <" << pos->names() << (pos->consumes_remaining() ? "..." : "") << ">";
    }
    oss << " [options]";

    return oss.str();
}

std::string HelpFormatter::format_subcommands(const App& app) {
    std::ostringstream oss;
    oss << "SUBCOMMANDS:\n";

    for (const auto& sub : app.get_subcommands()) {
        write_row(oss, sub->name(), sub->description());
    }
    oss << "\nUse \"" << app.full_name()
        << " <subcommand> --help\" for more information about a subcommand.\n";

    return oss.str();
}

std::string HelpFormatter::format_positionals(const App& app) {
    std::ostringstream oss;
    oss << "ARGUMENTS:\n";

    for (const auto& pos : app.get_positionals()) {
        write_row(oss, pos->signature(),
                  pos->description() + (pos->is_required() ? " [REQUIRED]" : ""));
    }

    return oss.str();
}

std::string HelpFormatter::format_options(const App& app) {
    std::ostringstream oss;
    oss << "OPTIONS:\n";

    for (const auto& opt : app.get_options()) {
        write_row(oss, opt->signature(),
                  opt->description() + (opt->is_required() ? " [REQUIRED]" : ""));
    }
    write_row(oss, "-h,--help", "Show this help message and exit");

    return oss.str();
}

}  // namespace cli
}  // namespace protscope
