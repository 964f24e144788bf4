#include "app.h"
#include "formatter.h"
#include <iostream>

namespace protscope {
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

Option* App::find_option(const std::string& arg) {
    for (auto& opt : options_) {
        if (opt->matches(arg)) {
            return opt.get();
        }
    }
    // Global options may follow the subcommand name
    return parent_ ? parent_->find_option(arg) : nullptr;
}

std::string App::full_name() const {
    return parent_ ? parent_->full_name() + " " + name_ : name_;
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
    bool only_positionals = false;

    while (i < args.size()) {
        const std::string& arg = args[i];

        if (!only_positionals && (arg == "-h" || arg == "--help")) {
            if (parent_) {
                parent_->active_subcommand_ = this;
            }
            throw CallForHelp();
        }

        if (!only_positionals && arg == "--") {
            only_positionals = true;
            ++i;
            continue;
        }

        if (!only_positionals && positional_index == 0 && positionals_.empty()) {
            if (auto* sub = get_subcommand(arg)) {
                active_subcommand_ = sub;
                std::vector<std::string> remaining(args.begin() + i + 1, args.end());
                sub->parse(remaining);
                break;
            }
        }

        if (!only_positionals && arg.size() > 1 && arg[0] == '-') {
            Option* opt = find_option(arg);
            if (opt == nullptr) {
                throw ParseError("Unknown option: " + arg);
            }
            if (opt->has_inline_value(arg)) {
                opt->parse(opt->inline_value(arg));
            } else if (opt->is_flag()) {
                opt->set();
            } else {
                if (i + 1 >= args.size()) {
                    throw MissingArgument("Option " + arg + " requires a value");
                }
                opt->parse(args[++i]);
            }
            ++i;
            continue;
        }

        if (positional_index < positionals_.size()) {
            auto* positional = positionals_[positional_index].get();
            positional->parse(arg);
            if (!positional->consumes_remaining()) {
                ++positional_index;
            }
            ++i;
        } else {
            throw ParseError("Unexpected argument: " + arg);
        }
    }

    for (const auto& opt : options_) {
        if (!opt->is_satisfied()) {
            throw MissingArgument("Required option missing: " + opt->names());
        }
    }

    // A subcommand validates its own arguments
    if (active_subcommand_ != nullptr) {
        return;
    }

    for (const auto& pos : positionals_) {
        if (!pos->is_satisfied()) {
            throw MissingArgument("Required argument missing: " + pos->names());
        }
    }

    if (require_subcommand_) {
        throw ParseError("Subcommand required. Use --help to see available subcommands.");
    }
}

std::string App::help() const {
    // Show the help of the deepest subcommand that was reached
    if (active_subcommand_ != nullptr) {
        return active_subcommand_->help();
    }
    return HelpFormatter::format(*this);
}

int App::exit(const Error& e) const {
    if (dynamic_cast<const CallForHelp*>(&e)) {
        std::cout << help() << std::endl;
    } else {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << std::endl;
        std::cerr << help() << std::endl;
    }
    return e.get_exit_code();
}

}  // namespace cli
}  // namespace protscope
