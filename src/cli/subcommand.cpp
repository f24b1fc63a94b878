#include "subcommand.hpp"
#include "args.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

namespace postoga {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

bool SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    if (find(name)) {
        std::cerr << "postoga: subcommand '" << name << "' registered twice\n";
        return false;
    }
    auto pos = std::upper_bound(entries_.begin(), entries_.end(), std::make_pair(order, name),
                                [](const std::pair<int, std::string>& key, const CommandEntry& e) {
                                    return key < std::make_pair(e.order, e.name);
                                });
    entries_.insert(pos, CommandEntry{name, description, order, std::move(fn)});
    return true;
}

const SubcommandRegistry::CommandEntry* SubcommandRegistry::find(const std::string& name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&name](const CommandEntry& e) { return e.name == name; });
    return it == entries_.end() ? nullptr : &*it;
}

bool SubcommandRegistry::has_command(const std::string& name) const {
    return find(name) != nullptr;
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    const CommandEntry* entry = find(name);
    if (!entry) {
        std::cerr << "Unknown command: " << name << "\n";
        std::cerr << "Run 'postoga --help' for usage information.\n";
        return 1;
    }
    return entry->fn(argc, argv);
}

void SubcommandRegistry::print_help(std::ostream& out, const char* program_name) const {
    size_t width = 0;
    for (const auto& e : entries_) width = std::max(width, e.name.size());

    out << version_banner() << "\n";
    out << "Post-processing of TOGA results\n\n";
    out << "Usage: " << program_name << " <command> [options]\n\n";
    out << "Commands:\n";
    for (const auto& e : entries_) {
        out << "  " << std::left << std::setw(static_cast<int>(width + 2)) << e.name
            << e.description << "\n";
    }
    out << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace postoga
