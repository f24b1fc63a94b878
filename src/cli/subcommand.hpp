#ifndef POSTOGA_CLI_SUBCOMMAND_HPP
#define POSTOGA_CLI_SUBCOMMAND_HPP

#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace postoga {
namespace cli {

using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Subcommands register themselves from static initializers in their own
// translation unit; the dispatcher looks them up by name.
class SubcommandRegistry {
public:
    struct CommandEntry {
        std::string name;
        std::string description;
        int order;
        SubcommandFn fn;
    };

    static SubcommandRegistry& instance();

    // Returns false and keeps the earlier entry when `name` is taken.
    bool register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    bool has_command(const std::string& name) const;
    int run_command(const std::string& name, int argc, char* argv[]) const;

    // Commands are listed by workflow order, then by name.
    void print_help(std::ostream& out, const char* program_name) const;

    const std::vector<CommandEntry>& commands() const { return entries_; }

private:
    SubcommandRegistry() = default;
    const CommandEntry* find(const std::string& name) const;

    std::vector<CommandEntry> entries_;  // sorted by (order, name)
};

int cmd_base(int argc, char* argv[]);
int cmd_haplotype(int argc, char* argv[]);

}  // namespace cli
}  // namespace postoga

#endif  // POSTOGA_CLI_SUBCOMMAND_HPP
