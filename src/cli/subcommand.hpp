#ifndef GROWTHFIT_CLI_SUBCOMMAND_HPP
#define GROWTHFIT_CLI_SUBCOMMAND_HPP

#include <functional>
#include <map>
#include <string>

namespace growthfit {
namespace cli {

// argv[0] is the subcommand name.
using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Commands register themselves from static objects in their own TU; help
// lists them by `order` (smooth, band, log-phase).
class SubcommandRegistry {
public:
    static SubcommandRegistry& instance();

    // Throws std::logic_error when the name is taken.
    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    // nullptr for unknown names.
    const SubcommandFn* find(const std::string& name) const;

    void print_help(const char* program_name) const;

private:
    struct Entry {
        std::string description;
        int order;
        SubcommandFn fn;
    };

    SubcommandRegistry() = default;
    std::map<std::string, Entry> entries_;
};

int cmd_smooth(int argc, char* argv[]);
int cmd_band(int argc, char* argv[]);
int cmd_log_phase(int argc, char* argv[]);

}  // namespace cli
}  // namespace growthfit

#endif  // GROWTHFIT_CLI_SUBCOMMAND_HPP
