#include "subcommand.hpp"
#include "growthfit/version.h"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace growthfit {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    auto inserted = entries_.emplace(name, Entry{description, order, std::move(fn)});
    if (!inserted.second) {
        throw std::logic_error("Subcommand registered twice: " + name);
    }
}

const SubcommandFn* SubcommandRegistry::find(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second.fn;
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::vector<std::pair<const std::string*, const Entry*>> listed;
    size_t width = 0;
    for (const auto& kv : entries_) {
        listed.emplace_back(&kv.first, &kv.second);
        width = std::max(width, kv.first.size());
    }
    std::stable_sort(listed.begin(), listed.end(), [](const auto& a, const auto& b) {
        return a.second->order < b.second->order;
    });

    std::cout << "growthfit v" << GROWTHFIT_VERSION
              << ": LOESS smoothing, replicate bands and log-phase detection for growth curves\n\n";
    std::cout << "Usage: " << program_name << " <command> -i <curves.tsv[.gz]> [options]\n\n";
    std::cout << "Commands:\n";
    for (const auto& item : listed) {
        std::cout << "  " << *item.first << std::string(width + 2 - item.first->size(), ' ')
                  << item.second->description << "\n";
    }

    std::cout << "\nInput is a tab-separated long table (plain or .gz) with columns\n";
    std::cout << "sample, well, replicate, time_min, value and an optional color.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " smooth -i plate1.tsv -o plate1.json --span 0.3 --band-mode pointwise\n";
    std::cout << "  " << program_name << " log-phase -i plate1.tsv.gz --log-window 10 -v\n";
    std::cout << "\nFor help on a command: " << program_name << " help <command>\n";
}

}  // namespace cli
}  // namespace growthfit
