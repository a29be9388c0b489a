#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include "slotguard/config.hpp"
#include "slotguard/counter.hpp"
#include "slotguard/layout.hpp"
#include "slotguard/log.hpp"
#include "slotguard/slots.hpp"

using namespace slotguard;

void print_banner() {
    std::cout << R"(
    ==============================================
      slotguard - upgradeable proxy storage model
    ==============================================
    )" << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command>\n"
              << "\nCommands:\n"
              << "  slots                Print reserved control slots\n"
              << "  layout               Print reference layouts and their upgrade checks\n"
              << "\nOptions:\n"
              << "  --config <path>      Path to config file\n"
              << "  --namespace <ns>     Also derive slots for <ns> (repeatable)\n"
              << "  --log-level <level>  Log level: trace, debug, info, warn, error, off\n"
              << "  --help               Show this help message\n"
              << std::endl;
}

struct CliArgs {
    RuntimeConfig config;
    std::string command;
    std::vector<std::string> namespaces;
    bool ok{true};
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "--config" && i + 1 < argc) {
            args.config = RuntimeConfig::from_file(argv[++i]);
        } else if (arg == "--namespace" && i + 1 < argc) {
            args.namespaces.push_back(argv[++i]);
        } else if (arg == "--log-level" && i + 1 < argc) {
            auto level = RuntimeConfig::parse_log_level(argv[++i]);
            if (!level) {
                std::cerr << "[SLOTGUARD] Unknown log level: " << argv[i] << std::endl;
                args.ok = false;
            } else {
                args.config.log_level = *level;
            }
        } else if (args.command.empty() && arg[0] != '-') {
            args.command = arg;
        } else {
            std::cerr << "[SLOTGUARD] Unexpected argument: " << arg << std::endl;
            args.ok = false;
        }
    }

    return args;
}

void print_slots(const RuntimeConfig& config, const std::vector<std::string>& namespaces) {
    std::cout << "Standard control layout:" << std::endl;
    for (const auto& [name, slot] : slots::ControlLayout::standard().named()) {
        std::cout << "  " << name << " " << word::to_hex(slot) << std::endl;
    }

    std::cout << "Configured transparent proxy layout:" << std::endl;
    for (const auto& [name, slot] : config.control_layout().named()) {
        std::cout << "  " << name << " " << word::to_hex(slot) << std::endl;
    }

    for (const auto& ns : namespaces) {
        std::cout << "Namespace \"" << ns << "\":" << std::endl;
        std::cout << "  reserved   " << word::to_hex(slots::reserved(ns)) << std::endl;
        std::cout << "  namespaced " << word::to_hex(slots::namespaced(ns)) << std::endl;
    }

    auto conflicts = slots::find_conflicts(config.control_layout(), config.max_sequential_fields);
    std::cout << "Reachable by " << config.max_sequential_fields << " sequential fields: "
              << (conflicts.empty() ? "none" : std::to_string(conflicts.size()) + " slot(s)")
              << std::endl;
}

void print_layout(const layout::StorageLayout& fields) {
    std::cout << fields.contract() << " (" << fields.footprint() << " slots)" << std::endl;
    uint64_t index = 0;
    for (const auto& f : fields.fields()) {
        std::cout << "  slot " << index << "  " << layout::type_name(f.type) << " " << f.name;
        if (f.is_gap()) std::cout << "[" << f.slots << "]";
        std::cout << std::endl;
        index += f.is_gap() ? f.slots : 1;
    }
}

int print_layouts(const RuntimeConfig& config) {
    const auto& v1 = contracts::CounterV1::storage_layout();
    const auto& v2 = contracts::CounterV2::storage_layout();
    const auto& slot_zero = contracts::SlotZeroStore::storage_layout();

    print_layout(v1);
    print_layout(v2);
    print_layout(slot_zero);

    auto show = [](const std::string& title, const layout::LayoutReport& report) {
        std::cout << title << ": " << (report.compatible() ? "compatible" : "INCOMPATIBLE") << std::endl;
        std::cout << report.to_string();
        return report.compatible();
    };

    bool ok = show("CounterV1 -> CounterV2", layout::check_upgrade(v1, v2, config.gap_policy));
    ok = show("CounterV2 vs standard control slots",
              layout::check_control_disjoint(v2, slots::ControlLayout::standard())) && ok;

    // Expected to collide
    show("SlotZeroStore vs naive control slots",
         layout::check_control_disjoint(slot_zero, slots::ControlLayout::naive()));

    return ok ? 0 : 1;
}

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args.ok || args.command.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    log::set_level(args.config.log_level);
    print_banner();

    try {
        if (args.command == "slots") {
            print_slots(args.config, args.namespaces);
            return 0;
        }
        if (args.command == "layout") {
            return print_layouts(args.config);
        }

        std::cerr << "[SLOTGUARD] Unknown command: " << args.command << std::endl;
        print_usage(argv[0]);
        return 1;

    } catch (const std::exception& e) {
        std::cerr << "[SLOTGUARD] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
