// xbridge-quote - wrapper fee quotes from a deployment config
//
// Loads the fee schedule of a deployment config into a ControllerWrapper on a
// local chain and prints the (fee, net) split for each amount.

#include <xbridge/xbridge.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

//------------------------------------------------------------------------------
// Options
//------------------------------------------------------------------------------

struct Options {
    std::string config_path;
    std::string controller;
    std::string dest_chain;
    std::vector<std::string> amounts;
    bool verbose = false;
    bool json_output = false;
};

void print_usage(const char* prog) {
    std::cout << "xbridge-quote - ControllerWrapper fee quotes\n\n"
              << "Usage: " << prog << " [options] <config.json> <controller> <dest_chain> <amount>...\n\n"
              << "Options:\n"
              << "  -j, --json           Print quotes as JSON\n"
              << "  -v, --verbose        Debug logging\n"
              << "  -h, --help           Show this help message\n\n"
              << "Arguments:\n"
              << "  controller           0x-prefixed controller address the tiers are keyed by\n"
              << "  dest_chain           Chain id, or a chain name from the config\n"
              << "  amount               Decimal amount in token base units\n\n"
              << "Examples:\n"
              << "  " << prog << " deploy.json 0x00000000000000000000000000000000000000c1 10 1000000\n"
              << "  " << prog << " -j deploy.json 0x00000000000000000000000000000000000000c1 optimism 26 2974\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "-j" || arg == "--json") {
            opts.json_output = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            std::exit(1);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 4) {
        print_usage(argv[0]);
        std::exit(1);
    }

    opts.config_path = positional[0];
    opts.controller = positional[1];
    opts.dest_chain = positional[2];
    opts.amounts.assign(positional.begin() + 3, positional.end());
    return opts;
}

xbridge::ChainId resolve_chain(const xbridge::Config& config, const std::string& name) {
    if (!name.empty() && name.find_first_not_of("0123456789") == std::string::npos) {
        return std::stoull(name);
    }
    return config.chain_id(name);
}

//------------------------------------------------------------------------------
// Main
//------------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options opts = parse_args(argc, argv);

    try {
        xbridge::Config config = xbridge::Config::from_file(opts.config_path);

        auto& logger = xbridge::log::Logger::instance();
        logger.set_level(opts.verbose ? xbridge::log::Level::Debug : config.log_level);

        const xbridge::Address controller = xbridge::addresses::from_hex(opts.controller);
        const xbridge::ChainId dest = resolve_chain(config, opts.dest_chain);

        // Local chain: the first configured chain, or an anonymous one
        const xbridge::ChainId local_id = config.chains.empty() ? 1 : config.chains.front().chain_id;
        xbridge::Chain chain(local_id);

        const xbridge::Address admin = xbridge::addresses::from_u64(0xA0);
        const xbridge::Address manager = xbridge::addresses::from_u64(0xA1);
        auto& wrapper = chain.deploy<xbridge::ControllerWrapper>(
            admin, manager, config.wrapper.treasury, 0, std::vector<xbridge::Address>{controller},
            std::vector<xbridge::ChainId>{}, std::vector<uint32_t>{});
        config.apply_fee_schedule(wrapper, controller, manager);

        json out = json::array();
        if (!opts.json_output) {
            std::cout << "controller " << xbridge::addresses::to_hex(controller) << " -> chain " << dest << "\n"
                      << std::left << std::setw(42) << "amount" << std::setw(42) << "fee" << "net\n";
        }

        for (const auto& text : opts.amounts) {
            const xbridge::U128 amount = xbridge::parse_u128(text);
            const xbridge::FeeQuote q = wrapper.quote(controller, dest, amount);

            if (opts.json_output) {
                out.push_back({
                    {"amount", xbridge::u128_to_string(amount)},
                    {"fee", xbridge::u128_to_string(q.fee)},
                    {"net", xbridge::u128_to_string(q.net)},
                });
            } else {
                std::cout << std::left << std::setw(42) << xbridge::u128_to_string(amount)
                          << std::setw(42) << xbridge::u128_to_string(q.fee)
                          << xbridge::u128_to_string(q.net) << "\n";
            }
        }

        if (opts.json_output) {
            std::cout << out.dump(2) << "\n";
        }
    } catch (const xbridge::Revert& e) {
        std::cerr << "Reverted: " << xbridge::error_name(e.code()) << " " << e.detail() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
