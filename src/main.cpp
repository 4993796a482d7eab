/*
 * rankpoll - ranked-choice polls on single-writer chains
 *
 * Usage:
 *   ./rankpoll [config.json]
 *
 * Reads one JSON request per line from stdin and writes one JSON response
 * per line to stdout. See PollService for the request format.
 */

#include <rankpoll/core/logger.hpp>
#include <rankpoll/core/config.hpp>
#include <rankpoll/chain/chain_host.hpp>
#include <rankpoll/storage/poll_store.hpp>
#include <rankpoll/service/poll_service.hpp>
#include <rankpoll/core/utils.hpp>

#include <iostream>
#include <string>

namespace rankpoll {

static const char* APP_VERSION = "0.1.0";
static const char* APP_NAME = "rankpoll";

static HostOptions host_options_from(const Config& config) {
    HostOptions options;
    int64_t workers = config.get_int("runtime.workers", 2);
    options.workers = workers > 0 ? static_cast<size_t>(workers) : 1;
    int64_t balance = config.get_int("factory.initial_balance", static_cast<int64_t>(DEFAULT_POLL_CHAIN_BALANCE));
    if (balance <= 0) {
        LOG_WARN("factory.initial_balance must be positive; using %llu",
                 static_cast<unsigned long long>(DEFAULT_POLL_CHAIN_BALANCE));
        balance = static_cast<int64_t>(DEFAULT_POLL_CHAIN_BALANCE);
    }
    options.poll_chain_balance = static_cast<Amount>(balance);
    options.root_owner = config.get_string("chain.root_owner", "root");
    return options;
}

static int run(int argc, char* argv[]) {
    Config config;
    if (argc > 1) {
        if (!config.load_file(argv[1])) {
            LOG_ERROR("Failed to load config %s: %s", argv[1], config.last_error().c_str());
            return 1;
        }
    }
    
    Logger::instance().set_level(parse_log_level(config.get_string("log_level", "info")));
    LOG_INFO("%s %s starting", APP_NAME, APP_VERSION);
    
    std::string db_path = config.get_string("storage.path", "rankpoll.db");
    PollStore store;
    if (!store.open(db_path) || !store.ensure_schema()) {
        LOG_ERROR("Failed to open store %s: %s", db_path.c_str(), store.last_error().c_str());
        return 1;
    }
    
    ChainHost host(store, host_options_from(config));
    if (!host.start()) {
        return 1;
    }
    
    PollService service(host);
    
    Json ready = Json::object();
    ready.set("ready", true);
    ready.set("rootChain", host.root_chain());
    std::cout << ready.dump() << std::endl;
    
    std::string line;
    while (std::getline(std::cin, line)) {
        if (trim(line).empty()) continue;
        std::cout << service.handle_line(line).dump() << std::endl;
    }
    
    host.wait_idle();
    host.shutdown();
    LOG_INFO("%s stopped", APP_NAME);
    return 0;
}

} // namespace rankpoll

int main(int argc, char* argv[]) {
    return rankpoll::run(argc, argv);
}
