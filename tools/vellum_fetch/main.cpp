/**
 * Resource fetch CLI
 * Usage: vellum-fetch [-v] <type>:<url> [<type>:<url> ...]
 *
 * Loads every argument through the resource manager as one batch and
 * prints the handles and manager statistics.
 */

#include "vellum/cache/memory_pressure.hpp"
#include "vellum/codecs/codecs.hpp"
#include "vellum/core/clock.hpp"
#include "vellum/core/event_loop.hpp"
#include "vellum/core/logger.hpp"
#include "vellum/network/http_transport.hpp"
#include "vellum/resource/resource_manager.hpp"
#include <iostream>
#include <string>
#include <vector>

using namespace vellum;

namespace {

void print_usage() {
    std::cerr << "Usage: vellum-fetch [-v] <type>:<url> [<type>:<url> ...]\n"
              << "Types: texture, font, audio, json, binary, svg\n";
}

void print_stats(const resource::ResourceManagerStats& stats) {
    std::cout << "\n=== Loader ===\n";
    std::cout << "Loaded: " << stats.loader.loaded << "  Errors: " << stats.loader.error
              << "  Cancelled: " << stats.loader.cancelled << "\n";

    std::cout << "\n=== Cache ===\n";
    std::cout << "Items: " << stats.cache.item_count << "  Used: " << stats.cache.used
              << " / " << stats.cache.limit << " bytes\n";
    std::cout << "GPU items: " << stats.gpu_cache.item_count << "  Used: " << stats.gpu_cache.used
              << " / " << stats.gpu_cache.limit << " bytes\n";

    std::cout << "\n=== References ===\n";
    std::cout << "Total: " << stats.references.total_refs
              << "  Active: " << stats.references.active_refs
              << "  Orphaned: " << stats.references.orphaned_refs << "\n";

    std::cout << "\nAverage load time: " << stats.performance.average_load_time << " ms\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    logging::init();
    logging::set_level(LogLevel::Warn);

    std::vector<network::ResourceConfig> configs;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-v") {
            logging::set_level(LogLevel::Debug);
            continue;
        }

        auto colon = arg.find(':');
        auto type = colon == std::string::npos
            ? std::nullopt
            : network::parse_resource_type(arg.substr(0, colon));
        if (!type) {
            std::cerr << "Error: Expected <type>:<url>, got: " << arg << "\n";
            print_usage();
            return 1;
        }

        network::ResourceConfig config;
        config.url = arg.substr(colon + 1);
        config.id = config.url;
        config.type = *type;
        configs.push_back(std::move(config));
    }

    if (configs.empty()) {
        print_usage();
        return 1;
    }

    SteadyClock clock;
    EventLoop loop(clock);
    network::HttpTransport transport(loop);
    auto decoders = network::DecoderRegistry::with_builtin_decoders();
    codecs::register_default_decoders(decoders);
    cache::SystemMemoryPressureSource memory_pressure;

    resource::ResourceContext context{loop, transport, decoders, memory_pressure};
    resource::ResourceManagerOptions options;
    options.auto_gc = false;
    resource::EnhancedResourceManager manager(context, options);

    manager.on_loading_progress.connect(
        [](const std::string& id, const network::LoadingProgress& progress) {
            if (progress.total > 0) {
                std::cerr << "  " << id << ": " << progress.loaded << "/" << progress.total << "\n";
            }
        });

    int exit_code = 0;
    manager.load_batch(configs).then(
        [&](const ResourceResult<std::vector<resource::ResourceRefPtr>>& result) {
            if (result.is_err()) {
                const auto& error = result.error();
                std::cerr << "Error: " << error.message;
                if (error.status != 0) {
                    std::cerr << " (HTTP " << error.status << ")";
                }
                std::cerr << "\n";
                exit_code = 1;
            } else {
                std::cout << "=== Resources ===\n";
                for (const auto& ref : result.value()) {
                    std::cout << "  " << ref->id() << "  [" << network::to_string(ref->type())
                              << "]  " << ref->size() << " bytes\n";
                }
            }
            loop.stop();
        });

    loop.run();

    print_stats(manager.get_stats());

    manager.dispose();
    logging::shutdown();
    return exit_code;
}
