#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "prefstore/config_store.hpp"
#include "prefstore/manifest_loader.hpp"

namespace {

struct DemoConfig {
    unsigned windowWidth{1280};
    unsigned windowHeight{720};
    int windowX{0};
    int windowY{0};
    std::string theme{"dark"};
    std::map<std::string, std::string> userData;
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(DemoConfig, windowWidth, windowHeight, windowX, windowY, theme, userData)

void print_usage(const char *program)
{
    std::cerr << "Usage: " << program << " [--manifest <path> --store <name>]\n"
              << "       " << program << " [--app <name>] [--format <tag>] [--indent <n|tab>]\n"
              << "       " << "   [--path <file> | --file <name> | --dir <directory>] [--keep] [--verbose]"
              << std::endl;
}

}  // namespace

int main(int argc, char **argv)
{
    std::string manifestPath;
    std::string storeName;
    std::string formatTag = "json";
    std::string indent;
    bool keep = false;
    bool verbose = false;
    prefstore::StoreDescriptor descriptor{"MyApp", prefstore::Location::automatic(), prefstore::Format::json()};

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if ((arg == "--manifest" || arg == "-m") && i + 1 < argc) {
            manifestPath = argv[++i];
        } else if ((arg == "--store" || arg == "-s") && i + 1 < argc) {
            storeName = argv[++i];
        } else if ((arg == "--app" || arg == "-a") && i + 1 < argc) {
            descriptor.app = argv[++i];
        } else if ((arg == "--format" || arg == "-f") && i + 1 < argc) {
            formatTag = argv[++i];
        } else if (arg == "--indent" && i + 1 < argc) {
            indent = argv[++i];
        } else if (arg == "--path" && i + 1 < argc) {
            descriptor.location = prefstore::Location::explicit_path(argv[++i]);
        } else if (arg == "--file" && i + 1 < argc) {
            descriptor.location = prefstore::Location::explicit_file(argv[++i]);
        } else if (arg == "--dir" && i + 1 < argc) {
            descriptor.location = prefstore::Location::explicit_dir(argv[++i]);
        } else if (arg == "--keep") {
            keep = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!manifestPath.empty() && storeName.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto logger = std::make_shared<prefstore::Logger>(verbose ? prefstore::LogLevel::Debug : prefstore::LogLevel::Info);
    std::unique_ptr<std::ofstream> logFile;

    try {
        if (!manifestPath.empty()) {
            const auto manifest = prefstore::load_manifest(manifestPath);
            descriptor = prefstore::find_store(manifest, storeName);
            logger->enable_console(manifest.logging.enableConsole);
            logger->set_level(verbose ? prefstore::LogLevel::Debug : manifest.logging.level);
            if (!manifest.logging.filePath.empty()) {
                logFile = std::make_unique<std::ofstream>(manifest.logging.filePath, std::ios::app);
                if (!*logFile) {
                    throw std::runtime_error("Unable to open log file: " + manifest.logging.filePath);
                }
                logger->set_file(logFile.get());
            }
        } else {
            descriptor.format = prefstore::format_from_string(formatTag, indent);
        }

        prefstore::ConfigStore store;
        store.set_logger(logger);

        logger->info("Using store " + prefstore::describe_descriptor(descriptor));
        logger->info("Settings path: " + store.path_for(descriptor).string());

        DemoConfig config;
        config.userData["greeting"] = "hello";
        store.save(config, descriptor);

        const auto loaded = store.load<DemoConfig>(descriptor);
        std::cout << nlohmann::json(loaded).dump(4) << std::endl;

        if (!keep) {
            store.remove(descriptor);
            logger->info("Settings file deleted");
        }
    } catch (const prefstore::StoreError &ex) {
        logger->error(prefstore::error_kind_to_string(ex.kind()) + ": " + ex.what());
        logger->set_file(nullptr);
        return 1;
    } catch (const std::exception &ex) {
        logger->error(std::string("Fatal error: ") + ex.what());
        logger->set_file(nullptr);
        return 1;
    }

    logger->set_file(nullptr);
    return 0;
}
