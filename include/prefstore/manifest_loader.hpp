#pragma once

#include <string>
#include <vector>

#include "prefstore/descriptor.hpp"
#include "prefstore/logger.hpp"

namespace prefstore {

struct LoggingConfig {
    bool enableConsole{true};
    std::string filePath;
    LogLevel level{LogLevel::Info};
};

struct NamedStore {
    std::string name;
    StoreDescriptor descriptor;
};

// Stores and logging settings declared by a host application in an XML manifest:
//
//   <prefstore>
//     <logging level="debug" console="true" file="prefstore.log"/>
//     <store name="main" app="MyApp" format="json" indent="4">
//       <location kind="dir">/tmp/t</location>
//     </store>
//   </prefstore>
struct StoreManifest {
    LoggingConfig logging;
    std::vector<NamedStore> stores;
};

StoreManifest load_manifest(const std::string &path);
StoreManifest load_manifest_from_string(const std::string &xml);
void validate_manifest(const StoreManifest &manifest);

const StoreDescriptor &find_store(const StoreManifest &manifest, const std::string &name);

}  // namespace prefstore
