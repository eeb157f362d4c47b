#pragma once

#include <string>

#include "prefstore/format.hpp"

namespace prefstore {

struct Location {
    enum class Kind {
        Auto,
        ExplicitPath,
        ExplicitFile,
        ExplicitDir
    };

    Kind kind{Kind::Auto};
    // Full path, file name or directory depending on kind. Unused for Auto.
    std::string value;

    static Location automatic();
    static Location explicit_path(std::string path);
    static Location explicit_file(std::string filename);
    static Location explicit_dir(std::string directory);

    bool operator==(const Location &other) const { return kind == other.kind && value == other.value; }
    bool operator!=(const Location &other) const { return !(*this == other); }
};

Location::Kind location_kind_from_string(const std::string &value);
std::string location_kind_to_string(Location::Kind kind);

struct StoreDescriptor {
    std::string app;
    Location location;
    Format format;

    bool operator==(const StoreDescriptor &other) const
    {
        return app == other.app && location == other.location && format == other.format;
    }
    bool operator!=(const StoreDescriptor &other) const { return !(*this == other); }
};

std::string describe_descriptor(const StoreDescriptor &descriptor);

}  // namespace prefstore
