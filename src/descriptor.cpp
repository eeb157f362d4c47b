#include "prefstore/descriptor.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace prefstore {

Location Location::automatic()
{
    return Location{};
}

Location Location::explicit_path(std::string path)
{
    return Location{Kind::ExplicitPath, std::move(path)};
}

Location Location::explicit_file(std::string filename)
{
    return Location{Kind::ExplicitFile, std::move(filename)};
}

Location Location::explicit_dir(std::string directory)
{
    return Location{Kind::ExplicitDir, std::move(directory)};
}

Location::Kind location_kind_from_string(const std::string &value)
{
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "auto") return Location::Kind::Auto;
    if (lowered == "path") return Location::Kind::ExplicitPath;
    if (lowered == "file") return Location::Kind::ExplicitFile;
    if (lowered == "dir" || lowered == "directory") return Location::Kind::ExplicitDir;
    throw std::runtime_error("Unsupported location kind: " + value);
}

std::string location_kind_to_string(Location::Kind kind)
{
    switch (kind) {
    case Location::Kind::Auto:
        return "auto";
    case Location::Kind::ExplicitPath:
        return "path";
    case Location::Kind::ExplicitFile:
        return "file";
    case Location::Kind::ExplicitDir:
        return "dir";
    }
    return "unknown";
}

std::string describe_descriptor(const StoreDescriptor &descriptor)
{
    std::string text = "app='" + descriptor.app + "' location=" + location_kind_to_string(descriptor.location.kind);
    if (descriptor.location.kind != Location::Kind::Auto) {
        text += "(" + descriptor.location.value + ")";
    }
    text += " format=" + format_to_string(descriptor.format);
    return text;
}

}  // namespace prefstore
