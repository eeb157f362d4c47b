#include "prefstore/location_resolver.hpp"

#include <stdexcept>
#include <utility>

#include "prefstore/errors.hpp"

namespace prefstore {

LocationResolver::LocationResolver(std::shared_ptr<const DirectoryProvider> directories)
    : directories_(std::move(directories))
{
    if (!directories_) {
        throw std::invalid_argument("LocationResolver requires a directory provider");
    }
}

std::filesystem::path LocationResolver::resolve(const StoreDescriptor &descriptor) const
{
    const auto &location = descriptor.location;
    switch (location.kind) {
    case Location::Kind::Auto:
        return config_root() / descriptor.app / descriptor.format.default_name();
    case Location::Kind::ExplicitPath:
        return std::filesystem::path(location.value);
    case Location::Kind::ExplicitDir:
        return std::filesystem::path(location.value) / descriptor.format.default_name();
    case Location::Kind::ExplicitFile:
        return config_root() / descriptor.app / location.value;
    }
    throw std::logic_error("Unhandled location kind");
}

std::filesystem::path LocationResolver::config_root() const
{
    auto root = directories_->user_config_root();
    if (!root) {
        throw DirectoryUnavailable("No system config directory detected");
    }
    return *root;
}

}  // namespace prefstore
