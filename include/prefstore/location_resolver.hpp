#pragma once

#include <filesystem>
#include <memory>

#include "prefstore/descriptor.hpp"
#include "prefstore/directory_provider.hpp"

namespace prefstore {

// Composes the settings file path for a descriptor. Purely textual: the
// filesystem is never consulted and the result is not normalized.
class LocationResolver {
public:
    explicit LocationResolver(std::shared_ptr<const DirectoryProvider> directories);

    // Throws DirectoryUnavailable for Auto and ExplicitFile when the provider has no root.
    std::filesystem::path resolve(const StoreDescriptor &descriptor) const;

private:
    std::filesystem::path config_root() const;

    std::shared_ptr<const DirectoryProvider> directories_;
};

}  // namespace prefstore
