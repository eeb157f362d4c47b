#pragma once

#include <filesystem>
#include <memory>
#include <optional>

namespace prefstore {

// Source of the per-user configuration root of the running platform.
class DirectoryProvider {
public:
    virtual ~DirectoryProvider() = default;

    // Empty when the platform offers no usable configuration directory.
    virtual std::optional<std::filesystem::path> user_config_root() const = 0;
};

// %APPDATA% on Windows, ~/Library/Application Support on macOS,
// $XDG_CONFIG_HOME or ~/.config elsewhere.
std::unique_ptr<DirectoryProvider> create_platform_directory_provider();

std::unique_ptr<DirectoryProvider> create_fixed_directory_provider(std::optional<std::filesystem::path> root);

}  // namespace prefstore
