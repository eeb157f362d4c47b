#include "prefstore/directory_provider.hpp"

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#if defined(_WIN32)
#include <windows.h>
#include <shlobj.h>
#else
#include <pwd.h>
#include <unistd.h>
#endif

namespace prefstore {
namespace {

std::optional<std::filesystem::path> environment_path(const char *name)
{
    const char *value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::filesystem::path(value);
}

#if defined(_WIN32)
std::optional<std::filesystem::path> roaming_app_data()
{
    PWSTR path = nullptr;
    if (SUCCEEDED(SHGetKnownFolderPath(FOLDERID_RoamingAppData, 0, nullptr, &path)) && path) {
        std::filesystem::path result(path);
        CoTaskMemFree(path);
        return result;
    }
    if (path) {
        CoTaskMemFree(path);
    }
    return environment_path("APPDATA");
}
#else
std::optional<std::filesystem::path> home_directory()
{
    if (auto home = environment_path("HOME")) {
        return home;
    }

    long bufferSize = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufferSize <= 0) {
        bufferSize = 16384;
    }
    std::vector<char> buffer(static_cast<std::size_t>(bufferSize));
    passwd entry{};
    passwd *result = nullptr;
    if (getpwuid_r(getuid(), &entry, buffer.data(), buffer.size(), &result) != 0 || result == nullptr) {
        return std::nullopt;
    }
    if (result->pw_dir == nullptr || *result->pw_dir == '\0') {
        return std::nullopt;
    }
    return std::filesystem::path(result->pw_dir);
}
#endif

class PlatformDirectoryProvider : public DirectoryProvider {
public:
    std::optional<std::filesystem::path> user_config_root() const override
    {
#if defined(_WIN32)
        return roaming_app_data();
#elif defined(__APPLE__)
        auto home = home_directory();
        if (!home) {
            return std::nullopt;
        }
        return *home / "Library" / "Application Support";
#else
        auto xdg = environment_path("XDG_CONFIG_HOME");
        if (xdg && xdg->is_absolute()) {
            return xdg;
        }
        auto home = home_directory();
        if (!home) {
            return std::nullopt;
        }
        return *home / ".config";
#endif
    }
};

class FixedDirectoryProvider : public DirectoryProvider {
public:
    explicit FixedDirectoryProvider(std::optional<std::filesystem::path> root)
        : root_(std::move(root))
    {
    }

    std::optional<std::filesystem::path> user_config_root() const override { return root_; }

private:
    std::optional<std::filesystem::path> root_;
};

}  // namespace

std::unique_ptr<DirectoryProvider> create_platform_directory_provider()
{
    return std::make_unique<PlatformDirectoryProvider>();
}

std::unique_ptr<DirectoryProvider> create_fixed_directory_provider(std::optional<std::filesystem::path> root)
{
    return std::make_unique<FixedDirectoryProvider>(std::move(root));
}

}  // namespace prefstore
