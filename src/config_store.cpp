#include "prefstore/config_store.hpp"

#include <fstream>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace prefstore {

namespace {
std::filesystem::path temporary_sibling(const std::filesystem::path &target)
{
    std::random_device device;
    std::mt19937_64 generator(device());
    std::ostringstream suffix;
    suffix << std::hex << std::setw(16) << std::setfill('0') << generator();
    return target.parent_path() / ("." + target.filename().string() + ".tmp-" + suffix.str());
}
}  // namespace

ConfigStore::ConfigStore()
    : ConfigStore(std::shared_ptr<const DirectoryProvider>(create_platform_directory_provider()),
                  std::make_shared<const CodecRegistry>(create_default_codec_registry()))
{
}

ConfigStore::ConfigStore(std::shared_ptr<const DirectoryProvider> directories,
                         std::shared_ptr<const CodecRegistry> codecs)
    : resolver_(std::move(directories)), codecs_(std::move(codecs))
{
    if (!codecs_) {
        throw std::invalid_argument("ConfigStore requires a codec registry");
    }
}

void ConfigStore::set_logger(std::shared_ptr<Logger> logger)
{
    logger_ = std::move(logger);
}

void ConfigStore::save_document(const Document &document, const StoreDescriptor &descriptor) const
{
    const auto target = path_for(descriptor);
    const auto &codec = codecs_->codec_for(descriptor.format);

    const auto directory = target.parent_path();
    if (!directory.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        if (ec) {
            throw IoFailure("Unable to create settings directory", directory, ec);
        }
    }

    const auto data = codec.encode(document, descriptor.format);
    write_file(target, data);
    debug("Saved " + std::to_string(data.size()) + " bytes of " + descriptor.format.tag() + " settings to " +
          target.string());
}

Document ConfigStore::load_document(const StoreDescriptor &descriptor) const
{
    const auto source = path_for(descriptor);
    const auto &codec = codecs_->codec_for(descriptor.format);
    const auto data = read_file(source);
    auto document = codec.decode(data, descriptor.format);
    debug("Loaded " + descriptor.format.tag() + " settings from " + source.string());
    return document;
}

void ConfigStore::remove(const StoreDescriptor &descriptor) const
{
    const auto target = path_for(descriptor);
    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
        throw IoFailure("Settings path is a directory", target, std::make_error_code(std::errc::is_a_directory));
    }
    const bool removed = std::filesystem::remove(target, ec);
    if (ec) {
        throw IoFailure("Unable to delete settings file", target, ec);
    }
    if (!removed) {
        throw FileNotFound(target);
    }
    debug("Deleted settings file " + target.string());

    // An explicit directory belongs to the caller and is never removed.
    if (descriptor.location.kind != Location::Kind::ExplicitDir) {
        remove_parent_if_empty(target);
    }
}

bool ConfigStore::exists(const StoreDescriptor &descriptor) const
{
    std::filesystem::path target;
    try {
        target = path_for(descriptor);
    } catch (const DirectoryUnavailable &) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(target, ec);
}

std::filesystem::path ConfigStore::path_for(const StoreDescriptor &descriptor) const
{
    return resolver_.resolve(descriptor);
}

void ConfigStore::write_file(const std::filesystem::path &requested, const std::string &data) const
{
    // A symlinked settings file is written through, not replaced.
    std::filesystem::path target = requested;
    std::error_code ec;
    if (std::filesystem::is_symlink(std::filesystem::symlink_status(requested, ec))) {
        target = std::filesystem::weakly_canonical(requested, ec);
        if (ec) {
            throw IoFailure("Unable to resolve settings file link", requested, ec);
        }
    }

    const auto staging = temporary_sibling(target);
    {
        std::ofstream stream(staging, std::ios::binary | std::ios::trunc);
        if (!stream) {
            throw IoFailure("Unable to write settings file", staging);
        }
        stream.write(data.data(), static_cast<std::streamsize>(data.size()));
        stream.flush();
        if (!stream) {
            stream.close();
            std::error_code ignored;
            std::filesystem::remove(staging, ignored);
            throw IoFailure("Failed to write settings file", staging);
        }
    }

    std::filesystem::rename(staging, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(staging, ignored);
        throw IoFailure("Unable to replace settings file", target, ec);
    }
}

std::string ConfigStore::read_file(const std::filesystem::path &source) const
{
    std::error_code ec;
    const auto status = std::filesystem::status(source, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        throw FileNotFound(source);
    }
    if (ec) {
        throw IoFailure("Unable to inspect settings file", source, ec);
    }
    if (status.type() == std::filesystem::file_type::directory) {
        throw IoFailure("Settings path is a directory", source,
                        std::make_error_code(std::errc::is_a_directory));
    }

    std::ifstream stream(source, std::ios::binary);
    if (!stream) {
        throw IoFailure("Unable to open settings file", source);
    }
    std::string data((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    if (stream.bad()) {
        throw IoFailure("Failed to read settings file", source);
    }
    return data;
}

void ConfigStore::remove_parent_if_empty(const std::filesystem::path &file) const
{
    const auto directory = file.parent_path();
    if (directory.empty()) {
        return;
    }
    // Never a symlinked directory.
    std::error_code ignored;
    if (std::filesystem::symlink_status(directory, ignored).type() != std::filesystem::file_type::directory) {
        debug("Kept settings directory " + directory.string() + " (not a plain directory)");
        return;
    }
    // Fails for a non-empty directory.
    if (std::filesystem::remove(directory, ignored)) {
        debug("Removed empty settings directory " + directory.string());
    } else {
        debug("Kept settings directory " + directory.string() +
              (ignored ? " (" + ignored.message() + ")" : std::string()));
    }
}

void ConfigStore::debug(const std::string &message) const
{
    if (logger_) {
        logger_->debug(message);
    }
}

}  // namespace prefstore
