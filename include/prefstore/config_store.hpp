#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "prefstore/codec.hpp"
#include "prefstore/descriptor.hpp"
#include "prefstore/directory_provider.hpp"
#include "prefstore/errors.hpp"
#include "prefstore/location_resolver.hpp"
#include "prefstore/logger.hpp"

namespace prefstore {

// Saves, loads and deletes settings records described by a StoreDescriptor.
//
// Records are any type nlohmann::json can convert to and from (to_json/from_json
// overloads or NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE). Every call resolves the path
// again; nothing is cached between calls and no locking is performed.
class ConfigStore {
public:
    // Platform config directory and every built-in codec.
    ConfigStore();
    ConfigStore(std::shared_ptr<const DirectoryProvider> directories, std::shared_ptr<const CodecRegistry> codecs);

    // Optional; a store without a logger is silent.
    void set_logger(std::shared_ptr<Logger> logger);

    template <typename Record>
    void save(const Record &record, const StoreDescriptor &descriptor) const
    {
        Document document;
        try {
            document = record;
        } catch (const nlohmann::json::exception &ex) {
            throw EncodingFailure(std::string("Unable to convert record: ") + ex.what());
        }
        save_document(document, descriptor);
    }

    template <typename Record>
    Record load(const StoreDescriptor &descriptor) const
    {
        const Document document = load_document(descriptor);
        try {
            return document.get<Record>();
        } catch (const nlohmann::json::exception &ex) {
            throw DecodingFailure("Settings at " + path_for(descriptor).string() +
                                  " do not match the record: " + ex.what());
        }
    }

    void save_document(const Document &document, const StoreDescriptor &descriptor) const;
    Document load_document(const StoreDescriptor &descriptor) const;

    // Deletes the settings file. Unless the location is ExplicitDir, the parent
    // directory is removed as well when that leaves it empty.
    void remove(const StoreDescriptor &descriptor) const;

    bool exists(const StoreDescriptor &descriptor) const;
    std::filesystem::path path_for(const StoreDescriptor &descriptor) const;

private:
    void write_file(const std::filesystem::path &requested, const std::string &data) const;
    std::string read_file(const std::filesystem::path &source) const;
    void remove_parent_if_empty(const std::filesystem::path &file) const;
    void debug(const std::string &message) const;

    LocationResolver resolver_;
    std::shared_ptr<const CodecRegistry> codecs_;
    std::shared_ptr<Logger> logger_;
};

}  // namespace prefstore
