#include "prefstore/manifest_loader.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_set>

#include "tinyxml2.h"

namespace prefstore {
namespace {

std::string require_attribute(const tinyxml2::XMLElement &element, const char *name)
{
    const char *value = element.Attribute(name);
    if (!value) {
        throw std::runtime_error(std::string("Missing attribute '") + name + "' in element '" + element.Name() + "'");
    }
    return value;
}

std::string optional_attribute(const tinyxml2::XMLElement &element, const char *name, const std::string &fallback = "")
{
    const char *value = element.Attribute(name);
    return value ? std::string(value) : fallback;
}

bool optional_bool_attribute(const tinyxml2::XMLElement &element, const char *name, bool fallback = false)
{
    const char *value = element.Attribute(name);
    if (!value) {
        return fallback;
    }
    std::string text(value);
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "1" || text == "yes") {
        return true;
    }
    if (text == "false" || text == "0" || text == "no") {
        return false;
    }
    throw std::runtime_error(std::string("Invalid boolean attribute '") + name + "' in element '" + element.Name() + "'");
}

Location load_location(const tinyxml2::XMLElement &element)
{
    Location location;
    location.kind = location_kind_from_string(optional_attribute(element, "kind", "auto"));
    location.value = element.GetText() ? std::string(element.GetText()) : std::string();
    return location;
}

NamedStore load_store(const tinyxml2::XMLElement &element)
{
    NamedStore store;
    store.name = require_attribute(element, "name");
    store.descriptor.app = optional_attribute(element, "app");
    store.descriptor.format = format_from_string(optional_attribute(element, "format", "json"),
                                                 optional_attribute(element, "indent"));
    if (const auto *locationElement = element.FirstChildElement("location")) {
        store.descriptor.location = load_location(*locationElement);
    }
    return store;
}

StoreManifest load_manifest_from_document(tinyxml2::XMLDocument &doc)
{
    const auto *root = doc.RootElement();
    if (!root || std::string(root->Name()) != "prefstore") {
        throw std::runtime_error("Root element <prefstore> not found");
    }

    StoreManifest manifest;

    if (const auto *loggingElement = root->FirstChildElement("logging")) {
        manifest.logging.enableConsole = optional_bool_attribute(*loggingElement, "console", true);
        manifest.logging.filePath = optional_attribute(*loggingElement, "file");
        if (const char *level = loggingElement->Attribute("level")) {
            manifest.logging.level = log_level_from_string(level);
        }
    }

    for (auto *store = root->FirstChildElement("store"); store; store = store->NextSiblingElement("store")) {
        manifest.stores.emplace_back(load_store(*store));
    }

    return manifest;
}

}  // namespace

void validate_manifest(const StoreManifest &manifest)
{
    std::unordered_set<std::string> names;
    for (const auto &store : manifest.stores) {
        if (store.name.empty()) {
            throw std::runtime_error("Store name must not be empty");
        }
        if (!names.insert(store.name).second) {
            throw std::runtime_error("Duplicate store name '" + store.name + "'");
        }

        const auto &location = store.descriptor.location;
        const bool usesConfigRoot =
            location.kind == Location::Kind::Auto || location.kind == Location::Kind::ExplicitFile;
        if (usesConfigRoot && store.descriptor.app.empty()) {
            throw std::runtime_error("Store '" + store.name + "' must specify an app for location '" +
                                     location_kind_to_string(location.kind) + "'");
        }
        if (location.kind != Location::Kind::Auto && location.value.empty()) {
            throw std::runtime_error("Store '" + store.name + "' location '" +
                                     location_kind_to_string(location.kind) + "' requires a value");
        }
    }
}

StoreManifest load_manifest(const std::string &path)
{
    tinyxml2::XMLDocument doc;
    const auto result = doc.LoadFile(path.c_str());
    if (result != tinyxml2::XML_SUCCESS) {
        throw std::runtime_error("Failed to load manifest XML: " + std::string(doc.ErrorStr() ? doc.ErrorStr() : "unknown error"));
    }

    StoreManifest manifest = load_manifest_from_document(doc);
    validate_manifest(manifest);
    return manifest;
}

StoreManifest load_manifest_from_string(const std::string &xml)
{
    tinyxml2::XMLDocument doc;
    const auto result = doc.Parse(xml.c_str(), xml.size());
    if (result != tinyxml2::XML_SUCCESS) {
        throw std::runtime_error("Failed to parse manifest XML: " + std::string(doc.ErrorStr() ? doc.ErrorStr() : "unknown error"));
    }

    StoreManifest manifest = load_manifest_from_document(doc);
    validate_manifest(manifest);
    return manifest;
}

const StoreDescriptor &find_store(const StoreManifest &manifest, const std::string &name)
{
    auto it = std::find_if(manifest.stores.begin(), manifest.stores.end(),
                           [&name](const NamedStore &store) { return store.name == name; });
    if (it == manifest.stores.end()) {
        throw std::runtime_error("Store '" + name + "' is not declared in the manifest");
    }
    return it->descriptor;
}

}  // namespace prefstore
