#include "prefstore/errors.hpp"

#include <utility>

namespace prefstore {

namespace {
std::string describe(const std::string &message, const std::filesystem::path &path, const std::error_code &code)
{
    std::string text = message + ": " + path.string();
    if (code) {
        text += " (" + code.message() + ")";
    }
    return text;
}
}  // namespace

std::string error_kind_to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::DirectoryUnavailable:
        return "DirectoryUnavailable";
    case ErrorKind::FileNotFound:
        return "FileNotFound";
    case ErrorKind::IoFailure:
        return "IoFailure";
    case ErrorKind::EncodingFailure:
        return "EncodingFailure";
    case ErrorKind::DecodingFailure:
        return "DecodingFailure";
    case ErrorKind::UnsupportedFormat:
        return "UnsupportedFormat";
    }
    return "Unknown";
}

StoreError::StoreError(ErrorKind kind, const std::string &message)
    : std::runtime_error(message), kind_(kind)
{
}

DirectoryUnavailable::DirectoryUnavailable(const std::string &message)
    : StoreError(ErrorKind::DirectoryUnavailable, message)
{
}

IoFailure::IoFailure(const std::string &message, std::filesystem::path path, std::error_code code)
    : IoFailure(ErrorKind::IoFailure, message, std::move(path), code)
{
}

IoFailure::IoFailure(ErrorKind kind, const std::string &message, std::filesystem::path path, std::error_code code)
    : StoreError(kind, describe(message, path, code)), path_(std::move(path)), code_(code)
{
}

FileNotFound::FileNotFound(std::filesystem::path path)
    : IoFailure(ErrorKind::FileNotFound, "Settings file not found", std::move(path),
                std::make_error_code(std::errc::no_such_file_or_directory))
{
}

EncodingFailure::EncodingFailure(const std::string &message)
    : StoreError(ErrorKind::EncodingFailure, message)
{
}

DecodingFailure::DecodingFailure(const std::string &message)
    : StoreError(ErrorKind::DecodingFailure, message)
{
}

UnsupportedFormat::UnsupportedFormat(const std::string &tag)
    : StoreError(ErrorKind::UnsupportedFormat, "No codec registered for format '" + tag + "'")
{
}

}  // namespace prefstore
