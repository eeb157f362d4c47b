#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace prefstore {

enum class ErrorKind {
    DirectoryUnavailable,
    FileNotFound,
    IoFailure,
    EncodingFailure,
    DecodingFailure,
    UnsupportedFormat
};

std::string error_kind_to_string(ErrorKind kind);

class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string &message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// The OS config root could not be discovered.
class DirectoryUnavailable : public StoreError {
public:
    explicit DirectoryUnavailable(const std::string &message);
};

class IoFailure : public StoreError {
public:
    IoFailure(const std::string &message, std::filesystem::path path, std::error_code code = {});

    const std::filesystem::path &path() const noexcept { return path_; }
    const std::error_code &code() const noexcept { return code_; }

protected:
    IoFailure(ErrorKind kind, const std::string &message, std::filesystem::path path, std::error_code code);

private:
    std::filesystem::path path_;
    std::error_code code_;
};

class FileNotFound : public IoFailure {
public:
    explicit FileNotFound(std::filesystem::path path);
};

class EncodingFailure : public StoreError {
public:
    explicit EncodingFailure(const std::string &message);
};

class DecodingFailure : public StoreError {
public:
    explicit DecodingFailure(const std::string &message);
};

class UnsupportedFormat : public StoreError {
public:
    explicit UnsupportedFormat(const std::string &tag);
};

}  // namespace prefstore
