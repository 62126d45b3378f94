#pragma once

#include <stdexcept>
#include <string>

// Failure of the durable storage under the cache directory
class StorageError : public std::runtime_error {
private:
    int error_code;

public:
    explicit StorageError(const std::string& message, int code = 0)
        : std::runtime_error(message), error_code(code) {}

    int code() const { return error_code; }
};

// The write was rejected for lack of space. Partial writes are reported this way too.
class QuotaExceededError : public StorageError {
public:
    explicit QuotaExceededError(const std::string& message, int code = 0)
        : StorageError(message, code) {}
};
