#pragma once

#include <stdexcept>
#include <string>

namespace streamfetch {

class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class HttpStatusError : public TransferError {
public:
    HttpStatusError(long status_code, const std::string& reason);

    [[nodiscard]] long statusCode() const noexcept { return status_code_; }

private:
    long status_code_;
};

class EmptyBodyError : public TransferError {
public:
    EmptyBodyError() : TransferError("Response body is empty") {}
};

class CancelledError : public TransferError {
public:
    enum class Cause { External, Deadline };

    explicit CancelledError(Cause cause, const std::string& message = "Download cancelled")
        : TransferError(message), cause_(cause) {}

    [[nodiscard]] Cause cause() const noexcept { return cause_; }
    [[nodiscard]] bool byDeadline() const noexcept { return cause_ == Cause::Deadline; }

private:
    Cause cause_;
};

class TransportError : public TransferError {
public:
    explicit TransportError(const std::string& message, int curl_code = 0)
        : TransferError(message), curl_code_(curl_code) {}

    [[nodiscard]] int curlCode() const noexcept { return curl_code_; }

private:
    int curl_code_;
};

class StorageError : public TransferError {
public:
    using TransferError::TransferError;
};

} // namespace streamfetch
