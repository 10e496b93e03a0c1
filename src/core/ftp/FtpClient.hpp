#pragma once

/**
 * FtpClient.hpp
 *
 * Blocking FTP client interface used by the transfer worker.
 * Implementations report every failure by throwing transfer::TransferError.
 */

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ftpget::core::ftp {

/**
 * Representation type sent with TYPE before retrieval
 */
enum class TransferType {
    Binary,  // TYPE I
    Ascii    // TYPE A
};

/**
 * Where and as whom to log in
 */
struct FtpLogin {
    std::string host;
    uint16_t port{21};
    std::string username;
    std::string password;
};

/**
 * Data connection of a RETR command
 */
class FtpDataStream {
public:
    virtual ~FtpDataStream() = default;

    /**
     * Read up to maxBytes into buffer, blocking until at least one byte is
     * available or the stream ends.
     * @return Number of bytes read, 0 once the stream is exhausted
     */
    virtual std::size_t read(char* buffer, std::size_t maxBytes) = 0;

    /**
     * Size announced by the server, if any
     */
    virtual std::optional<uint64_t> totalSize() const = 0;

    /**
     * Release the data connection. Safe to call more than once.
     */
    virtual void close() = 0;
};

/**
 * Control connection
 */
class FtpClient {
public:
    virtual ~FtpClient() = default;

    /**
     * Open the control connection and log in
     */
    virtual void connect(const FtpLogin& login) = 0;

    virtual void setTransferType(TransferType type) = 0;

    /**
     * Issue RETR for remotePath and return its data stream
     */
    virtual std::unique_ptr<FtpDataStream> openRetrieve(const std::string& remotePath) = 0;

    /**
     * Close the control connection. Safe to call more than once.
     */
    virtual void close() = 0;
};

/**
 * Creates one client per transfer, on the worker thread
 */
using FtpClientFactory = std::function<std::unique_ptr<FtpClient>()>;

} // namespace ftpget::core::ftp
