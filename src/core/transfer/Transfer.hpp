#pragma once

/**
 * Transfer.hpp
 *
 * Retrieval of one remote file over FTP into one local file, run on a
 * dedicated background thread. The caller polls state and progress and may
 * request abort from its own thread; only the worker touches the network
 * stream and the destination file.
 */

#include "TransferState.hpp"
#include "TransferError.hpp"
#include "../ftp/FtpClient.hpp"
#include "../../utils/FileSystem.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <fstream>
#include <ostream>
#include <string>
#include <thread>

namespace ftpget::core::transfer {

/**
 * What to retrieve and where to put it. Immutable once a Transfer owns it.
 */
struct TransferRequest {
    std::string host;
    uint16_t port{21};
    std::string remotePath;
    std::string localPath;

    bool isBinary{true};
    bool overwrite{false};
    bool createDir{true};

    // Derived from host and remotePath when empty
    std::optional<std::string> displayLabel;

    // "anonymous" and a placeholder e-mail address when empty
    std::optional<std::string> username;
    std::optional<std::string> password;

    std::size_t chunkSize{8192};
};

/**
 * Collaborators of a transfer. Empty members select the defaults:
 * a CurlFtpClient and the local file system.
 */
struct TransferDependencies {
    ftp::FtpClientFactory ftpClientFactory;
    std::shared_ptr<utils::FileSystem> fileSystem;
};

/**
 * Transfer - single asynchronous FTP retrieval
 *
 * State machine:
 * - Queued -> Connecting on start(), launching the worker thread
 * - Queued -> Aborted on abort(); no worker ever runs
 * - Connecting/Running -> Aborting on abort(); the worker honors it after
 *   the next chunk (or when the data stream opens)
 * - the worker alone enters Done, Aborted or Failed, exactly once
 *
 * Abort is cooperative: a worker blocked in a network read notices the
 * request only once the read returns. The destructor requests abort and
 * joins the worker, so it may block for that long.
 */
class Transfer {
public:
    static constexpr const char* kDefaultUsername = "anonymous";
    static constexpr const char* kDefaultPassword = "abc@def.org";
    static constexpr std::size_t kDefaultChunkSize = 8192;

    /**
     * Construct a transfer against the default collaborators
     * @param startNow Call start() before returning
     */
    Transfer(std::string host,
             std::string remotePath,
             std::string localPath,
             bool isBinary = true,
             bool overwrite = false,
             bool createDir = true,
             bool startNow = true,
             std::optional<std::string> displayLabel = std::nullopt,
             std::optional<std::string> username = std::nullopt,
             std::optional<std::string> password = std::nullopt);

    explicit Transfer(TransferRequest request,
                      bool startNow = true,
                      TransferDependencies dependencies = {});

    ~Transfer();

    Transfer(const Transfer&) = delete;
    Transfer& operator=(const Transfer&) = delete;
    Transfer(Transfer&&) = delete;
    Transfer& operator=(Transfer&&) = delete;

    /**
     * Start the retrieval
     * @throws ConfigurationError if the state is not Queued
     */
    void start();

    /**
     * Request cancellation. Ignored once the transfer is finished.
     */
    void abort();

    TransferState state() const;

    /**
     * True while abort() still has an effect: Queued, Connecting or
     * Running, and cleanup has not started
     */
    bool isAbortable() const;

    /**
     * True once Done, Aborted or Failed
     */
    bool isDone() const;

    uint64_t bytesRead() const;

    /**
     * Size announced by the server; unknown until the data stream opens
     * and possibly for the whole transfer
     */
    std::optional<uint64_t> totalBytes() const;

    /**
     * Why the transfer failed; empty unless the state is Failed
     */
    std::optional<FailureCause> failureCause() const;

    /**
     * Block until the transfer is finished or the timeout elapses
     * @return true if finished
     */
    bool waitForCompletion(std::chrono::milliseconds timeout) const;

    const TransferRequest& request() const { return m_request; }
    const std::string& displayLabel() const { return *m_request.displayLabel; }

    /**
     * "Transfer(<remote path>)"
     */
    std::string describe() const;

private:
    friend class TransferTestAccess;

    static TransferRequest resolve(TransferRequest request);

    // Worker thread
    void run();
    void prepareDestination();
    void retrieve();
    void closeResources();
    void finalize(TransferState newState, std::optional<FailureCause> cause = std::nullopt);

    const TransferRequest m_request;
    ftp::FtpClientFactory m_ftpClientFactory;
    std::shared_ptr<utils::FileSystem> m_fileSystem;

    // Owned by the worker thread
    std::unique_ptr<ftp::FtpClient> m_client;
    std::unique_ptr<ftp::FtpDataStream> m_stream;
    std::unique_ptr<std::ofstream> m_file;
    bool m_fileOpened{false};

    // Shared state, guarded by m_mutex
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_doneCondition;
    TransferState m_state{TransferState::Queued};
    bool m_finalizing{false};
    uint64_t m_bytesRead{0};
    std::optional<uint64_t> m_totalBytes;
    std::optional<FailureCause> m_failure;

    std::thread m_worker;
};

inline std::ostream& operator<<(std::ostream& os, const Transfer& transfer) {
    return os << transfer.describe();
}

} // namespace ftpget::core::transfer
