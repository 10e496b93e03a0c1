/**
 * Transfer.cpp
 *
 * Worker loop, pre-flight checks and one-time cleanup of a transfer.
 */

#include "Transfer.hpp"
#include "../Logger.hpp"
#include "../ftp/CurlFtpClient.hpp"
#include "../../utils/UrlUtils.hpp"

#include <system_error>
#include <vector>

namespace ftpget::core::transfer {

namespace fs = std::filesystem;

Transfer::Transfer(std::string host,
                   std::string remotePath,
                   std::string localPath,
                   bool isBinary,
                   bool overwrite,
                   bool createDir,
                   bool startNow,
                   std::optional<std::string> displayLabel,
                   std::optional<std::string> username,
                   std::optional<std::string> password)
    : Transfer(TransferRequest{std::move(host), 21, std::move(remotePath), std::move(localPath),
                               isBinary, overwrite, createDir, std::move(displayLabel),
                               std::move(username), std::move(password), kDefaultChunkSize},
               startNow) {
}

Transfer::Transfer(TransferRequest request, bool startNow, TransferDependencies dependencies)
    : m_request(resolve(std::move(request)))
    , m_ftpClientFactory(std::move(dependencies.ftpClientFactory))
    , m_fileSystem(std::move(dependencies.fileSystem)) {

    if (!m_ftpClientFactory) {
        m_ftpClientFactory = [] { return std::make_unique<ftp::CurlFtpClient>(); };
    }
    if (!m_fileSystem) {
        m_fileSystem = utils::LocalFileSystem::instance();
    }

    if (startNow) {
        start();
    }
}

Transfer::~Transfer() {
    abort();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

TransferRequest Transfer::resolve(TransferRequest request) {
    if (!request.displayLabel) {
        request.displayLabel = utils::UrlUtils::displayUrl(request.host, request.remotePath);
    }
    if (!request.username || request.username->empty()) {
        request.username = kDefaultUsername;
    }
    if (!request.password || request.password->empty()) {
        request.password = kDefaultPassword;
    }
    if (request.chunkSize == 0) {
        request.chunkSize = kDefaultChunkSize;
    }
    return request;
}

void Transfer::start() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state != TransferState::Queued) {
            throw ConfigurationError("Cannot start " + describe() + ": state = " +
                                     std::string(toString(m_state)) + ", not Queued");
        }
        m_state = TransferState::Connecting;
    }

    LOG_INFO("Starting {}", displayLabel());

    try {
        m_worker = std::thread(&Transfer::run, this);
    } catch (const std::system_error& e) {
        LOG_ERROR("Cannot start worker for {}: {}", displayLabel(), e.what());
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_state = TransferState::Failed;
            m_failure = FailureCause{ErrorKind::Transfer,
                                     std::string("cannot start worker thread: ") + e.what()};
        }
        m_doneCondition.notify_all();
    }
}

void Transfer::abort() {
    TransferState previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_state;
        if (m_state == TransferState::Queued) {
            m_state = TransferState::Aborted;
        } else if (isAbortableState(m_state) && !m_finalizing) {
            m_state = TransferState::Aborting;
        } else {
            return;
        }
    }

    if (previous == TransferState::Queued) {
        m_doneCondition.notify_all();
        LOG_INFO("Aborted {} before it started", displayLabel());
    } else {
        LOG_INFO("Aborting {}", displayLabel());
    }
}

TransferState Transfer::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool Transfer::isAbortable() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return isAbortableState(m_state) && !m_finalizing;
}

bool Transfer::isDone() const {
    return isDoneState(state());
}

uint64_t Transfer::bytesRead() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bytesRead;
}

std::optional<uint64_t> Transfer::totalBytes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalBytes;
}

std::optional<FailureCause> Transfer::failureCause() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != TransferState::Failed) {
        return std::nullopt;
    }
    return m_failure;
}

bool Transfer::waitForCompletion(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_doneCondition.wait_for(lock, timeout, [this] { return isDoneState(m_state); });
}

std::string Transfer::describe() const {
    return "Transfer(" + m_request.remotePath + ")";
}

// -- Worker --

void Transfer::run() {
    LOG_DEBUG("{}: worker started", describe());

    try {
        prepareDestination();
        retrieve();
    } catch (const TransferException& e) {
        finalize(TransferState::Failed, FailureCause{e.kind(), e.what()});
    } catch (const std::exception& e) {
        finalize(TransferState::Failed, FailureCause{ErrorKind::Transfer, e.what()});
    } catch (...) {
        finalize(TransferState::Failed, FailureCause{ErrorKind::Transfer, "unknown error"});
    }
}

void Transfer::prepareDestination() {
    const fs::path destination(m_request.localPath);

    if (!m_request.overwrite && m_fileSystem->exists(destination)) {
        throw PreflightError("Destination " + destination.string() + " already exists");
    }

    const fs::path directory = destination.parent_path();
    if (directory.empty()) {
        return;
    }

    if (!m_fileSystem->exists(directory)) {
        if (!m_request.createDir) {
            throw PreflightError("Directory " + directory.string() + " does not exist");
        }
        LOG_DEBUG("{}: creating directory {}", describe(), directory.string());
        m_fileSystem->createDirectories(directory);
    } else if (!m_fileSystem->isDirectory(directory)) {
        throw PreflightError(directory.string() + " is a file, not a directory");
    }
}

void Transfer::retrieve() {
    LOG_DEBUG("{}: connecting to {}:{}", describe(), m_request.host, m_request.port);
    m_client = m_ftpClientFactory();
    m_client->connect(ftp::FtpLogin{m_request.host, m_request.port,
                                    *m_request.username, *m_request.password});

    m_client->setTransferType(m_request.isBinary ? ftp::TransferType::Binary
                                                 : ftp::TransferType::Ascii);

    // Only after login: a refused connection must not truncate an existing file
    LOG_DEBUG("{}: opening output file {}", describe(), m_request.localPath);
    m_file = m_fileSystem->openForWrite(m_request.localPath, m_request.isBinary);
    m_fileOpened = true;

    m_stream = m_client->openRetrieve(m_request.remotePath);

    const std::optional<uint64_t> totalSize = m_stream->totalSize();
    bool abortRequested = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_totalBytes) {
            m_totalBytes = totalSize;
        }
        if (m_state == TransferState::Connecting) {
            m_state = TransferState::Running;
        }
        abortRequested = (m_state == TransferState::Aborting);
    }
    if (abortRequested) {
        finalize(TransferState::Aborted);
        return;
    }

    LOG_DEBUG("{}: reading from {}, total bytes {}", describe(), m_request.host,
              totalSize ? std::to_string(*totalSize) : "unknown");

    std::vector<char> buffer(m_request.chunkSize);
    while (true) {
        const std::size_t count = m_stream->read(buffer.data(), buffer.size());
        if (count == 0) {
            break;
        }

        m_file->write(buffer.data(), static_cast<std::streamsize>(count));
        if (!*m_file) {
            throw TransferError("Cannot write to " + m_request.localPath);
        }

        uint64_t bytesRead = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_bytesRead += count;
            bytesRead = m_bytesRead;
            abortRequested = (m_state == TransferState::Aborting);
        }
        LOG_TRACE("{}: {} bytes written", describe(), bytesRead);
        if (abortRequested) {
            finalize(TransferState::Aborted);
            return;
        }
    }

    m_file->flush();
    if (!*m_file) {
        throw TransferError("Cannot write to " + m_request.localPath);
    }
    m_file->close();
    if (!*m_file) {
        throw TransferError("Cannot close " + m_request.localPath);
    }
    finalize(TransferState::Done);
}

void Transfer::closeResources() {
    // Done transfers closed the file already; the others are deleted
    m_file.reset();

    try {
        if (m_stream) {
            m_stream->close();
        }
    } catch (const std::exception& e) {
        LOG_WARN("{}: error closing data stream: {}", describe(), e.what());
    }
    m_stream.reset();

    try {
        if (m_client) {
            m_client->close();
        }
    } catch (const std::exception& e) {
        LOG_WARN("{}: error closing connection: {}", describe(), e.what());
    }
    m_client.reset();
}

void Transfer::finalize(TransferState newState, std::optional<FailureCause> cause) {
    closeResources();

    if (!isDoneState(newState)) {
        LOG_WARN("{}: invalid cleanup state {}; assuming Failed", describe(), toString(newState));
        if (!cause) {
            cause = FailureCause{ErrorKind::Transfer,
                                 "invalid cleanup state " + std::string(toString(newState))};
        }
        newState = TransferState::Failed;
    }

    bool alreadyFinished = false;
    TransferState outcome = newState;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_finalizing || isDoneState(m_state)) {
            alreadyFinished = true;
        } else {
            // A pending abort wins over completion and failure
            if (m_state == TransferState::Aborting) {
                outcome = TransferState::Aborted;
            }
            m_finalizing = true;
        }
    }

    if (alreadyFinished) {
        LOG_DEBUG("{}: already finished; ignoring cleanup to {}", describe(), toString(newState));
        return;
    }

    // Delete before publishing so a finished transfer never shows a partial file
    if (m_fileOpened &&
        (outcome == TransferState::Aborted || outcome == TransferState::Failed)) {
        if (!m_fileSystem->remove(m_request.localPath)) {
            LOG_DEBUG("{}: no partial file to remove at {}", describe(), m_request.localPath);
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_state = outcome;
        if (outcome == TransferState::Failed) {
            m_failure = cause ? *cause
                              : FailureCause{ErrorKind::Transfer, "unknown failure"};
        }
    }
    m_doneCondition.notify_all();

    switch (outcome) {
        case TransferState::Done:
            LOG_INFO("Finished {}", displayLabel());
            break;
        case TransferState::Aborted:
            LOG_INFO("Aborted {}", displayLabel());
            break;
        default:
            LOG_ERROR("Failed {}: {}", displayLabel(), cause ? cause->message : "unknown failure");
            break;
    }
}

} // namespace ftpget::core::transfer
