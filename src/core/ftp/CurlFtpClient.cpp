/**
 * CurlFtpClient.cpp
 *
 * libcurl backed FTP client. Requests run on a multi handle that is pumped
 * from the calling thread, which turns libcurl's push-style write callback
 * into the pull-style read() the transfer worker expects.
 */

#include "CurlFtpClient.hpp"
#include "../Logger.hpp"
#include "../transfer/TransferError.hpp"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <string_view>

namespace ftpget::core::ftp {

using transfer::TransferError;

namespace {

constexpr int kPollTimeoutMs = 1000;

void checkSetopt(CURLcode rc, const char* option) {
    if (rc != CURLE_OK) {
        throw TransferError(std::string("curl_easy_setopt(") + option + ") failed: " +
                            curl_easy_strerror(rc));
    }
}

void checkMulti(CURLMcode rc, const char* call) {
    if (rc != CURLM_OK) {
        throw TransferError(std::string(call) + " failed: " + curl_multi_strerror(rc));
    }
}

} // namespace

// -- CurlGlobalInit --

void CurlGlobalInit::init() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            LOG_ERROR("curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

// -- CurlHandle --

CurlHandle::CurlHandle() : m_curl(curl_easy_init()) {}
CurlHandle::~CurlHandle() { if (m_curl) curl_easy_cleanup(m_curl); }
CurlHandle::CurlHandle(CurlHandle&& other) noexcept : m_curl(other.m_curl) { other.m_curl = nullptr; }
CurlHandle& CurlHandle::operator=(CurlHandle&& other) noexcept {
    if (this != &other) { if (m_curl) curl_easy_cleanup(m_curl); m_curl = other.m_curl; other.m_curl = nullptr; }
    return *this;
}

// -- CurlMultiHandle --

CurlMultiHandle::CurlMultiHandle() : m_multi(curl_multi_init()) {}
CurlMultiHandle::~CurlMultiHandle() { if (m_multi) curl_multi_cleanup(m_multi); }

// -- CurlRetrieveStream --

class CurlRetrieveStream : public FtpDataStream {
public:
    CurlRetrieveStream(CurlFtpClient& client, std::optional<uint64_t> totalSize)
        : m_client(&client), m_totalSize(totalSize) {}

    ~CurlRetrieveStream() override { close(); }

    std::size_t read(char* buffer, std::size_t maxBytes) override {
        if (!m_client) {
            throw TransferError("read from a closed data stream");
        }
        return m_client->readRetrieved(buffer, maxBytes);
    }

    std::optional<uint64_t> totalSize() const override { return m_totalSize; }

    void close() override {
        if (m_client) {
            m_client->endRequest();
            m_client = nullptr;
        }
    }

private:
    CurlFtpClient* m_client;
    std::optional<uint64_t> m_totalSize;
};

// -- CurlFtpClient --

CurlFtpClient::CurlFtpClient(long connectTimeoutSeconds)
    : m_connectTimeout(connectTimeoutSeconds) {
    CurlGlobalInit::init();
}

CurlFtpClient::~CurlFtpClient() {
    close();
}

void CurlFtpClient::connect(const FtpLogin& login) {
    if (!m_curl.get() || !m_multi.get()) {
        throw TransferError("Cannot allocate curl handles");
    }

    m_login = login;
    LOG_DEBUG("FTP connect to {}:{} as {}", login.host, login.port, login.username);

    // NOBODY on the server root: connect and log in, transfer nothing.
    setupSession(requestUrl(login, ""));
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_NOBODY, 1L), "CURLOPT_NOBODY");

    beginRequest();
    pumpUntil([] { return false; });
    endRequest();
    throwIfFailed("Cannot log in to " + login.host);

    m_connected = true;
}

void CurlFtpClient::setTransferType(TransferType type) {
    // libcurl issues TYPE itself right before RETR
    m_type = type;
}

std::unique_ptr<FtpDataStream> CurlFtpClient::openRetrieve(const std::string& remotePath) {
    if (!m_connected) {
        throw TransferError("FTP client is not connected");
    }

    setupSession(requestUrl(m_login, remotePath));
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_NOBODY, 0L), "CURLOPT_NOBODY");
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_TRANSFERTEXT,
                                 m_type == TransferType::Ascii ? 1L : 0L),
                "CURLOPT_TRANSFERTEXT");
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_FTP_FILEMETHOD,
                                 static_cast<long>(CURLFTPMETHOD_NOCWD)),
                "CURLOPT_FTP_FILEMETHOD");

    LOG_DEBUG("FTP RETR {}", remotePath);
    beginRequest();
    pumpUntil([this] { return hasPendingData(); });
    if (m_finished) {
        throwIfFailed("Cannot retrieve " + remotePath);
    }

    std::optional<uint64_t> totalSize;
    curl_off_t length = -1;
    if (curl_easy_getinfo(m_curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK &&
        length >= 0) {
        totalSize = static_cast<uint64_t>(length);
    }

    return std::make_unique<CurlRetrieveStream>(*this, totalSize);
}

void CurlFtpClient::close() {
    endRequest();
    m_connected = false;
}

std::string CurlFtpClient::requestUrl(const FtpLogin& login, const std::string& remotePath) {
    std::string url = "ftp://" + login.host;
    if (login.port != 21) {
        url += ":" + std::to_string(login.port);
    }
    url += "/";

    std::string_view path = remotePath;
    if (!path.empty() && path.front() == '/') {
        url += "%2F";
        path.remove_prefix(1);
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        throw TransferError("Cannot allocate curl handle");
    }

    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();

        std::string_view segment = path.substr(start, end - start);
        // A zero length makes curl_easy_escape fall back to strlen()
        if (!segment.empty()) {
            char* escaped = curl_easy_escape(curl, segment.data(), static_cast<int>(segment.size()));
            if (escaped) {
                url += escaped;
                curl_free(escaped);
            }
        }
        if (end < path.size()) url += "/";
        start = end + 1;
    }

    curl_easy_cleanup(curl);
    return url;
}

void CurlFtpClient::setupSession(const std::string& url) {
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_URL, url.c_str()), "CURLOPT_URL");
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_USERNAME, m_login.username.c_str()), "CURLOPT_USERNAME");
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_PASSWORD, m_login.password.c_str()), "CURLOPT_PASSWORD");
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_CONNECTTIMEOUT, m_connectTimeout), "CURLOPT_CONNECTTIMEOUT");
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_ERRORBUFFER, m_errorBuffer), "CURLOPT_ERRORBUFFER");
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_WRITEFUNCTION, &CurlFtpClient::writeCallback), "CURLOPT_WRITEFUNCTION");
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_WRITEDATA, this), "CURLOPT_WRITEDATA");
    checkSetopt(curl_easy_setopt(m_curl.get(), CURLOPT_NOSIGNAL, 1L), "CURLOPT_NOSIGNAL");
}

void CurlFtpClient::beginRequest() {
    m_errorBuffer[0] = '\0';
    m_pending.clear();
    m_pendingOffset = 0;
    m_finished = false;
    m_result = CURLE_OK;

    checkMulti(curl_multi_add_handle(m_multi.get(), m_curl.get()), "curl_multi_add_handle");
    m_active = true;
}

void CurlFtpClient::endRequest() {
    if (!m_active) {
        return;
    }
    m_active = false;

    CURLMcode rc = curl_multi_remove_handle(m_multi.get(), m_curl.get());
    if (rc != CURLM_OK) {
        LOG_WARN("curl_multi_remove_handle failed: {}", curl_multi_strerror(rc));
    }
}

void CurlFtpClient::pumpUntil(const std::function<bool()>& satisfied) {
    while (!m_finished && !satisfied()) {
        int running = 0;
        checkMulti(curl_multi_perform(m_multi.get(), &running), "curl_multi_perform");
        collectResult();
        if (m_finished || satisfied()) {
            break;
        }
        checkMulti(curl_multi_poll(m_multi.get(), nullptr, 0, kPollTimeoutMs, nullptr),
                   "curl_multi_poll");
    }
}

void CurlFtpClient::collectResult() {
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(m_multi.get(), &queued)) {
        if (msg->msg == CURLMSG_DONE && msg->easy_handle == m_curl.get()) {
            m_finished = true;
            m_result = msg->data.result;
        }
    }
}

void CurlFtpClient::throwIfFailed(const std::string& what) const {
    if (m_result == CURLE_OK) {
        return;
    }

    std::string message = what + ": " + curl_easy_strerror(m_result);
    if (m_errorBuffer[0] != '\0') {
        message += " (";
        message += m_errorBuffer;
        message += ")";
    }

    long ftpStatusCode = 0;
    if (curl_easy_getinfo(m_curl.get(), CURLINFO_RESPONSE_CODE, &ftpStatusCode) == CURLE_OK &&
        ftpStatusCode > 0) {
        message += " [FTP " + std::to_string(ftpStatusCode) + "]";
    }

    throw TransferError(message);
}

std::size_t CurlFtpClient::readRetrieved(char* buffer, std::size_t maxBytes) {
    if (maxBytes == 0) {
        return 0;
    }

    pumpUntil([this] { return hasPendingData(); });

    if (!hasPendingData()) {
        throwIfFailed("Transfer of " + m_login.host + " interrupted");
        return 0;
    }

    std::size_t count = std::min(maxBytes, m_pending.size() - m_pendingOffset);
    std::memcpy(buffer, m_pending.data() + m_pendingOffset, count);
    m_pendingOffset += count;

    if (m_pendingOffset == m_pending.size()) {
        m_pending.clear();
        m_pendingOffset = 0;
    }
    return count;
}

size_t CurlFtpClient::writeCallback(char* data, size_t size, size_t nmemb, void* userp) {
    auto* self = static_cast<CurlFtpClient*>(userp);
    const size_t bytes = size * nmemb;
    self->m_pending.insert(self->m_pending.end(), data, data + bytes);
    return bytes;
}

} // namespace ftpget::core::ftp
