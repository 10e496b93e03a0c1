#pragma once

/**
 * CurlFtpClient.hpp
 *
 * FtpClient implementation on top of the libcurl multi interface.
 * The easy handle stays attached to one multi handle for the whole session
 * so the connection opened by connect() is reused for the retrieval.
 */

#include "FtpClient.hpp"

#include <curl/curl.h>

#include <functional>
#include <string>
#include <vector>

namespace ftpget::core::ftp {

/**
 * @brief RAII wrapper for CURL easy handle
 */
class CurlHandle {
public:
    CurlHandle();
    ~CurlHandle();

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CurlHandle(CurlHandle&& other) noexcept;
    CurlHandle& operator=(CurlHandle&& other) noexcept;

    CURL* get() const { return m_curl; }
    operator CURL*() const { return m_curl; }

private:
    CURL* m_curl{nullptr};
};

/**
 * @brief RAII wrapper for CURLM multi handle
 */
class CurlMultiHandle {
public:
    CurlMultiHandle();
    ~CurlMultiHandle();

    CurlMultiHandle(const CurlMultiHandle&) = delete;
    CurlMultiHandle& operator=(const CurlMultiHandle&) = delete;

    CURLM* get() const { return m_multi; }

private:
    CURLM* m_multi{nullptr};
};

/**
 * @brief Process-wide curl_global_init, performed once
 */
class CurlGlobalInit {
public:
    static void init();
};

class CurlRetrieveStream;

/**
 * @brief Blocking FTP client driven by libcurl
 *
 * Not thread-safe; a transfer creates and uses it on its worker thread only.
 */
class CurlFtpClient : public FtpClient {
public:
    explicit CurlFtpClient(long connectTimeoutSeconds = 30);
    ~CurlFtpClient() override;

    CurlFtpClient(const CurlFtpClient&) = delete;
    CurlFtpClient& operator=(const CurlFtpClient&) = delete;

    void connect(const FtpLogin& login) override;
    void setTransferType(TransferType type) override;
    std::unique_ptr<FtpDataStream> openRetrieve(const std::string& remotePath) override;
    void close() override;

    /**
     * Build the request URL for a server path. A leading '/' is kept as an
     * absolute server path ("%2F"), other characters are percent-encoded
     * per path segment.
     */
    static std::string requestUrl(const FtpLogin& login, const std::string& remotePath);

private:
    friend class CurlRetrieveStream;

    void setupSession(const std::string& url);
    void beginRequest();
    void endRequest();
    void pumpUntil(const std::function<bool()>& satisfied);
    void collectResult();
    void throwIfFailed(const std::string& what) const;
    std::size_t readRetrieved(char* buffer, std::size_t maxBytes);
    bool hasPendingData() const { return m_pendingOffset < m_pending.size(); }

    static size_t writeCallback(char* data, size_t size, size_t nmemb, void* userp);

    CurlHandle m_curl;
    CurlMultiHandle m_multi;
    FtpLogin m_login;
    TransferType m_type{TransferType::Binary};
    long m_connectTimeout;
    bool m_connected{false};

    // State of the request currently attached to the multi handle
    bool m_active{false};
    bool m_finished{false};
    CURLcode m_result{CURLE_OK};
    std::vector<char> m_pending;
    std::size_t m_pendingOffset{0};
    char m_errorBuffer[CURL_ERROR_SIZE]{};
};

} // namespace ftpget::core::ftp
