// ftpget - URL Utilities
// Display URLs for FTP resources

#pragma once

#include <string>

namespace ftpget::utils {

/**
 * @brief URL helpers
 */
class UrlUtils {
public:
    /**
     * Credential-free "ftp://host/path" for display. The path is joined to
     * the host the way a relative URL reference is resolved against
     * "ftp://host": both "/pub/a" and "pub/a" give "ftp://host/pub/a".
     */
    static std::string displayUrl(const std::string& host, const std::string& path);
};

} // namespace ftpget::utils
