/**
 * UrlUtils.cpp
 */

#include "UrlUtils.hpp"

namespace ftpget::utils {

std::string UrlUtils::displayUrl(const std::string& host, const std::string& path) {
    std::string url = "ftp://" + host;
    if (path.empty()) {
        return url;
    }
    if (path.front() != '/') {
        url += '/';
    }
    return url + path;
}

} // namespace ftpget::utils
