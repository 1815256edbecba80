#include "api/http_transport.hpp"
#include <sstream>

namespace taskstream {

std::string describe_http_status(int status_code, const std::string& body) {
    std::ostringstream oss;
    if (status_code == 401) {
        oss << "Authentication failed - please login again";
    } else if (status_code == 403) {
        oss << "Access denied - you don't have permission to access this resource";
    } else if (status_code == 404) {
        oss << "Resource not found";
    } else if (status_code >= 500) {
        oss << "Backend server error (HTTP " << status_code << ") - please try again later";
    } else {
        oss << "HTTP " << status_code;
        if (!body.empty()) {
            oss << ": " << body;
        }
    }
    return oss.str();
}

} // namespace taskstream
