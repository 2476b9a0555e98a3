#pragma once

#include <string>
#include <utility>
#include <vector>

namespace itemvault {
namespace http {

// Routed request as delivered by the ingress layer. `path` is already
// percent-decoded and carries no query string.
struct Request {
    std::string method;
    std::string path;
    std::string body;
};

// Structured HTTP-shaped response
struct Response {
    int status = 200;
    std::string body;
    std::string content_type;
    std::vector<std::pair<std::string, std::string>> headers;

    // Value of the first header named `name`, nullptr if absent
    const std::string *header(const std::string &name) const {
        for (const auto &[key, value] : headers) {
            if (key == name) {
                return &value;
            }
        }
        return nullptr;
    }
};

}  // namespace http
}  // namespace itemvault
