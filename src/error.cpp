#include "error.hpp"

namespace clanlookup {

std::string Error::getCategoryName() const {
    switch (category) {
        case ErrorCategory::NotFound:
            return "NotFound";
        case ErrorCategory::UpstreamRejected:
            return "UpstreamRejected";
        case ErrorCategory::Transport:
            return "Transport";
        case ErrorCategory::MalformedPayload:
            return "MalformedPayload";
        case ErrorCategory::Validation:
            return "Validation";
        case ErrorCategory::Configuration:
            return "Configuration";
        default:
            return "Unknown";
    }
}

crow::response Error::toHttpResponse() const {
    return crow::response(http_status_code, toJson());
}

crow::json::wvalue Error::toJson() const {
    crow::json::wvalue error_json;
    error_json["detail"] = message;
    return error_json;
}

} // namespace clanlookup
