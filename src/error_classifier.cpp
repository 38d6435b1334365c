#include "error_classifier.hpp"

namespace supercast {

static std::string messageFrom(const Response& response) {
    const auto& data = response.data;
    if (data.is_object()) {
        auto it = data.find("message");
        if (it != data.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return response.httpBody;
}

std::unique_ptr<SupercastError> classifyStatus(const Response& response) {
    ErrorDetails details;
    details.httpStatus  = response.httpStatus;
    details.httpHeaders = response.httpHeaders;
    details.httpBody    = response.httpBody;
    details.jsonBody    = response.data;
    details.code        = static_cast<int>(response.httpStatus);

    const std::string message = messageFrom(response);

    std::unique_ptr<SupercastError> error;
    switch (response.httpStatus) {
        case 400:
        case 404:
        case 422:
            error = std::make_unique<InvalidRequestError>(message, std::move(details));
            break;
        case 401:
            error = std::make_unique<AuthenticationError>(message, std::move(details));
            break;
        case 403:
            error = std::make_unique<PermissionError>(message, std::move(details));
            break;
        case 429:
            error = std::make_unique<RateLimitError>(message, std::move(details));
            break;
        default:
            error = std::make_unique<ApiError>(message, std::move(details));
            break;
    }

    error->setResponse(response);
    return error;
}

std::unique_ptr<SupercastError> classifyResponse(const HttpResult& result) {
    Response response;
    try {
        response = Response::fromHttpResult(result);
    } catch (const nlohmann::json::exception&) {
        return generalApiError(result.status, result.body);
    }

    if (!response.data.is_object()) {
        return generalApiError(result.status, result.body);
    }
    return classifyStatus(response);
}

std::unique_ptr<SupercastError> generalApiError(unsigned int status,
                                                const std::string& body) {
    ErrorDetails details;
    details.httpStatus = status;
    details.httpBody   = body;
    details.code       = static_cast<int>(status);

    return std::make_unique<ApiError>(
        "Invalid response object from API: " +
        nlohmann::json(body).dump(-1, ' ', false,
                                  nlohmann::json::error_handler_t::replace) +
        " (HTTP response code was " + std::to_string(status) + ")",
        std::move(details));
}

std::unique_ptr<SupercastError> classifyNetworkFailure(FailureKind kind,
                                                       const std::string& detail,
                                                       int numRetries,
                                                       const std::string& apiBase) {
    std::string message;
    switch (kind) {
        case FailureKind::ConnectionFailed:
            message = "Unexpected error communicating when trying to connect to "
                      "Supercast. You may be seeing this message because your DNS "
                      "is not working. To check, try running `host supercast.com` "
                      "from the command line.";
            break;
        case FailureKind::TlsFailure:
            message = "Could not establish a secure connection to Supercast, you "
                      "may need to upgrade your OpenSSL version. To check, try "
                      "running `openssl s_client -connect supercast.com:443` from "
                      "the command line.";
            break;
        case FailureKind::Timeout:
            message = "Could not connect to Supercast (" + apiBase + "). Please "
                      "check your internet connection and try again. If this "
                      "problem persists, you should check Supercast's service "
                      "status, or let us know at support@supercast.com.";
            break;
        case FailureKind::HttpStatus:
        case FailureKind::DecodeFailure:
        case FailureKind::Other:
            message = "Unexpected error communicating with Supercast. If this "
                      "problem persists, let us know at support@supercast.com.";
            break;
    }

    if (numRetries > 0) {
        message += " Request was retried " + std::to_string(numRetries) + " times.";
    }
    message += "\n\n(Network error: " + detail + ")";

    return std::make_unique<ApiConnectionError>(message);
}

} // namespace supercast
