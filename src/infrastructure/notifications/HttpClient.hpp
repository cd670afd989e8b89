#pragma once

#include <QNetworkAccessManager>
#include <QObject>

#include <functional>
#include <map>
#include <string>

namespace hostwatch::infra {

/**
 * @brief A single outgoing HTTP request.
 */
struct HttpRequest {
    std::string url;                            ///< Absolute target URL.
    std::string body;                           ///< Request body.
    std::map<std::string, std::string> headers; ///< Raw headers.
    int timeoutMs{10000};                       ///< Transfer timeout.
};

/**
 * @brief Outcome of an HTTP request.
 */
struct HttpResponse {
    int statusCode{0};        ///< HTTP status code (e.g. 202, 401), 0 if no answer.
    std::string body;         ///< Response body content.
    std::string errorMessage; ///< Transport or HTTP error description.
    bool success{false};      ///< True if the server answered with a 2xx status.
    bool timedOut{false};     ///< True if the transfer timeout expired.
};

using HttpCallback = std::function<void(const HttpResponse&)>;

/**
 * @brief Asynchronous HTTP POST client on top of QNetworkAccessManager.
 *
 * Must be used from the thread that owns it; callbacks run on that
 * thread's event loop, exactly once per request.
 */
class HttpClient : public QObject {
    Q_OBJECT

public:
    explicit HttpClient(QObject* parent = nullptr);
    ~HttpClient() override = default;

    /**
     * @brief Starts a POST request.
     *
     * An invalid or relative URL fails immediately; the callback is then
     * invoked before post() returns.
     *
     * @param request Target, body, headers and timeout.
     * @param callback Completion handler.
     */
    void post(const HttpRequest& request, HttpCallback callback);

private:
    QNetworkAccessManager manager_;
};

} // namespace hostwatch::infra
