#include "infrastructure/notifications/HttpClient.hpp"

#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>
#include <spdlog/spdlog.h>

namespace hostwatch::infra {

namespace {

HttpResponse toResponse(QNetworkReply* reply) {
    HttpResponse response;
    response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    response.body = reply->readAll().toStdString();

    switch (reply->error()) {
    case QNetworkReply::NoError:
        response.success = response.statusCode >= 200 && response.statusCode < 300;
        if (!response.success) {
            response.errorMessage = "HTTP error: " + std::to_string(response.statusCode);
        }
        break;
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
        // The transfer timeout aborts the reply; nothing else cancels requests here.
        response.timedOut = true;
        response.errorMessage = "Request timed out";
        break;
    default:
        response.errorMessage = reply->errorString().toStdString();
        break;
    }
    return response;
}

} // namespace

HttpClient::HttpClient(QObject* parent) : QObject(parent) {}

void HttpClient::post(const HttpRequest& request, HttpCallback callback) {
    QUrl target(QString::fromStdString(request.url));
    if (!target.isValid() || target.isRelative()) {
        HttpResponse response;
        response.errorMessage = "Invalid URL: " + request.url;
        callback(response);
        return;
    }

    QNetworkRequest networkRequest(target);
    for (const auto& [key, value] : request.headers) {
        networkRequest.setRawHeader(QByteArray::fromStdString(key),
                                    QByteArray::fromStdString(value));
    }
    networkRequest.setTransferTimeout(request.timeoutMs);

    QNetworkReply* reply = manager_.post(networkRequest, QByteArray::fromStdString(request.body));
    if (!reply) {
        HttpResponse response;
        response.errorMessage = "Failed to create network request";
        callback(response);
        return;
    }

    spdlog::debug("HTTP POST {} ({} bytes)", request.url, request.body.size());

    connect(reply, &QNetworkReply::finished, this,
            [reply, url = request.url, callback = std::move(callback)]() {
                HttpResponse response = toResponse(reply);
                reply->deleteLater();

                if (!response.success) {
                    spdlog::warn("HTTP POST {} failed: {} (status: {})", url,
                                 response.errorMessage, response.statusCode);
                }
                callback(response);
            });
}

} // namespace hostwatch::infra
