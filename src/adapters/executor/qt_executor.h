#pragma once
#include "semantic/ports.h"
#include <memory>
#include <optional>
#include <QNetworkRequest>
#include <QSslConfiguration>

class QNetworkAccessManager;
class QNetworkReply;

class QtExecutor : public IStreamExecutor {
public:
    explicit QtExecutor(const QSslConfiguration& sslConfig = QSslConfiguration::defaultConfiguration());
    ~QtExecutor() override;

    VoidResult stream(const ProviderRequest& request, const ChunkHandler& onChunk) override;

    // Inactivity limit while the body is being transferred.
    void setRequestTimeout(int ms) { m_requestTimeout = ms; }
    // Limit for the response headers to arrive.
    void setConnectionTimeout(int ms) { m_connectionTimeout = ms; }

    static QString errorMessageFromBody(const QByteArray& body);
    // URL without query and user info, safe for logs (Gemini carries the key in ?key=).
    static QString redactedUrl(const QString& url);

private:
    std::unique_ptr<QNetworkAccessManager> m_nam;
    QSslConfiguration m_sslConfig;
    int m_requestTimeout = 120000;
    int m_connectionTimeout = 30000;

    QNetworkRequest buildQtRequest(const ProviderRequest& request) const;
    QNetworkReply* send(const ProviderRequest& request);
    std::optional<DomainFailure> checkConnectionError(QNetworkReply* reply,
                                                      const QByteArray& errorBody) const;
    QString replyErrorString(QNetworkReply* reply) const;
};
