#include "qt_executor.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QTimer>
#include <QUrl>

namespace {

bool isSuccessStatus(int status)
{
    return status >= 200 && status < 300;
}

} // namespace

QtExecutor::QtExecutor(const QSslConfiguration& sslConfig)
    : m_nam(std::make_unique<QNetworkAccessManager>())
    , m_sslConfig(sslConfig)
{
}

QtExecutor::~QtExecutor() = default;

QNetworkRequest QtExecutor::buildQtRequest(const ProviderRequest& request) const {
    QNetworkRequest req{QUrl{request.url}};
    req.setSslConfiguration(m_sslConfig);

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    return req;
}

QNetworkReply* QtExecutor::send(const ProviderRequest& request) {
    QNetworkRequest req = buildQtRequest(request);

    const QString method = request.method.trimmed().toUpper();
    if (method == "POST")
        return m_nam->post(req, request.body);
    if (method == "GET")
        return m_nam->get(req);
    return m_nam->sendCustomRequest(req, method.toUtf8(), request.body);
}

QString QtExecutor::errorMessageFromBody(const QByteArray& body) {
    const QJsonDocument doc = QJsonDocument::fromJson(body);
    if (doc.isObject()) {
        const QJsonValue error = doc.object().value("error");
        if (error.isObject()) {
            const QString message = error.toObject().value("message").toString();
            if (!message.isEmpty()) return message;
        }
        if (error.isString() && !error.toString().isEmpty())
            return error.toString();
    }
    return QString::fromUtf8(body.left(512)).trimmed();
}

QString QtExecutor::redactedUrl(const QString& url) {
    return QUrl(url).adjusted(QUrl::RemoveQuery | QUrl::RemoveUserInfo | QUrl::RemoveFragment).toString();
}

QString QtExecutor::replyErrorString(QNetworkReply* reply) const {
    QString message = reply->errorString();
    const QUrl url = reply->url();
    if (url.isEmpty())
        return message;
    const QString redacted = redactedUrl(url.toString());
    message.replace(url.toString(), redacted);
    message.replace(url.toDisplayString(), redacted);
    message.replace(QString::fromUtf8(url.toEncoded()), redacted);
    return message;
}

std::optional<DomainFailure> QtExecutor::checkConnectionError(QNetworkReply* reply,
                                                              const QByteArray& errorBody) const {
    if (!reply) return DomainFailure::internal("null reply");

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status != 0 && !isSuccessStatus(status)) {
        QString message = errorMessageFromBody(errorBody);
        if (message.isEmpty()) message = replyErrorString(reply);
        return DomainFailure::httpStatus(status, message);
    }

    if (reply->error() == QNetworkReply::NoError) return std::nullopt;
    if (reply->error() == QNetworkReply::TimeoutError)
        return DomainFailure::timeout(replyErrorString(reply));

    return DomainFailure::connection(replyErrorString(reply));
}

VoidResult QtExecutor::stream(const ProviderRequest& request, const ChunkHandler& onChunk) {
    const QString logUrl = redactedUrl(request.url);
    LOG_DEBUG(QString("%1 %2").arg(request.method, logUrl));

    QNetworkReply* reply = send(request);

    QEventLoop loop;
    QByteArray errorBody;
    bool stopped = false;
    QString timeoutReason = "connection timeout";

    // Single timer: first the connection limit, then re-armed with the
    // inactivity limit on every header or body activity.
    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    auto drain = [&]() {
        if (stopped) return;
        const QByteArray data = reply->readAll();
        if (data.isEmpty()) return;

        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (status != 0 && !isSuccessStatus(status)) {
            errorBody += data;
            return;
        }
        if (!onChunk(data)) {
            stopped = true;
            loop.quit();
        }
    };

    auto activity = [&]() {
        timeoutReason = QString("no data for %1 ms").arg(m_requestTimeout);
        timer.start(m_requestTimeout);
    };

    QObject::connect(reply, &QNetworkReply::metaDataChanged, &loop, [&]() {
        activity();
    });
    QObject::connect(reply, &QNetworkReply::readyRead, &loop, [&]() {
        activity();
        drain();
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);

    timer.start(m_connectionTimeout);
    loop.exec();
    timer.stop();

    if (stopped) {
        LOG_DEBUG(QString("stream stopped by consumer: %1").arg(logUrl));
        reply->abort();
        reply->deleteLater();
        return {};
    }

    if (reply->isRunning()) {
        reply->abort();
        reply->deleteLater();
        LOG_ERROR(QString("%1: %2").arg(timeoutReason, logUrl));
        return std::unexpected(DomainFailure::timeout(timeoutReason));
    }

    // Anything that arrived together with the finished signal.
    drain();
    if (stopped) {
        reply->deleteLater();
        return {};
    }

    auto err = checkConnectionError(reply, errorBody);
    reply->deleteLater();
    if (err) {
        LOG_ERROR(QString("request failed [%1]: %2 (%3)").arg(err->code, err->message, logUrl));
        return std::unexpected(*err);
    }
    return {};
}
