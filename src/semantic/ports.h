#pragma once
#include "failure.h"
#include <expected>
#include <functional>
#include <memory>
#include <QByteArray>
#include <QMap>
#include <QString>
#include <QUrl>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

// Receives one text fragment per call. Runs on the reading thread between
// two network reads, so it must return promptly.
using DeltaSink = std::function<void(const QString& delta)>;

// Returns false to stop reading the response body.
using ChunkHandler = std::function<bool(const QByteArray& chunk)>;

struct ProviderRequest {
    QString method = QStringLiteral("POST");
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    QString adapterHint;
};

class IStreamExecutor {
public:
    virtual ~IStreamExecutor() = default;
    virtual VoidResult stream(const ProviderRequest& request,
                              const ChunkHandler& onChunk) = 0;
};

struct GatewayMessage {
    enum class Kind { Text, Binary, Close };
    Kind kind = Kind::Text;
    QString text;

    static GatewayMessage fromText(const QString& text) { return {Kind::Text, text}; }
    static GatewayMessage binary() { return {Kind::Binary, {}}; }
    static GatewayMessage close() { return {Kind::Close, {}}; }
};

class IGatewayChannel {
public:
    virtual ~IGatewayChannel() = default;
    virtual VoidResult open(const QUrl& url, int timeoutMs) = 0;
    virtual VoidResult sendText(const QString& message) = 0;
    // Fails with ErrorKind::Timeout when nothing arrives within timeoutMs.
    virtual Result<GatewayMessage> receive(int timeoutMs) = 0;
    virtual void close() = 0;
};

using GatewayChannelFactory = std::function<std::unique_ptr<IGatewayChannel>()>;
