#pragma once
#include "config_types.h"
#include <QObject>
#include <QJsonObject>

class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    // Missing or unreadable file: defaults stay in place and false is returned.
    bool load(const QString& path);
    bool save();
    QString filePath() const { return m_filePath; }

    const QList<ApiKey>& apiKeys() const { return m_config.apiKeys; }
    // Both persist immediately; false when the file could not be written
    // (removeApiKey also returns false when no key matched).
    bool addApiKey(const ApiKey& key);
    bool removeApiKey(const QString& key);

    AppConfig appConfig() const { return m_config; }
    ProviderEndpoints endpoints() const { return m_config.endpoints; }
    WolframOptions wolframConfig() const { return m_config.wolfram; }
    RuntimeOptions runtimeConfig() const { return m_config.runtime; }

    static QString encodeApiKey(const QString& plain);
    static QString decodeApiKey(const QString& encoded);

signals:
    void configChanged();

private:
    AppConfig m_config;
    QString m_filePath;

    QJsonObject endpointsToJson(const ProviderEndpoints& e) const;
    ProviderEndpoints jsonToEndpoints(const QJsonObject& obj) const;
    QJsonObject wolframToJson(const WolframOptions& w) const;
    WolframOptions jsonToWolfram(const QJsonObject& obj) const;
};
