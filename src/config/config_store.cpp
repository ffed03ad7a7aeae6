#include "config_store.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QStandardPaths>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

void clampWolfram(WolframOptions& w)
{
    w.handshakeTimeout = clampInt(w.handshakeTimeout, 1000, 120000);
    w.messageTimeout = clampInt(w.messageTimeout, 1000, 600000);
    w.maxMessages = clampInt(w.maxMessages, 1, 10000);
    w.cacheCapacity = clampInt(w.cacheCapacity, 1, 100000);
}

void clampRuntime(RuntimeOptions& rt)
{
    rt.requestTimeout = clampInt(rt.requestTimeout, 1000, 600000);
    rt.connectionTimeout = clampInt(rt.connectionTimeout, 500, 300000);
}

}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

bool ConfigStore::load(const QString& path) {
    m_filePath = path;
    if (m_filePath.isEmpty()) {
        QString appData = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
        QDir().mkpath(appData);
        m_filePath = appData + "/config.json";
    }
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_INFO(QString("config file not found, using defaults: %1").arg(m_filePath));
        return false;
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (!doc.isObject()) {
        LOG_WARNING(QString("config file is not a JSON object (%1): %2")
                        .arg(err.errorString(), m_filePath));
        return false;
    }

    QJsonObject root = doc.object();

    // api keys
    m_config.apiKeys.clear();
    QJsonArray keys = jsonValueEither(root, "api_keys", "apiKeys").toArray();
    for (const auto& kv : keys) {
        const QJsonObject obj = kv.toObject();
        auto type = providerKindFromString(jsonStringEither(obj, "key_type", "keyType", obj["type"].toString()));
        if (!type) {
            LOG_WARNING(QString("skipping api key '%1' with unknown provider").arg(obj["name"].toString()));
            continue;
        }
        ApiKey k;
        k.key = decodeApiKey(obj["key"].toString());
        k.name = obj["name"].toString();
        k.type = *type;
        m_config.apiKeys.append(k);
    }

    m_config.endpoints = jsonToEndpoints(root["endpoints"].toObject());
    m_config.wolfram = jsonToWolfram(root["wolfram"].toObject());

    // runtime
    QJsonObject rt = root["runtime"].toObject();
    const RuntimeOptions defaults;
    m_config.runtime.debugMode = jsonBoolEither(rt, "debug_mode", "debugMode", false);
    m_config.runtime.requestTimeout = jsonIntEither(rt, "request_timeout", "requestTimeout", defaults.requestTimeout);
    m_config.runtime.connectionTimeout = jsonIntEither(rt, "connection_timeout", "connectionTimeout", defaults.connectionTimeout);
    m_config.runtime.logDirectory = jsonStringEither(rt, "log_directory", "logDirectory", QString());
    clampRuntime(m_config.runtime);

    emit configChanged();
    return true;
}

bool ConfigStore::save() {
    if (m_filePath.isEmpty())
        return false;

    QJsonObject root;
    root["version"] = 1;

    QJsonArray keys;
    for (const auto& k : m_config.apiKeys) {
        QJsonObject obj;
        obj["key"] = encodeApiKey(k.key);
        obj["name"] = k.name;
        obj["key_type"] = providerKindToString(k.type);
        keys.append(obj);
    }
    root["api_keys"] = keys;

    root["endpoints"] = endpointsToJson(m_config.endpoints);
    root["wolfram"] = wolframToJson(m_config.wolfram);

    QJsonObject rt;
    rt["debug_mode"] = m_config.runtime.debugMode;
    rt["request_timeout"] = m_config.runtime.requestTimeout;
    rt["connection_timeout"] = m_config.runtime.connectionTimeout;
    if (!m_config.runtime.logDirectory.isEmpty())
        rt["log_directory"] = m_config.runtime.logDirectory;
    root["runtime"] = rt;

    QDir().mkpath(QFileInfo(m_filePath).absolutePath());
    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(QString("cannot write config file: %1").arg(m_filePath));
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return true;
}

bool ConfigStore::addApiKey(const ApiKey& key) {
    m_config.apiKeys.append(key);
    const bool saved = save();
    emit configChanged();
    return saved;
}

bool ConfigStore::removeApiKey(const QString& key) {
    const auto removed = m_config.apiKeys.removeIf([&](const ApiKey& k) { return k.key == key; });
    if (removed == 0)
        return false;
    const bool saved = save();
    emit configChanged();
    return saved;
}

QString ConfigStore::encodeApiKey(const QString& plain) {
    if (plain.isEmpty()) {
        return QString();
    }
    return QStringLiteral("ENC:") + QString::fromUtf8(plain.toUtf8().toBase64());
}

QString ConfigStore::decodeApiKey(const QString& encoded) {
    if (encoded.startsWith(QStringLiteral("ENC:")))
        return QString::fromUtf8(QByteArray::fromBase64(encoded.mid(4).toUtf8()));
    return encoded;
}

QJsonObject ConfigStore::endpointsToJson(const ProviderEndpoints& e) const {
    QJsonObject obj;
    obj["gemini_base_url"] = e.geminiBaseUrl;
    obj["gemini_model"] = e.geminiModel;
    obj["deepseek_base_url"] = e.deepseekBaseUrl;
    obj["deepseek_model"] = e.deepseekModel;
    obj["coze_chat_url"] = e.cozeChatUrl;
    obj["coze_bot_id"] = e.cozeBotId;
    obj["coze_user_id"] = e.cozeUserId;
    return obj;
}

ProviderEndpoints ConfigStore::jsonToEndpoints(const QJsonObject& obj) const {
    const ProviderEndpoints d;
    ProviderEndpoints e;
    e.geminiBaseUrl = jsonStringEither(obj, "gemini_base_url", "geminiBaseUrl", d.geminiBaseUrl);
    e.geminiModel = jsonStringEither(obj, "gemini_model", "geminiModel", d.geminiModel);
    e.deepseekBaseUrl = jsonStringEither(obj, "deepseek_base_url", "deepseekBaseUrl", d.deepseekBaseUrl);
    e.deepseekModel = jsonStringEither(obj, "deepseek_model", "deepseekModel", d.deepseekModel);
    e.cozeChatUrl = jsonStringEither(obj, "coze_chat_url", "cozeChatUrl", d.cozeChatUrl);
    e.cozeBotId = jsonStringEither(obj, "coze_bot_id", "cozeBotId", d.cozeBotId);
    e.cozeUserId = jsonStringEither(obj, "coze_user_id", "cozeUserId", d.cozeUserId);
    return e;
}

QJsonObject ConfigStore::wolframToJson(const WolframOptions& w) const {
    QJsonObject obj;
    obj["gateway_url"] = w.gatewayUrl;
    obj["handshake_timeout"] = w.handshakeTimeout;
    obj["message_timeout"] = w.messageTimeout;
    obj["max_messages"] = w.maxMessages;
    obj["cache_capacity"] = w.cacheCapacity;
    obj["language"] = w.language;
    obj["location_id"] = w.locationId;
    obj["theme"] = w.theme;
    obj["category"] = w.category;
    return obj;
}

WolframOptions ConfigStore::jsonToWolfram(const QJsonObject& obj) const {
    const WolframOptions d;
    WolframOptions w;
    w.gatewayUrl = jsonStringEither(obj, "gateway_url", "gatewayUrl", d.gatewayUrl);
    w.handshakeTimeout = jsonIntEither(obj, "handshake_timeout", "handshakeTimeout", d.handshakeTimeout);
    w.messageTimeout = jsonIntEither(obj, "message_timeout", "messageTimeout", d.messageTimeout);
    w.maxMessages = jsonIntEither(obj, "max_messages", "maxMessages", d.maxMessages);
    w.cacheCapacity = jsonIntEither(obj, "cache_capacity", "cacheCapacity", d.cacheCapacity);
    w.language = jsonStringEither(obj, "language", "language", d.language);
    w.locationId = jsonStringEither(obj, "location_id", "locationId", d.locationId);
    w.theme = jsonStringEither(obj, "theme", "theme", d.theme);
    w.category = jsonStringEither(obj, "category", "category", d.category);
    clampWolfram(w);
    return w;
}
