#pragma once
#include "semantic/api_key.h"
#include <optional>
#include <QList>
#include <QString>

struct ProviderEndpoints {
    QString geminiBaseUrl = "https://generativelanguage.googleapis.com/v1beta";
    QString geminiModel = "gemini-2.5-flash";
    QString deepseekBaseUrl = "https://api.deepseek.com";
    QString deepseekModel = "deepseek-chat";
    QString cozeChatUrl = "https://api.coze.cn/v3/chat";
    QString cozeBotId;
    QString cozeUserId;
};

struct WolframOptions {
    QString gatewayUrl = "wss://gateway.wolframalpha.com/gateway";
    int handshakeTimeout = 15000;
    int messageTimeout = 30000;
    int maxMessages = 50;
    int cacheCapacity = 100;
    QString language = "en";
    QString locationId = "oi8ft_en_light";
    QString theme = "light";
    QString category = "results";
};

struct RuntimeOptions {
    bool debugMode = false;
    int requestTimeout = 120000;
    int connectionTimeout = 30000;
    QString logDirectory;
};

struct AppConfig {
    QList<ApiKey> apiKeys;
    ProviderEndpoints endpoints;
    WolframOptions wolfram;
    RuntimeOptions runtime;

    // First key of the given provider, or the named one when name is set.
    std::optional<ApiKey> findKey(ProviderKind type, const QString& name = {}) const {
        for (const auto& k : apiKeys) {
            if (k.type != type) continue;
            if (name.isEmpty() || k.name == name) return k;
        }
        return std::nullopt;
    }
};
