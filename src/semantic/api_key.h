#pragma once
#include "types.h"
#include <optional>
#include <QString>

struct ApiKey {
    QString key;
    QString name;
    ProviderKind type = ProviderKind::Gemini;
};

QString providerKindToString(ProviderKind kind);
std::optional<ProviderKind> providerKindFromString(const QString& name);
