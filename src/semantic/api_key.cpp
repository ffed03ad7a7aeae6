#include "api_key.h"

QString providerKindToString(ProviderKind kind)
{
    switch (kind) {
    case ProviderKind::Gemini:   return QStringLiteral("Gemini");
    case ProviderKind::DeepSeek: return QStringLiteral("DeepSeek");
    case ProviderKind::Coze:     return QStringLiteral("Coze");
    }
    return QStringLiteral("Unknown");
}

std::optional<ProviderKind> providerKindFromString(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QStringLiteral("gemini"))
        return ProviderKind::Gemini;
    if (n == QStringLiteral("deepseek"))
        return ProviderKind::DeepSeek;
    if (n == QStringLiteral("coze"))
        return ProviderKind::Coze;
    return std::nullopt;
}
