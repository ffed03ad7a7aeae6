#pragma once
#include <optional>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

// One pod of a Wolfram|Alpha answer, flattened across its subpods.
struct WolframResult {
    std::optional<QString> title;
    std::optional<QString> plaintext;
    std::optional<QString> minput;
    std::optional<QString> moutput;
    std::optional<QString> imgBase64;
    std::optional<QString> imgContentType;
    QStringList relatedQueries;

    QJsonObject toJson() const;
};

using WolframResults = QList<WolframResult>;

QJsonArray wolframResultsToJson(const WolframResults& results);

// Presentation helpers used by the CLI.
QString formatWolframMarkdown(const WolframResults& results);
QString formatWolframHtml(const WolframResults& results);
