#include "wolfram_types.h"

namespace {

void putOptional(QJsonObject& obj, const char* key, const std::optional<QString>& value)
{
    if (value)
        obj[QString::fromUtf8(key)] = *value;
}

QString escapeHtml(QString s)
{
    s.replace('&', "&amp;");
    s.replace('<', "&lt;");
    s.replace('>', "&gt;");
    s.replace('"', "&quot;");
    s.replace('\'', "&#39;");
    return s;
}

const QString kNoResultsHtml =
    QStringLiteral("<div class=\"alert alert-warning\" role=\"alert\">No results</div>");

}

QJsonObject WolframResult::toJson() const
{
    QJsonObject obj;
    putOptional(obj, "title", title);
    putOptional(obj, "plaintext", plaintext);
    putOptional(obj, "img_base64", imgBase64);
    putOptional(obj, "img_contenttype", imgContentType);
    putOptional(obj, "minput", minput);
    putOptional(obj, "moutput", moutput);
    if (!relatedQueries.isEmpty())
        obj["relatedQueries"] = QJsonArray::fromStringList(relatedQueries);
    return obj;
}

QJsonArray wolframResultsToJson(const WolframResults& results)
{
    QJsonArray arr;
    for (const auto& r : results)
        arr.append(r.toJson());
    return arr;
}

QString formatWolframMarkdown(const WolframResults& results)
{
    if (results.isEmpty())
        return kNoResultsHtml;

    QString out;
    for (const auto& r : results) {
        if (r.title)
            out += *r.title + '\n';
        if (r.plaintext)
            out += QString("Expr:%1\n").arg(*r.plaintext);
        if (r.imgBase64) {
            out += QString("![Image](data:%1;base64,%2)\n")
                       .arg(r.imgContentType.value_or("image/png"), *r.imgBase64);
        }
        if (r.minput)
            out += QString("Mathematica Input:%1\n").arg(*r.minput);
        if (r.moutput)
            out += QString("Mathematica Output:%1\n").arg(*r.moutput);
        if (!r.relatedQueries.isEmpty()) {
            out += "Related Queries:\n";
            for (const auto& q : r.relatedQueries)
                out += q + '\n';
        }
    }
    return out;
}

QString formatWolframHtml(const WolframResults& results)
{
    if (results.isEmpty())
        return kNoResultsHtml;

    QString out = "<div style=\"border: 1px solid #ccc; padding: 10px; margin: 10px; border-radius: 5px;\">";
    for (qsizetype i = 0; i < results.size(); ++i) {
        const WolframResult& r = results[i];
        if (r.title)
            out += QString("<h2>%1</h2>\n").arg(escapeHtml(*r.title));
        if (r.plaintext)
            out += QString("<p><strong>Expr:</strong> %1</p>\n").arg(escapeHtml(*r.plaintext));
        if (r.imgBase64) {
            out += QString("<p><img src='data:%1;base64,%2' alt='Image' /></p>")
                       .arg(escapeHtml(r.imgContentType.value_or("image/png")), *r.imgBase64);
        }
        if (r.minput)
            out += QString("<p><strong>Mathematica Input:</strong> %1</p>\n").arg(escapeHtml(*r.minput));
        if (r.moutput)
            out += QString("<p><strong>Mathematica Output:</strong> %1</p>\n").arg(escapeHtml(*r.moutput));
        if (!r.relatedQueries.isEmpty()) {
            out += "<p><strong>Related Queries:</strong></p>\n<ul>\n";
            for (const auto& q : r.relatedQueries)
                out += QString("<li>%1</li>\n").arg(escapeHtml(q));
            out += "</ul>\n";
        }
        if (i < results.size() - 1)
            out += "<hr />\n";
    }
    out += "</div>\n";
    return out;
}
