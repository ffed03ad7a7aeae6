#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QTextStream>

#include "config/config_store.h"
#include "core/app_context.h"
#include "core/log_manager.h"

namespace {

int reportFailure(const DomainFailure& failure)
{
    QTextStream err(stderr);
    err << QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact) << Qt::endl;
    return 1;
}

int runWolfram(AppContext& context, const QString& query, bool imageOnly, const QString& format)
{
    auto results = context.wolfram().compute(query, imageOnly);
    if (!results)
        return reportFailure(results.error());

    QTextStream out(stdout);
    if (format == QStringLiteral("markdown"))
        out << formatWolframMarkdown(*results);
    else if (format == QStringLiteral("html"))
        out << formatWolframHtml(*results);
    else
        out << QJsonDocument(wolframResultsToJson(*results)).toJson(QJsonDocument::Indented);
    out.flush();
    return 0;
}

int runSaveKey(ConfigStore& store, const QCommandLineParser& parser)
{
    const auto kind = providerKindFromString(parser.value(QStringLiteral("provider")));
    if (!kind || !parser.isSet(QStringLiteral("key"))) {
        return reportFailure(DomainFailure::invalidInput(
            QStringLiteral("cli.save_key"),
            QStringLiteral("--save-key needs --provider and --key")));
    }

    ApiKey key;
    key.key = parser.value(QStringLiteral("key"));
    key.name = parser.value(QStringLiteral("key-name"));
    key.type = *kind;
    if (!store.addApiKey(key)) {
        return reportFailure(DomainFailure::internal(
            QStringLiteral("cannot write %1").arg(store.filePath())));
    }
    LOG_INFO(QStringLiteral("stored %1 key '%2'").arg(providerKindToString(*kind), key.name));
    return 0;
}

int runRemoveKey(ConfigStore& store, const QString& key)
{
    if (!store.removeApiKey(key)) {
        return reportFailure(DomainFailure::invalidInput(
            QStringLiteral("cli.remove_key"),
            QStringLiteral("key not found or %1 not writable").arg(store.filePath())));
    }
    return 0;
}

int runChat(AppContext& context, const QCommandLineParser& parser)
{
    const auto kind = providerKindFromString(parser.value(QStringLiteral("provider")));
    if (!kind) {
        return reportFailure(DomainFailure::invalidInput(
            QStringLiteral("cli.unknown_provider"),
            QStringLiteral("unknown provider: %1").arg(parser.value(QStringLiteral("provider")))));
    }

    ApiKey key;
    if (parser.isSet(QStringLiteral("key"))) {
        key.key = parser.value(QStringLiteral("key"));
        key.name = QStringLiteral("command line");
        key.type = *kind;
    } else {
        auto stored = context.config().findKey(*kind, parser.value(QStringLiteral("key-name")));
        if (!stored) {
            return reportFailure(DomainFailure::invalidInput(
                QStringLiteral("cli.missing_key"),
                QStringLiteral("no API key for %1; pass --key or add one to the config")
                    .arg(providerKindToString(*kind))));
        }
        key = *stored;
    }

    ChatProvider chat = context.createChat(*kind);
    if (parser.isSet(QStringLiteral("system")))
        chat.setSystemPrompt(parser.value(QStringLiteral("system")));

    for (const QString& param : parser.values(QStringLiteral("param"))) {
        const qsizetype eq = param.indexOf(QLatin1Char('='));
        if (eq <= 0) {
            return reportFailure(DomainFailure::invalidInput(
                QStringLiteral("cli.bad_param"), QStringLiteral("expected key=value, got '%1'").arg(param)));
        }
        auto ok = chat.setParameter(param.left(eq).trimmed(), param.mid(eq + 1));
        if (!ok)
            return reportFailure(ok.error());
    }

    QTextStream out(stdout);
    auto reply = chat.generateStreaming(key, parser.value(QStringLiteral("prompt")),
                                        [&out](const QString& delta) {
                                            out << delta;
                                            out.flush();
                                        });
    out << Qt::endl;
    if (!reply)
        return reportFailure(reply.error());
    return 0;
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("deltaflow"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Streams chat replies from Gemini, DeepSeek or Coze and queries Wolfram|Alpha."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        {QStringLiteral("config"), QStringLiteral("Configuration file."), QStringLiteral("file")},
        {QStringLiteral("provider"), QStringLiteral("Chat provider: gemini, deepseek or coze."), QStringLiteral("name")},
        {QStringLiteral("key"), QStringLiteral("API key for the provider."), QStringLiteral("key")},
        {QStringLiteral("key-name"), QStringLiteral("Name of a stored API key."), QStringLiteral("name")},
        {QStringLiteral("prompt"), QStringLiteral("User prompt."), QStringLiteral("text")},
        {QStringLiteral("system"), QStringLiteral("System prompt."), QStringLiteral("text")},
        {QStringLiteral("param"), QStringLiteral("Sampling parameter, repeatable."), QStringLiteral("key=value")},
        {QStringLiteral("wolfram"), QStringLiteral("Wolfram|Alpha query."), QStringLiteral("query")},
        {QStringLiteral("image-only"), QStringLiteral("Only keep images in Wolfram results.")},
        {QStringLiteral("format"), QStringLiteral("Wolfram output: json, markdown or html."), QStringLiteral("format"), QStringLiteral("json")},
        {QStringLiteral("save-key"), QStringLiteral("Store --key for --provider under --key-name in the config.")},
        {QStringLiteral("remove-key"), QStringLiteral("Remove a stored API key."), QStringLiteral("key")},
        {QStringLiteral("debug"), QStringLiteral("Echo debug logs to stderr.")},
    });
    parser.process(app);

    ConfigStore configStore;
    const bool configLoaded = configStore.load(parser.value(QStringLiteral("config")));
    AppConfig config = configStore.appConfig();

    QString logDir = config.runtime.logDirectory;
    if (logDir.isEmpty())
        logDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/logs");
    QDir().mkpath(logDir);
    LogManager::instance().initialize(logDir);

    const bool debug = parser.isSet(QStringLiteral("debug")) || config.runtime.debugMode;
    LogManager::instance().setMinimumLevel(debug ? LogManager::Debug : LogManager::Info);
    LogManager::instance().setConsoleEcho(debug);
    if (!configLoaded)
        LOG_INFO(QStringLiteral("using default configuration (%1 not loaded)").arg(configStore.filePath()));

    if (parser.isSet(QStringLiteral("save-key")))
        return runSaveKey(configStore, parser);
    if (parser.isSet(QStringLiteral("remove-key")))
        return runRemoveKey(configStore, parser.value(QStringLiteral("remove-key")));

    AppContext context(config);

    if (parser.isSet(QStringLiteral("wolfram"))) {
        return runWolfram(context, parser.value(QStringLiteral("wolfram")),
                          parser.isSet(QStringLiteral("image-only")),
                          parser.value(QStringLiteral("format")));
    }

    if (parser.isSet(QStringLiteral("provider")) && parser.isSet(QStringLiteral("prompt")))
        return runChat(context, parser);

    parser.showHelp(1);
}
