#pragma once
#include <QFile>
#include <QMutex>
#include <QString>

// Process-wide logger. Lines go to <logDir>/deltaflow.log and, when console
// echo is on, to stderr. Messages below the minimum level are dropped.
class LogManager {
public:
    enum Level { Debug, Info, Warning, Error };

    static LogManager& instance();

    void initialize(const QString& logDir);
    QString logFilePath() const;

    void setMinimumLevel(Level level);
    Level minimumLevel() const;
    void setConsoleEcho(bool enabled);

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "deltaflow", msg); }
    void info(const QString& msg)    { log(Info, "deltaflow", msg); }
    void warning(const QString& msg) { log(Warning, "deltaflow", msg); }
    void error(const QString& msg)   { log(Error, "deltaflow", msg); }

    static QString formatMessage(Level level, const QString& category, const QString& message);

private:
    LogManager() = default;
    ~LogManager();
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    QFile m_logFile;
    Level m_minimumLevel = Info;
    bool m_consoleEcho = false;
    mutable QMutex m_mutex;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)
