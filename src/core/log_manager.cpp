#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();

    QDir().mkpath(logDir);
    const QString logPath = logDir + "/deltaflow.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
    }
}

QString LogManager::logFilePath() const {
    QMutexLocker locker(&m_mutex);
    return m_logFile.isOpen() ? m_logFile.fileName() : QString();
}

void LogManager::setMinimumLevel(Level level) {
    QMutexLocker locker(&m_mutex);
    m_minimumLevel = level;
}

LogManager::Level LogManager::minimumLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_minimumLevel;
}

void LogManager::setConsoleEcho(bool enabled) {
    QMutexLocker locker(&m_mutex);
    m_consoleEcho = enabled;
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    QMutexLocker locker(&m_mutex);
    if (level < m_minimumLevel)
        return;

    const QString formatted = formatMessage(level, category, message);

    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }

    if (m_consoleEcho) {
        QTextStream err(stderr);
        err << formatted << "\n";
    }
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    return QString("[%1] [%2] [%3] %4")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz"),
             kLevelNames[level], category, message);
}
