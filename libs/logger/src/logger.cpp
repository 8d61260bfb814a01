#include "logger/logger.h"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

Logger* Logger::m_instance = nullptr;

Logger* Logger::instance() {
    // Double-checked locking; the instance lives for the whole process
    if (m_instance == nullptr) {
        static QMutex mutex;
        QMutexLocker locker(&mutex);

        if (m_instance == nullptr) {
            m_instance = new Logger();
        }
    }
    return m_instance;
}

Logger::Logger(QObject* parent)
    : QObject(parent)
    , m_logLevel(Info)
    , m_consoleOutput(true)
{
}

Logger::~Logger() {
    closeLogFile();
}

Logger::LogLevel Logger::levelFromString(const QString& name, LogLevel fallback) {
    const QString level = name.trimmed().toLower();
    if (level == "debug") {
        return Debug;
    } else if (level == "info") {
        return Info;
    } else if (level == "warning" || level == "warn") {
        return Warning;
    } else if (level == "error") {
        return Error;
    } else if (level == "fatal") {
        return Fatal;
    }
    return fallback;
}

QString Logger::levelToString(LogLevel level) {
    switch (level) {
        case Debug:   return "DEBUG";
        case Info:    return "INFO";
        case Warning: return "WARNING";
        case Error:   return "ERROR";
        case Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

bool Logger::setLogFile(const QString& filePath) {
    QMutexLocker locker(&m_mutex);
    closeFileLocked();

    QDir().mkpath(QFileInfo(filePath).absolutePath());
    m_logFile.setFileName(filePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "Failed to open log file:" << filePath;
        return false;
    }

    m_logStream.setDevice(&m_logFile);
    writeToLog(formatLogMessage(Info, QString("Log file opened: %1").arg(filePath), QString(), -1));
    return true;
}

void Logger::closeLogFile() {
    QMutexLocker locker(&m_mutex);
    closeFileLocked();
}

void Logger::closeFileLocked() {
    if (m_logFile.isOpen()) {
        m_logStream.flush();
        m_logStream.setDevice(nullptr);
        m_logFile.close();
    }
}

void Logger::setLogLevel(LogLevel level) {
    QMutexLocker locker(&m_mutex);
    m_logLevel = level;
}

Logger::LogLevel Logger::logLevel() const {
    QMutexLocker locker(&m_mutex);
    return m_logLevel;
}

void Logger::enableConsoleOutput(bool enable) {
    QMutexLocker locker(&m_mutex);
    m_consoleOutput = enable;
}

void Logger::log(LogLevel level, const QString& message, const QString& source, int line) {
    if (level < logLevel()) {
        return;
    }

    // Format outside the lock to keep the critical section short
    const QString formattedMessage = formatLogMessage(level, message, source, line);

    QMutexLocker locker(&m_mutex);
    writeToLog(formattedMessage);

    if (m_consoleOutput) {
        switch (level) {
            case Debug:
                qDebug().noquote() << formattedMessage;
                break;
            case Info:
                qInfo().noquote() << formattedMessage;
                break;
            case Warning:
                qWarning().noquote() << formattedMessage;
                break;
            case Error:
            case Fatal:
                qCritical().noquote() << formattedMessage;
                break;
        }
    }
}

void Logger::logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source, int line) {
    if (level < logLevel()) {
        return;
    }

    QStringList logParts;
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        logParts.append(QString("%1: %2").arg(it.key(), it.value().toString()));
    }

    log(level, logParts.join(", "), source, line);
}

QString Logger::shortSource(const QString& source) {
    QString sourceInfo = source;

    // "bool RecalculationEngine::recalculate(const QUuid&, int)" -> "RecalculationEngine::recalculate"
    const int parenPos = sourceInfo.indexOf('(');
    if (parenPos > 0) {
        sourceInfo = sourceInfo.left(parenPos);
    }

    // Template arguments may contain spaces, drop them before splitting off the return type
    const int templatePos = sourceInfo.indexOf('<');
    if (templatePos > 0) {
        sourceInfo = sourceInfo.left(templatePos);
    }

    const int spacePos = sourceInfo.lastIndexOf(' ');
    if (spacePos >= 0) {
        sourceInfo = sourceInfo.mid(spacePos + 1);
    }

    sourceInfo.remove("__cdecl");
    return sourceInfo;
}

QString Logger::formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const {
    const QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    const QString pid = QString::number(QCoreApplication::applicationPid());
    const QString threadId = QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()));
    const QString levelStr = levelToString(level);

    if (source.isEmpty()) {
        return QString("[%1] [%2] [PID:%3] [TID:%4] %5")
            .arg(timestamp, levelStr, pid, threadId, message);
    }

    QString sourceInfo = shortSource(source);
    if (line >= 0) {
        sourceInfo += QString(":%1").arg(line);
    }

    return QString("[%1] [%2] [PID:%3] [TID:%4] [%5] %6")
        .arg(timestamp, levelStr, pid, threadId, sourceInfo, message);
}

void Logger::writeToLog(const QString& message) {
    if (m_logFile.isOpen()) {
        m_logStream << message << Qt::endl;
        m_logStream.flush();
    }
}
