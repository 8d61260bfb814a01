#pragma once

#include <QObject>
#include <QString>
#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QMutex>
#include <QDebug>
#include <QMap>
#include <QVariant>
#include <QThread>

/**
 * @brief Process-wide logger used by the engine, the storage layer and the CLI
 *
 * Messages go to an optional log file and, when enabled, to the Qt message
 * handlers (qDebug/qInfo/qWarning/qCritical). Access is serialized with a mutex
 * so services may log from worker threads.
 */
class Logger : public QObject {
    Q_OBJECT
public:
    enum LogLevel {
        Debug,    ///< Row-level diagnostics
        Info,     ///< Pipeline milestones
        Warning,  ///< Recoverable anomalies (skipped rows, unpaired layovers)
        Error,    ///< Failed operations (storage errors, rejected files)
        Fatal     ///< Unusable configuration or database
    };
    Q_ENUM(LogLevel)

    /**
     * @brief Gets the singleton instance of the logger
     */
    static Logger* instance();

    /**
     * @brief Maps "debug", "info", "warning", "error" or "fatal" to a level
     * @param name Level name, case-insensitive
     * @param fallback Level returned for unknown names
     */
    static LogLevel levelFromString(const QString& name, LogLevel fallback = Info);
    static QString levelToString(LogLevel level);

    /**
     * @brief Opens (append mode) the file that receives every message
     * @param filePath Full path; the parent directory is created when missing
     * @return True if the file could be opened
     */
    bool setLogFile(const QString& filePath);
    void closeLogFile();

    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;

    // Echo to the Qt message handlers, on by default
    void enableConsoleOutput(bool enable);

    /**
     * @brief Logs a message at the given level
     * @param level The log level
     * @param message The log message
     * @param source The source function (Q_FUNC_INFO)
     * @param line Source line, or -1 when unknown
     */
    void log(LogLevel level, const QString& message, const QString& source = QString(), int line = -1);

    /**
     * @brief Logs key-value pairs as a single "key: value, ..." line
     */
    void logData(LogLevel level, const QMap<QString, QVariant>& data, const QString& source = QString(), int line = -1);

private:
    explicit Logger(QObject* parent = nullptr);
    ~Logger();

    static Logger* m_instance;
    QFile m_logFile;
    QTextStream m_logStream;
    LogLevel m_logLevel;
    bool m_consoleOutput;
    mutable QMutex m_mutex;

    /**
     * @brief Reduces a Q_FUNC_INFO signature to "Class::method"
     */
    static QString shortSource(const QString& source);
    QString formatLogMessage(LogLevel level, const QString& message, const QString& source, int line) const;
    // Caller must hold m_mutex
    void writeToLog(const QString& message);
    void closeFileLocked();
};

#define LOG_AT(level, msg) Logger::instance()->log(Logger::level, msg, Q_FUNC_INFO, __LINE__)

#define LOG_DEBUG(msg) LOG_AT(Debug, msg)
#define LOG_INFO(msg) LOG_AT(Info, msg)
#define LOG_WARNING(msg) LOG_AT(Warning, msg)
#define LOG_ERROR(msg) LOG_AT(Error, msg)
#define LOG_FATAL(msg) LOG_AT(Fatal, msg)

#define LOG_DATA(level, data) Logger::instance()->logData(level, data, Q_FUNC_INFO, __LINE__)
