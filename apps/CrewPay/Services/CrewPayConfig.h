#ifndef CREWPAYCONFIG_H
#define CREWPAYCONFIG_H

#include <QObject>
#include <QString>

/**
 * @brief Engine settings read from an INI file
 *
 * Groups [Logging] (level, file, console) and [Roster] (homeBase, maxUploadSizeMb,
 * layoverPairingDays, crossMonthLookaheadDays, inferImplicitOvernight).
 * Missing keys keep their defaults; out-of-range values are reset to the
 * default with a warning.
 */
class CrewPayConfig : public QObject
{
    Q_OBJECT
public:
    explicit CrewPayConfig(QObject *parent = nullptr);

    bool load(const QString &configPath);
    // Level, optional file and console echo of the process logger
    void applyLogging() const;

    QString logLevel() const { return m_logLevel; }
    QString logFilePath() const { return m_logFilePath; }
    bool logToConsole() const { return m_logToConsole; }
    QString homeBase() const { return m_homeBase; }
    qint64 maxUploadSizeBytes() const { return m_maxUploadSizeMb * 1024 * 1024; }
    int layoverPairingDays() const { return m_layoverPairingDays; }
    int crossMonthLookaheadDays() const { return m_crossMonthLookaheadDays; }
    bool inferImplicitOvernight() const { return m_inferImplicitOvernight; }

    void setLogLevel(const QString &level);
    void setHomeBase(const QString &homeBase);

signals:
    void configChanged();

private:
    void loadDefaults();

    QString m_logLevel;
    QString m_logFilePath;
    bool m_logToConsole;
    QString m_homeBase;
    qint64 m_maxUploadSizeMb;
    int m_layoverPairingDays;
    int m_crossMonthLookaheadDays;
    bool m_inferImplicitOvernight;
};

#endif // CREWPAYCONFIG_H
