#include "CrewPayConfig.h"
#include "logger/logger.h"
#include <QFile>
#include <QRegularExpression>
#include <QSettings>

CrewPayConfig::CrewPayConfig(QObject *parent)
    : QObject(parent)
{
    loadDefaults();
}

void CrewPayConfig::loadDefaults()
{
    m_logLevel = "info";
    m_logFilePath = "";
    m_logToConsole = true;
    m_homeBase = "DXB";
    m_maxUploadSizeMb = 10;
    m_layoverPairingDays = 5;
    m_crossMonthLookaheadDays = 3;
    m_inferImplicitOvernight = true;
}

bool CrewPayConfig::load(const QString &configPath)
{
    if (!QFile::exists(configPath)) {
        LOG_WARNING(QString("Configuration file not found: %1, using defaults").arg(configPath));
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        LOG_ERROR(QString("Cannot read configuration file %1").arg(configPath));
        return false;
    }

    settings.beginGroup("Logging");
    m_logLevel = settings.value("level", m_logLevel).toString().trimmed().toLower();
    m_logFilePath = settings.value("file", m_logFilePath).toString().trimmed();
    m_logToConsole = settings.value("console", m_logToConsole).toBool();
    settings.endGroup();

    settings.beginGroup("Roster");
    m_homeBase = settings.value("homeBase", m_homeBase).toString().trimmed().toUpper();
    m_maxUploadSizeMb = settings.value("maxUploadSizeMb", m_maxUploadSizeMb).toLongLong();
    m_layoverPairingDays = settings.value("layoverPairingDays", m_layoverPairingDays).toInt();
    m_crossMonthLookaheadDays = settings.value("crossMonthLookaheadDays", m_crossMonthLookaheadDays).toInt();
    m_inferImplicitOvernight = settings.value("inferImplicitOvernight", m_inferImplicitOvernight).toBool();
    settings.endGroup();

    static const QRegularExpression airportPattern("^[A-Z]{3}$");
    if (!airportPattern.match(m_homeBase).hasMatch()) {
        LOG_WARNING(QString("Invalid home base '%1', using DXB").arg(m_homeBase));
        m_homeBase = "DXB";
    }

    if (m_maxUploadSizeMb <= 0) {
        LOG_WARNING(QString("Invalid maxUploadSizeMb %1, using 10").arg(m_maxUploadSizeMb));
        m_maxUploadSizeMb = 10;
    }

    if (m_layoverPairingDays < 1) {
        LOG_WARNING(QString("Invalid layoverPairingDays %1, using 5").arg(m_layoverPairingDays));
        m_layoverPairingDays = 5;
    }

    if (m_crossMonthLookaheadDays < 0 || m_crossMonthLookaheadDays > 28) {
        LOG_WARNING(QString("Invalid crossMonthLookaheadDays %1, using 3").arg(m_crossMonthLookaheadDays));
        m_crossMonthLookaheadDays = 3;
    }

    if (m_crossMonthLookaheadDays < m_layoverPairingDays) {
        LOG_WARNING(QString("crossMonthLookaheadDays %1 is shorter than layoverPairingDays, using %2")
                    .arg(m_crossMonthLookaheadDays).arg(m_layoverPairingDays));
        m_crossMonthLookaheadDays = m_layoverPairingDays;
    }

    LOG_DATA(Logger::Info, (QMap<QString, QVariant>{
        {"config", configPath},
        {"logLevel", m_logLevel},
        {"homeBase", m_homeBase},
        {"maxUploadSizeMb", m_maxUploadSizeMb},
        {"layoverPairingDays", m_layoverPairingDays},
        {"crossMonthLookaheadDays", m_crossMonthLookaheadDays},
        {"inferImplicitOvernight", m_inferImplicitOvernight}
    }));

    emit configChanged();
    return true;
}

void CrewPayConfig::applyLogging() const
{
    Logger::instance()->setLogLevel(Logger::levelFromString(m_logLevel));
    Logger::instance()->enableConsoleOutput(m_logToConsole);
    if (!m_logFilePath.isEmpty()) {
        Logger::instance()->setLogFile(m_logFilePath);
    }
}

void CrewPayConfig::setLogLevel(const QString &level)
{
    m_logLevel = level.trimmed().toLower();
    emit configChanged();
}

void CrewPayConfig::setHomeBase(const QString &homeBase)
{
    m_homeBase = homeBase.trimmed().toUpper();
    emit configChanged();
}
