#include "FlightDutyModel.h"

#include <QTimeZone>

FlightDutyModel::FlightDutyModel(QObject *parent)
    : QObject(parent)
{
    m_createdAt = QDateTime::currentDateTimeUtc();
    m_updatedAt = QDateTime::currentDateTimeUtc();
}

QUuid FlightDutyModel::id() const
{
    return m_id;
}

void FlightDutyModel::setId(const QUuid &id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

QUuid FlightDutyModel::userId() const
{
    return m_userId;
}

void FlightDutyModel::setUserId(const QUuid &userId)
{
    if (m_userId != userId) {
        m_userId = userId;
        emit userIdChanged(m_userId);
    }
}

QDate FlightDutyModel::date() const
{
    return m_date;
}

void FlightDutyModel::setDate(const QDate &date)
{
    if (m_date != date) {
        m_date = date;
        emit dateChanged(m_date);
    }
}

int FlightDutyModel::month() const
{
    return m_month;
}

void FlightDutyModel::setMonth(int month)
{
    if (m_month != month) {
        m_month = month;
        emit monthChanged(m_month);
    }
}

int FlightDutyModel::year() const
{
    return m_year;
}

void FlightDutyModel::setYear(int year)
{
    if (m_year != year) {
        m_year = year;
        emit yearChanged(m_year);
    }
}

QStringList FlightDutyModel::flightNumbers() const
{
    return m_flightNumbers;
}

void FlightDutyModel::setFlightNumbers(const QStringList &flightNumbers)
{
    if (m_flightNumbers != flightNumbers) {
        m_flightNumbers = flightNumbers;
        emit flightNumbersChanged(m_flightNumbers);
    }
}

QStringList FlightDutyModel::sectors() const
{
    return m_sectors;
}

void FlightDutyModel::setSectors(const QStringList &sectors)
{
    if (m_sectors != sectors) {
        m_sectors = sectors;
        emit sectorsChanged(m_sectors);
    }
}

DutyTypes::DutyType FlightDutyModel::dutyType() const
{
    return m_dutyType;
}

void FlightDutyModel::setDutyType(DutyTypes::DutyType dutyType)
{
    if (m_dutyType != dutyType) {
        m_dutyType = dutyType;
        emit dutyTypeChanged(m_dutyType);
    }
}

QTime FlightDutyModel::reportTime() const
{
    return m_reportTime;
}

void FlightDutyModel::setReportTime(const QTime &reportTime)
{
    if (m_reportTime != reportTime) {
        m_reportTime = reportTime;
        emit reportTimeChanged(m_reportTime);
    }
}

QTime FlightDutyModel::debriefTime() const
{
    return m_debriefTime;
}

void FlightDutyModel::setDebriefTime(const QTime &debriefTime)
{
    if (m_debriefTime != debriefTime) {
        m_debriefTime = debriefTime;
        emit debriefTimeChanged(m_debriefTime);
    }
}

bool FlightDutyModel::isCrossDay() const
{
    return m_isCrossDay;
}

void FlightDutyModel::setIsCrossDay(bool isCrossDay)
{
    if (m_isCrossDay != isCrossDay) {
        m_isCrossDay = isCrossDay;
        emit isCrossDayChanged(m_isCrossDay);
    }
}

double FlightDutyModel::dutyHours() const
{
    return m_dutyHours;
}

void FlightDutyModel::setDutyHours(double dutyHours)
{
    if (m_dutyHours != dutyHours) {
        m_dutyHours = dutyHours;
        emit dutyHoursChanged(m_dutyHours);
    }
}

double FlightDutyModel::flightPay() const
{
    return m_flightPay;
}

void FlightDutyModel::setFlightPay(double flightPay)
{
    if (m_flightPay != flightPay) {
        m_flightPay = flightPay;
        emit flightPayChanged(m_flightPay);
    }
}

DutyTypes::DataSource FlightDutyModel::dataSource() const
{
    return m_dataSource;
}

void FlightDutyModel::setDataSource(DutyTypes::DataSource dataSource)
{
    if (m_dataSource != dataSource) {
        m_dataSource = dataSource;
        emit dataSourceChanged(m_dataSource);
    }
}

QJsonObject FlightDutyModel::originalData() const
{
    return m_originalData;
}

void FlightDutyModel::setOriginalData(const QJsonObject &originalData)
{
    if (m_originalData != originalData) {
        m_originalData = originalData;
        emit originalDataChanged(m_originalData);
    }
}

QDateTime FlightDutyModel::lastEditedAt() const
{
    return m_lastEditedAt;
}

void FlightDutyModel::setLastEditedAt(const QDateTime &lastEditedAt)
{
    if (m_lastEditedAt != lastEditedAt) {
        m_lastEditedAt = lastEditedAt;
        emit lastEditedAtChanged(m_lastEditedAt);
    }
}

QUuid FlightDutyModel::lastEditedBy() const
{
    return m_lastEditedBy;
}

void FlightDutyModel::setLastEditedBy(const QUuid &lastEditedBy)
{
    if (m_lastEditedBy != lastEditedBy) {
        m_lastEditedBy = lastEditedBy;
        emit lastEditedByChanged(m_lastEditedBy);
    }
}

QDateTime FlightDutyModel::createdAt() const
{
    return m_createdAt;
}

void FlightDutyModel::setCreatedAt(const QDateTime &createdAt)
{
    if (m_createdAt != createdAt) {
        m_createdAt = createdAt;
        emit createdAtChanged(m_createdAt);
    }
}

QDateTime FlightDutyModel::updatedAt() const
{
    return m_updatedAt;
}

void FlightDutyModel::setUpdatedAt(const QDateTime &updatedAt)
{
    if (m_updatedAt != updatedAt) {
        m_updatedAt = updatedAt;
        emit updatedAtChanged(m_updatedAt);
    }
}

QDateTime FlightDutyModel::reportDateTime() const
{
    return QDateTime(m_date, m_reportTime.isValid() ? m_reportTime : QTime(0, 0), QTimeZone::utc());
}

QDateTime FlightDutyModel::debriefDateTime() const
{
    QDate debriefDate = m_isCrossDay ? m_date.addDays(1) : m_date;
    return QDateTime(debriefDate, m_debriefTime.isValid() ? m_debriefTime : QTime(0, 0), QTimeZone::utc());
}

bool FlightDutyModel::isEdited() const
{
    return m_dataSource == DutyTypes::DataSource::Edited;
}
