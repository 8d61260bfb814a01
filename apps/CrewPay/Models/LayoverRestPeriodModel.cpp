#include "LayoverRestPeriodModel.h"

LayoverRestPeriodModel::LayoverRestPeriodModel(QObject *parent)
    : QObject(parent)
{
    m_createdAt = QDateTime::currentDateTimeUtc();
}

QUuid LayoverRestPeriodModel::id() const
{
    return m_id;
}

void LayoverRestPeriodModel::setId(const QUuid &id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

QUuid LayoverRestPeriodModel::userId() const
{
    return m_userId;
}

void LayoverRestPeriodModel::setUserId(const QUuid &userId)
{
    if (m_userId != userId) {
        m_userId = userId;
        emit userIdChanged(m_userId);
    }
}

QUuid LayoverRestPeriodModel::outboundFlightId() const
{
    return m_outboundFlightId;
}

void LayoverRestPeriodModel::setOutboundFlightId(const QUuid &outboundFlightId)
{
    if (m_outboundFlightId != outboundFlightId) {
        m_outboundFlightId = outboundFlightId;
        emit outboundFlightIdChanged(m_outboundFlightId);
    }
}

QUuid LayoverRestPeriodModel::inboundFlightId() const
{
    return m_inboundFlightId;
}

void LayoverRestPeriodModel::setInboundFlightId(const QUuid &inboundFlightId)
{
    if (m_inboundFlightId != inboundFlightId) {
        m_inboundFlightId = inboundFlightId;
        emit inboundFlightIdChanged(m_inboundFlightId);
    }
}

QDateTime LayoverRestPeriodModel::restStartTime() const
{
    return m_restStartTime;
}

void LayoverRestPeriodModel::setRestStartTime(const QDateTime &restStartTime)
{
    if (m_restStartTime != restStartTime) {
        m_restStartTime = restStartTime;
        emit restStartTimeChanged(m_restStartTime);
    }
}

QDateTime LayoverRestPeriodModel::restEndTime() const
{
    return m_restEndTime;
}

void LayoverRestPeriodModel::setRestEndTime(const QDateTime &restEndTime)
{
    if (m_restEndTime != restEndTime) {
        m_restEndTime = restEndTime;
        emit restEndTimeChanged(m_restEndTime);
    }
}

double LayoverRestPeriodModel::restHours() const
{
    return m_restHours;
}

void LayoverRestPeriodModel::setRestHours(double restHours)
{
    if (m_restHours != restHours) {
        m_restHours = restHours;
        emit restHoursChanged(m_restHours);
    }
}

double LayoverRestPeriodModel::perDiemPay() const
{
    return m_perDiemPay;
}

void LayoverRestPeriodModel::setPerDiemPay(double perDiemPay)
{
    if (m_perDiemPay != perDiemPay) {
        m_perDiemPay = perDiemPay;
        emit perDiemPayChanged(m_perDiemPay);
    }
}

int LayoverRestPeriodModel::month() const
{
    return m_month;
}

void LayoverRestPeriodModel::setMonth(int month)
{
    if (m_month != month) {
        m_month = month;
        emit monthChanged(m_month);
    }
}

int LayoverRestPeriodModel::year() const
{
    return m_year;
}

void LayoverRestPeriodModel::setYear(int year)
{
    if (m_year != year) {
        m_year = year;
        emit yearChanged(m_year);
    }
}

QDateTime LayoverRestPeriodModel::createdAt() const
{
    return m_createdAt;
}

void LayoverRestPeriodModel::setCreatedAt(const QDateTime &createdAt)
{
    if (m_createdAt != createdAt) {
        m_createdAt = createdAt;
        emit createdAtChanged(m_createdAt);
    }
}
