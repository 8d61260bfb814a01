#include "AuditTrailEntryModel.h"

AuditTrailEntryModel::AuditTrailEntryModel(QObject *parent)
    : QObject(parent)
{
    m_createdAt = QDateTime::currentDateTimeUtc();
}

QUuid AuditTrailEntryModel::id() const
{
    return m_id;
}

void AuditTrailEntryModel::setId(const QUuid &id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

QUuid AuditTrailEntryModel::flightId() const
{
    return m_flightId;
}

void AuditTrailEntryModel::setFlightId(const QUuid &flightId)
{
    if (m_flightId != flightId) {
        m_flightId = flightId;
        emit flightIdChanged(m_flightId);
    }
}

QUuid AuditTrailEntryModel::userId() const
{
    return m_userId;
}

void AuditTrailEntryModel::setUserId(const QUuid &userId)
{
    if (m_userId != userId) {
        m_userId = userId;
        emit userIdChanged(m_userId);
    }
}

DutyTypes::AuditAction AuditTrailEntryModel::action() const
{
    return m_action;
}

void AuditTrailEntryModel::setAction(DutyTypes::AuditAction action)
{
    if (m_action != action) {
        m_action = action;
        emit actionChanged(m_action);
    }
}

QJsonObject AuditTrailEntryModel::oldData() const
{
    return m_oldData;
}

void AuditTrailEntryModel::setOldData(const QJsonObject &oldData)
{
    if (m_oldData != oldData) {
        m_oldData = oldData;
        emit oldDataChanged(m_oldData);
    }
}

QJsonObject AuditTrailEntryModel::newData() const
{
    return m_newData;
}

void AuditTrailEntryModel::setNewData(const QJsonObject &newData)
{
    if (m_newData != newData) {
        m_newData = newData;
        emit newDataChanged(m_newData);
    }
}

QString AuditTrailEntryModel::changeReason() const
{
    return m_changeReason;
}

void AuditTrailEntryModel::setChangeReason(const QString &changeReason)
{
    if (m_changeReason != changeReason) {
        m_changeReason = changeReason;
        emit changeReasonChanged(m_changeReason);
    }
}

QDateTime AuditTrailEntryModel::createdAt() const
{
    return m_createdAt;
}

void AuditTrailEntryModel::setCreatedAt(const QDateTime &createdAt)
{
    if (m_createdAt != createdAt) {
        m_createdAt = createdAt;
        emit createdAtChanged(m_createdAt);
    }
}
