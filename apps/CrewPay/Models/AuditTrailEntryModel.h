#ifndef AUDITTRAILENTRYMODEL_H
#define AUDITTRAILENTRYMODEL_H

#include <QObject>
#include <QString>
#include <QUuid>
#include <QDateTime>
#include <QJsonObject>
#include "DutyTypes.h"

class AuditTrailEntryModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QUuid id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(QUuid flightId READ flightId WRITE setFlightId NOTIFY flightIdChanged)
    Q_PROPERTY(QUuid userId READ userId WRITE setUserId NOTIFY userIdChanged)
    Q_PROPERTY(DutyTypes::AuditAction action READ action WRITE setAction NOTIFY actionChanged)
    Q_PROPERTY(QJsonObject oldData READ oldData WRITE setOldData NOTIFY oldDataChanged)
    Q_PROPERTY(QJsonObject newData READ newData WRITE setNewData NOTIFY newDataChanged)
    Q_PROPERTY(QString changeReason READ changeReason WRITE setChangeReason NOTIFY changeReasonChanged)
    Q_PROPERTY(QDateTime createdAt READ createdAt WRITE setCreatedAt NOTIFY createdAtChanged)

public:
    explicit AuditTrailEntryModel(QObject *parent = nullptr);

    QUuid id() const;
    void setId(const QUuid &id);

    QUuid flightId() const;
    void setFlightId(const QUuid &flightId);

    QUuid userId() const;
    void setUserId(const QUuid &userId);

    DutyTypes::AuditAction action() const;
    void setAction(DutyTypes::AuditAction action);

    QJsonObject oldData() const;
    void setOldData(const QJsonObject &oldData);

    QJsonObject newData() const;
    void setNewData(const QJsonObject &newData);

    QString changeReason() const;
    void setChangeReason(const QString &changeReason);

    QDateTime createdAt() const;
    void setCreatedAt(const QDateTime &createdAt);

signals:
    void idChanged(const QUuid &id);
    void flightIdChanged(const QUuid &flightId);
    void userIdChanged(const QUuid &userId);
    void actionChanged(DutyTypes::AuditAction action);
    void oldDataChanged(const QJsonObject &oldData);
    void newDataChanged(const QJsonObject &newData);
    void changeReasonChanged(const QString &changeReason);
    void createdAtChanged(const QDateTime &createdAt);

private:
    QUuid m_id;
    QUuid m_flightId;
    QUuid m_userId;
    DutyTypes::AuditAction m_action = DutyTypes::AuditAction::Created;
    QJsonObject m_oldData;
    QJsonObject m_newData;
    QString m_changeReason;
    QDateTime m_createdAt;
};

#endif // AUDITTRAILENTRYMODEL_H
