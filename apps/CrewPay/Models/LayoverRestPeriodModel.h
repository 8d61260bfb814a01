#ifndef LAYOVERRESTPERIODMODEL_H
#define LAYOVERRESTPERIODMODEL_H

#include <QObject>
#include <QUuid>
#include <QDateTime>

class LayoverRestPeriodModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QUuid id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(QUuid userId READ userId WRITE setUserId NOTIFY userIdChanged)
    Q_PROPERTY(QUuid outboundFlightId READ outboundFlightId WRITE setOutboundFlightId NOTIFY outboundFlightIdChanged)
    Q_PROPERTY(QUuid inboundFlightId READ inboundFlightId WRITE setInboundFlightId NOTIFY inboundFlightIdChanged)
    Q_PROPERTY(QDateTime restStartTime READ restStartTime WRITE setRestStartTime NOTIFY restStartTimeChanged)
    Q_PROPERTY(QDateTime restEndTime READ restEndTime WRITE setRestEndTime NOTIFY restEndTimeChanged)
    Q_PROPERTY(double restHours READ restHours WRITE setRestHours NOTIFY restHoursChanged)
    Q_PROPERTY(double perDiemPay READ perDiemPay WRITE setPerDiemPay NOTIFY perDiemPayChanged)
    Q_PROPERTY(int month READ month WRITE setMonth NOTIFY monthChanged)
    Q_PROPERTY(int year READ year WRITE setYear NOTIFY yearChanged)
    Q_PROPERTY(QDateTime createdAt READ createdAt WRITE setCreatedAt NOTIFY createdAtChanged)

public:
    explicit LayoverRestPeriodModel(QObject *parent = nullptr);

    QUuid id() const;
    void setId(const QUuid &id);

    QUuid userId() const;
    void setUserId(const QUuid &userId);

    QUuid outboundFlightId() const;
    void setOutboundFlightId(const QUuid &outboundFlightId);

    QUuid inboundFlightId() const;
    void setInboundFlightId(const QUuid &inboundFlightId);

    QDateTime restStartTime() const;
    void setRestStartTime(const QDateTime &restStartTime);

    QDateTime restEndTime() const;
    void setRestEndTime(const QDateTime &restEndTime);

    double restHours() const;
    void setRestHours(double restHours);

    double perDiemPay() const;
    void setPerDiemPay(double perDiemPay);

    int month() const;
    void setMonth(int month);

    int year() const;
    void setYear(int year);

    QDateTime createdAt() const;
    void setCreatedAt(const QDateTime &createdAt);

signals:
    void idChanged(const QUuid &id);
    void userIdChanged(const QUuid &userId);
    void outboundFlightIdChanged(const QUuid &outboundFlightId);
    void inboundFlightIdChanged(const QUuid &inboundFlightId);
    void restStartTimeChanged(const QDateTime &restStartTime);
    void restEndTimeChanged(const QDateTime &restEndTime);
    void restHoursChanged(double restHours);
    void perDiemPayChanged(double perDiemPay);
    void monthChanged(int month);
    void yearChanged(int year);
    void createdAtChanged(const QDateTime &createdAt);

private:
    QUuid m_id;
    QUuid m_userId;
    QUuid m_outboundFlightId;
    QUuid m_inboundFlightId;
    QDateTime m_restStartTime;
    QDateTime m_restEndTime;
    double m_restHours = 0.0;
    double m_perDiemPay = 0.0;
    int m_month = 0;
    int m_year = 0;
    QDateTime m_createdAt;
};

#endif // LAYOVERRESTPERIODMODEL_H
