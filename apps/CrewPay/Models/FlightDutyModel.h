#ifndef FLIGHTDUTYMODEL_H
#define FLIGHTDUTYMODEL_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <QDate>
#include <QTime>
#include <QDateTime>
#include <QJsonObject>
#include "DutyTypes.h"

class FlightDutyModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QUuid id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(QUuid userId READ userId WRITE setUserId NOTIFY userIdChanged)
    Q_PROPERTY(QDate date READ date WRITE setDate NOTIFY dateChanged)
    Q_PROPERTY(int month READ month WRITE setMonth NOTIFY monthChanged)
    Q_PROPERTY(int year READ year WRITE setYear NOTIFY yearChanged)
    Q_PROPERTY(QStringList flightNumbers READ flightNumbers WRITE setFlightNumbers NOTIFY flightNumbersChanged)
    Q_PROPERTY(QStringList sectors READ sectors WRITE setSectors NOTIFY sectorsChanged)
    Q_PROPERTY(DutyTypes::DutyType dutyType READ dutyType WRITE setDutyType NOTIFY dutyTypeChanged)
    Q_PROPERTY(QTime reportTime READ reportTime WRITE setReportTime NOTIFY reportTimeChanged)
    Q_PROPERTY(QTime debriefTime READ debriefTime WRITE setDebriefTime NOTIFY debriefTimeChanged)
    Q_PROPERTY(bool isCrossDay READ isCrossDay WRITE setIsCrossDay NOTIFY isCrossDayChanged)
    Q_PROPERTY(double dutyHours READ dutyHours WRITE setDutyHours NOTIFY dutyHoursChanged)
    Q_PROPERTY(double flightPay READ flightPay WRITE setFlightPay NOTIFY flightPayChanged)
    Q_PROPERTY(DutyTypes::DataSource dataSource READ dataSource WRITE setDataSource NOTIFY dataSourceChanged)
    Q_PROPERTY(QJsonObject originalData READ originalData WRITE setOriginalData NOTIFY originalDataChanged)
    Q_PROPERTY(QDateTime lastEditedAt READ lastEditedAt WRITE setLastEditedAt NOTIFY lastEditedAtChanged)
    Q_PROPERTY(QUuid lastEditedBy READ lastEditedBy WRITE setLastEditedBy NOTIFY lastEditedByChanged)
    Q_PROPERTY(QDateTime createdAt READ createdAt WRITE setCreatedAt NOTIFY createdAtChanged)
    Q_PROPERTY(QDateTime updatedAt READ updatedAt WRITE setUpdatedAt NOTIFY updatedAtChanged)

public:
    explicit FlightDutyModel(QObject *parent = nullptr);

    QUuid id() const;
    void setId(const QUuid &id);

    QUuid userId() const;
    void setUserId(const QUuid &userId);

    QDate date() const;
    void setDate(const QDate &date);

    int month() const;
    void setMonth(int month);

    int year() const;
    void setYear(int year);

    QStringList flightNumbers() const;
    void setFlightNumbers(const QStringList &flightNumbers);

    QStringList sectors() const;
    void setSectors(const QStringList &sectors);

    DutyTypes::DutyType dutyType() const;
    void setDutyType(DutyTypes::DutyType dutyType);

    QTime reportTime() const;
    void setReportTime(const QTime &reportTime);

    QTime debriefTime() const;
    void setDebriefTime(const QTime &debriefTime);

    bool isCrossDay() const;
    void setIsCrossDay(bool isCrossDay);

    double dutyHours() const;
    void setDutyHours(double dutyHours);

    double flightPay() const;
    void setFlightPay(double flightPay);

    DutyTypes::DataSource dataSource() const;
    void setDataSource(DutyTypes::DataSource dataSource);

    QJsonObject originalData() const;
    void setOriginalData(const QJsonObject &originalData);

    QDateTime lastEditedAt() const;
    void setLastEditedAt(const QDateTime &lastEditedAt);

    QUuid lastEditedBy() const;
    void setLastEditedBy(const QUuid &lastEditedBy);

    QDateTime createdAt() const;
    void setCreatedAt(const QDateTime &createdAt);

    QDateTime updatedAt() const;
    void setUpdatedAt(const QDateTime &updatedAt);

    // Helper methods
    QDateTime reportDateTime() const;
    // Debrief falls on the next calendar day when isCrossDay is set
    QDateTime debriefDateTime() const;
    bool isEdited() const;

signals:
    void idChanged(const QUuid &id);
    void userIdChanged(const QUuid &userId);
    void dateChanged(const QDate &date);
    void monthChanged(int month);
    void yearChanged(int year);
    void flightNumbersChanged(const QStringList &flightNumbers);
    void sectorsChanged(const QStringList &sectors);
    void dutyTypeChanged(DutyTypes::DutyType dutyType);
    void reportTimeChanged(const QTime &reportTime);
    void debriefTimeChanged(const QTime &debriefTime);
    void isCrossDayChanged(bool isCrossDay);
    void dutyHoursChanged(double dutyHours);
    void flightPayChanged(double flightPay);
    void dataSourceChanged(DutyTypes::DataSource dataSource);
    void originalDataChanged(const QJsonObject &originalData);
    void lastEditedAtChanged(const QDateTime &lastEditedAt);
    void lastEditedByChanged(const QUuid &lastEditedBy);
    void createdAtChanged(const QDateTime &createdAt);
    void updatedAtChanged(const QDateTime &updatedAt);

private:
    QUuid m_id;
    QUuid m_userId;
    QDate m_date;
    int m_month = 0;
    int m_year = 0;
    QStringList m_flightNumbers;
    QStringList m_sectors;
    DutyTypes::DutyType m_dutyType = DutyTypes::DutyType::Unknown;
    QTime m_reportTime;
    QTime m_debriefTime;
    bool m_isCrossDay = false;
    double m_dutyHours = 0.0;
    double m_flightPay = 0.0;
    DutyTypes::DataSource m_dataSource = DutyTypes::DataSource::Manual;
    QJsonObject m_originalData;
    QDateTime m_lastEditedAt;
    QUuid m_lastEditedBy;
    QDateTime m_createdAt;
    QDateTime m_updatedAt;
};

#endif // FLIGHTDUTYMODEL_H
