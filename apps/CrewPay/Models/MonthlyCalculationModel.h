#ifndef MONTHLYCALCULATIONMODEL_H
#define MONTHLYCALCULATIONMODEL_H

#include <QObject>
#include <QUuid>
#include <QDateTime>

/**
 * @brief Aggregated salary for one (user, month, year)
 *
 * totalFixed = basic + housing + transport,
 * totalVariable = flightPay + perDiemPay + asbyPay,
 * totalSalary = totalFixed + totalVariable.
 */
class MonthlyCalculationModel : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QUuid id READ id WRITE setId NOTIFY idChanged)
    Q_PROPERTY(QUuid userId READ userId WRITE setUserId NOTIFY userIdChanged)
    Q_PROPERTY(int month READ month WRITE setMonth NOTIFY monthChanged)
    Q_PROPERTY(int year READ year WRITE setYear NOTIFY yearChanged)
    Q_PROPERTY(double basicSalary READ basicSalary WRITE setBasicSalary NOTIFY basicSalaryChanged)
    Q_PROPERTY(double housingAllowance READ housingAllowance WRITE setHousingAllowance NOTIFY housingAllowanceChanged)
    Q_PROPERTY(double transportAllowance READ transportAllowance WRITE setTransportAllowance NOTIFY transportAllowanceChanged)
    Q_PROPERTY(double totalDutyHours READ totalDutyHours WRITE setTotalDutyHours NOTIFY totalDutyHoursChanged)
    Q_PROPERTY(double flightPay READ flightPay WRITE setFlightPay NOTIFY flightPayChanged)
    Q_PROPERTY(double totalRestHours READ totalRestHours WRITE setTotalRestHours NOTIFY totalRestHoursChanged)
    Q_PROPERTY(double perDiemPay READ perDiemPay WRITE setPerDiemPay NOTIFY perDiemPayChanged)
    Q_PROPERTY(int asbyCount READ asbyCount WRITE setAsbyCount NOTIFY asbyCountChanged)
    Q_PROPERTY(double asbyPay READ asbyPay WRITE setAsbyPay NOTIFY asbyPayChanged)
    Q_PROPERTY(double totalFixed READ totalFixed WRITE setTotalFixed NOTIFY totalFixedChanged)
    Q_PROPERTY(double totalVariable READ totalVariable WRITE setTotalVariable NOTIFY totalVariableChanged)
    Q_PROPERTY(double totalSalary READ totalSalary WRITE setTotalSalary NOTIFY totalSalaryChanged)
    Q_PROPERTY(QDateTime createdAt READ createdAt WRITE setCreatedAt NOTIFY createdAtChanged)
    Q_PROPERTY(QDateTime updatedAt READ updatedAt WRITE setUpdatedAt NOTIFY updatedAtChanged)

public:
    explicit MonthlyCalculationModel(QObject *parent = nullptr);

    QUuid id() const;
    void setId(const QUuid &id);

    QUuid userId() const;
    void setUserId(const QUuid &userId);

    int month() const;
    void setMonth(int month);

    int year() const;
    void setYear(int year);

    double basicSalary() const;
    void setBasicSalary(double basicSalary);

    double housingAllowance() const;
    void setHousingAllowance(double housingAllowance);

    double transportAllowance() const;
    void setTransportAllowance(double transportAllowance);

    double totalDutyHours() const;
    void setTotalDutyHours(double totalDutyHours);

    double flightPay() const;
    void setFlightPay(double flightPay);

    double totalRestHours() const;
    void setTotalRestHours(double totalRestHours);

    double perDiemPay() const;
    void setPerDiemPay(double perDiemPay);

    int asbyCount() const;
    void setAsbyCount(int asbyCount);

    double asbyPay() const;
    void setAsbyPay(double asbyPay);

    double totalFixed() const;
    void setTotalFixed(double totalFixed);

    double totalVariable() const;
    void setTotalVariable(double totalVariable);

    double totalSalary() const;
    void setTotalSalary(double totalSalary);

    QDateTime createdAt() const;
    void setCreatedAt(const QDateTime &createdAt);

    QDateTime updatedAt() const;
    void setUpdatedAt(const QDateTime &updatedAt);

signals:
    void idChanged(const QUuid &id);
    void userIdChanged(const QUuid &userId);
    void monthChanged(int month);
    void yearChanged(int year);
    void basicSalaryChanged(double basicSalary);
    void housingAllowanceChanged(double housingAllowance);
    void transportAllowanceChanged(double transportAllowance);
    void totalDutyHoursChanged(double totalDutyHours);
    void flightPayChanged(double flightPay);
    void totalRestHoursChanged(double totalRestHours);
    void perDiemPayChanged(double perDiemPay);
    void asbyCountChanged(int asbyCount);
    void asbyPayChanged(double asbyPay);
    void totalFixedChanged(double totalFixed);
    void totalVariableChanged(double totalVariable);
    void totalSalaryChanged(double totalSalary);
    void createdAtChanged(const QDateTime &createdAt);
    void updatedAtChanged(const QDateTime &updatedAt);

private:
    QUuid m_id;
    QUuid m_userId;
    int m_month = 0;
    int m_year = 0;
    double m_basicSalary = 0.0;
    double m_housingAllowance = 0.0;
    double m_transportAllowance = 0.0;
    double m_totalDutyHours = 0.0;
    double m_flightPay = 0.0;
    double m_totalRestHours = 0.0;
    double m_perDiemPay = 0.0;
    int m_asbyCount = 0;
    double m_asbyPay = 0.0;
    double m_totalFixed = 0.0;
    double m_totalVariable = 0.0;
    double m_totalSalary = 0.0;
    QDateTime m_createdAt;
    QDateTime m_updatedAt;
};

#endif // MONTHLYCALCULATIONMODEL_H
