#include "MonthlyCalculationModel.h"

MonthlyCalculationModel::MonthlyCalculationModel(QObject *parent)
    : QObject(parent)
{
    m_createdAt = QDateTime::currentDateTimeUtc();
    m_updatedAt = QDateTime::currentDateTimeUtc();
}

QUuid MonthlyCalculationModel::id() const
{
    return m_id;
}

void MonthlyCalculationModel::setId(const QUuid &id)
{
    if (m_id != id) {
        m_id = id;
        emit idChanged(m_id);
    }
}

QUuid MonthlyCalculationModel::userId() const
{
    return m_userId;
}

void MonthlyCalculationModel::setUserId(const QUuid &userId)
{
    if (m_userId != userId) {
        m_userId = userId;
        emit userIdChanged(m_userId);
    }
}

int MonthlyCalculationModel::month() const
{
    return m_month;
}

void MonthlyCalculationModel::setMonth(int month)
{
    if (m_month != month) {
        m_month = month;
        emit monthChanged(m_month);
    }
}

int MonthlyCalculationModel::year() const
{
    return m_year;
}

void MonthlyCalculationModel::setYear(int year)
{
    if (m_year != year) {
        m_year = year;
        emit yearChanged(m_year);
    }
}

double MonthlyCalculationModel::basicSalary() const
{
    return m_basicSalary;
}

void MonthlyCalculationModel::setBasicSalary(double basicSalary)
{
    if (m_basicSalary != basicSalary) {
        m_basicSalary = basicSalary;
        emit basicSalaryChanged(m_basicSalary);
    }
}

double MonthlyCalculationModel::housingAllowance() const
{
    return m_housingAllowance;
}

void MonthlyCalculationModel::setHousingAllowance(double housingAllowance)
{
    if (m_housingAllowance != housingAllowance) {
        m_housingAllowance = housingAllowance;
        emit housingAllowanceChanged(m_housingAllowance);
    }
}

double MonthlyCalculationModel::transportAllowance() const
{
    return m_transportAllowance;
}

void MonthlyCalculationModel::setTransportAllowance(double transportAllowance)
{
    if (m_transportAllowance != transportAllowance) {
        m_transportAllowance = transportAllowance;
        emit transportAllowanceChanged(m_transportAllowance);
    }
}

double MonthlyCalculationModel::totalDutyHours() const
{
    return m_totalDutyHours;
}

void MonthlyCalculationModel::setTotalDutyHours(double totalDutyHours)
{
    if (m_totalDutyHours != totalDutyHours) {
        m_totalDutyHours = totalDutyHours;
        emit totalDutyHoursChanged(m_totalDutyHours);
    }
}

double MonthlyCalculationModel::flightPay() const
{
    return m_flightPay;
}

void MonthlyCalculationModel::setFlightPay(double flightPay)
{
    if (m_flightPay != flightPay) {
        m_flightPay = flightPay;
        emit flightPayChanged(m_flightPay);
    }
}

double MonthlyCalculationModel::totalRestHours() const
{
    return m_totalRestHours;
}

void MonthlyCalculationModel::setTotalRestHours(double totalRestHours)
{
    if (m_totalRestHours != totalRestHours) {
        m_totalRestHours = totalRestHours;
        emit totalRestHoursChanged(m_totalRestHours);
    }
}

double MonthlyCalculationModel::perDiemPay() const
{
    return m_perDiemPay;
}

void MonthlyCalculationModel::setPerDiemPay(double perDiemPay)
{
    if (m_perDiemPay != perDiemPay) {
        m_perDiemPay = perDiemPay;
        emit perDiemPayChanged(m_perDiemPay);
    }
}

int MonthlyCalculationModel::asbyCount() const
{
    return m_asbyCount;
}

void MonthlyCalculationModel::setAsbyCount(int asbyCount)
{
    if (m_asbyCount != asbyCount) {
        m_asbyCount = asbyCount;
        emit asbyCountChanged(m_asbyCount);
    }
}

double MonthlyCalculationModel::asbyPay() const
{
    return m_asbyPay;
}

void MonthlyCalculationModel::setAsbyPay(double asbyPay)
{
    if (m_asbyPay != asbyPay) {
        m_asbyPay = asbyPay;
        emit asbyPayChanged(m_asbyPay);
    }
}

double MonthlyCalculationModel::totalFixed() const
{
    return m_totalFixed;
}

void MonthlyCalculationModel::setTotalFixed(double totalFixed)
{
    if (m_totalFixed != totalFixed) {
        m_totalFixed = totalFixed;
        emit totalFixedChanged(m_totalFixed);
    }
}

double MonthlyCalculationModel::totalVariable() const
{
    return m_totalVariable;
}

void MonthlyCalculationModel::setTotalVariable(double totalVariable)
{
    if (m_totalVariable != totalVariable) {
        m_totalVariable = totalVariable;
        emit totalVariableChanged(m_totalVariable);
    }
}

double MonthlyCalculationModel::totalSalary() const
{
    return m_totalSalary;
}

void MonthlyCalculationModel::setTotalSalary(double totalSalary)
{
    if (m_totalSalary != totalSalary) {
        m_totalSalary = totalSalary;
        emit totalSalaryChanged(m_totalSalary);
    }
}

QDateTime MonthlyCalculationModel::createdAt() const
{
    return m_createdAt;
}

void MonthlyCalculationModel::setCreatedAt(const QDateTime &createdAt)
{
    if (m_createdAt != createdAt) {
        m_createdAt = createdAt;
        emit createdAtChanged(m_createdAt);
    }
}

QDateTime MonthlyCalculationModel::updatedAt() const
{
    return m_updatedAt;
}

void MonthlyCalculationModel::setUpdatedAt(const QDateTime &updatedAt)
{
    if (m_updatedAt != updatedAt) {
        m_updatedAt = updatedAt;
        emit updatedAtChanged(m_updatedAt);
    }
}
