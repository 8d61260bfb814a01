#ifndef LAYOVERPAIRER_H
#define LAYOVERPAIRER_H

#include <QDateTime>
#include <QList>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include "Models/FlightDutyModel.h"

struct LayoverPair {
    QSharedPointer<FlightDutyModel> outbound;
    QSharedPointer<FlightDutyModel> inbound;
    QString destination;
    QDateTime restStart;
    QDateTime restEnd;
    double restHours = 0.0;
};

struct PairingResult {
    QList<LayoverPair> pairs;
    // Outbound legs with no inbound leg inside the pairing window
    QList<QSharedPointer<FlightDutyModel>> unpaired;
    QStringList warnings;
};

/**
 * @brief Links outbound and inbound layover legs and measures the rest between them
 *
 * Layover duties are processed in date order. An outbound leg departs the
 * home base; its partner is the earliest later layover leg that returns to
 * the home base from the same station within maxPairingDays. Each inbound leg
 * is used at most once. Only positive rest durations form a pair.
 *
 * Duties later than the month being calculated may be passed in as inbound
 * candidates; only outbound legs of the month itself are paired.
 */
class LayoverPairer {
public:
    explicit LayoverPairer(const QString& homeBase = "DXB", int maxPairingDays = 5);

    /**
     * @param duties Duties of the month, plus optional inbound candidates
     * @param month Month whose outbound legs are paired; 0 pairs every outbound leg
     * @param year Year of that month
     */
    PairingResult pair(const QList<QSharedPointer<FlightDutyModel>>& duties, int month = 0, int year = 0) const;

    bool isOutbound(const FlightDutyModel& duty) const;
    bool isInbound(const FlightDutyModel& duty) const;

    // The non-home airport of the first sector
    QString destinationOf(const FlightDutyModel& duty) const;

    static double restHoursBetween(const FlightDutyModel& outbound, const FlightDutyModel& inbound);

private:
    QString m_homeBase;
    int m_maxPairingDays;
};

#endif // LAYOVERPAIRER_H
