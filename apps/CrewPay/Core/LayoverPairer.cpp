#include "LayoverPairer.h"
#include "DutyClassifier.h"
#include "TimeParser.h"
#include "logger/logger.h"

#include <QSet>
#include <algorithm>

using DutyTypes::DutyType;

LayoverPairer::LayoverPairer(const QString& homeBase, int maxPairingDays)
    : m_homeBase(homeBase.trimmed().toUpper())
    , m_maxPairingDays(maxPairingDays)
{
}

bool LayoverPairer::isOutbound(const FlightDutyModel& duty) const
{
    const QStringList airports = DutyClassifier::sectorAirports(duty.sectors().value(0));
    return airports.size() >= 2 && airports.first() == m_homeBase;
}

bool LayoverPairer::isInbound(const FlightDutyModel& duty) const
{
    const QStringList airports = DutyClassifier::sectorAirports(duty.sectors().value(0));
    return airports.size() >= 2 && airports.last() == m_homeBase;
}

QString LayoverPairer::destinationOf(const FlightDutyModel& duty) const
{
    const QStringList airports = DutyClassifier::sectorAirports(duty.sectors().value(0));
    if (airports.size() < 2) {
        return QString();
    }
    return airports.first() == m_homeBase ? airports.at(1) : airports.first();
}

double LayoverPairer::restHoursBetween(const FlightDutyModel& outbound, const FlightDutyModel& inbound)
{
    return TimeParser::calculateRestPeriod(TimeValue::fromQTime(outbound.debriefTime()),
                                           outbound.isCrossDay(),
                                           TimeValue::fromQTime(inbound.reportTime()),
                                           static_cast<int>(outbound.date().daysTo(inbound.date())));
}

PairingResult LayoverPairer::pair(const QList<QSharedPointer<FlightDutyModel>>& duties, int month, int year) const
{
    PairingResult result;

    QList<QSharedPointer<FlightDutyModel>> layovers;
    for (const auto& duty : duties) {
        if (duty && duty->dutyType() == DutyType::Layover) {
            layovers.append(duty);
        }
    }

    std::stable_sort(layovers.begin(), layovers.end(),
                     [](const QSharedPointer<FlightDutyModel>& a, const QSharedPointer<FlightDutyModel>& b) {
                         return a->reportDateTime() < b->reportDateTime();
                     });

    QSet<int> usedInbound;

    for (int i = 0; i < layovers.size(); ++i) {
        const QSharedPointer<FlightDutyModel>& outbound = layovers.at(i);

        if (month > 0 && (outbound->month() != month || outbound->year() != year)) {
            continue;
        }
        if (usedInbound.contains(i) || !isOutbound(*outbound)) {
            continue;
        }

        const QString destination = destinationOf(*outbound);
        if (destination.isEmpty()) {
            result.warnings.append(QString("Could not determine destination for flight %1 on %2")
                                   .arg(outbound->flightNumbers().join(' '), outbound->date().toString(Qt::ISODate)));
            continue;
        }

        int match = -1;
        double restHours = 0.0;
        for (int j = i + 1; j < layovers.size(); ++j) {
            const QSharedPointer<FlightDutyModel>& candidate = layovers.at(j);
            if (usedInbound.contains(j) || !isInbound(*candidate) || destinationOf(*candidate) != destination) {
                continue;
            }

            const qint64 days = outbound->date().daysTo(candidate->date());
            if (days <= 0 || days > m_maxPairingDays) {
                continue;
            }

            const double candidateRest = restHoursBetween(*outbound, *candidate);
            if (candidateRest <= 0) {
                result.warnings.append(QString("Rest between %1 and %2 is not positive (%3 h); trying later flights")
                                       .arg(outbound->flightNumbers().join(' '), candidate->flightNumbers().join(' '))
                                       .arg(candidateRest));
                continue;
            }

            match = j;
            restHours = candidateRest;
            break;
        }

        if (match < 0) {
            result.unpaired.append(outbound);
            result.warnings.append(QString("No pair found for outbound flight %1 to %2 on %3")
                                   .arg(outbound->flightNumbers().join(' '), destination,
                                        outbound->date().toString(Qt::ISODate)));
            continue;
        }

        const QSharedPointer<FlightDutyModel>& inbound = layovers.at(match);
        usedInbound.insert(match);

        LayoverPair pair;
        pair.outbound = outbound;
        pair.inbound = inbound;
        pair.destination = destination;
        pair.restStart = outbound->debriefDateTime();
        pair.restEnd = inbound->reportDateTime();
        pair.restHours = restHours;
        result.pairs.append(pair);

        LOG_DEBUG(QString("Paired %1 -> %2 (%3): %4 h rest")
                  .arg(outbound->flightNumbers().join(' '), inbound->flightNumbers().join(' '), destination)
                  .arg(restHours, 0, 'f', 2));
    }

    LOG_INFO(QString("Layover pairing: %1 pairs, %2 unpaired outbound legs")
             .arg(result.pairs.size()).arg(result.unpaired.size()));
    return result;
}
