#include "DutyClassifier.h"

#include <QRegularExpression>

using DutyTypes::DutyType;

namespace {

bool containsWord(const QString& text, const QString& pattern)
{
    const QRegularExpression expression(QString("\\b(?:%1)\\b").arg(pattern),
                                        QRegularExpression::CaseInsensitiveOption);
    return expression.match(text).hasMatch();
}

}

DutyClassifier::DutyClassifier(const QString& homeBase)
    : m_homeBase(homeBase.trimmed().toUpper())
{
    buildRules();
}

void DutyClassifier::buildRules()
{
    // Order matters, ASBY must be tested before the SBY rule
    m_rules.append(Rule{
        "airport-standby",
        [](const RuleContext& c) { return containsWord(c.duties, "ASBY|XSBY"); },
        [](const DutyClassifier&, const RuleContext&) { return keywordResult(DutyType::Asby, "Airport standby duty detected"); }
    });

    m_rules.append(Rule{
        "home-standby",
        [](const RuleContext& c) { return containsWord(c.duties, "SBY"); },
        [](const DutyClassifier&, const RuleContext&) { return keywordResult(DutyType::Sby, "Home standby duty detected"); }
    });

    m_rules.append(Rule{
        "business-promotion",
        [](const RuleContext& c) { return containsWord(c.combined, "BUSINESS\\s+PROMOTION|PROMO"); },
        [](const DutyClassifier&, const RuleContext&) { return keywordResult(DutyType::BusinessPromotion, "Business promotion duty detected"); }
    });

    m_rules.append(Rule{
        "recurrent-training",
        [](const RuleContext& c) {
            return containsWord(c.duties, "RECURRENT|TRAINING|IFX|CSR|RTC|ELD|SEPR|GS");
        },
        [](const DutyClassifier&, const RuleContext& c) {
            ClassificationResult result = keywordResult(DutyType::Recurrent, "Recurrent training duty detected");
            if (isElearningDay(c.duties)) {
                result.reasoning = "E-learning day (ELD) detected, unpaid recurrent training";
            }
            return result;
        }
    });

    m_rules.append(Rule{
        "annual-leave",
        [](const RuleContext& c) { return containsWord(c.duties, "ANNUAL\\s+LEAVE|AL|LEAVE"); },
        [](const DutyClassifier&, const RuleContext&) { return keywordResult(DutyType::AnnualLeave, "Annual leave detected"); }
    });

    m_rules.append(Rule{
        "rest-or-off",
        [](const RuleContext& c) {
            return isNonDutyCalendarEntry(c.duties) && c.flightNumbers.isEmpty();
        },
        [](const DutyClassifier&, const RuleContext&) { return keywordResult(DutyType::Off, "Day off detected"); }
    });

    m_rules.append(Rule{
        "rest",
        [](const RuleContext& c) { return containsWord(c.duties, "REST") && c.flightNumbers.isEmpty(); },
        [](const DutyClassifier&, const RuleContext&) { return keywordResult(DutyType::Rest, "Rest period detected"); }
    });

    m_rules.append(Rule{
        "flights",
        [](const RuleContext& c) { return !c.flightNumbers.isEmpty(); },
        [](const DutyClassifier& self, const RuleContext& c) { return self.classifyFlights(c); }
    });
}

ClassificationResult DutyClassifier::keywordResult(DutyType type, const QString& reasoning)
{
    ClassificationResult result;
    result.dutyType = type;
    result.confidence = 1.0;
    result.reasoning = reasoning;
    return result;
}

ClassificationResult DutyClassifier::classify(const QString& duties, const QString& details) const
{
    RuleContext context;
    context.duties = duties.trimmed().toUpper();
    context.details = details.trimmed().toUpper();
    context.combined = context.duties + "\n" + context.details;
    context.flightNumbers = extractFlightNumbers(context.duties);
    context.sectors = extractSectors(context.details);
    if (context.sectors.isEmpty()) {
        context.sectors = extractSectors(context.duties);
    }

    for (const Rule& rule : m_rules) {
        if (rule.matches(context)) {
            ClassificationResult result = rule.build(*this, context);
            result.flightNumbers = context.flightNumbers;
            result.sectors = context.sectors;
            return result;
        }
    }

    ClassificationResult result;
    result.dutyType = DutyType::Unknown;
    result.confidence = 0.3;
    result.reasoning = "No duty keyword or flight number found";
    result.warnings.append("Could not detect flight numbers in duties column");
    result.sectors = context.sectors;
    return result;
}

ClassificationResult DutyClassifier::classifyFlights(const RuleContext& context) const
{
    ClassificationResult result;

    if (context.flightNumbers.size() > 1) {
        result.dutyType = DutyType::Turnaround;

        const bool returnsHome = !context.sectors.isEmpty()
            && sectorAirports(context.sectors.last()).value(1) == m_homeBase;

        if (context.sectors.size() > 1 && (returnsHome || isTurnaroundSequence(context.sectors))) {
            result.confidence = 0.9;
            result.reasoning = QString("%1 flights returning to %2 on the same day")
                                   .arg(context.flightNumbers.size())
                                   .arg(m_homeBase);
        } else {
            result.confidence = 0.7;
            result.reasoning = QString("%1 flights on the same day").arg(context.flightNumbers.size());
            result.warnings.append(QString("Could not confirm return to %1 - verify turnaround classification")
                                       .arg(m_homeBase));
        }
        return result;
    }

    // One flight: one leg of a layover pair, matched later by the pairer
    result.dutyType = DutyType::Layover;
    result.confidence = 0.8;
    if (context.sectors.isEmpty()) {
        result.reasoning = "Single flight without sector information";
        result.warnings.append("No sector found for single-flight duty - verify layover classification");
        result.confidence = 0.6;
    } else {
        const QStringList airports = sectorAirports(context.sectors.first());
        if (airports.value(0) == m_homeBase) {
            result.reasoning = QString("Single outbound flight to %1").arg(airports.value(1));
        } else if (airports.value(1) == m_homeBase) {
            result.reasoning = QString("Single inbound flight from %1").arg(airports.value(0));
        } else {
            result.reasoning = "Single flight not touching home base";
            result.warnings.append(QString("Layover sector %1 does not touch %2").arg(context.sectors.first(), m_homeBase));
            result.confidence = 0.6;
        }
    }
    return result;
}

QStringList DutyClassifier::extractFlightNumbers(const QString& text)
{
    static const QRegularExpression pattern("\\b([A-Z]{2}\\d{3,4})\\b");

    QStringList flights;
    auto it = pattern.globalMatch(text.toUpper());
    while (it.hasNext()) {
        const QString flight = it.next().captured(1);
        if (!flights.contains(flight)) {
            flights.append(flight);
        }
    }
    return flights;
}

QStringList DutyClassifier::extractSectors(const QString& text)
{
    static const QRegularExpression pattern("\\b([A-Z]{3})\\s*-\\s*([A-Z]{3})\\b");

    QStringList sectors;
    auto it = pattern.globalMatch(text.toUpper());
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        sectors.append(match.captured(1) + "-" + match.captured(2));
    }
    return sectors;
}

bool DutyClassifier::isNonDutyCalendarEntry(const QString& duties)
{
    const QString normalized = duties.simplified().toUpper();
    if (normalized.isEmpty()) {
        return false;
    }

    static const QStringList vocabulary = {
        "DAY OFF", "REST DAY", "ADDITIONAL DAY OFF", "OFF", "*OFF", "X"
    };
    if (vocabulary.contains(normalized)) {
        return true;
    }

    return normalized.contains("DAY OFF") || normalized.contains("REST DAY");
}

bool DutyClassifier::isElearningDay(const QString& text)
{
    return text.toUpper().contains("ELD");
}

bool DutyClassifier::validateFlightNumber(const QString& flightNumber)
{
    static const QRegularExpression pattern("^FZ\\d{3,4}$");
    return pattern.match(flightNumber.trimmed().toUpper()).hasMatch();
}

bool DutyClassifier::validateSector(const QString& sector)
{
    static const QRegularExpression pattern("^[A-Z]{3}\\s*-\\s*[A-Z]{3}$");
    return pattern.match(sector.trimmed().toUpper()).hasMatch();
}

QStringList DutyClassifier::sectorAirports(const QString& sector)
{
    QStringList airports;
    const QStringList parts = sector.split('-', Qt::SkipEmptyParts);
    for (const QString& part : parts) {
        const QString airport = part.trimmed().toUpper();
        if (!airport.isEmpty()) {
            airports.append(airport);
        }
    }
    return airports;
}

bool DutyClassifier::isTurnaroundSequence(const QStringList& sectors)
{
    if (sectors.size() < 2) {
        return false;
    }

    QStringList route;
    for (int i = 0; i < sectors.size(); ++i) {
        const QStringList airports = sectorAirports(sectors.at(i));
        if (airports.size() != 2) {
            return false;
        }
        if (i == 0) {
            route.append(airports.at(0));
        } else if (route.last() != airports.at(0)) {
            return false;
        }
        route.append(airports.at(1));
    }

    return route.first() == route.last() && route.size() >= 3;
}
