#ifndef DUTYCLASSIFIER_H
#define DUTYCLASSIFIER_H

#include <QList>
#include <QString>
#include <QStringList>
#include <functional>
#include "Models/DutyTypes.h"

struct ClassificationResult {
    DutyTypes::DutyType dutyType = DutyTypes::DutyType::Unknown;
    double confidence = 0.0;
    QString reasoning;
    QStringList warnings;
    QStringList flightNumbers;
    // "DXB-KHI" style, spaces removed
    QStringList sectors;
};

/**
 * @brief Maps the duties/details text of one roster row to a duty type
 *
 * Rules are evaluated in priority order and the first match wins: the fixed
 * keyword vocabulary first (standby, airport standby, training, business
 * promotion, rest and leave), then flight number and sector extraction. A
 * low-confidence result is still a usable best guess; ambiguity only adds
 * warnings.
 */
class DutyClassifier {
public:
    explicit DutyClassifier(const QString& homeBase = "DXB");

    ClassificationResult classify(const QString& duties, const QString& details = QString()) const;

    QString homeBase() const { return m_homeBase; }

    static QStringList extractFlightNumbers(const QString& text);
    static QStringList extractSectors(const QString& text);

    // "DAY OFF", "REST DAY", "ADDITIONAL DAY OFF", "OFF", "*OFF", "X"
    static bool isNonDutyCalendarEntry(const QString& duties);

    // ELD (e-learning day) is unpaid recurrent training
    static bool isElearningDay(const QString& text);

    static bool validateFlightNumber(const QString& flightNumber);
    static bool validateSector(const QString& sector);

    // Consecutive sectors chain and the last one returns to the first departure airport
    static bool isTurnaroundSequence(const QStringList& sectors);

    // Airports of "DXB-KHI" or "DXB - KHI"
    static QStringList sectorAirports(const QString& sector);

private:
    struct RuleContext {
        QString duties;
        QString details;
        QString combined;
        QStringList flightNumbers;
        QStringList sectors;
    };

    struct Rule {
        QString name;
        std::function<bool(const RuleContext&)> matches;
        std::function<ClassificationResult(const DutyClassifier&, const RuleContext&)> build;
    };

    void buildRules();
    ClassificationResult classifyFlights(const RuleContext& context) const;
    static ClassificationResult keywordResult(DutyTypes::DutyType type, const QString& reasoning);

    QString m_homeBase;
    QList<Rule> m_rules;
};

#endif // DUTYCLASSIFIER_H
