#ifndef FLIGHTDUTYBUILDER_H
#define FLIGHTDUTYBUILDER_H

#include <QList>
#include <QSharedPointer>
#include <QStringList>
#include <QUuid>
#include <optional>
#include "DutyClassifier.h"
#include "TimeParser.h"
#include "Parsers/RosterTypes.h"
#include "Models/FlightDutyModel.h"

struct DutyBuildOptions {
    QUuid userId;
    // Target month; rows of other months are dropped with a warning when filterToTargetMonth is set
    int month = 0;
    int year = 0;
    DutyTypes::DataSource dataSource = DutyTypes::DataSource::Csv;
    QString homeBase = "DXB";
    bool filterToTargetMonth = true;
    // Debrief not after report without a next-day marker: treat as overnight (true) or reject the row
    bool inferImplicitOvernight = true;
};

struct DutyBuildResult {
    QList<QSharedPointer<FlightDutyModel>> duties;
    QStringList warnings;
    int skippedRows = 0;
    int filteredRows = 0;
};

// "HH:MM - HH:MM" ranges of the actual times column, one per line
struct TrainingTimes {
    TimeValue start;
    TimeValue end;
    double totalHours = 0.0;
    bool isCrossDay = false;
};

/**
 * @brief Turns detected roster rows into flight duty models
 *
 * Each row is classified, its report and debrief tokens are parsed and the
 * duty hours are computed with cross-day correction. Multi-line cells of
 * multi-sector duties use the first report and the last debrief. Recurrent
 * training takes its hours from the actual times column and falls back to
 * 08:00-16:00.
 *
 * A row whose debrief is not after its report and carries no next-day marker
 * is treated as an overnight duty and reported with a warning. With
 * inferImplicitOvernight disabled such rows are rejected instead.
 *
 * Pay is not computed here.
 */
class FlightDutyBuilder {
public:
    explicit FlightDutyBuilder(const DutyBuildOptions& options);

    DutyBuildResult build(const QList<RosterRow>& rows) const;

    // Null when the row yields no duty; reasons are appended to warnings
    QSharedPointer<FlightDutyModel> buildDuty(const RosterRow& row, QStringList& warnings) const;

    static QString firstLine(const QString& text);
    static QString lastLine(const QString& text);

    static std::optional<TrainingTimes> parseTrainingTimes(const QString& text);

    const DutyBuildOptions& options() const { return m_options; }

private:
    bool applyTimes(FlightDutyModel* duty, const RosterRow& row, QStringList& warnings) const;
    bool applyTrainingTimes(FlightDutyModel* duty, const RosterRow& row, QStringList& warnings) const;
    QJsonObject originalData(const RosterRow& row, const ClassificationResult& classification) const;

    DutyBuildOptions m_options;
    DutyClassifier m_classifier;
};

#endif // FLIGHTDUTYBUILDER_H
