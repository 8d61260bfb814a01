#include "TimeParser.h"

#include <QRegularExpression>
#include <cmath>

namespace {

const QString kSuperscriptDayOffsets = QString::fromUtf8("¹²³⁴⁵⁶⁷⁸⁹");
const QString kStrippedMarkers = QString::fromUtf8("⁰⁺?♦◆*") + QChar(0xFFFD);

int minutesFromFraction(double dayFraction)
{
    return static_cast<int>(std::lround(dayFraction * 24.0 * 60.0)) % (24 * 60);
}

}

QString TimeValue::toString() const
{
    return TimeParser::formatTime(*this);
}

TimeValue TimeValue::fromMinutes(int minutesOfDay, bool crossDay)
{
    const int normalized = ((minutesOfDay % 1440) + 1440) % 1440;

    TimeValue value;
    value.hours = normalized / 60;
    value.minutes = normalized % 60;
    value.totalMinutes = normalized;
    value.totalHours = normalized / 60.0;
    value.isCrossDay = crossDay;
    return value;
}

TimeValue TimeValue::fromQTime(const QTime& time, bool crossDay)
{
    return fromMinutes(time.hour() * 60 + time.minute(), crossDay);
}

TimeFormatError::TimeFormatError(const QString& token, int row, const QString& reason)
    : std::runtime_error(QString("Invalid time '%1'%2: %3")
                             .arg(token,
                                  row >= 0 ? QString(" in row %1").arg(row) : QString(),
                                  reason)
                             .toStdString())
    , m_token(token)
    , m_row(row)
    , m_reason(reason)
{
}

QString TimeParser::cleanToken(const QString& token, bool* crossDay)
{
    bool dayOffset = false;
    QString cleaned;
    cleaned.reserve(token.size());

    for (const QChar ch : token) {
        if (kSuperscriptDayOffsets.contains(ch)) {
            dayOffset = true;
            continue;
        }
        if (kStrippedMarkers.contains(ch)) {
            continue;
        }
        cleaned.append(ch);
    }

    if (crossDay) {
        *crossDay = dayOffset;
    }
    return cleaned.trimmed();
}

bool TimeParser::hasCrossDayMarker(const QString& token)
{
    bool crossDay = false;
    cleanToken(token, &crossDay);
    return crossDay;
}

bool TimeParser::isValidTimeFormat(const QString& token)
{
    static const QRegularExpression pattern("^([0-1]?[0-9]|2[0-3]):([0-5][0-9])$");
    return pattern.match(token.trimmed()).hasMatch();
}

TimeValue TimeParser::parse(const QString& token, int row)
{
    if (token.trimmed().isEmpty()) {
        throw TimeFormatError(token, row, "empty time value");
    }

    bool crossDay = false;
    const QString cleaned = cleanToken(token, &crossDay);

    static const QRegularExpression exact("^([0-1]?[0-9]|2[0-3]):([0-5][0-9])$");
    QRegularExpressionMatch match = exact.match(cleaned);

    if (!match.hasMatch()) {
        // Fall back to the first HH:MM embedded in the cell, e.g. "05:45 (L)"
        static const QRegularExpression embedded("(?:^|[^0-9])(\\d{1,2}):(\\d{2})(?![0-9])");
        match = embedded.match(cleaned);
    }

    if (match.hasMatch()) {
        const int hours = match.captured(1).toInt();
        const int minutes = match.captured(2).toInt();
        if (hours > 23 || minutes > 59) {
            throw TimeFormatError(token, row, "hours or minutes out of range");
        }
        return TimeValue::fromMinutes(hours * 60 + minutes, crossDay);
    }

    // Spreadsheet cells without a text format carry the time as a day fraction
    bool isNumber = false;
    const double fraction = cleaned.toDouble(&isNumber);
    if (isNumber && fraction >= 0.0 && fraction < 1.0 && cleaned.contains('.')) {
        return TimeValue::fromMinutes(minutesFromFraction(fraction), crossDay);
    }

    throw TimeFormatError(token, row, "no HH:MM value found");
}

std::optional<TimeValue> TimeParser::tryParse(const QString& token, QString* error)
{
    try {
        return parse(token);
    } catch (const TimeFormatError& e) {
        if (error) {
            *error = QString::fromStdString(e.what());
        }
        return std::nullopt;
    }
}

bool TimeParser::impliesOvernight(const TimeValue& start, const TimeValue& end, bool crossDay)
{
    return !crossDay && end.totalMinutes <= start.totalMinutes;
}

int TimeParser::calculateDurationMinutes(const TimeValue& start, const TimeValue& end, bool crossDay)
{
    int minutes = end.totalMinutes - start.totalMinutes;

    if (crossDay) {
        minutes += 24 * 60;
    } else if (minutes <= 0) {
        minutes += 24 * 60;
    }

    return minutes;
}

double TimeParser::calculateDuration(const TimeValue& start, const TimeValue& end, bool crossDay)
{
    return calculateDurationMinutes(start, end, crossDay) / 60.0;
}

double TimeParser::calculateRestPeriod(const TimeValue& debrief, bool debriefCrossDay,
                                       const TimeValue& report, int daysBetween)
{
    const int debriefMinutes = debrief.totalMinutes + (debriefCrossDay ? 24 * 60 : 0);
    const int reportMinutes = report.totalMinutes + daysBetween * 24 * 60;
    return (reportMinutes - debriefMinutes) / 60.0;
}

QString TimeParser::formatTime(const TimeValue& value)
{
    return QString("%1:%2")
        .arg(value.hours, 2, 10, QChar('0'))
        .arg(value.minutes, 2, 10, QChar('0'));
}

QString TimeParser::formatDecimalHours(double hours)
{
    const int totalMinutes = static_cast<int>(std::lround(hours * 60.0));
    return QString("%1:%2")
        .arg(totalMinutes / 60)
        .arg(totalMinutes % 60, 2, 10, QChar('0'));
}
