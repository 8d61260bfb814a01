#ifndef TIMEPARSER_H
#define TIMEPARSER_H

#include <QString>
#include <QTime>
#include <optional>
#include <stdexcept>

/**
 * @brief Time of day recovered from a roster cell
 */
struct TimeValue {
    int hours = 0;
    int minutes = 0;
    int totalMinutes = 0;
    double totalHours = 0.0;
    bool isCrossDay = false;

    QTime toQTime() const { return QTime(hours, minutes); }
    QString toString() const;

    static TimeValue fromMinutes(int minutesOfDay, bool crossDay = false);
    static TimeValue fromQTime(const QTime& time, bool crossDay = false);
};

/**
 * @brief Raised when no HH:MM can be recovered from a token
 */
class TimeFormatError : public std::runtime_error {
public:
    TimeFormatError(const QString& token, int row, const QString& reason);

    QString token() const { return m_token; }
    int row() const { return m_row; }
    QString reason() const { return m_reason; }

private:
    QString m_token;
    int m_row;
    QString m_reason;
};

class TimeParser {
public:
    /**
     * @brief Parses "09:20", "05:45¹", "04:33?¹" and similar export artifacts
     *
     * Superscript digits, "⁺" and stray marker characters are removed first.
     * A superscript 1-9 marks the time as falling on the following day.
     *
     * @param token Raw cell text
     * @param row Row index reported in the error, -1 when unknown
     * @throws TimeFormatError when no valid HH:MM remains
     */
    static TimeValue parse(const QString& token, int row = -1);

    // Non-throwing variant; error receives the failure reason
    static std::optional<TimeValue> tryParse(const QString& token, QString* error = nullptr);

    // Removes marker characters; crossDay is set if a day-offset superscript was present
    static QString cleanToken(const QString& token, bool* crossDay = nullptr);

    static bool hasCrossDayMarker(const QString& token);
    static bool isValidTimeFormat(const QString& token);

    /**
     * @brief Minutes between two times of day
     *
     * 24 hours are added when crossDay is set, or when end is not after start
     * (implicit overnight). The result is therefore never negative.
     */
    static int calculateDurationMinutes(const TimeValue& start, const TimeValue& end, bool crossDay);
    static double calculateDuration(const TimeValue& start, const TimeValue& end, bool crossDay);

    // True when end <= start and no cross-day marker was given
    static bool impliesOvernight(const TimeValue& start, const TimeValue& end, bool crossDay);

    /**
     * @brief Hours between a debrief and a later report
     * @param debrief Debrief time of the outbound duty
     * @param debriefCrossDay Debrief falls on the day after the outbound duty date
     * @param report Report time of the inbound duty
     * @param daysBetween Calendar days from the outbound duty date to the inbound duty date
     */
    static double calculateRestPeriod(const TimeValue& debrief, bool debriefCrossDay,
                                      const TimeValue& report, int daysBetween);

    static QString formatTime(const TimeValue& value);
    // 8.5 -> "8:30"
    static QString formatDecimalHours(double hours);
};

#endif // TIMEPARSER_H
