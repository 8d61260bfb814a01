#ifndef CSVROSTERREADER_H
#define CSVROSTERREADER_H

#include <QByteArray>
#include <QString>
#include "RosterGrid.h"

/**
 * @brief Reads comma-separated roster exports into a RosterGrid
 *
 * Quoted fields may contain commas, doubled quotes and line breaks. A UTF-8
 * byte order mark is skipped.
 */
class CsvRosterReader {
public:
    bool read(const QByteArray& content, RosterGrid& grid);

    QString lastError() const { return m_lastError; }

    // Number of physical, non-empty text lines (used for the minimum size check)
    static int countLines(const QByteArray& content);

private:
    QString m_lastError;
};

#endif // CSVROSTERREADER_H
