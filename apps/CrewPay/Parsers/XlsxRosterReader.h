#ifndef XLSXROSTERREADER_H
#define XLSXROSTERREADER_H

#include <QByteArray>
#include <QString>
#include <QStringList>
#include "RosterGrid.h"

/**
 * @brief Reads the first worksheet of an .xlsx/.xlsm workbook into a RosterGrid
 *
 * The ZIP container is opened with miniz; workbook, relationship, shared
 * string and sheet parts are parsed with QXmlStreamReader. Cells are placed
 * by their reference so gaps left by empty cells are preserved.
 */
class XlsxRosterReader {
public:
    XlsxRosterReader();

    bool read(const QByteArray& content, RosterGrid& grid);

    // Largest uncompressed archive part that is extracted, clamped to at most 512 MB
    void setMaxPartSize(qint64 bytes);
    qint64 maxPartSize() const { return m_maxPartSize; }

    QString lastError() const { return m_lastError; }
    QString sheetName() const { return m_sheetName; }

    // True when the bytes start with the ZIP local file header signature
    static bool looksLikeZip(const QByteArray& content);

private:
    bool parseSharedStrings(const QByteArray& xml);
    QString resolveFirstSheetPath(const QByteArray& workbookXml, const QByteArray& relsXml);
    bool parseSheet(const QByteArray& xml, RosterGrid& grid);

    QStringList m_sharedStrings;
    QString m_sheetName;
    QString m_lastError;
    qint64 m_maxPartSize;
};

#endif // XLSXROSTERREADER_H
