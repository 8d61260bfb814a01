#include "CsvRosterReader.h"
#include "logger/logger.h"

bool CsvRosterReader::read(const QByteArray& content, RosterGrid& grid)
{
    m_lastError.clear();

    QString text = QString::fromUtf8(content);
    if (text.startsWith(QChar(0xFEFF))) {
        text.remove(0, 1);
    }

    if (text.trimmed().isEmpty()) {
        m_lastError = "CSV content is empty";
        return false;
    }

    QStringList row;
    QString field;
    bool inQuotes = false;

    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);

        if (inQuotes) {
            if (ch == '"') {
                if (i + 1 < text.size() && text.at(i + 1) == '"') {
                    field.append('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field.append(ch);
            }
            continue;
        }

        if (ch == '"') {
            inQuotes = true;
        } else if (ch == ',') {
            row.append(field.trimmed());
            field.clear();
        } else if (ch == '\r') {
            // Handled by the following '\n'; a lone '\r' also ends the row
            if (i + 1 >= text.size() || text.at(i + 1) != '\n') {
                row.append(field.trimmed());
                grid.appendRow(row);
                row.clear();
                field.clear();
            }
        } else if (ch == '\n') {
            row.append(field.trimmed());
            grid.appendRow(row);
            row.clear();
            field.clear();
        } else {
            field.append(ch);
        }
    }

    if (inQuotes) {
        LOG_WARNING("CSV ends inside a quoted field, closing it");
    }

    if (!field.isEmpty() || !row.isEmpty()) {
        row.append(field.trimmed());
        grid.appendRow(row);
    }

    LOG_DEBUG(QString("Read %1 CSV rows").arg(grid.rowCount()));
    return true;
}

int CsvRosterReader::countLines(const QByteArray& content)
{
    int lines = 0;
    const QList<QByteArray> parts = content.split('\n');
    for (const QByteArray& part : parts) {
        if (!part.trimmed().isEmpty()) {
            ++lines;
        }
    }
    return lines;
}
