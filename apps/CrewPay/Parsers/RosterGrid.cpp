#include "RosterGrid.h"

#include <QRegularExpression>

void RosterGrid::appendRow(const QStringList& cells)
{
    m_rows.append(cells);
}

void RosterGrid::setCell(int row, int column, const QString& value)
{
    if (row < 0 || column < 0) {
        return;
    }

    while (m_rows.size() <= row) {
        m_rows.append(QStringList());
    }

    QStringList& cells = m_rows[row];
    while (cells.size() <= column) {
        cells.append(QString());
    }
    cells[column] = value;
}

int RosterGrid::columnCount(int row) const
{
    return (row >= 0 && row < m_rows.size()) ? m_rows.at(row).size() : 0;
}

int RosterGrid::maxColumnCount() const
{
    int count = 0;
    for (const QStringList& cells : m_rows) {
        count = qMax(count, static_cast<int>(cells.size()));
    }
    return count;
}

QString RosterGrid::cell(int row, int column) const
{
    if (row < 0 || row >= m_rows.size() || column < 0) {
        return QString();
    }
    return m_rows.at(row).value(column);
}

QStringList RosterGrid::row(int row) const
{
    return m_rows.value(row);
}

bool RosterGrid::isRowBlank(int row) const
{
    const QStringList cells = m_rows.value(row);
    for (const QString& value : cells) {
        if (!value.trimmed().isEmpty()) {
            return false;
        }
    }
    return true;
}

QString RosterGrid::firstNonEmpty(int row, int fromColumn) const
{
    const int count = columnCount(row);
    for (int column = qMax(0, fromColumn); column < count; ++column) {
        const QString value = cell(row, column).trimmed();
        if (!value.isEmpty()) {
            return value;
        }
    }
    return QString();
}

int RosterGrid::columnIndex(const QString& letters)
{
    const QString normalized = letters.trimmed().toUpper();
    if (normalized.isEmpty()) {
        return -1;
    }

    int index = 0;
    for (const QChar ch : normalized) {
        if (ch < QChar('A') || ch > QChar('Z')) {
            return -1;
        }
        index = index * 26 + (ch.unicode() - 'A' + 1);
    }
    return index - 1;
}

bool RosterGrid::parseCellReference(const QString& reference, int& row, int& column)
{
    static const QRegularExpression pattern("^([A-Za-z]+)(\\d+)$");
    const QRegularExpressionMatch match = pattern.match(reference.trimmed());
    if (!match.hasMatch()) {
        return false;
    }

    column = columnIndex(match.captured(1));
    row = match.captured(2).toInt() - 1;
    return column >= 0 && row >= 0;
}
