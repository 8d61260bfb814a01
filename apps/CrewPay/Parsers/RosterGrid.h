#ifndef ROSTERGRID_H
#define ROSTERGRID_H

#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief Uniform row/cell view over a CSV or spreadsheet roster
 *
 * Rows may have different widths; reading outside a row yields an empty
 * string instead of failing.
 */
class RosterGrid {
public:
    void appendRow(const QStringList& cells);
    void setCell(int row, int column, const QString& value);

    int rowCount() const { return m_rows.size(); }
    int columnCount(int row) const;
    int maxColumnCount() const;

    QString cell(int row, int column) const;
    QStringList row(int row) const;
    bool isRowBlank(int row) const;

    // Text of the first non-empty cell in the row at or after column
    QString firstNonEmpty(int row, int fromColumn = 0) const;

    // "A" -> 0, "U" -> 20, "AA" -> 26; -1 for invalid input
    static int columnIndex(const QString& letters);
    // "G4" -> row 3, column 6
    static bool parseCellReference(const QString& reference, int& row, int& column);

private:
    QList<QStringList> m_rows;
};

#endif // ROSTERGRID_H
