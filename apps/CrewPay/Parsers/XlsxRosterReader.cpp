#include "XlsxRosterReader.h"
#include "logger/logger.h"

#include <QXmlStreamReader>
#include <miniz.h>

namespace {

enum class EntryStatus {
    Missing,
    Extracted,
    Failed
};

/**
 * Extracts one archive member. Members whose declared uncompressed size
 * exceeds maxSize are refused before anything is inflated.
 */
EntryStatus extractEntry(mz_zip_archive* zip, const char* name, qint64 maxSize, QByteArray& bytes, QString& error)
{
    bytes.clear();
    const int index = mz_zip_reader_locate_file(zip, name, nullptr, 0);
    if (index < 0) {
        return EntryStatus::Missing;
    }

    mz_zip_archive_file_stat stat;
    if (!mz_zip_reader_file_stat(zip, static_cast<mz_uint>(index), &stat)) {
        error = QString("Cannot read '%1' in workbook: %2")
                    .arg(QString::fromUtf8(name), QString::fromUtf8(mz_zip_get_error_string(mz_zip_get_last_error(zip))));
        return EntryStatus::Failed;
    }
    if (stat.m_uncomp_size > static_cast<mz_uint64>(maxSize)) {
        error = QString("Workbook part '%1' exceeds %2 bytes uncompressed")
                    .arg(QString::fromUtf8(name)).arg(maxSize);
        return EntryStatus::Failed;
    }

    size_t size = 0;
    void* data = mz_zip_reader_extract_to_heap(zip, static_cast<mz_uint>(index), &size, 0);
    if (!data) {
        error = QString("Failed to extract '%1' from workbook: %2")
                    .arg(QString::fromUtf8(name), QString::fromUtf8(mz_zip_get_error_string(mz_zip_get_last_error(zip))));
        return EntryStatus::Failed;
    }

    // size is bounded by maxSize, which setMaxPartSize keeps below INT_MAX
    bytes = QByteArray(static_cast<const char*>(data), static_cast<int>(size));
    mz_free(data);
    return EntryStatus::Extracted;
}

QString readRichText(QXmlStreamReader& xml, const QString& containerName)
{
    // Concatenates every <t> below the container (<si> or <is>), covering rich text runs
    QString text;
    while (!xml.atEnd()) {
        xml.readNext();
        if (xml.isStartElement() && xml.name() == QLatin1String("t")) {
            text += xml.readElementText();
        } else if (xml.isEndElement() && xml.name() == containerName) {
            break;
        }
    }
    return text;
}

}

static const qint64 kDefaultMaxPartSize = 64 * 1024 * 1024;
static const qint64 kLargestMaxPartSize = 512 * 1024 * 1024;

XlsxRosterReader::XlsxRosterReader()
    : m_maxPartSize(kDefaultMaxPartSize)
{
}

void XlsxRosterReader::setMaxPartSize(qint64 bytes)
{
    m_maxPartSize = qBound(qint64(1), bytes, kLargestMaxPartSize);
}

bool XlsxRosterReader::looksLikeZip(const QByteArray& content)
{
    return content.size() >= 4 && content.startsWith(QByteArray("PK\x03\x04", 4));
}

bool XlsxRosterReader::read(const QByteArray& content, RosterGrid& grid)
{
    m_lastError.clear();
    m_sharedStrings.clear();
    m_sheetName.clear();

    if (!looksLikeZip(content)) {
        m_lastError = "File is not a valid Excel workbook";
        return false;
    }

    mz_zip_archive zip;
    mz_zip_zero_struct(&zip);
    if (!mz_zip_reader_init_mem(&zip, content.constData(), static_cast<size_t>(content.size()), 0)) {
        m_lastError = QString("Failed to open workbook archive: %1")
                          .arg(QString::fromUtf8(mz_zip_get_error_string(zip.m_last_error)));
        LOG_ERROR(m_lastError);
        return false;
    }

    bool ok = false;
    QString error;
    QByteArray sharedStrings;
    QByteArray workbook;
    QByteArray rels;
    QByteArray sheet;

    const EntryStatus sharedStatus = extractEntry(&zip, "xl/sharedStrings.xml", m_maxPartSize, sharedStrings, error);
    const EntryStatus workbookStatus = sharedStatus == EntryStatus::Failed
        ? EntryStatus::Failed
        : extractEntry(&zip, "xl/workbook.xml", m_maxPartSize, workbook, error);
    const EntryStatus relsStatus = workbookStatus == EntryStatus::Failed
        ? EntryStatus::Failed
        : extractEntry(&zip, "xl/_rels/workbook.xml.rels", m_maxPartSize, rels, error);

    if (relsStatus != EntryStatus::Failed
        && (sharedStatus == EntryStatus::Missing || parseSharedStrings(sharedStrings))) {
        QString sheetPath;
        if (workbookStatus == EntryStatus::Extracted && relsStatus == EntryStatus::Extracted) {
            sheetPath = resolveFirstSheetPath(workbook, rels);
        }
        if (sheetPath.isEmpty()) {
            sheetPath = "xl/worksheets/sheet1.xml";
        }

        const QByteArray sheetPathBytes = sheetPath.toUtf8();
        const EntryStatus sheetStatus = extractEntry(&zip, sheetPathBytes.constData(), m_maxPartSize, sheet, error);
        if (sheetStatus == EntryStatus::Missing) {
            error = QString("Workbook has no worksheet at %1").arg(sheetPath);
        } else if (sheetStatus == EntryStatus::Extracted) {
            ok = parseSheet(sheet, grid);
        }
    }

    if (!ok && !error.isEmpty()) {
        m_lastError = error;
        LOG_ERROR(m_lastError);
    }

    mz_zip_reader_end(&zip);

    if (ok) {
        LOG_DEBUG(QString("Read %1 rows from worksheet '%2'").arg(grid.rowCount()).arg(m_sheetName));
    }
    return ok;
}

bool XlsxRosterReader::parseSharedStrings(const QByteArray& xmlData)
{
    QXmlStreamReader xml(xmlData);
    while (!xml.atEnd()) {
        xml.readNext();
        if (xml.isStartElement() && xml.name() == QLatin1String("si")) {
            m_sharedStrings.append(readRichText(xml, "si"));
        }
    }

    if (xml.hasError()) {
        m_lastError = QString("Invalid shared strings part: %1").arg(xml.errorString());
        LOG_ERROR(m_lastError);
        return false;
    }
    return true;
}

QString XlsxRosterReader::resolveFirstSheetPath(const QByteArray& workbookXml, const QByteArray& relsXml)
{
    QString relationId;
    {
        QXmlStreamReader xml(workbookXml);
        while (!xml.atEnd()) {
            xml.readNext();
            if (xml.isStartElement() && xml.name() == QLatin1String("sheet")) {
                m_sheetName = xml.attributes().value("name").toString();
                // r:id lives in the relationships namespace
                for (const QXmlStreamAttribute& attribute : xml.attributes()) {
                    if (attribute.name() == QLatin1String("id")) {
                        relationId = attribute.value().toString();
                    }
                }
                break;
            }
        }
    }

    if (relationId.isEmpty()) {
        return QString();
    }

    QXmlStreamReader xml(relsXml);
    while (!xml.atEnd()) {
        xml.readNext();
        if (xml.isStartElement() && xml.name() == QLatin1String("Relationship")
            && xml.attributes().value("Id") == relationId) {
            QString target = xml.attributes().value("Target").toString();
            if (target.startsWith('/')) {
                return target.mid(1);
            }
            return "xl/" + target;
        }
    }
    return QString();
}

bool XlsxRosterReader::parseSheet(const QByteArray& xmlData, RosterGrid& grid)
{
    QXmlStreamReader xml(xmlData);

    int currentRow = -1;
    int nextColumn = 0;

    while (!xml.atEnd()) {
        xml.readNext();
        if (!xml.isStartElement()) {
            continue;
        }

        if (xml.name() == QLatin1String("row")) {
            bool ok = false;
            const int rowNumber = xml.attributes().value("r").toInt(&ok);
            currentRow = ok ? rowNumber - 1 : currentRow + 1;
            nextColumn = 0;
            continue;
        }

        if (xml.name() != QLatin1String("c")) {
            continue;
        }

        int row = currentRow;
        int column = nextColumn;
        const QString reference = xml.attributes().value("r").toString();
        if (!reference.isEmpty()) {
            RosterGrid::parseCellReference(reference, row, column);
        }
        const QString type = xml.attributes().value("t").toString();

        QString value;
        while (!xml.atEnd()) {
            xml.readNext();
            if (xml.isStartElement() && xml.name() == QLatin1String("v")) {
                value = xml.readElementText();
            } else if (xml.isStartElement() && xml.name() == QLatin1String("is")) {
                value = readRichText(xml, "is");
            } else if (xml.isEndElement() && xml.name() == QLatin1String("c")) {
                break;
            }
        }

        if (type == QLatin1String("s")) {
            bool ok = false;
            const int index = value.toInt(&ok);
            value = (ok && index >= 0 && index < m_sharedStrings.size()) ? m_sharedStrings.at(index) : QString();
        } else if (type == QLatin1String("b")) {
            value = value == QLatin1String("1") ? "TRUE" : "FALSE";
        }

        if (!value.isEmpty()) {
            grid.setCell(row, column, value);
        }
        nextColumn = column + 1;
    }

    if (xml.hasError()) {
        m_lastError = QString("Invalid worksheet XML: %1").arg(xml.errorString());
        LOG_ERROR(m_lastError);
        return false;
    }
    return true;
}
