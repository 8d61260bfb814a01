#include "RosterIngestor.h"
#include "CsvRosterReader.h"
#include "XlsxRosterReader.h"
#include "StructureDetector.h"
#include "logger/logger.h"

#include <QFile>
#include <QFileInfo>

RosterIngestor::RosterIngestor(qint64 maxFileSize)
    : m_maxFileSize(maxFileSize)
{
    if (m_maxFileSize <= 0) {
        m_maxFileSize = DefaultMaxFileSize;
    }
}

std::optional<RosterFormat> RosterIngestor::detectFormat(const QString& hint)
{
    const QString lower = hint.trimmed().toLower();

    if (lower == "text/csv" || lower == "application/csv" || lower.endsWith(".csv")) {
        return RosterFormat::Csv;
    }

    if (lower == "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"
        || lower == "application/vnd.ms-excel.sheet.macroenabled.12"
        || lower.endsWith(".xlsx") || lower.endsWith(".xlsm")) {
        return RosterFormat::Excel;
    }

    return std::nullopt;
}

IngestResult RosterIngestor::ingest(const QByteArray& content, const QString& hint) const
{
    IngestResult result;

    const std::optional<RosterFormat> format = detectFormat(hint);
    if (!format) {
        result.errors.append(QString("Unsupported file type \"%1\"; expected .csv, .xlsx or .xlsm").arg(hint));
        LOG_WARNING(result.errors.last());
        return result;
    }
    result.metadata.format = *format;

    if (content.isEmpty()) {
        result.errors.append("File is empty");
        LOG_WARNING(result.errors.last());
        return result;
    }

    if (content.size() > m_maxFileSize) {
        result.errors.append(QString("File size (%1 bytes) exceeds the maximum of %2 bytes")
                             .arg(content.size()).arg(m_maxFileSize));
        LOG_WARNING(result.errors.last());
        return result;
    }

    RosterGrid grid;
    StructureDetector detector;

    if (*format == RosterFormat::Csv) {
        if (CsvRosterReader::countLines(content) < 5) {
            result.errors.append("CSV file must contain at least 5 lines");
            LOG_WARNING(result.errors.last());
            return result;
        }

        CsvRosterReader reader;
        if (!reader.read(content, grid)) {
            result.errors.append(reader.lastError());
            return result;
        }
        result = detector.detectCsv(grid);
    } else {
        XlsxRosterReader reader;
        if (!reader.read(content, grid)) {
            result.errors.append(reader.lastError());
            return result;
        }
        result = detector.detectExcel(grid);
    }

    LOG_DATA(Logger::Info, (QMap<QString, QVariant>{
        {"file", hint},
        {"success", result.success},
        {"rows", result.rows.size()},
        {"warnings", result.warnings.size()},
        {"errors", result.errors.size()}
    }));
    return result;
}

IngestResult RosterIngestor::ingestFile(const QString& filePath) const
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        IngestResult result;
        result.errors.append(QString("Cannot open %1: %2").arg(filePath, file.errorString()));
        LOG_ERROR(result.errors.last());
        return result;
    }

    if (file.size() > m_maxFileSize) {
        IngestResult result;
        result.errors.append(QString("File size (%1 bytes) exceeds the maximum of %2 bytes")
                             .arg(file.size()).arg(m_maxFileSize));
        LOG_WARNING(result.errors.last());
        return result;
    }

    return ingest(file.readAll(), QFileInfo(filePath).fileName());
}
