#ifndef ROSTERINGESTOR_H
#define ROSTERINGESTOR_H

#include <QByteArray>
#include <QString>
#include <optional>
#include "RosterTypes.h"

/**
 * @brief Entry point of the ingestion contract: file bytes in, roster rows out
 *
 * Validates the file (type, size, minimal shape), picks the CSV or
 * spreadsheet reader and runs structure detection. Nothing is classified or
 * stored here.
 */
class RosterIngestor {
public:
    static const qint64 DefaultMaxFileSize = 10 * 1024 * 1024;

    explicit RosterIngestor(qint64 maxFileSize = DefaultMaxFileSize);

    /**
     * @brief Ingests an in-memory roster
     * @param content Raw file bytes
     * @param hint File name (extension) or MIME type
     */
    IngestResult ingest(const QByteArray& content, const QString& hint) const;

    IngestResult ingestFile(const QString& filePath) const;

    // csv, xlsx, xlsm, or the matching MIME types
    static std::optional<RosterFormat> detectFormat(const QString& hint);

    qint64 maxFileSize() const { return m_maxFileSize; }

private:
    qint64 m_maxFileSize;
};

#endif // ROSTERINGESTOR_H
