#pragma once

#include <QString>
#include <QStringList>

#include <optional>

class QTextStream;

namespace pm {

class CatalogStore;
class FeedbackRecorder;

// Bulk import of known-good matches from CSV:
//   line_item_text,product_sku,match_quality,confidence
// The header row is optional. Every accepted row goes through
// FeedbackRecorder::recordApproval without publishing; the recorder's engine,
// if any, reloads the scope once when the stream ends.
class TrainingImporter {
public:
    struct ImportReport {
        int imported = 0;
        int skipped = 0;   // rows with missing fields or unknown SKUs
        int failed = 0;    // rows the recorder could not persist
    };

    TrainingImporter(CatalogStore* store, FeedbackRecorder* recorder);

    // nullopt when the file cannot be opened.
    std::optional<ImportReport> importFile(const QString& path, const QString& scope);
    ImportReport importStream(QTextStream& stream, const QString& scope);

    // Splits one CSV record; supports quoted fields and "" escapes.
    static QStringList parseCsvLine(const QString& line);

private:
    CatalogStore* m_store = nullptr;
    FeedbackRecorder* m_recorder = nullptr;
};

} // namespace pm
