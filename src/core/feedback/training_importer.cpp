#include "core/feedback/training_importer.h"
#include "core/feedback/feedback_recorder.h"
#include "core/index/catalog_store.h"
#include "core/match/match_engine.h"
#include "core/shared/logging.h"

#include <QFile>
#include <QTextStream>

namespace pm {

namespace {

constexpr double kDefaultImportConfidence = 0.8;

} // anonymous namespace

TrainingImporter::TrainingImporter(CatalogStore* store, FeedbackRecorder* recorder)
    : m_store(store)
    , m_recorder(recorder)
{
}

QStringList TrainingImporter::parseCsvLine(const QString& line)
{
    QStringList fields;
    QString field;
    bool quoted = false;

    for (int i = 0; i < line.size(); ++i) {
        const QChar ch = line.at(i);
        if (quoted) {
            if (ch == QLatin1Char('"')) {
                if (i + 1 < line.size() && line.at(i + 1) == QLatin1Char('"')) {
                    field.append(QLatin1Char('"'));
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                field.append(ch);
            }
            continue;
        }

        if (ch == QLatin1Char('"')) {
            quoted = true;
        } else if (ch == QLatin1Char(',')) {
            fields.append(field.trimmed());
            field.clear();
        } else {
            field.append(ch);
        }
    }
    fields.append(field.trimmed());
    return fields;
}

std::optional<TrainingImporter::ImportReport> TrainingImporter::importFile(const QString& path,
                                                                           const QString& scope)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        LOG_ERROR(pmFeedback, "Cannot open training CSV %s: %s",
                  qUtf8Printable(path), qUtf8Printable(file.errorString()));
        return std::nullopt;
    }
    QTextStream stream(&file);
    const ImportReport report = importStream(stream, scope);
    LOG_INFO(pmFeedback, "Imported %s: %d imported, %d skipped, %d failed",
             qUtf8Printable(path), report.imported, report.skipped, report.failed);
    return report;
}

TrainingImporter::ImportReport TrainingImporter::importStream(QTextStream& stream,
                                                              const QString& scope)
{
    ImportReport report;
    if (!m_store || !m_recorder) {
        return report;
    }

    bool firstRecord = true;
    int lineNumber = 0;
    while (!stream.atEnd()) {
        const QString line = stream.readLine();
        ++lineNumber;
        if (line.trimmed().isEmpty()) {
            continue;
        }

        const QStringList fields = parseCsvLine(line);
        if (firstRecord) {
            firstRecord = false;
            if (fields.value(0).compare(QLatin1String("line_item_text"), Qt::CaseInsensitive) == 0) {
                continue;
            }
        }

        const QString text = fields.value(0);
        const QString sku = fields.value(1);
        if (text.isEmpty() || sku.isEmpty()) {
            ++report.skipped;
            continue;
        }

        const std::optional<Product> product = m_store->findProductBySku(scope, sku);
        if (!product.has_value()) {
            LOG_DEBUG(pmFeedback, "Line %d: unknown SKU %s", lineNumber, qUtf8Printable(sku));
            ++report.skipped;
            continue;
        }

        FeedbackRecorder::Approval approval;
        approval.scope = scope;
        approval.lineItemText = text;
        approval.productId = product->id;
        approval.quality = fields.value(2).isEmpty() ? MatchQuality::Good
                                                     : matchQualityFromString(fields.value(2));
        bool confidenceOk = false;
        const double confidence = fields.value(3).toDouble(&confidenceOk);
        approval.confidence = confidenceOk ? clampUnit(confidence) : kDefaultImportConfidence;

        if (m_recorder->recordApproval(approval, false).has_value()) {
            ++report.imported;
        } else {
            ++report.failed;
        }
    }

    // One snapshot rebuild for the whole batch.
    if (report.imported > 0) {
        if (MatchEngine* engine = m_recorder->engine()) {
            engine->reload(scope);
        }
    }
    return report;
}

} // namespace pm
