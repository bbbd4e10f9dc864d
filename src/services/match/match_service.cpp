#include "match_service.h"
#include "core/feedback/feedback_recorder.h"
#include "core/feedback/training_importer.h"
#include "core/match/match_engine.h"
#include "core/shared/logging.h"
#include "core/signals/embedding_provider.h"

#include <QDir>
#include <QJsonArray>
#include <QStandardPaths>

#include <algorithm>

namespace pm {

namespace {

const QString kServiceName = QStringLiteral("partmatch-match");

QJsonObject invalidParams(uint64_t id, const QString& message)
{
    return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, message);
}

// Optional numeric field; false when present with a non-numeric value.
bool readOptionalNumber(const QJsonObject& params, const QString& key, double& out)
{
    const QJsonValue value = params.value(key);
    if (value.isUndefined() || value.isNull()) {
        return true;
    }
    if (!value.isDouble()) {
        return false;
    }
    out = value.toDouble();
    return true;
}

int toBoundedInt(double value)
{
    return static_cast<int>(std::clamp(value, -1.0e6, 1.0e6));
}

bool isKnownQuality(const QString& quality)
{
    const QString lowered = quality.trimmed().toLower();
    return lowered == QLatin1String("excellent") || lowered == QLatin1String("good")
        || lowered == QLatin1String("fair") || lowered == QLatin1String("poor");
}

SignalScores scoresFromJson(const QJsonObject& json)
{
    SignalScores scores;
    scores.trigram = json.value(QStringLiteral("trigram_score")).toDouble();
    scores.fuzzy = json.value(QStringLiteral("fuzzy_score")).toDouble();
    scores.alias = json.value(QStringLiteral("alias_score")).toDouble();
    scores.learned = json.value(QStringLiteral("learned_score")).toDouble();
    scores.vector = json.value(QStringLiteral("vector_score")).toDouble();
    scores.clamp();
    return scores;
}

} // namespace

MatchService::MatchService(Settings settings,
                           std::shared_ptr<EmbeddingProvider> embeddingProvider,
                           QObject* parent)
    : ServiceBase(kServiceName, parent)
    , m_settings(std::move(settings))
    , m_embeddingProvider(std::move(embeddingProvider))
{
    m_settings.match = m_settings.match.normalized();
    if (m_settings.defaultScope.trimmed().isEmpty()) {
        m_settings.defaultScope = defaultScope();
    }
}

MatchService::~MatchService() = default;

QString MatchService::resolveDbPath(const Settings& settings)
{
    if (!settings.dbPath.trimmed().isEmpty()) {
        return QDir::cleanPath(settings.dbPath);
    }
    const QString envDataDir = qEnvironmentVariable("PARTMATCH_DATA_DIR").trimmed();
    const QString dataDir = envDataDir.isEmpty()
        ? QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation)
              + QStringLiteral("/partmatch")
        : QDir::cleanPath(envDataDir);
    return dataDir + QStringLiteral("/catalog.db");
}

bool MatchService::ensureStoreOpen()
{
    if (m_store.has_value()) {
        return true;
    }

    const QString dbPath = resolveDbPath(m_settings);
    auto store = CatalogStore::open(dbPath);
    if (!store.has_value()) {
        LOG_ERROR(pmIpc, "Cannot open catalog database at %s", qPrintable(dbPath));
        return false;
    }
    m_store.emplace(std::move(store.value()));

    MatchEngineOptions options;
    options.config = m_settings.match;
    options.cache.maxEntries = m_settings.cacheCapacity;
    options.cache.ttlSeconds = m_settings.cacheTtlSeconds;
    options.batchWorkers = m_settings.batchWorkers;
    options.embeddingEnabled = m_settings.embeddingEnabled;

    m_engine = std::make_unique<MatchEngine>(&*m_store, options, m_embeddingProvider);
    m_recorder = std::make_unique<FeedbackRecorder>(&*m_store, m_engine.get());
    m_importer = std::make_unique<TrainingImporter>(&*m_store, m_recorder.get());

    LOG_INFO(pmIpc, "Catalog database opened at %s", qPrintable(dbPath));
    return true;
}

QJsonObject MatchService::handleRequest(const QJsonObject& request)
{
    const QString method = IpcMessage::requestMethod(request);
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonValue rawParams = request.value(QStringLiteral("params"));

    const bool ownMethod = method == QLatin1String("match")
        || method == QLatin1String("matchBatch")
        || method == QLatin1String("recordApproval")
        || method == QLatin1String("importTraining")
        || method == QLatin1String("reloadCatalog");
    if (!ownMethod) {
        return ServiceBase::handleRequest(request);
    }

    if (!rawParams.isUndefined() && !rawParams.isObject()) {
        return invalidParams(id, QStringLiteral("params must be an object"));
    }
    if (!ensureStoreOpen()) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Catalog database unavailable"));
    }

    const QJsonObject params = rawParams.toObject();
    if (method == QLatin1String("match"))          return handleMatch(id, params);
    if (method == QLatin1String("matchBatch"))     return handleMatchBatch(id, params);
    if (method == QLatin1String("recordApproval")) return handleRecordApproval(id, params);
    if (method == QLatin1String("importTraining")) return handleImportTraining(id, params);
    return handleReloadCatalog(id, params);
}

QString MatchService::scopeFrom(const QJsonObject& params) const
{
    const QString scope = params.value(QStringLiteral("scope")).toString().trimmed();
    return scope.isEmpty() ? m_settings.defaultScope : scope;
}

QJsonObject MatchService::outcomeError(uint64_t id, const MatchOutcome& outcome) const
{
    if (outcome.status == MatchStatus::CatalogUnavailable) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Catalog unavailable"));
    }
    return IpcMessage::makeError(id, IpcErrorCode::Timeout,
                                 QStringLiteral("Match deadline exceeded"));
}

void MatchService::touchTrainingHits(const MatchOutcome& outcome)
{
    if (!outcome.tier || (*outcome.tier != MatchTier::TrainingExact
                          && *outcome.tier != MatchTier::TrainingGood)) {
        return;
    }
    for (const MatchCandidate& candidate : outcome.candidates) {
        if (candidate.trainingExampleId) {
            m_recorder->touchReference(*candidate.trainingExampleId);
        }
    }
}

QJsonObject MatchService::handleMatch(uint64_t id, const QJsonObject& params)
{
    const QJsonValue queryValue = params.value(QStringLiteral("query"));
    if (!queryValue.isString()) {
        return invalidParams(id, QStringLiteral("'query' must be a string"));
    }

    double limit = 10;
    double threshold = 0.3;
    double timeoutMs = 0;
    if (!readOptionalNumber(params, QStringLiteral("limit"), limit)
        || !readOptionalNumber(params, QStringLiteral("threshold"), threshold)
        || !readOptionalNumber(params, QStringLiteral("timeoutMs"), timeoutMs)) {
        return invalidParams(id, QStringLiteral("limit, threshold and timeoutMs must be numbers"));
    }

    MatchQuery query;
    query.text = queryValue.toString();
    query.scope = scopeFrom(params);
    query.limit = toBoundedInt(limit);
    query.threshold = threshold;
    query.timeoutMs = std::max(0, toBoundedInt(timeoutMs));

    const MatchOutcome outcome = m_engine->match(query);
    if (!outcome.ok()) {
        return outcomeError(id, outcome);
    }

    // Reference counting runs after the match and never affects the reply.
    touchTrainingHits(outcome);

    QJsonArray results;
    for (const MatchCandidate& candidate : outcome.candidates) {
        results.append(candidateToJson(candidate));
    }

    QJsonObject result;
    result[QStringLiteral("results")] = results;
    result[QStringLiteral("tier")] = outcome.tier
        ? QJsonValue(matchTierToString(*outcome.tier)) : QJsonValue(QJsonValue::Null);
    result[QStringLiteral("snapshotVersion")] = static_cast<qint64>(outcome.snapshotVersion);
    result[QStringLiteral("cached")] = outcome.fromCache;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject MatchService::handleMatchBatch(uint64_t id, const QJsonObject& params)
{
    const QJsonValue queriesValue = params.value(QStringLiteral("queries"));
    if (!queriesValue.isArray()) {
        return invalidParams(id, QStringLiteral("'queries' must be an array of strings"));
    }

    QStringList texts;
    const QJsonArray queries = queriesValue.toArray();
    texts.reserve(queries.size());
    for (const QJsonValue& value : queries) {
        if (!value.isString()) {
            return invalidParams(id, QStringLiteral("'queries' must be an array of strings"));
        }
        texts.append(value.toString());
    }

    double limit = 10;
    double threshold = 0.3;
    double timeoutMs = 0;
    if (!readOptionalNumber(params, QStringLiteral("limit"), limit)
        || !readOptionalNumber(params, QStringLiteral("threshold"), threshold)
        || !readOptionalNumber(params, QStringLiteral("timeoutMs"), timeoutMs)) {
        return invalidParams(id, QStringLiteral("limit, threshold and timeoutMs must be numbers"));
    }

    const QString scope = scopeFrom(params);
    if (!texts.isEmpty() && !m_engine->snapshot(scope)) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Catalog unavailable"));
    }

    const std::vector<BatchMatchResult> batch = m_engine->matchBatch(
        texts, toBoundedInt(limit), threshold, scope,
        std::max(0, toBoundedInt(timeoutMs)));

    QJsonArray results;
    QJsonArray timedOut;
    for (const BatchMatchResult& item : batch) {
        if (!item.outcome.ok()) {
            if (item.outcome.status == MatchStatus::CatalogUnavailable) {
                return outcomeError(id, item.outcome);
            }
            timedOut.append(item.queryIndex);
            continue;
        }
        touchTrainingHits(item.outcome);
        for (const MatchCandidate& candidate : item.outcome.candidates) {
            QJsonObject row = candidateToJson(candidate);
            row[QStringLiteral("query_index")] = item.queryIndex;
            row[QStringLiteral("query_text")] = item.queryText;
            results.append(row);
        }
    }

    QJsonObject result;
    result[QStringLiteral("results")] = results;
    if (!timedOut.isEmpty()) {
        result[QStringLiteral("timed_out")] = timedOut;
    }
    return IpcMessage::makeResponse(id, result);
}

QJsonObject MatchService::handleRecordApproval(uint64_t id, const QJsonObject& params)
{
    const QString lineItem = params.value(QStringLiteral("line_item_text")).toString();
    const QString productId = params.value(QStringLiteral("product_id")).toString().trimmed();
    if (lineItem.trimmed().isEmpty() || productId.isEmpty()) {
        return invalidParams(id, QStringLiteral("line_item_text and product_id are required"));
    }

    FeedbackRecorder::Approval approval;
    approval.scope = scopeFrom(params);
    approval.lineItemText = lineItem;
    approval.productId = productId;

    const QJsonValue qualityValue = params.value(QStringLiteral("quality"));
    if (!qualityValue.isUndefined()) {
        if (!qualityValue.isString() || !isKnownQuality(qualityValue.toString())) {
            return invalidParams(id, QStringLiteral("quality must be excellent, good, fair or poor"));
        }
        approval.quality = matchQualityFromString(qualityValue.toString());
    }

    double confidence = approval.confidence;
    if (!readOptionalNumber(params, QStringLiteral("confidence"), confidence)) {
        return invalidParams(id, QStringLiteral("confidence must be a number"));
    }
    approval.confidence = clampUnit(confidence);

    const QJsonValue scoresValue = params.value(QStringLiteral("scores"));
    if (scoresValue.isObject()) {
        const QJsonObject scores = scoresValue.toObject();
        approval.scores = scoresFromJson(scores);
        if (scores.value(QStringLiteral("final_score")).isDouble()) {
            approval.finalScore = clampUnit(scores.value(QStringLiteral("final_score")).toDouble());
        }
    } else if (!scoresValue.isUndefined() && !scoresValue.isNull()) {
        return invalidParams(id, QStringLiteral("scores must be an object"));
    }

    QJsonObject result;
    const auto stored = m_recorder->recordApproval(approval);
    result[QStringLiteral("ok")] = stored.has_value();
    if (stored) {
        result[QStringLiteral("training_example_id")] = static_cast<qint64>(stored->id);
    } else {
        result[QStringLiteral("error")] = QStringLiteral("Approval was not persisted");
    }
    return IpcMessage::makeResponse(id, result);
}

QJsonObject MatchService::handleImportTraining(uint64_t id, const QJsonObject& params)
{
    const QString path = params.value(QStringLiteral("path")).toString().trimmed();
    if (path.isEmpty()) {
        return invalidParams(id, QStringLiteral("'path' is required"));
    }

    const auto report = m_importer->importFile(path, scopeFrom(params));
    if (!report) {
        return invalidParams(id, QStringLiteral("Cannot read %1").arg(path));
    }

    QJsonObject result;
    result[QStringLiteral("imported")] = report->imported;
    result[QStringLiteral("skipped")] = report->skipped;
    result[QStringLiteral("failed")] = report->failed;
    return IpcMessage::makeResponse(id, result);
}

QJsonObject MatchService::handleReloadCatalog(uint64_t id, const QJsonObject& params)
{
    const SnapshotPtr snapshot = m_engine->reload(scopeFrom(params));
    if (!snapshot) {
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable,
                                     QStringLiteral("Catalog unavailable"));
    }

    QJsonObject result;
    result[QStringLiteral("version")] = static_cast<qint64>(snapshot->version());
    result[QStringLiteral("products")] = snapshot->productCount();
    return IpcMessage::makeResponse(id, result);
}

} // namespace pm
