#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace pm {

namespace {

double readDouble(const QJsonObject& json, const char* key, double fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toDouble() : fallback;
}

int readInt(const QJsonObject& json, const char* key, int fallback)
{
    const QJsonValue value = json.value(QLatin1String(key));
    return value.isDouble() ? value.toInt(fallback) : fallback;
}

QJsonObject matchConfigToJson(const MatchConfig& config)
{
    QJsonObject weights;
    weights.insert(QStringLiteral("trigram"), config.weights.trigram);
    weights.insert(QStringLiteral("fuzzy"), config.weights.fuzzy);
    weights.insert(QStringLiteral("alias"), config.weights.alias);
    weights.insert(QStringLiteral("learned"), config.weights.learned);
    weights.insert(QStringLiteral("vector"), config.weights.vector);

    QJsonObject tiers;
    tiers.insert(QStringLiteral("exactSimilarity"), config.tiers.exactSimilarity);
    tiers.insert(QStringLiteral("goodSimilarity"), config.tiers.goodSimilarity);
    tiers.insert(QStringLiteral("goodScoreBase"), config.tiers.goodScoreBase);
    tiers.insert(QStringLiteral("goodScoreSpan"), config.tiers.goodScoreSpan);
    tiers.insert(QStringLiteral("trainingRecencyDays"), config.tiers.trainingRecencyDays);

    QJsonObject signalConfig;
    signalConfig.insert(QStringLiteral("aliasFloor"), config.signals.aliasFloor);
    signalConfig.insert(QStringLiteral("learnedFloor"), config.signals.learnedFloor);
    signalConfig.insert(QStringLiteral("learnedCap"), config.signals.learnedCap);
    signalConfig.insert(QStringLiteral("learnedRecencyDays"), config.signals.learnedRecencyDays);
    signalConfig.insert(QStringLiteral("fuzzyCutoff"), config.signals.fuzzyCutoff);

    QJsonObject retrieval;
    retrieval.insert(QStringLiteral("fullScanLimit"), config.retrieval.fullScanLimit);
    retrieval.insert(QStringLiteral("retrievalFloor"), config.retrieval.retrievalFloor);
    retrieval.insert(QStringLiteral("relaxedFloor"), config.retrieval.relaxedFloor);
    retrieval.insert(QStringLiteral("maxCandidates"), config.retrieval.maxCandidates);

    QJsonObject json;
    json.insert(QStringLiteral("weights"), weights);
    json.insert(QStringLiteral("tiers"), tiers);
    json.insert(QStringLiteral("signals"), signalConfig);
    json.insert(QStringLiteral("retrieval"), retrieval);
    return json;
}

MatchConfig matchConfigFromJson(const QJsonObject& json)
{
    MatchConfig config;

    const QJsonObject weights = json.value(QStringLiteral("weights")).toObject();
    config.weights.trigram = readDouble(weights, "trigram", config.weights.trigram);
    config.weights.fuzzy = readDouble(weights, "fuzzy", config.weights.fuzzy);
    config.weights.alias = readDouble(weights, "alias", config.weights.alias);
    config.weights.learned = readDouble(weights, "learned", config.weights.learned);
    config.weights.vector = readDouble(weights, "vector", config.weights.vector);

    const QJsonObject tiers = json.value(QStringLiteral("tiers")).toObject();
    config.tiers.exactSimilarity = readDouble(tiers, "exactSimilarity", config.tiers.exactSimilarity);
    config.tiers.goodSimilarity = readDouble(tiers, "goodSimilarity", config.tiers.goodSimilarity);
    config.tiers.goodScoreBase = readDouble(tiers, "goodScoreBase", config.tiers.goodScoreBase);
    config.tiers.goodScoreSpan = readDouble(tiers, "goodScoreSpan", config.tiers.goodScoreSpan);
    config.tiers.trainingRecencyDays =
        readInt(tiers, "trainingRecencyDays", config.tiers.trainingRecencyDays);

    const QJsonObject signalConfig = json.value(QStringLiteral("signals")).toObject();
    config.signals.aliasFloor = readDouble(signalConfig, "aliasFloor", config.signals.aliasFloor);
    config.signals.learnedFloor = readDouble(signalConfig, "learnedFloor", config.signals.learnedFloor);
    config.signals.learnedCap = readDouble(signalConfig, "learnedCap", config.signals.learnedCap);
    config.signals.learnedRecencyDays =
        readInt(signalConfig, "learnedRecencyDays", config.signals.learnedRecencyDays);
    config.signals.fuzzyCutoff = readInt(signalConfig, "fuzzyCutoff", config.signals.fuzzyCutoff);

    const QJsonObject retrieval = json.value(QStringLiteral("retrieval")).toObject();
    config.retrieval.fullScanLimit =
        readInt(retrieval, "fullScanLimit", config.retrieval.fullScanLimit);
    config.retrieval.retrievalFloor =
        readDouble(retrieval, "retrievalFloor", config.retrieval.retrievalFloor);
    config.retrieval.relaxedFloor =
        readDouble(retrieval, "relaxedFloor", config.retrieval.relaxedFloor);
    config.retrieval.maxCandidates =
        readInt(retrieval, "maxCandidates", config.retrieval.maxCandidates);

    return config.normalized();
}

} // anonymous namespace

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(pmCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(pmCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(pmCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(pmCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(pmCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("PARTMATCH_SETTINGS");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/partmatch/settings.json");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("defaultScope"), settings.defaultScope);
    json.insert(QStringLiteral("match"), matchConfigToJson(settings.match));
    json.insert(QStringLiteral("cacheCapacity"), settings.cacheCapacity);
    json.insert(QStringLiteral("cacheTtlSeconds"), settings.cacheTtlSeconds);
    json.insert(QStringLiteral("batchWorkers"), settings.batchWorkers);
    json.insert(QStringLiteral("embeddingEnabled"), settings.embeddingEnabled);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    const QString scope = json.value(QStringLiteral("defaultScope")).toString().trimmed();
    if (!scope.isEmpty()) {
        settings.defaultScope = scope;
    }

    settings.match = matchConfigFromJson(json.value(QStringLiteral("match")).toObject());

    settings.cacheCapacity = std::max(0, readInt(json, "cacheCapacity", settings.cacheCapacity));
    settings.cacheTtlSeconds =
        std::max(0, readInt(json, "cacheTtlSeconds", settings.cacheTtlSeconds));
    settings.batchWorkers = std::max(0, readInt(json, "batchWorkers", settings.batchWorkers));

    settings.embeddingEnabled = json.value(QStringLiteral("embeddingEnabled"))
                                    .toBool(settings.embeddingEnabled);

    return settings;
}

} // namespace pm
