#pragma once

#include "core/ipc/service_base.h"
#include "core/index/catalog_store.h"
#include "core/shared/settings.h"

#include <memory>
#include <optional>

namespace pm {

class EmbeddingProvider;
class FeedbackRecorder;
class MatchEngine;
class TrainingImporter;
struct MatchOutcome;

class MatchService : public ServiceBase {
    Q_OBJECT
public:
    explicit MatchService(Settings settings,
                          std::shared_ptr<EmbeddingProvider> embeddingProvider = nullptr,
                          QObject* parent = nullptr);
    ~MatchService() override;

    QJsonObject handleRequest(const QJsonObject& request) override;

    // Resolved database location: settings.dbPath, else
    // $PARTMATCH_DATA_DIR/catalog.db, else <GenericDataLocation>/partmatch/catalog.db.
    static QString resolveDbPath(const Settings& settings);

private:
    QJsonObject handleMatch(uint64_t id, const QJsonObject& params);
    QJsonObject handleMatchBatch(uint64_t id, const QJsonObject& params);
    QJsonObject handleRecordApproval(uint64_t id, const QJsonObject& params);
    QJsonObject handleImportTraining(uint64_t id, const QJsonObject& params);
    QJsonObject handleReloadCatalog(uint64_t id, const QJsonObject& params);

    bool ensureStoreOpen();
    QString scopeFrom(const QJsonObject& params) const;
    QJsonObject outcomeError(uint64_t id, const MatchOutcome& outcome) const;
    void touchTrainingHits(const MatchOutcome& outcome);

    Settings m_settings;
    std::shared_ptr<EmbeddingProvider> m_embeddingProvider;

    std::optional<CatalogStore> m_store;
    std::unique_ptr<MatchEngine> m_engine;
    std::unique_ptr<FeedbackRecorder> m_recorder;
    std::unique_ptr<TrainingImporter> m_importer;
};

} // namespace pm
