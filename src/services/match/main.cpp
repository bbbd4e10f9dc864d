#include "match_service.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("partmatch-match"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    pm::Settings settings;
    if (auto loaded = pm::SettingsManager::load()) {
        settings = *loaded;
    } else {
        LOG_INFO(pmCore, "No settings at %s, using defaults",
                 qPrintable(pm::SettingsManager::settingsFilePath()));
    }

    pm::MatchService service(settings);
    return service.run();
}
