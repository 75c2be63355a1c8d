#include <QCoreApplication>
#include <QTimer>
#include <QTextStream>
#include <QDebug>
#include "backend/app/FleetClient.h"
#include "backend/managers/app/SettingsManager.h"
#include "frontend/cli/FleetCommandRunner.h"

namespace {
// Settings come from --config when given, otherwise from the native store
std::unique_ptr<SettingsManager> openSettings(const CliOptions& options) {
    std::unique_ptr<SettingsManager> settings = options.configPath.isEmpty()
        ? std::make_unique<SettingsManager>()
        : std::make_unique<SettingsManager>(options.configPath);
    settings->loadSettings();
    return settings;
}
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    app.setApplicationName("FleetLink");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("FleetLink");
    app.setOrganizationDomain("fleetlink.local");

    QTextStream err(stderr);

    CliOptions options;
    QString error;
    if (!FleetCommandRunner::parseArguments(app.arguments(), &options, &error)) {
        err << error << "\n" << FleetCommandRunner::usage();
        return FleetCommandRunner::ExitUsage;
    }

    std::unique_ptr<SettingsManager> settings = openSettings(options);
    if (!FleetCommandRunner::applyOverrides(options, settings.get(), &error)) {
        err << error << "\n";
        return FleetCommandRunner::ExitUsage;
    }

    FleetClient client(settings->settings());
    FleetCommandRunner runner(&client, options);

    QObject::connect(&runner, &FleetCommandRunner::finished, &app, [&client](int exitCode) {
        client.shutdown();
        // Let the close frame go out before leaving the loop
        QTimer::singleShot(0, [exitCode]() { QCoreApplication::exit(exitCode); });
    });

    QTimer::singleShot(0, &runner, &FleetCommandRunner::run);
    return app.exec();
}
