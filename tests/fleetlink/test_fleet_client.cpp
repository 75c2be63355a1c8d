#include <catch2/catch.hpp>

#include "test_utils.hpp"
#include "backend/app/FleetClient.h"
#include "backend/correlation/ResultCorrelator.h"
#include "backend/devices/DeviceStatusHub.h"
#include "backend/control/DeviceCommandClient.h"
#include "backend/upload/UploadManager.h"
#include "frontend/cli/FleetCommandRunner.h"

#include <QTemporaryFile>
#include <QTextStream>

namespace {

FleetSettings testSettings()
{
    FleetSettings settings = FleetSettings::defaults();
    settings.userId = "alice";
    settings.devices = {"p1", "p2"};
    settings.chunkSizeBytes = 500;
    settings.commandResultTimeoutMs = 7000;
    return settings;
}

QStringList argv(const QStringList& args)
{
    return QStringList{"fleetlink"} + args;
}

} // namespace

TEST_CASE("Composition root wiring", "[FleetClient]")
{
    FakeTransport transport(false);
    FleetClient client(testSettings(), &transport);

    REQUIRE(client.transport() == &transport);
    REQUIRE(client.uploads()->defaultChunkSize() == 500);
    REQUIRE(client.commands()->commandTimeout() == 7000);

    QString error;
    REQUIRE(client.watchUserDevices(false, &error));
    REQUIRE(client.statusHub()->isWatching("p1"));
    REQUIRE(client.statusHub()->isWatching("p2"));

    client.start();
    REQUIRE(transport.isConnected());

    UploadRequest request;
    request.deviceId = "p1";
    request.filename = "a.gcode";
    request.data = QByteArray(10, 'a');
    const QString transferId = client.uploads()->startUpload(request, &error);
    REQUIRE_FALSE(transferId.isEmpty());

    QList<UploadOutcome> outcomes;
    QObject::connect(client.uploads(), &UploadManager::uploadFinished,
                     [&](const UploadOutcome& o) { outcomes.append(o); });

    client.shutdown();
    REQUIRE(outcomes.size() == 1);
    REQUIRE(outcomes.first().state == TransferState::Cancelled);
    REQUIRE(client.correlator()->pendingCount() == 0);
    REQUIRE_FALSE(transport.isConnected());
    REQUIRE(client.statusHub()->watchedDevices().isEmpty());
}

TEST_CASE("Command line parsing", "[FleetCommandRunner]")
{
    CliOptions options;
    QString error;

    SECTION("upload with flags") {
        REQUIRE(FleetCommandRunner::parseArguments(
            argv({"upload", "p1", "/tmp/cube.gcode", "--sdcard", "--print", "--chunk-size", "1024"}), &options, &error));
        REQUIRE(options.command == CliOptions::Command::Upload);
        REQUIRE(options.deviceId == "p1");
        REQUIRE(options.filePath == "/tmp/cube.gcode");
        REQUIRE(options.destination == UploadDestination::SdCard);
        REQUIRE(options.printAfterUpload);
        REQUIRE(options.chunkSize == 1024);
    }

    SECTION("print with origin and job id") {
        REQUIRE(FleetCommandRunner::parseArguments(
            argv({"print", "p1", "cube.gcode", "--origin", "sdcard", "--job-id", "j1"}), &options, &error));
        REQUIRE(options.origin == UploadDestination::SdCard);
        REQUIRE(options.jobId == "j1");
    }

    SECTION("status defaults") {
        REQUIRE(FleetCommandRunner::parseArguments(argv({"status"}), &options, &error));
        REQUIRE(options.command == CliOptions::Command::Status);
        REQUIRE(options.watchMs == 10000);
    }

    SECTION("usage errors") {
        REQUIRE_FALSE(FleetCommandRunner::parseArguments(argv({}), &options, &error));
        REQUIRE_FALSE(FleetCommandRunner::parseArguments(argv({"upload", "p1"}), &options, &error));
        REQUIRE_FALSE(FleetCommandRunner::parseArguments(argv({"control", "p1", "explode"}), &options, &error));
        REQUIRE(error.contains("explode"));
        REQUIRE_FALSE(FleetCommandRunner::parseArguments(argv({"print", "p1", "f", "--origin", "usb"}), &options, &error));
        REQUIRE_FALSE(FleetCommandRunner::parseArguments(argv({"status", "--timeout-ms", "0"}), &options, &error));
        REQUIRE_FALSE(FleetCommandRunner::parseArguments(argv({"frobnicate"}), &options, &error));
    }
}

TEST_CASE("Command line overrides", "[FleetCommandRunner]")
{
    SettingsManager settings(QStringLiteral("unused.ini"));
    CliOptions options;
    options.serverUrl = "wss://fleet.example.com";
    options.timeoutMs = 4000;
    options.chunkSize = 2048;
    QString error;

    REQUIRE(FleetCommandRunner::applyOverrides(options, &settings, &error));
    REQUIRE(settings.getServerUrl() == "wss://fleet.example.com");
    REQUIRE(settings.getUploadResultTimeout() == 4000);
    REQUIRE(settings.getCommandResultTimeout() == 4000);
    REQUIRE(settings.getChunkSize() == 2048);

    options.serverUrl = "http://nope";
    REQUIRE_FALSE(FleetCommandRunner::applyOverrides(options, &settings, &error));
}

TEST_CASE("Exit codes follow the upload outcome", "[FleetCommandRunner]")
{
    UploadOutcome outcome;
    outcome.state = TransferState::Succeeded;
    REQUIRE(FleetCommandRunner::exitCodeForOutcome(outcome) == FleetCommandRunner::ExitSuccess);
    outcome.state = TransferState::TimedOut;
    REQUIRE(FleetCommandRunner::exitCodeForOutcome(outcome) == FleetCommandRunner::ExitTimeout);
    outcome.state = TransferState::Failed;
    REQUIRE(FleetCommandRunner::exitCodeForOutcome(outcome) == FleetCommandRunner::ExitFailure);
}

TEST_CASE("Control command end to end", "[FleetCommandRunner]")
{
    FakeTransport transport(false);
    FleetClient client(testSettings(), &transport);

    CliOptions options;
    options.command = CliOptions::Command::Control;
    options.deviceId = "p1";
    options.controlAction = "pause";

    QString output;
    QTextStream out(&output);
    FleetCommandRunner runner(&client, options);
    runner.setOutput(&out);

    int exitCode = -1;
    QObject::connect(&runner, &FleetCommandRunner::finished, [&](int code) { exitCode = code; });
    runner.run();

    REQUIRE(exitCode == FleetCommandRunner::ExitSuccess);
    REQUIRE(transport.publishedOn(Topics::control("p1")).first().type() == "pause");
    REQUIRE(output.contains("pause sent to p1"));
}

TEST_CASE("Upload command reports a missing confirmation", "[FleetCommandRunner]")
{
    FakeTransport transport(false);
    FleetSettings settings = testSettings();
    settings.uploadResultTimeoutMs = 30;
    settings.timeoutScanIntervalMs = 5;
    FleetClient client(settings, &transport);

    QTemporaryFile file;
    REQUIRE(file.open());
    file.write("G28\n");
    file.flush();

    CliOptions options;
    options.command = CliOptions::Command::Upload;
    options.deviceId = "p1";
    options.filePath = file.fileName();

    QString output;
    QTextStream out(&output);
    FleetCommandRunner runner(&client, options);
    runner.setOutput(&out);

    int exitCode = -1;
    QObject::connect(&runner, &FleetCommandRunner::finished, [&](int code) { exitCode = code; });
    runner.run();

    REQUIRE(waitUntil([&]() { return exitCode >= 0; }));
    REQUIRE(exitCode == FleetCommandRunner::ExitTimeout);
    REQUIRE(output.contains("started on p1"));
    REQUIRE(output.contains("Uploading 99%"));
    REQUIRE_FALSE(output.contains("Uploading 0%"));
    REQUIRE(output.contains("No confirmation received, verify on the printer"));
}
