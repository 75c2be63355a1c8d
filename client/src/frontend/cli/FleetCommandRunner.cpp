#include "frontend/cli/FleetCommandRunner.h"
#include "backend/app/FleetClient.h"
#include "backend/managers/app/SettingsManager.h"
#include "backend/network/MessageTransport.h"
#include "backend/devices/DeviceStatusHub.h"
#include "backend/control/DeviceCommandClient.h"
#include "backend/upload/UploadManager.h"
#include <QCommandLineParser>
#include <QDebug>

namespace {

const QStringList CONTROL_ACTIONS = {"home", "pause", "resume", "cancel"};

bool readPositiveOption(const QCommandLineParser& parser, const QString& name, int* value, QString* errorMessage) {
    if (!parser.isSet(name)) return true;
    bool ok = false;
    const int parsed = parser.value(name).toInt(&ok);
    if (!ok || parsed <= 0) {
        if (errorMessage) *errorMessage = QString("--%1 expects a positive integer").arg(name);
        return false;
    }
    *value = parsed;
    return true;
}

}

FleetCommandRunner::FleetCommandRunner(FleetClient* client, const CliOptions& options, QObject* parent)
    : QObject(parent)
    , m_client(client)
    , m_options(options)
    , m_stdout(stdout)
    , m_out(&m_stdout)
    , m_connectTimer(new QTimer(this))
{
    m_connectTimer->setSingleShot(true);
}

QString FleetCommandRunner::usage() {
    return QStringLiteral(
        "Usage:\n"
        "  fleetlink status [--watch-ms N] [--user ID]\n"
        "  fleetlink upload <deviceId> <file> [--sdcard] [--print]\n"
        "  fleetlink print <deviceId> <file> [--origin local|sdcard] [--job-id ID]\n"
        "  fleetlink control <deviceId> home|pause|resume|cancel\n"
        "Global options: --server URL --token TOKEN --config FILE --chunk-size BYTES --timeout-ms MS\n");
}

bool FleetCommandRunner::parseArguments(const QStringList& arguments, CliOptions* options, QString* errorMessage) {
    QCommandLineParser parser;
    parser.addPositionalArgument("command", "status, upload, print or control");
    parser.addOptions({
        {"server", "Broker proxy URL (ws:// or wss://).", "url"},
        {"token", "Authentication token for the proxy.", "token"},
        {"config", "Read settings from this INI file.", "file"},
        {"chunk-size", "Upload chunk size in raw bytes.", "bytes"},
        {"timeout-ms", "Result deadline for uploads and commands.", "ms"},
        {"watch-ms", "How long `status` keeps watching.", "ms"},
        {"user", "User whose devices `status` watches.", "id"},
        {"sdcard", "Store the upload on the printer SD card."},
        {"print", "Start printing once the upload is confirmed."},
        {"origin", "Where the file to print lives (local or sdcard).", "origin"},
        {"job-id", "Job id for the print command.", "id"},
    });

    auto fail = [errorMessage](const QString& error) {
        if (errorMessage) *errorMessage = error;
        return false;
    };

    if (!parser.parse(arguments)) return fail(parser.errorText());

    CliOptions parsed;
    parsed.serverUrl = parser.value("server");
    parsed.authToken = parser.value("token");
    parsed.configPath = parser.value("config");
    parsed.userId = parser.value("user");
    QString optionError;
    if (!readPositiveOption(parser, "chunk-size", &parsed.chunkSize, &optionError)) return fail(optionError);
    if (!readPositiveOption(parser, "timeout-ms", &parsed.timeoutMs, &optionError)) return fail(optionError);
    if (!readPositiveOption(parser, "watch-ms", &parsed.watchMs, &optionError)) return fail(optionError);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) return fail("Missing command");

    const QString command = positional.first().toLower();
    if (command == "status") {
        parsed.command = CliOptions::Command::Status;
        if (positional.size() != 1) return fail("status takes no positional arguments");
    } else if (command == "upload") {
        parsed.command = CliOptions::Command::Upload;
        if (positional.size() != 3) return fail("upload expects <deviceId> <file>");
        parsed.deviceId = positional.at(1);
        parsed.filePath = positional.at(2);
        parsed.destination = parser.isSet("sdcard") ? UploadDestination::SdCard : UploadDestination::Local;
        parsed.printAfterUpload = parser.isSet("print");
    } else if (command == "print") {
        parsed.command = CliOptions::Command::Print;
        if (positional.size() != 3) return fail("print expects <deviceId> <file>");
        parsed.deviceId = positional.at(1);
        parsed.filePath = positional.at(2);
        if (parser.isSet("origin") && !destinationFromString(parser.value("origin"), &parsed.origin)) {
            return fail(QString("Unknown origin %1").arg(parser.value("origin")));
        }
        parsed.jobId = parser.value("job-id");
    } else if (command == "control") {
        parsed.command = CliOptions::Command::Control;
        if (positional.size() != 3) return fail("control expects <deviceId> <action>");
        parsed.deviceId = positional.at(1);
        parsed.controlAction = positional.at(2).toLower();
        if (!CONTROL_ACTIONS.contains(parsed.controlAction)) {
            return fail(QString("Unknown control action %1").arg(positional.at(2)));
        }
    } else {
        return fail(QString("Unknown command %1").arg(positional.first()));
    }

    if (options) *options = parsed;
    return true;
}

bool FleetCommandRunner::applyOverrides(const CliOptions& options, SettingsManager* settings, QString* errorMessage) {
    if (!options.serverUrl.isEmpty() && !settings->setServerUrl(options.serverUrl)) {
        if (errorMessage) *errorMessage = QString("Invalid server URL %1").arg(options.serverUrl);
        return false;
    }
    if (!options.authToken.isEmpty()) settings->setAuthToken(options.authToken);
    if (!options.userId.isEmpty()) settings->setUserId(options.userId);
    if (options.chunkSize > 0) settings->setChunkSize(options.chunkSize);
    if (options.timeoutMs > 0) {
        settings->setUploadResultTimeout(options.timeoutMs);
        settings->setCommandResultTimeout(options.timeoutMs);
    }
    return true;
}

int FleetCommandRunner::exitCodeForOutcome(const UploadOutcome& outcome) {
    switch (outcome.state) {
        case TransferState::Succeeded: return ExitSuccess;
        case TransferState::TimedOut: return ExitTimeout;
        default: return ExitFailure;
    }
}

void FleetCommandRunner::run() {
    switch (m_options.command) {
        case CliOptions::Command::Status: runStatus(); break;
        case CliOptions::Command::Upload: runUpload(); break;
        case CliOptions::Command::Print: runPrint(); break;
        case CliOptions::Command::Control: runControl(); break;
    }
}

void FleetCommandRunner::runStatus() {
    DeviceStatusHub* hub = m_client->statusHub();

    connect(hub, &DeviceStatusHub::statusChanged, this, [this](const DeviceStatusSnapshot& snap) {
        *m_out << snap.deviceId << "  connected=" << (snap.connected ? "yes" : "no")
               << "  printing=" << (snap.printing ? "yes" : "no")
               << "  state=" << snap.stateText() << Qt::endl;
    });
    connect(hub, &DeviceStatusHub::summaryChanged, this, [this](const DashboardSummary&) { printSummary(); });

    QString error;
    if (!m_client->watchUserDevices(false, &error)) {
        *m_out << "Cannot list devices: " << error << Qt::endl;
        finish(ExitFailure);
        return;
    }
    if (hub->watchedDevices().isEmpty()) {
        *m_out << "No devices configured (set `devices` in the settings file)" << Qt::endl;
        finish(ExitUsage);
        return;
    }

    m_client->start();
    QTimer::singleShot(m_options.watchMs, this, [this]() {
        printSummary();
        finish(ExitSuccess);
    });
}

void FleetCommandRunner::runUpload() {
    m_client->statusHub()->watchDevice(m_options.deviceId);
    UploadManager* uploads = m_client->uploads();

    connect(uploads, &UploadManager::uploadStarted, this, [this](const QString& transferId, const QString& deviceId) {
        m_transferId = transferId;
        *m_out << "Upload " << transferId << " started on " << deviceId << Qt::endl;
    });
    connect(uploads, &UploadManager::uploadProgress, this, [this](const QString& transferId, int percent) {
        if (transferId != m_transferId) return;
        *m_out << "\rUploading " << percent << "%" << Qt::flush;
    });
    connect(uploads, &UploadManager::uploadFinished, this, [this](const UploadOutcome& outcome) {
        *m_out << Qt::endl;
        switch (outcome.state) {
            case TransferState::Succeeded:
                *m_out << "Upload confirmed: " << (outcome.remoteFilename.isEmpty() ? outcome.filename : outcome.remoteFilename) << Qt::endl;
                break;
            case TransferState::TimedOut:
                *m_out << "No confirmation received, verify on the printer" << Qt::endl;
                break;
            default:
                *m_out << "Upload " << transferStateName(outcome.state) << ": " << outcome.errorText << Qt::endl;
        }
        // With --print the command result decides the exit code
        if (!(m_options.printAfterUpload && outcome.succeeded())) {
            finish(exitCodeForOutcome(outcome));
        }
    });
    connect(uploads, &UploadManager::printCommandFinished, this, [this](const QString&, const CommandOutcome& outcome) {
        *m_out << "Print " << commandStatusName(outcome.status)
               << (outcome.errorText.isEmpty() ? QString() : ": " + outcome.errorText) << Qt::endl;
        finish(outcome.succeeded() ? ExitSuccess
               : outcome.status == CommandStatus::TimedOut ? ExitTimeout : ExitFailure);
    });

    whenConnected([this]() {
        QString error;
        const QString transferId = m_client->uploads()->startUploadFromFile(
            m_options.deviceId, m_options.filePath, m_options.destination, m_options.printAfterUpload, &error);
        if (transferId.isEmpty()) {
            *m_out << "Cannot start upload: " << error << Qt::endl;
            finish(ExitFailure);
        }
    });
}

void FleetCommandRunner::runPrint() {
    whenConnected([this]() {
        m_client->commands()->startPrint(m_options.deviceId, m_options.filePath, m_options.origin, m_options.jobId,
            [this](const CommandOutcome& outcome) {
                *m_out << "Print job " << outcome.jobId << " " << commandStatusName(outcome.status)
                       << (outcome.errorText.isEmpty() ? QString() : ": " + outcome.errorText) << Qt::endl;
                if (outcome.succeeded()) finish(ExitSuccess);
                else if (outcome.status == CommandStatus::TimedOut) finish(ExitTimeout);
                else finish(ExitFailure);
            });
    });
}

void FleetCommandRunner::runControl() {
    whenConnected([this]() {
        DeviceCommandClient* commands = m_client->commands();
        const QString& action = m_options.controlAction;

        PublishResult result;
        if (action == "home") result = commands->home(m_options.deviceId);
        else if (action == "pause") result = commands->pause(m_options.deviceId);
        else if (action == "resume") result = commands->resume(m_options.deviceId);
        else result = commands->cancelJob(m_options.deviceId);

        if (!result.ok) {
            *m_out << action << " failed: " << result.error << Qt::endl;
            finish(ExitFailure);
            return;
        }
        *m_out << action << " sent to " << m_options.deviceId << Qt::endl;
        finish(ExitSuccess);
    });
}

void FleetCommandRunner::whenConnected(std::function<void()> action) {
    MessageTransport* transport = m_client->transport();
    if (transport->isConnected()) {
        action();
        return;
    }

    auto connection = std::make_shared<QMetaObject::Connection>();
    *connection = connect(transport, &MessageTransport::connected, this, [this, connection, action]() {
        QObject::disconnect(*connection);
        m_connectTimer->stop();
        action();
    });

    connect(m_connectTimer, &QTimer::timeout, this, [this, connection]() {
        QObject::disconnect(*connection);
        *m_out << "Could not connect to " << m_client->settings().serverUrl << Qt::endl;
        finish(ExitFailure);
    });
    m_connectTimer->start(CONNECT_TIMEOUT_MS);
    m_client->start();
}

void FleetCommandRunner::printSummary() {
    const DashboardSummary summary = m_client->statusHub()->summary();
    *m_out << "devices=" << summary.total << " connected=" << summary.connected
           << " printing=" << summary.printing << " error=" << summary.error
           << " idle=" << summary.idle << Qt::endl;
}

void FleetCommandRunner::finish(int exitCode) {
    if (m_finished) return;
    m_finished = true;
    m_connectTimer->stop();
    qDebug() << "FleetCommandRunner: Finished with exit code" << exitCode;
    emit finished(exitCode);
}
