#ifndef FLEETCOMMANDRUNNER_H
#define FLEETCOMMANDRUNNER_H

#include <QObject>
#include <QStringList>
#include <QTextStream>
#include <QTimer>
#include <functional>
#include "backend/protocol/WireMessages.h"
#include "backend/upload/Transfer.h"

class FleetClient;
class SettingsManager;

struct CliOptions {
    enum class Command { Status, Upload, Print, Control };

    Command command = Command::Status;
    QString deviceId;
    QString filePath;
    QString controlAction;
    UploadDestination destination = UploadDestination::Local;
    bool printAfterUpload = false;
    UploadDestination origin = UploadDestination::Local;
    QString jobId;
    int watchMs = 10000;

    // Overrides on top of the settings store; empty / 0 means "not given"
    QString serverUrl;
    QString authToken;
    QString configPath;
    QString userId;
    int chunkSize = 0;
    int timeoutMs = 0;
};

/**
 * Runs one fleetlink command against a FleetClient and reports an exit code
 * through finished(). Never blocks; everything is driven by the event loop.
 */
class FleetCommandRunner : public QObject {
    Q_OBJECT

public:
    enum ExitCode {
        ExitSuccess = 0,
        ExitFailure = 1,
        ExitTimeout = 2,
        ExitUsage = 3
    };

    static constexpr int CONNECT_TIMEOUT_MS = 15000;

    FleetCommandRunner(FleetClient* client, const CliOptions& options, QObject* parent = nullptr);

    static bool parseArguments(const QStringList& arguments, CliOptions* options, QString* errorMessage);
    static bool applyOverrides(const CliOptions& options, SettingsManager* settings, QString* errorMessage);
    static int exitCodeForOutcome(const UploadOutcome& outcome);
    static QString usage();

    void setOutput(QTextStream* out) { m_out = out; }

public slots:
    void run();

signals:
    void finished(int exitCode);

private:
    void runStatus();
    void runUpload();
    void runPrint();
    void runControl();

    void whenConnected(std::function<void()> action);
    void finish(int exitCode);
    void printSummary();

    FleetClient* m_client;
    CliOptions m_options;
    QTextStream m_stdout;
    QTextStream* m_out;
    QTimer* m_connectTimer;
    QString m_transferId;
    bool m_finished = false;
};

#endif // FLEETCOMMANDRUNNER_H
