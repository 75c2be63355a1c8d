#ifndef DEVICECOMMANDCLIENT_H
#define DEVICECOMMANDCLIENT_H

#include <QObject>
#include <QPointer>
#include <QString>
#include <functional>
#include "backend/network/MessageTransport.h"
#include "backend/protocol/WireMessages.h"

class ResultCorrelator;

enum class CommandStatus { Succeeded, Failed, TimedOut, TransportError, Rejected };

QString commandStatusName(CommandStatus status);

struct CommandOutcome {
    QString deviceId;
    QString jobId;
    CommandStatus status = CommandStatus::Failed;
    QString errorText;

    bool succeeded() const { return status == CommandStatus::Succeeded; }
};

/**
 * DeviceCommandClient
 *
 * Commands that are not file transfers.
 *
 * startPrint() is correlated: it waits for a command_result keyed by
 * (deviceId, jobId) and reports a CommandOutcome exactly once, either
 * synchronously (Rejected / TransportError) or later through the callback
 * and commandFinished().
 *
 * The control helpers are fire-class: success only means the broker took
 * the publish.
 */
class DeviceCommandClient : public QObject {
    Q_OBJECT

public:
    using CommandCallback = std::function<void(const CommandOutcome& outcome)>;

    static constexpr int DEFAULT_COMMAND_TIMEOUT_MS = 30000;

    DeviceCommandClient(MessageTransport* transport, ResultCorrelator* correlator, QObject* parent = nullptr);

    void setCommandTimeout(int timeoutMs) { m_commandTimeoutMs = timeoutMs > 0 ? timeoutMs : DEFAULT_COMMAND_TIMEOUT_MS; }
    int commandTimeout() const { return m_commandTimeoutMs; }

    /**
     * @brief Ask the controller to print a file it already stores
     * @param jobId Empty to derive it from the file's base name
     * @return The job id in flight, or an empty string if dispatch failed
     */
    QString startPrint(const QString& deviceId,
                       const QString& filename,
                       UploadDestination origin,
                       const QString& jobId = QString(),
                       CommandCallback callback = CommandCallback());

    PublishResult home(const QString& deviceId, const QString& axes = QStringLiteral("XYZ"));
    PublishResult pause(const QString& deviceId);
    PublishResult resume(const QString& deviceId);
    PublishResult cancelJob(const QString& deviceId);
    PublishResult move(const QString& deviceId, const ControlCommands::Move& move);
    PublishResult setTemperature(const QString& deviceId, int tool, double temperature, bool wait = false);

signals:
    void commandFinished(const CommandOutcome& outcome);

private:
    PublishResult publishControl(const QString& deviceId, const QJsonObject& command);
    void finish(const CommandOutcome& outcome, const CommandCallback& callback);

    QPointer<MessageTransport> m_transport;
    QPointer<ResultCorrelator> m_correlator;
    int m_commandTimeoutMs = DEFAULT_COMMAND_TIMEOUT_MS;
};

Q_DECLARE_METATYPE(CommandOutcome)

#endif // DEVICECOMMANDCLIENT_H
