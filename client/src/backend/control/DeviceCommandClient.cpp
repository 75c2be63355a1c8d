#include "backend/control/DeviceCommandClient.h"
#include "backend/correlation/ResultCorrelator.h"
#include <QDebug>

QString commandStatusName(CommandStatus status) {
    switch (status) {
        case CommandStatus::Succeeded: return "succeeded";
        case CommandStatus::Failed: return "failed";
        case CommandStatus::TimedOut: return "timed-out";
        case CommandStatus::TransportError: return "transport-error";
        case CommandStatus::Rejected: return "rejected";
    }
    return "unknown";
}

DeviceCommandClient::DeviceCommandClient(MessageTransport* transport, ResultCorrelator* correlator, QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_correlator(correlator)
{
}

QString DeviceCommandClient::startPrint(const QString& deviceId,
                                        const QString& filename,
                                        UploadDestination origin,
                                        const QString& jobId,
                                        CommandCallback callback) {
    PrintCommand command;
    command.deviceId = deviceId;
    command.filename = filename;
    command.origin = origin;
    command.jobId = jobId.isEmpty() ? PrintCommand::jobIdForFile(filename) : jobId;

    CommandOutcome outcome;
    outcome.deviceId = deviceId;
    outcome.jobId = command.jobId;

    if (deviceId.isEmpty() || filename.isEmpty()) {
        outcome.status = CommandStatus::Rejected;
        outcome.errorText = "Device id and filename are required";
        finish(outcome, callback);
        return QString();
    }
    if (!m_transport || !m_correlator) {
        outcome.status = CommandStatus::TransportError;
        outcome.errorText = "Command client is not wired to a transport";
        finish(outcome, callback);
        return QString();
    }

    m_correlator->watchDevice(deviceId);

    // Register before publishing so a fast reply cannot slip past us
    QPointer<DeviceCommandClient> self(this);
    const RegisterResult reg = m_correlator->registerWait(
        CorrelationKey{deviceId, command.jobId},
        m_commandTimeoutMs,
        [self, outcome, callback](const ControllerResult& result) {
            if (!self) return;
            CommandOutcome done = outcome;
            done.status = result.success ? CommandStatus::Succeeded : CommandStatus::Failed;
            done.errorText = result.success ? QString() : result.error;
            self->finish(done, callback);
        },
        [self, outcome, callback](WaitError error, const QString& message) {
            if (!self) return;
            CommandOutcome done = outcome;
            done.status = error == WaitError::TimedOut ? CommandStatus::TimedOut : CommandStatus::Failed;
            done.errorText = message;
            self->finish(done, callback);
        });

    if (!reg.ok) {
        outcome.status = CommandStatus::Rejected;
        outcome.errorText = reg.error;
        finish(outcome, callback);
        return QString();
    }

    const PublishResult published = m_transport->publish(Topics::gcodeIn(deviceId), toPayload(command.toJson()));
    if (!published.ok) {
        m_correlator->abandon(reg.handle);
        outcome.status = CommandStatus::TransportError;
        outcome.errorText = published.error;
        finish(outcome, callback);
        return QString();
    }

    qDebug() << "DeviceCommandClient: Print" << filename << "sent to" << deviceId << "job" << command.jobId;
    return command.jobId;
}

PublishResult DeviceCommandClient::home(const QString& deviceId, const QString& axes) {
    return publishControl(deviceId, ControlCommands::home(axes));
}

PublishResult DeviceCommandClient::pause(const QString& deviceId) {
    return publishControl(deviceId, ControlCommands::pause());
}

PublishResult DeviceCommandClient::resume(const QString& deviceId) {
    return publishControl(deviceId, ControlCommands::resume());
}

PublishResult DeviceCommandClient::cancelJob(const QString& deviceId) {
    return publishControl(deviceId, ControlCommands::cancel());
}

PublishResult DeviceCommandClient::move(const QString& deviceId, const ControlCommands::Move& move) {
    if (!move.hasX && !move.hasY && !move.hasZ && !move.hasE) {
        return PublishResult::failure("Move without any axis");
    }
    return publishControl(deviceId, ControlCommands::move(move));
}

PublishResult DeviceCommandClient::setTemperature(const QString& deviceId, int tool, double temperature, bool wait) {
    if (tool < -1) {
        return PublishResult::failure(QString("Invalid tool index %1").arg(tool));
    }
    if (temperature < 0) {
        return PublishResult::failure("Temperature must not be negative");
    }
    return publishControl(deviceId, ControlCommands::setTemperature(tool, temperature, wait));
}

PublishResult DeviceCommandClient::publishControl(const QString& deviceId, const QJsonObject& command) {
    if (deviceId.isEmpty()) {
        return PublishResult::failure("Device id is required");
    }
    if (!m_transport) {
        return PublishResult::failure("Command client is not wired to a transport");
    }

    const PublishResult result = m_transport->publish(Topics::control(deviceId), toPayload(command));
    if (!result.ok) {
        qWarning() << "DeviceCommandClient:" << command.value("type").toString()
                   << "to" << deviceId << "failed:" << result.error;
    }
    return result;
}

void DeviceCommandClient::finish(const CommandOutcome& outcome, const CommandCallback& callback) {
    if (!outcome.succeeded()) {
        qWarning() << "DeviceCommandClient: Job" << outcome.jobId << "on" << outcome.deviceId
                   << commandStatusName(outcome.status) << outcome.errorText;
    }
    emit commandFinished(outcome);
    if (callback) callback(outcome);
}
