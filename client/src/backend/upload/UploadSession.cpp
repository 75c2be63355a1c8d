#include "backend/upload/UploadSession.h"
#include "backend/network/MessageTransport.h"
#include <QTimer>
#include <QDebug>
#include <algorithm>

UploadSession::UploadSession(MessageTransport* transport,
                             ResultCorrelator* correlator,
                             const UploadRequest& request,
                             QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_correlator(correlator)
    , m_data(request.data)
    , m_resultTimeoutMs(request.resultTimeoutMs)
    , m_printAfterUpload(request.printAfterUpload)
{
    m_transfer.transferId = Transfer::generateTransferId();
    m_transfer.deviceId = request.deviceId;
    m_transfer.filename = request.filename;
    m_transfer.totalSize = request.data.size();
    m_transfer.destination = request.destination;
    m_transfer.chunkSize = request.chunkSize;

    m_outcome.transferId = m_transfer.transferId;
    m_outcome.deviceId = m_transfer.deviceId;
    m_outcome.filename = m_transfer.filename;
    m_outcome.destination = m_transfer.destination;
    m_outcome.state = m_transfer.state;
}

UploadSession::~UploadSession() {
    dropWait();
}

bool UploadSession::start(QString* errorMessage) {
    auto fail = [errorMessage](const QString& error) {
        qWarning() << "UploadSession: Cannot start:" << error;
        if (errorMessage) *errorMessage = error;
        return false;
    };

    if (m_started) return fail("Upload already started");
    if (m_transfer.deviceId.isEmpty()) return fail("Device id is required");
    if (m_transfer.filename.isEmpty()) return fail("Filename is required");
    if (m_transfer.chunkSize <= 0) return fail(QString("Invalid chunk size %1").arg(m_transfer.chunkSize));
    if (m_resultTimeoutMs <= 0) return fail(QString("Invalid result timeout %1").arg(m_resultTimeoutMs));
    if (!m_transport || !m_correlator) return fail("Upload session is not wired to a transport");

    m_started = true;
    m_totalChunks = ChunkEncoder::chunkCount(m_transfer.totalSize, m_transfer.chunkSize);

    // Result topic must be live before the controller can answer
    m_correlator->watchDevice(m_transfer.deviceId);

    qDebug() << "UploadSession: Starting" << m_transfer.transferId << m_transfer.filename
             << "to" << m_transfer.deviceId << "-" << m_transfer.totalSize << "bytes in"
             << m_totalChunks << "chunks";

    emit stateChanged(m_transfer.transferId, m_transfer.state);
    emit progressChanged(m_transfer.transferId, m_progress);
    QTimer::singleShot(0, this, &UploadSession::publishNextChunk);
    return true;
}

void UploadSession::publishNextChunk() {
    if (m_transfer.state != TransferState::Sending) return; // cancelled meanwhile

    if (!m_transport) {
        finishWith(TransferState::Failed, "Transport went away");
        return;
    }

    const int index = m_transfer.chunksSent;
    const QByteArray slice = ChunkEncoder::sliceAt(m_data, m_transfer.chunkSize, index);
    const ChunkEnvelope envelope = ChunkEncoder::buildEnvelope(m_transfer.transferId, index, slice,
                                                               m_transfer.filename, m_transfer.totalSize,
                                                               m_transfer.destination);

    const PublishResult result = m_transport->publish(Topics::gcodeIn(m_transfer.deviceId), toPayload(envelope.toJson()));
    if (m_transfer.state != TransferState::Sending) return;
    if (!result.ok) {
        finishWith(TransferState::Failed, QString("Chunk %1 publish failed: %2").arg(index).arg(result.error));
        return;
    }

    m_transfer.chunksSent++;
    m_transfer.sentBytes += slice.size();
    qDebug() << "UploadSession: Chunk" << index + 1 << "/" << m_totalChunks << "sent for" << m_transfer.transferId;
    setProgress(progressPercent(m_transfer.sentBytes, m_transfer.totalSize, false));

    if (m_transfer.chunksSent >= m_totalChunks) {
        commit();
    } else {
        QTimer::singleShot(0, this, &UploadSession::publishNextChunk);
    }
}

void UploadSession::commit() {
    if (!transitionTo(TransferState::Committing)) return;

    QPointer<UploadSession> self(this);
    const RegisterResult reg = m_correlator->registerWait(
        CorrelationKey{m_transfer.deviceId, m_transfer.transferId},
        m_resultTimeoutMs,
        [self](const ControllerResult& result) { if (self) self->onResult(result); },
        [self](WaitError error, const QString& message) { if (self) self->onRejected(error, message); },
        [self](const ControllerResult& progress) { if (self) self->onRemoteProgress(progress); });

    if (!reg.ok) {
        finishWith(TransferState::Failed, reg.error);
        return;
    }
    m_waitHandle = reg.handle;

    CommitMessage message;
    message.transferId = m_transfer.transferId;
    message.destination = m_transfer.destination;

    const PublishResult result = m_transport
        ? m_transport->publish(Topics::gcodeIn(m_transfer.deviceId), toPayload(message.toJson()))
        : PublishResult::failure("Transport went away");

    // A synchronous answer may already have finished us
    if (isTerminalState(m_transfer.state)) return;

    if (!result.ok) {
        dropWait();
        finishWith(TransferState::Failed, QString("Commit publish failed: %1").arg(result.error));
        return;
    }

    qDebug() << "UploadSession: Commit sent for" << m_transfer.transferId;
    if (m_transfer.state == TransferState::Committing) {
        transitionTo(TransferState::AwaitingResult);
    }
}

void UploadSession::onResult(const ControllerResult& result) {
    m_waitHandle = 0;
    if (m_transfer.state == TransferState::Committing) {
        transitionTo(TransferState::AwaitingResult);
    }

    if (result.success) {
        m_outcome.remoteFilename = result.filename;
        m_outcome.remoteTarget = result.target;
        setProgress(progressPercent(m_transfer.sentBytes, m_transfer.totalSize, true));
        finishWith(TransferState::Succeeded, QString());
    } else {
        finishWith(TransferState::Failed, result.error.isEmpty() ? QString("Controller reported failure") : result.error);
    }
}

void UploadSession::onRejected(WaitError error, const QString& message) {
    m_waitHandle = 0;
    if (error == WaitError::TimedOut) {
        if (m_transfer.state == TransferState::Committing) {
            transitionTo(TransferState::AwaitingResult);
        }
        finishWith(TransferState::TimedOut, message.isEmpty() ? QString("No confirmation received") : message);
    } else {
        finishWith(TransferState::Cancelled, message);
    }
}

void UploadSession::onRemoteProgress(const ControllerResult& progress) {
    const int percent = std::clamp(progress.percent, 0, 99);
    emit remoteProgress(m_transfer.transferId, progress.stage, percent);
    if (percent > m_progress) {
        setProgress(percent);
    }
}

void UploadSession::cancel() {
    if (isTerminalState(m_transfer.state)) return;

    qDebug() << "UploadSession: Cancelling" << m_transfer.transferId << "in state" << transferStateName(m_transfer.state);

    if (m_transfer.state == TransferState::Sending || m_transfer.state == TransferState::Committing) {
        // Already published chunks cannot be retracted; tell the controller to drop them
        if (m_transfer.chunksSent > 0 && m_transport) {
            CancelMessage message;
            message.transferId = m_transfer.transferId;
            const PublishResult result = m_transport->publish(Topics::gcodeIn(m_transfer.deviceId), toPayload(message.toJson()));
            if (!result.ok) {
                qWarning() << "UploadSession: Cancel notice for" << m_transfer.transferId << "not sent:" << result.error;
            }
        }
    }

    dropWait();
    finishWith(TransferState::Cancelled, "Cancelled by user");
}

bool UploadSession::transitionTo(TransferState state) {
    if (!isValidTransition(m_transfer.state, state)) {
        qWarning() << "UploadSession: Illegal transition" << transferStateName(m_transfer.state)
                   << "->" << transferStateName(state) << "for" << m_transfer.transferId;
        return false;
    }
    m_transfer.state = state;
    m_outcome.state = state;
    emit stateChanged(m_transfer.transferId, state);
    return true;
}

void UploadSession::finishWith(TransferState state, const QString& errorText) {
    if (!transitionTo(state)) return;

    m_outcome.errorText = errorText;
    m_data.clear();

    if (state == TransferState::Succeeded) {
        qDebug() << "UploadSession:" << m_transfer.transferId << "confirmed by" << m_transfer.deviceId;
    } else {
        qWarning() << "UploadSession:" << m_transfer.transferId << transferStateName(state) << "-" << errorText;
    }
    emit finished(m_outcome);
}

void UploadSession::setProgress(int percent) {
    if (percent == m_progress) return;
    m_progress = percent;
    emit progressChanged(m_transfer.transferId, m_progress);
}

void UploadSession::dropWait() {
    if (m_waitHandle != 0 && m_correlator) {
        m_correlator->abandon(m_waitHandle);
    }
    m_waitHandle = 0;
}
