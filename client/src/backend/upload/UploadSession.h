#ifndef UPLOADSESSION_H
#define UPLOADSESSION_H

#include <QObject>
#include <QPointer>
#include <QByteArray>
#include "backend/upload/Transfer.h"
#include "backend/upload/ChunkEncoder.h"
#include "backend/correlation/ResultCorrelator.h"

class MessageTransport;

struct UploadRequest {
    QString deviceId;
    QString filename;
    QByteArray data;
    UploadDestination destination = UploadDestination::Local;
    int chunkSize = ChunkEncoder::DEFAULT_CHUNK_SIZE;
    int resultTimeoutMs = 120000;
    bool printAfterUpload = false;
};

/**
 * UploadSession
 *
 * Drives one Transfer from first chunk to final outcome:
 *   sending -> committing -> awaiting-result -> succeeded | failed | timed-out
 * with cancelled reachable from every non-terminal state.
 *
 * Chunks go out strictly one at a time. The next chunk is scheduled on the
 * event loop only after the previous publish call returned, and the commit
 * only after the last one. A publish failure ends the transfer as failed
 * immediately; nothing is retried.
 *
 * Progress is sentBytes/totalSize capped at 99 until the controller confirms.
 * A missing confirmation ends as timed-out, which is not a failure: the file
 * may well be on the printer.
 */
class UploadSession : public QObject {
    Q_OBJECT

public:
    UploadSession(MessageTransport* transport,
                  ResultCorrelator* correlator,
                  const UploadRequest& request,
                  QObject* parent = nullptr);
    ~UploadSession() override;

    // Validates the request and schedules the first chunk
    bool start(QString* errorMessage = nullptr);

    // No-op once terminal
    void cancel();

    const Transfer& transfer() const { return m_transfer; }
    QString transferId() const { return m_transfer.transferId; }
    QString deviceId() const { return m_transfer.deviceId; }
    TransferState state() const { return m_transfer.state; }
    int progress() const { return m_progress; }
    bool isStarted() const { return m_started; }
    bool isFinished() const { return isTerminalState(m_transfer.state); }
    bool printAfterUpload() const { return m_printAfterUpload; }
    UploadOutcome outcome() const { return m_outcome; }

signals:
    void progressChanged(const QString& transferId, int percent);
    void stateChanged(const QString& transferId, TransferState state);
    void remoteProgress(const QString& transferId, const QString& stage, int percent);
    void finished(const UploadOutcome& outcome);

private:
    void publishNextChunk();
    void commit();
    void onResult(const ControllerResult& result);
    void onRejected(WaitError error, const QString& message);
    void onRemoteProgress(const ControllerResult& progress);

    bool transitionTo(TransferState state);
    void finishWith(TransferState state, const QString& errorText);
    void setProgress(int percent);
    void dropWait();

    QPointer<MessageTransport> m_transport;
    QPointer<ResultCorrelator> m_correlator;
    QByteArray m_data;
    Transfer m_transfer;
    UploadOutcome m_outcome;
    int m_resultTimeoutMs;
    bool m_printAfterUpload;
    int m_totalChunks = 0;
    int m_progress = 0;
    bool m_started = false;
    WaitHandle m_waitHandle = 0;
};

#endif // UPLOADSESSION_H
