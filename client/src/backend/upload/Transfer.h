#ifndef TRANSFER_H
#define TRANSFER_H

#include <QString>
#include <QMetaType>
#include "backend/protocol/WireMessages.h"

// sending -> committing -> awaiting-result -> {succeeded | failed | timed-out}
// plus cancelled from any non-terminal state.
enum class TransferState {
    Sending,
    Committing,
    AwaitingResult,
    Succeeded,
    Failed,
    TimedOut,
    Cancelled
};

QString transferStateName(TransferState state);
bool isTerminalState(TransferState state);
bool isValidTransition(TransferState from, TransferState to);

// 100 only once the controller confirmed; otherwise capped at 99
int progressPercent(qint64 sentBytes, qint64 totalSize, bool confirmed);

/**
 * One file upload. Mutated only by the UploadSession that owns it.
 */
struct Transfer {
    QString transferId;
    QString deviceId;
    QString filename;
    qint64 totalSize = 0;
    UploadDestination destination = UploadDestination::Local;
    int chunkSize = 0;
    qint64 sentBytes = 0;
    int chunksSent = 0;
    TransferState state = TransferState::Sending;

    static QString generateTransferId();
};

// Single completion report for a transfer
struct UploadOutcome {
    QString transferId;
    QString deviceId;
    QString filename;
    UploadDestination destination = UploadDestination::Local;
    TransferState state = TransferState::Failed;
    QString errorText;
    QString remoteFilename;
    QString remoteTarget;

    bool succeeded() const { return state == TransferState::Succeeded; }
    bool timedOut() const { return state == TransferState::TimedOut; }
};

Q_DECLARE_METATYPE(TransferState)
Q_DECLARE_METATYPE(UploadOutcome)

#endif // TRANSFER_H
