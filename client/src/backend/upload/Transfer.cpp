#include "backend/upload/Transfer.h"
#include <QUuid>
#include <algorithm>

QString transferStateName(TransferState state) {
    switch (state) {
        case TransferState::Sending: return "sending";
        case TransferState::Committing: return "committing";
        case TransferState::AwaitingResult: return "awaiting-result";
        case TransferState::Succeeded: return "succeeded";
        case TransferState::Failed: return "failed";
        case TransferState::TimedOut: return "timed-out";
        case TransferState::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool isTerminalState(TransferState state) {
    return state == TransferState::Succeeded
        || state == TransferState::Failed
        || state == TransferState::TimedOut
        || state == TransferState::Cancelled;
}

bool isValidTransition(TransferState from, TransferState to) {
    if (isTerminalState(from)) return false;
    if (to == TransferState::Cancelled || to == TransferState::Failed) return true;

    switch (from) {
        case TransferState::Sending:
            return to == TransferState::Committing;
        case TransferState::Committing:
            return to == TransferState::AwaitingResult;
        case TransferState::AwaitingResult:
            return to == TransferState::Succeeded || to == TransferState::TimedOut;
        default:
            return false;
    }
}

int progressPercent(qint64 sentBytes, qint64 totalSize, bool confirmed) {
    if (confirmed) return 100;
    if (totalSize <= 0) return 99; // an empty file is fully sent by its only chunk
    const qint64 percent = (std::max<qint64>(sentBytes, 0) * 100) / totalSize;
    return static_cast<int>(std::clamp<qint64>(percent, 0, 99));
}

QString Transfer::generateTransferId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}
