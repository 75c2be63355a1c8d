#include "backend/upload/ChunkEncoder.h"

QString ChunkEncoder::encode(const QByteArray& raw) {
    return QString::fromLatin1(raw.toBase64());
}

QByteArray ChunkEncoder::decode(const QString& text) {
    return QByteArray::fromBase64(text.toLatin1());
}

QList<QByteArray> ChunkEncoder::split(const QByteArray& raw, int chunkSize) {
    QList<QByteArray> slices;
    if (chunkSize <= 0) return slices;

    if (raw.isEmpty()) {
        // The controller still needs a chunk 0 to learn the filename
        slices.append(QByteArray());
        return slices;
    }

    for (qsizetype offset = 0; offset < raw.size(); offset += chunkSize) {
        slices.append(raw.mid(offset, chunkSize));
    }
    return slices;
}

int ChunkEncoder::chunkCount(qint64 totalSize, int chunkSize) {
    if (chunkSize <= 0) return 0;
    if (totalSize <= 0) return 1;
    return static_cast<int>((totalSize + chunkSize - 1) / chunkSize);
}

QByteArray ChunkEncoder::sliceAt(const QByteArray& raw, int chunkSize, int index) {
    if (chunkSize <= 0 || index < 0) return QByteArray();
    const qint64 offset = static_cast<qint64>(index) * chunkSize;
    if (offset >= raw.size()) return QByteArray();
    return raw.mid(offset, chunkSize);
}

ChunkEnvelope ChunkEncoder::buildEnvelope(const QString& transferId,
                                          int index,
                                          const QByteArray& slice,
                                          const QString& filename,
                                          qint64 totalSize,
                                          UploadDestination destination) {
    ChunkEnvelope envelope;
    envelope.transferId = transferId;
    envelope.index = index;
    envelope.payload = encode(slice);
    envelope.payloadLength = slice.size();
    if (index == 0) {
        envelope.filename = filename;
        envelope.totalSize = totalSize;
        envelope.destination = destination;
    }
    return envelope;
}
