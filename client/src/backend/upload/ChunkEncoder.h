#ifndef CHUNKENCODER_H
#define CHUNKENCODER_H

#include <QByteArray>
#include <QList>
#include <QString>
#include "backend/protocol/WireMessages.h"

// Splits upload payloads into fixed-size slices and wraps them for the wire.
class ChunkEncoder {
public:
    static constexpr int DEFAULT_CHUNK_SIZE = 32 * 1024;

    // Base64: deterministic and reversible, safe inside JSON text
    static QString encode(const QByteArray& raw);
    static QByteArray decode(const QString& text);

    // Slices of exactly chunkSize bytes except the last. Empty input yields a
    // single empty slice; chunkSize <= 0 yields nothing.
    static QList<QByteArray> split(const QByteArray& raw, int chunkSize);

    // Number of slices split() would produce (at least 1 for a valid chunk size)
    static int chunkCount(qint64 totalSize, int chunkSize);

    // Slice at index without materialising the whole list
    static QByteArray sliceAt(const QByteArray& raw, int chunkSize, int index);

    static ChunkEnvelope buildEnvelope(const QString& transferId,
                                       int index,
                                       const QByteArray& slice,
                                       const QString& filename,
                                       qint64 totalSize,
                                       UploadDestination destination);
};

#endif // CHUNKENCODER_H
