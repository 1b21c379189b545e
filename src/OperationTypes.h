#ifndef OPERATIONTYPES_H
#define OPERATIONTYPES_H

#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

enum class OperationKind {
    Copy,
    Move,
    Delete,
    Extract,    // zip archives; destination optional (defaults to archive's dir)
    Rename,     // one source, new base name in the same directory
    CreateDirectory   // sources are the directories to create, parents included
};

QString operationKindName(OperationKind kind);

struct OperationRequest {
    OperationKind kind = OperationKind::Copy;
    QStringList sourcePaths;       // absolute, processed in this order
    QString destinationDir;        // required for Copy/Move, empty for Delete/Rename/CreateDirectory
    QString newName;               // Rename only
    bool overwriteExisting = false;
    bool verifyCopies = false;     // hash-compare copied regular files
    QString verifyAlgorithm = "SHA-256";
    int hashBufferSize = 64 * 1024;
};

struct OperationProgress {
    int completedCount = 0;
    int totalCount = 0;
    QString currentPath;
};

struct OperationError {
    QString path;
    QString message;
};

struct OperationResult {
    QVector<OperationError> errors;   // empty means every processed item succeeded
    bool cancelled = false;

    bool succeeded() const { return errors.isEmpty() && !cancelled; }
};

Q_DECLARE_METATYPE(OperationProgress)
Q_DECLARE_METATYPE(OperationResult)

#endif // OPERATIONTYPES_H
