#ifndef FILEMANAGERCORE_H
#define FILEMANAGERCORE_H

#include "OperationEngine.h"
#include "SearchEngine.h"
#include "WatchSubscription.h"

#include <QObject>

class Clipboard;

// Entry point for the UI. Settings from Config are applied to every
// request here, on the caller's thread. Returned handles and subscriptions
// are children of the core; delete them once done with them.
//
// Every submit call returns nullptr and fills errorMessage (when given)
// if the request is invalid.
class FileManagerCore : public QObject
{
    Q_OBJECT
public:
    explicit FileManagerCore(QObject* parent = nullptr);

    OperationHandle* submitOperation(OperationKind kind, const QStringList& paths,
                                     const QString& destination, QString* errorMessage = nullptr);
    // Config values fill in verification settings the request left at
    // their defaults.
    OperationHandle* submitOperation(OperationRequest request, QString* errorMessage = nullptr);

    OperationHandle* submitRename(const QString& path, const QString& newName,
                                  QString* errorMessage = nullptr);
    // Create parentDir/name, with missing intermediate directories.
    OperationHandle* submitCreateDirectory(const QString& parentDir, const QString& name,
                                           QString* errorMessage = nullptr);

    SearchHandle* submitSearch(const QString& root, const QString& pattern,
                               QString* errorMessage = nullptr);

    WatchSubscription* watchDirectory(const QString& path, QString* errorMessage = nullptr);

    // Copy or move the clipboard contents into destination. A cut
    // selection is cleared once the move has been submitted.
    OperationHandle* paste(Clipboard& clipboard, const QString& destination,
                           QString* errorMessage = nullptr);

    OperationEngine* operationEngine() const { return m_operationEngine; }
    SearchEngine* searchEngine() const { return m_searchEngine; }

private:
    OperationEngine* m_operationEngine;
    SearchEngine* m_searchEngine;
};

#endif // FILEMANAGERCORE_H
