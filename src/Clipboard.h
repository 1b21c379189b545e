#ifndef CLIPBOARD_H
#define CLIPBOARD_H

#include "OperationTypes.h"

#include <QStringList>

// Selection put aside by Copy or Cut, turned into a batch on paste.
class Clipboard
{
public:
    void copy(const QStringList& paths);
    void cut(const QStringList& paths);
    void clear();

    bool isEmpty() const { return m_paths.isEmpty(); }
    bool isCutMode() const { return m_cutMode; }
    const QStringList& paths() const { return m_paths; }

    // Move request when cut, Copy request otherwise.
    OperationRequest toRequest(const QString& destinationDir) const;

private:
    QStringList m_paths;
    bool m_cutMode = false;
};

#endif // CLIPBOARD_H
