#include "Clipboard.h"

void Clipboard::copy(const QStringList& paths)
{
    m_paths = paths;
    m_cutMode = false;
}

void Clipboard::cut(const QStringList& paths)
{
    m_paths = paths;
    m_cutMode = true;
}

void Clipboard::clear()
{
    m_paths.clear();
    m_cutMode = false;
}

OperationRequest Clipboard::toRequest(const QString& destinationDir) const
{
    OperationRequest request;
    request.kind = m_cutMode ? OperationKind::Move : OperationKind::Copy;
    request.sourcePaths = m_paths;
    request.destinationDir = destinationDir;
    return request;
}
