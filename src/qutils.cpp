#include "quitls.h"

#include <QDir>
#include <QFile>

std::filesystem::path toFsPath(const QString& path)
{
    return std::filesystem::path(QFile::encodeName(path).toStdString());
}

QString fromFsPath(const std::filesystem::path& path)
{
    return QFile::decodeName(QByteArray::fromStdString(path.native()));
}

QString baseName(const QString& path)
{
    QString clean = QDir::cleanPath(path);
    if (clean == "/")
        return QString();

    int lastSlash = clean.lastIndexOf('/');
    return lastSlash >= 0 ? clean.mid(lastSlash + 1) : clean;
}
