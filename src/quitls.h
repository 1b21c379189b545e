#pragma once

#include <QString>
#include <filesystem>

// Bridges between Qt paths and std::filesystem paths. Conversion goes
// through the local 8-bit encoding so file names that are not valid UTF-8
// survive the round trip.
std::filesystem::path toFsPath(const QString& path);
QString fromFsPath(const std::filesystem::path& path);

// Last path component, ignoring a trailing slash ("/a/dirB/" -> "dirB").
QString baseName(const QString& path);
