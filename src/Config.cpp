#include "Config.h"
#include "fileutils.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <QStandardPaths>

#include <fstream>

#include <toml++/toml.h>

QString Config::defaultConfigPath() const
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::ConfigLocation);
    if (base.isEmpty())
        base = QDir::homePath() + "/.config";

    QDir dir(base + "/spleen");
    if (!dir.exists())
        dir.mkpath(".");

    return dir.filePath("config.toml");
}

Config& Config::instance()
{
    static Config cfg;
    return cfg;
}

void Config::resetToDefaults()
{
    m_verifyCopies = false;
    m_verifyAlgorithm = "SHA-256";
    m_hashBufferSize = DefaultHashBufferSize;
    m_searchCaseSensitive = true;
    m_searchProgressInterval = 1000;
    m_debounceMs = DefaultDebounceMs;
}

bool Config::load(const QString& path)
{
    m_configPath = path;
    resetToDefaults();

    QFile f(path);
    if (!f.exists()) {
        qDebug() << "Config file does not exist, using defaults.";
        return true;
    }

    try {
        auto tbl = toml::parse_file(path.toStdString());

        // [operations] section
        if (auto ops = tbl["operations"].as_table()) {
            if (auto verify = (*ops)["verify_copies"].value<bool>())
                m_verifyCopies = *verify;
            if (auto algo = (*ops)["verify_algorithm"].value<std::string>()) {
                const std::string trimmed = fileutils::trim(*algo);
                if (!trimmed.empty())
                    m_verifyAlgorithm = QString::fromStdString(trimmed);
            }
            if (auto buf = (*ops)["hash_buffer_size"].value<int64_t>()) {
                if (*buf > 0)
                    m_hashBufferSize = static_cast<int>(*buf);
                else
                    qWarning() << "Ignoring non-positive hash_buffer_size" << *buf;
            }
        }

        // [search] section
        if (auto search = tbl["search"].as_table()) {
            if (auto cs = (*search)["case_sensitive"].value<bool>())
                m_searchCaseSensitive = *cs;
            if (auto interval = (*search)["progress_interval"].value<int64_t>()) {
                if (*interval > 0)
                    m_searchProgressInterval = static_cast<int>(*interval);
            }
        }

        // [watch] section
        if (auto watch = tbl["watch"].as_table()) {
            if (auto ms = (*watch)["debounce_ms"].value<int64_t>()) {
                if (*ms >= 0)
                    m_debounceMs = static_cast<int>(*ms);
                else
                    qWarning() << "Ignoring negative debounce_ms" << *ms;
            }
        }
    }
    catch (const std::exception& e) {
        qWarning() << "Failed to parse config.toml:" << e.what();
        resetToDefaults();
        return false;
    }

    return true;
}

bool Config::validateToml(const QString& content, QString& errorMsg)
{
    try {
        auto parse_result = toml::parse(content.toStdString());
        return true;
    }
    catch (const toml::parse_error& e) {
        errorMsg = QString::fromStdString(std::string(e.description()));
        if (e.source().begin.line > 0) {
            errorMsg += QString(" (line %1)").arg(e.source().begin.line);
        }
        return false;
    }
}

bool Config::save() const
{
    if (m_configPath.isEmpty())
        return false;

    toml::table tbl;

    // [operations] section
    toml::table opsTbl;
    opsTbl.insert("verify_copies", m_verifyCopies);
    opsTbl.insert("verify_algorithm", m_verifyAlgorithm.toStdString());
    opsTbl.insert("hash_buffer_size", static_cast<int64_t>(m_hashBufferSize));
    tbl.insert("operations", opsTbl);

    // [search] section
    toml::table searchTbl;
    searchTbl.insert("case_sensitive", m_searchCaseSensitive);
    searchTbl.insert("progress_interval", static_cast<int64_t>(m_searchProgressInterval));
    tbl.insert("search", searchTbl);

    // [watch] section
    toml::table watchTbl;
    watchTbl.insert("debounce_ms", static_cast<int64_t>(m_debounceMs));
    tbl.insert("watch", watchTbl);

    std::ofstream out(m_configPath.toStdString());
    if (!out) {
        qWarning() << "Failed to save TOML config to" << m_configPath;
        return false;
    }
    out << tbl;
    out.flush();
    if (!out) {
        qWarning() << "Failed to write TOML config to" << m_configPath;
        return false;
    }

    return true;
}
