#ifndef CONFIG_H
#define CONFIG_H

#include <QString>

// Engine settings persisted in config.toml.
// Read on the caller's thread only; values are copied into requests at
// submission time so worker threads never touch the singleton.
class Config
{
public:
  static Config& instance();

  QString defaultConfigPath() const;

  bool load(const QString& path);
  bool save() const;

  void setConfigPath(const QString& p) { m_configPath = p; }
  QString configPath() const { return m_configPath; }

  // Validate TOML content without loading it
  static bool validateToml(const QString& content, QString& errorMsg);

  // [operations]
  bool verifyCopies() const { return m_verifyCopies; }
  void setVerifyCopies(bool verify) { m_verifyCopies = verify; }

  QString verifyAlgorithm() const { return m_verifyAlgorithm; }
  void setVerifyAlgorithm(const QString& algorithm) { m_verifyAlgorithm = algorithm; }

  int hashBufferSize() const { return m_hashBufferSize; }
  void setHashBufferSize(int size) { m_hashBufferSize = size; }

  // [search]
  bool searchCaseSensitive() const { return m_searchCaseSensitive; }
  void setSearchCaseSensitive(bool cs) { m_searchCaseSensitive = cs; }

  int searchProgressInterval() const { return m_searchProgressInterval; }
  void setSearchProgressInterval(int interval) { m_searchProgressInterval = interval; }

  // [watch]
  int debounceMs() const { return m_debounceMs; }
  void setDebounceMs(int ms) { m_debounceMs = ms; }

  static constexpr int DefaultDebounceMs = 300;
  static constexpr int DefaultHashBufferSize = 64 * 1024;

private:
  Config() = default;

  void resetToDefaults();

  QString m_configPath;

  bool m_verifyCopies = false;
  QString m_verifyAlgorithm = "SHA-256";
  int m_hashBufferSize = DefaultHashBufferSize;

  bool m_searchCaseSensitive = true;
  int m_searchProgressInterval = 1000;

  int m_debounceMs = DefaultDebounceMs;
};

#endif
