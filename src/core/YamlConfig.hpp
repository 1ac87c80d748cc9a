#pragma once

#include "core/bluetooth/BusSettings.hpp"
#include <QList>
#include <QString>
#include <QStringList>
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <stdexcept>

namespace btt {

/// Thrown by YamlConfig::load() when the file cannot be read or parsed.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class YamlConfig {
public:
    YamlConfig();

    void load(const QString& filePath);
    void loadFromString(const std::string& yaml);

    /// Problems that make the configuration unusable. Empty when valid.
    QStringList validate() const;

    /// Dotted paths of keys present in the loaded file but unknown to us.
    QStringList unknownKeys() const;

    // Timeout
    std::chrono::milliseconds timeout() const;
    bool notificationsEnabled() const;
    /// Warning offsets, de-duplicated and sorted longest first.
    QList<std::chrono::milliseconds> notificationsAt() const;

    // D-Bus
    QString dbusService() const;
    QString adapterInterface() const;
    QString adapterPath() const;
    QString deviceInterface() const;
    BusSettings busSettings() const;

    // Logging
    QString logLevel() const;
    QString logFile() const;

private:
    YAML::Node root_;
    QStringList unknownKeys_;

    void initDefaults();
    void mergeLoaded(const YAML::Node& loaded);
    QString stringAt(const char* section, const char* key, const char* fallback) const;
};

} // namespace btt
