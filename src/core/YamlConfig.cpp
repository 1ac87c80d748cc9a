#include "core/YamlConfig.hpp"
#include "core/YamlMerge.hpp"
#include "core/Duration.hpp"
#include <QRegularExpression>
#include <algorithm>
#include <functional>

namespace btt {

namespace {

const QStringList kLogLevels = {
    QStringLiteral("trace"), QStringLiteral("debug"), QStringLiteral("info"),
    QStringLiteral("warning"), QStringLiteral("error"), QStringLiteral("fatal"),
};

bool isInterfaceName(const QString& name)
{
    static const QRegularExpression re(
        QStringLiteral("^[A-Za-z_][A-Za-z0-9_]*(\\.[A-Za-z_][A-Za-z0-9_]*)+$"));
    return name.size() <= 255 && re.match(name).hasMatch();
}

bool isBusName(const QString& name)
{
    static const QRegularExpression re(
        QStringLiteral("^[A-Za-z_-][A-Za-z0-9_-]*(\\.[A-Za-z_-][A-Za-z0-9_-]*)+$"));
    return name.size() <= 255 && re.match(name).hasMatch();
}

bool isObjectPath(const QString& path)
{
    static const QRegularExpression re(QStringLiteral("^(/[A-Za-z0-9_]+)+$"));
    return re.match(path).hasMatch();
}

QString scalarText(const YAML::Node& node)
{
    return QString::fromStdString(node.as<std::string>());
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["timeout"] = "5m 1s";
    root_["notifications_enabled"] = true;
    root_["notifications_at"] = YAML::Node(YAML::NodeType::Sequence);
    root_["notifications_at"].push_back("5m");
    root_["notifications_at"].push_back("1m");
    root_["notifications_at"].push_back("30s");
    root_["notifications_at"].push_back("10s");

    root_["dbus"]["service"] = "org.bluez";
    root_["dbus"]["adapter_iface"] = "org.bluez.Adapter1";
    root_["dbus"]["adapter_path"] = "/org/bluez/hci0";
    root_["dbus"]["device_iface"] = "org.bluez.Device1";

    root_["log"]["level"] = "info";
    root_["log"]["file"] = "";
}

void YamlConfig::load(const QString& filePath)
{
    YAML::Node loaded;
    try {
        loaded = YAML::LoadFile(filePath.toStdString());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Could not read config file '" + filePath.toStdString() + "': " + e.what());
    }
    mergeLoaded(loaded);
}

void YamlConfig::loadFromString(const std::string& yaml)
{
    YAML::Node loaded;
    try {
        loaded = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Could not parse configuration: ") + e.what());
    }
    mergeLoaded(loaded);
}

void YamlConfig::mergeLoaded(const YAML::Node& loaded)
{
    if (loaded.IsDefined() && !loaded.IsNull() && !loaded.IsMap())
        throw ConfigError("Configuration root must be a mapping");

    initDefaults();
    std::vector<std::string> unknown;
    root_ = mergeYaml(YAML::Clone(root_), loaded, unknown);

    unknownKeys_.clear();
    for (const auto& key : unknown)
        unknownKeys_ << QString::fromStdString(key);
}

QStringList YamlConfig::unknownKeys() const
{
    return unknownKeys_;
}

QStringList YamlConfig::validate() const
{
    QStringList errors;

    const YAML::Node timeoutNode = root_["timeout"];
    if (!timeoutNode.IsScalar()) {
        errors << QStringLiteral("timeout: expected a duration");
    } else {
        const auto parsed = parseDuration(scalarText(timeoutNode));
        if (!parsed)
            errors << QStringLiteral("timeout: cannot parse '%1'").arg(scalarText(timeoutNode));
        else if (parsed->count() <= 0)
            errors << QStringLiteral("timeout: must be greater than zero");
    }

    try {
        root_["notifications_enabled"].as<bool>();
    } catch (const YAML::Exception&) {
        errors << QStringLiteral("notifications_enabled: expected true or false");
    }

    const YAML::Node offsets = root_["notifications_at"];
    if (!offsets.IsSequence()) {
        errors << QStringLiteral("notifications_at: expected a list of durations");
    } else {
        for (std::size_t i = 0; i < offsets.size(); ++i) {
            const YAML::Node item = offsets[i];
            const auto parsed = item.IsScalar() ? parseDuration(scalarText(item)) : std::nullopt;
            if (!parsed)
                errors << QStringLiteral("notifications_at[%1]: cannot parse duration").arg(i);
            else if (parsed->count() <= 0)
                errors << QStringLiteral("notifications_at[%1]: must be greater than zero").arg(i);
        }
    }

    if (!root_["dbus"].IsMap()) {
        errors << QStringLiteral("dbus: expected a mapping");
    } else {
        if (!isBusName(dbusService()))
            errors << QStringLiteral("dbus.service: '%1' is not a valid bus name").arg(dbusService());
        if (!isInterfaceName(adapterInterface()))
            errors << QStringLiteral("dbus.adapter_iface: '%1' is not a valid interface name").arg(adapterInterface());
        if (!isInterfaceName(deviceInterface()))
            errors << QStringLiteral("dbus.device_iface: '%1' is not a valid interface name").arg(deviceInterface());
        if (!isObjectPath(adapterPath()))
            errors << QStringLiteral("dbus.adapter_path: '%1' is not a valid object path").arg(adapterPath());
    }

    if (!root_["log"].IsMap()) {
        errors << QStringLiteral("log: expected a mapping");
    } else if (!kLogLevels.contains(logLevel())) {
        errors << QStringLiteral("log.level: '%1' is not one of %2").arg(logLevel(), kLogLevels.join(", "));
    }

    return errors;
}

// --- Timeout ---

std::chrono::milliseconds YamlConfig::timeout() const
{
    const YAML::Node node = root_["timeout"];
    if (node.IsScalar()) {
        if (auto parsed = parseDuration(scalarText(node)))
            return *parsed;
    }
    return std::chrono::milliseconds(301000);
}

bool YamlConfig::notificationsEnabled() const
{
    return root_["notifications_enabled"].as<bool>(true);
}

QList<std::chrono::milliseconds> YamlConfig::notificationsAt() const
{
    QList<std::chrono::milliseconds> result;
    const YAML::Node offsets = root_["notifications_at"];
    if (!offsets.IsSequence())
        return result;

    for (const auto& item : offsets) {
        if (!item.IsScalar())
            continue;
        const auto parsed = parseDuration(scalarText(item));
        if (parsed && parsed->count() > 0 && !result.contains(*parsed))
            result << *parsed;
    }
    std::sort(result.begin(), result.end(), std::greater<>());
    return result;
}

// --- D-Bus ---

QString YamlConfig::stringAt(const char* section, const char* key, const char* fallback) const
{
    const YAML::Node sec = root_[section];
    if (!sec.IsMap())
        return QString::fromLatin1(fallback);
    const YAML::Node value = sec[key];
    if (!value.IsScalar())
        return QString::fromLatin1(fallback);
    return scalarText(value).trimmed();
}

QString YamlConfig::dbusService() const
{
    return stringAt("dbus", "service", "org.bluez");
}

QString YamlConfig::adapterInterface() const
{
    return stringAt("dbus", "adapter_iface", "org.bluez.Adapter1");
}

QString YamlConfig::adapterPath() const
{
    return stringAt("dbus", "adapter_path", "/org/bluez/hci0");
}

QString YamlConfig::deviceInterface() const
{
    return stringAt("dbus", "device_iface", "org.bluez.Device1");
}

BusSettings YamlConfig::busSettings() const
{
    BusSettings settings;
    settings.service = dbusService();
    settings.adapterPath = adapterPath();
    settings.adapterInterface = adapterInterface();
    settings.deviceInterface = deviceInterface();
    return settings;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return stringAt("log", "level", "info").toLower();
}

QString YamlConfig::logFile() const
{
    return stringAt("log", "file", "");
}

} // namespace btt
