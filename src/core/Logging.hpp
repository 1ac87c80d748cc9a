#pragma once

#include <QString>
#include <QtGlobal>
#include <boost/log/trivial.hpp>
#include <optional>

namespace btt {
namespace logging {

/// Map a configuration level name ("debug", "info", ...) to a Boost.Log severity.
std::optional<boost::log::trivial::severity_level> severityFromString(const QString& name);

/// Set up the Boost.Log sinks: stderr always, plus filePath in append mode when
/// non-empty. Returns false if the file sink could not be opened; console
/// logging is active either way.
bool init(boost::log::trivial::severity_level level, const QString& filePath = QString());

/// Route qDebug/qInfo/qWarning/qCritical into Boost.Log. Returns the handler
/// that was installed before.
QtMessageHandler installQtMessageHandler();

} // namespace logging
} // namespace btt
