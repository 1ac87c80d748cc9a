#include "core/Logging.hpp"
#include <QDebug>
#include <QFileInfo>
#include <QDir>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <cstdlib>
#include <iostream>

namespace btt {
namespace logging {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;
using boost::log::trivial::severity_level;

std::optional<severity_level> severityFromString(const QString& name)
{
    const QString level = name.trimmed().toLower();
    if (level == QLatin1String("trace")) return severity_level::trace;
    if (level == QLatin1String("debug")) return severity_level::debug;
    if (level == QLatin1String("info")) return severity_level::info;
    if (level == QLatin1String("warning")) return severity_level::warning;
    if (level == QLatin1String("error")) return severity_level::error;
    if (level == QLatin1String("fatal")) return severity_level::fatal;
    return std::nullopt;
}

bool init(severity_level level, const QString& filePath)
{
    auto core = boost::log::core::get();
    core->remove_all_sinks();
    boost::log::add_common_attributes();

    const auto format = expr::stream
        << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << "] [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID")
        << "] [" << boost::log::trivial::severity
        << "] " << expr::smessage;

    boost::log::add_console_log(std::clog,
        keywords::format = format,
        keywords::auto_flush = true);

    core->set_filter(boost::log::trivial::severity >= level);

    if (filePath.isEmpty())
        return true;

    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        BOOST_LOG_TRIVIAL(warning) << "[Logging] Could not create log directory "
                                   << info.absolutePath().toStdString() << ", logging to console only";
        return false;
    }

    try {
        boost::log::add_file_log(
            keywords::file_name = info.absoluteFilePath().toStdString(),
            keywords::open_mode = std::ios_base::out | std::ios_base::app,
            keywords::format = format,
            keywords::auto_flush = true);
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "[Logging] File logging could not be initialized ("
                                   << e.what() << "), logging to console only";
        return false;
    }
    return true;
}

namespace {

void qtMessageHandler(QtMsgType type, const QMessageLogContext&, const QString& message)
{
    const std::string text = message.toStdString();
    switch (type) {
    case QtDebugMsg:
        BOOST_LOG_TRIVIAL(debug) << text;
        break;
    case QtInfoMsg:
        BOOST_LOG_TRIVIAL(info) << text;
        break;
    case QtWarningMsg:
        BOOST_LOG_TRIVIAL(warning) << text;
        break;
    case QtCriticalMsg:
        BOOST_LOG_TRIVIAL(error) << text;
        break;
    case QtFatalMsg:
        BOOST_LOG_TRIVIAL(fatal) << text;
        boost::log::core::get()->flush();
        std::abort();
    }
}

} // namespace

QtMessageHandler installQtMessageHandler()
{
    return qInstallMessageHandler(qtMessageHandler);
}

} // namespace logging
} // namespace btt
