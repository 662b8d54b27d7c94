#pragma once

#include <atomic>
#include <memory>
#include <typeinfo>

#include <QtCore/QFile>
#include <QtCore/QMutex>
#include <QtCore/QString>

#include <boost/core/demangle.hpp>

#include "log_message.h"

namespace cctv {
namespace utils {
namespace log {

enum class Level
{
    none,
    error,
    warning,
    info,
    debug,
    verbose,
};

QString toString(Level level);

/**
 * Parses level names as written by toString(). Case-insensitive.
 * @return defaultValue if the text does not name a level.
 */
Level levelFromString(const QString& text, Level defaultValue = Level::info);

/**
 * Log record source. Either a class name taken from an object pointer or an arbitrary text.
 */
class Tag
{
public:
    Tag(const char* text): m_value(QString::fromUtf8(text)) {}
    Tag(const QString& text): m_value(text) {}

    template<typename T>
    Tag(const T* object):
        m_value(QString::fromStdString(boost::core::demangle(typeid(*object).name())))
    {
    }

    const QString& toString() const { return m_value; }

private:
    QString m_value;
};

class Logger
{
public:
    Logger();
    ~Logger();

    void setLevel(Level level);
    Level level() const;
    bool isToBeLogged(Level level) const;

    /**
     * Redirects output to the file (appending). An empty path restores stderr.
     * @return false if the file could not be opened, output is left unchanged then.
     */
    bool setLogFile(const QString& path);

    void log(Level level, const Tag& tag, const QString& message);

    static Logger* instance();

private:
    mutable QMutex m_mutex;
    std::atomic<int> m_level;
    std::unique_ptr<QFile> m_file;
};

} // namespace log
} // namespace utils
} // namespace cctv

#define CCTV_LOG(LEVEL, TAG, MESSAGE) \
    do \
    { \
        auto cctvLogger = ::cctv::utils::log::Logger::instance(); \
        if (cctvLogger->isToBeLogged(LEVEL)) \
            cctvLogger->log(LEVEL, ::cctv::utils::log::Tag(TAG), QString(MESSAGE)); \
    } while (0)

#define CCTV_ERROR(TAG, MESSAGE) CCTV_LOG(::cctv::utils::log::Level::error, TAG, MESSAGE)
#define CCTV_WARNING(TAG, MESSAGE) CCTV_LOG(::cctv::utils::log::Level::warning, TAG, MESSAGE)
#define CCTV_INFO(TAG, MESSAGE) CCTV_LOG(::cctv::utils::log::Level::info, TAG, MESSAGE)
#define CCTV_DEBUG(TAG, MESSAGE) CCTV_LOG(::cctv::utils::log::Level::debug, TAG, MESSAGE)
#define CCTV_VERBOSE(TAG, MESSAGE) CCTV_LOG(::cctv::utils::log::Level::verbose, TAG, MESSAGE)

/**
 * Logs a broken invariant. Debug builds stop in Q_ASSERT_X as well.
 */
#define CCTV_ASSERT(CONDITION, MESSAGE) \
    do \
    { \
        if (!(CONDITION)) \
        { \
            CCTV_ERROR("ASSERT", lm("%1 (%2:%3): %4").args( \
                #CONDITION, __FILE__, __LINE__, QString(MESSAGE))); \
            Q_ASSERT_X(false, Q_FUNC_INFO, #CONDITION); \
        } \
    } while (0)
