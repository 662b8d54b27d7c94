#include "log.h"

#include <cstdio>

#include <QtCore/QDateTime>
#include <QtCore/QMutexLocker>
#include <QtCore/QThread>

namespace cctv {
namespace utils {
namespace log {

namespace {

static const char* const kLevelNames[] = {"NONE", "ERROR", "WARNING", "INFO", "DEBUG", "VERBOSE"};

} // namespace

QString toString(Level level)
{
    return QString::fromLatin1(kLevelNames[static_cast<int>(level)]);
}

Level levelFromString(const QString& text, Level defaultValue)
{
    const QString upper = text.trimmed().toUpper();
    for (int i = 0; i <= static_cast<int>(Level::verbose); ++i)
    {
        if (upper == QLatin1String(kLevelNames[i]))
            return static_cast<Level>(i);
    }
    return defaultValue;
}

//-------------------------------------------------------------------------------------------------

Logger::Logger():
    m_level(static_cast<int>(Level::info))
{
}

Logger::~Logger() = default;

void Logger::setLevel(Level level)
{
    m_level = static_cast<int>(level);
}

Level Logger::level() const
{
    return static_cast<Level>(m_level.load());
}

bool Logger::isToBeLogged(Level level) const
{
    return level != Level::none && static_cast<int>(level) <= m_level.load();
}

bool Logger::setLogFile(const QString& path)
{
    QMutexLocker lock(&m_mutex);
    if (path.isEmpty())
    {
        m_file.reset();
        return true;
    }

    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
        return false;

    m_file = std::move(file);
    return true;
}

void Logger::log(Level level, const Tag& tag, const QString& message)
{
    const QString line = lm("%1 %2 %3 %4: %5\n").args(
        QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss.zzz")),
        QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16),
        toString(level).leftJustified(7),
        tag.toString(),
        message);
    const QByteArray data = line.toUtf8();

    QMutexLocker lock(&m_mutex);
    if (m_file)
    {
        m_file->write(data);
        m_file->flush();
        return;
    }

    std::fputs(data.constData(), stderr);
    std::fflush(stderr);
}

Logger* Logger::instance()
{
    static Logger logger;
    return &logger;
}

} // namespace log
} // namespace utils
} // namespace cctv
