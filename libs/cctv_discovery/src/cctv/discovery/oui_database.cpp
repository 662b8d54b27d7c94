#include "oui_database.h"

#include <QtCore/QFile>
#include <QtCore/QTextStream>

#include <cctv/network/mac_address.h>
#include <cctv/utils/log/log.h>

namespace cctv {
namespace discovery {

namespace {

struct BuiltInEntry
{
    const char* prefix;
    const char* manufacturer;
};

static const BuiltInEntry kBuiltInEntries[] = {
    {"44:19:B6", "Hikvision"},
    {"C0:56:E3", "Hikvision"},
    {"4C:BD:8F", "Hikvision"},
    {"BC:AD:28", "Hikvision"},
    {"28:57:BE", "Hikvision"},
    {"3C:EF:8C", "Dahua"},
    {"90:02:A9", "Dahua"},
    {"E0:50:8B", "Dahua"},
    {"00:40:8C", "Axis"},
    {"AC:CC:8E", "Axis"},
    {"B8:A4:4F", "Axis"},
    {"00:02:D1", "Vivotek"},
    {"00:09:18", "Hanwha"},
    {"48:EA:63", "Uniview"},
    {"00:80:45", "Panasonic"},
    {"08:00:46", "Sony"},
};

static const char* const kCctvManufacturers[] = {
    "hikvision", "dahua", "axis", "vivotek", "sony", "panasonic", "samsung", "bosch",
    "hanwha", "honeywell", "uniview", "cp plus", "godrej", "matrix",
};

QString prefixKey(const QString& prefix)
{
    QString key = prefix.trimmed().toUpper();
    key.remove(QLatin1Char(':'));
    key.remove(QLatin1Char('-'));
    if (key.size() != 6)
        return QString();

    for (const QChar ch: key)
    {
        if (!ch.isDigit() && (ch < QLatin1Char('A') || ch > QLatin1Char('F')))
            return QString();
    }
    return key;
}

} // namespace

const QString OuiDatabase::kUnknownManufacturer = QStringLiteral("Unknown");

OuiDatabase::OuiDatabase()
{
    for (const auto& entry: kBuiltInEntries)
        add(QLatin1String(entry.prefix), QLatin1String(entry.manufacturer));
}

int OuiDatabase::loadCsv(QIODevice* device)
{
    QTextStream stream(device);
    stream.setCodec("UTF-8");

    int count = 0;
    while (!stream.atEnd())
    {
        const QString line = stream.readLine().trimmed();
        if (line.isEmpty() || line.startsWith(QLatin1Char('#')))
            continue;

        const int commaPos = line.indexOf(QLatin1Char(','));
        if (commaPos == -1)
            continue;

        if (add(line.left(commaPos), line.mid(commaPos + 1).trimmed()))
            ++count;
    }
    return count;
}

int OuiDatabase::loadCsvFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        CCTV_WARNING(this, lm("Could not open OUI database %1: %2").args(path, file.errorString()));
        return -1;
    }

    const int count = loadCsv(&file);
    CCTV_INFO(this, lm("Loaded %1 OUI entries from %2").args(count, path));
    return count;
}

bool OuiDatabase::add(const QString& prefix, const QString& manufacturer)
{
    const QString key = prefixKey(prefix);
    if (key.isEmpty() || manufacturer.isEmpty())
        return false;

    m_manufacturers.insert(key, manufacturer);
    return true;
}

QString OuiDatabase::lookup(const QString& macAddress) const
{
    const auto prefix = network::macPrefix(macAddress);
    if (!prefix)
        return kUnknownManufacturer;

    return m_manufacturers.value(prefixKey(*prefix), kUnknownManufacturer);
}

bool OuiDatabase::isCctvManufacturer(const QString& manufacturer)
{
    const QString lower = manufacturer.toLower();
    for (const char* name: kCctvManufacturers)
    {
        if (lower.contains(QLatin1String(name)))
            return true;
    }
    return false;
}

} // namespace discovery
} // namespace cctv
