#pragma once

#include <QtCore/QHash>
#include <QtCore/QIODevice>
#include <QtCore/QString>

namespace cctv {
namespace discovery {

/**
 * MAC prefix (OUI) to manufacturer name. Prefixes are accepted as "XX:XX:XX", "XX-XX-XX" or
 * "XXXXXX".
 */
class OuiDatabase
{
public:
    static const QString kUnknownManufacturer;

    /**
     * Starts with a built-in table of common surveillance vendors.
     */
    OuiDatabase();

    /**
     * Reads "prefix,manufacturer" lines, '#' starts a comment line.
     * @return Number of entries added.
     */
    int loadCsv(QIODevice* device);

    /**
     * @return -1 if the file could not be opened.
     */
    int loadCsvFile(const QString& path);

    bool add(const QString& prefix, const QString& manufacturer);

    /**
     * @return kUnknownManufacturer if macAddress is too short or its prefix is not known.
     */
    QString lookup(const QString& macAddress) const;

    int size() const { return m_manufacturers.size(); }

    static bool isCctvManufacturer(const QString& manufacturer);

private:
    QHash<QString, QString> m_manufacturers; //< Key is six upper-case hex digits.
};

} // namespace discovery
} // namespace cctv
