/** \file Package.hpp
 *  In-memory OPC (zip) container. Parts are held as implicitly shared QByteArrays, so copying
 *  a Package is cheap and copies never observe each other's writes.
 */
#pragma once
#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>
#include <optional>

namespace QtPptxTemplate { namespace opc {

class Package {
public:
    /** Read every entry of a zip file on disk. Returns false on I/O or archive errors. */
    bool open(const QString &path);
    /** Read every entry of an in-memory zip archive. */
    bool openData(const QByteArray &zipData);

    std::optional<QByteArray> readPart(const QString &name) const;
    /** Create or replace a part. New parts keep insertion order when saved. */
    void writePart(const QString &name, const QByteArray &data);
    bool removePart(const QString &name);
    bool hasPart(const QString &name) const { return m_parts.contains(name); }
    QStringList partNames() const { return m_order; }

    /** Store bytes under ppt/media/ with a free name; returns the part name. */
    QString addMedia(const QByteArray &data, const QString &extension);

    /** Serialize to zip bytes ([Content_Types].xml first). std::nullopt on archive errors. */
    std::optional<QByteArray> save() const;

    /** Description of the last failed open/save. */
    QString errorString() const { return m_error; }

private:
    QMap<QString, QByteArray> m_parts;
    QStringList m_order;
    mutable QString m_error;
};

}} // namespace QtPptxTemplate::opc
