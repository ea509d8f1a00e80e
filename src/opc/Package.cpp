#include "opc/Package.hpp"
#include "util/Logging.hpp"
#include <QFile>
#include <archive.h>
#include <archive_entry.h>

namespace QtPptxTemplate { namespace opc {

namespace {

const char *kContentTypesPart = "[Content_Types].xml";

la_ssize_t appendToByteArray(struct archive *, void *clientData, const void *buffer, size_t length) {
    auto *out = static_cast<QByteArray*>(clientData);
    out->append(static_cast<const char*>(buffer), static_cast<qsizetype>(length));
    return static_cast<la_ssize_t>(length);
}

QString archiveError(struct archive *a) {
    const char *msg = archive_error_string(a);
    return msg ? QString::fromUtf8(msg) : QStringLiteral("unknown libarchive error");
}

} // namespace

bool Package::open(const QString &path) {
    QFile f(path);
    if(!f.open(QIODevice::ReadOnly)) {
        m_error = QStringLiteral("cannot open %1: %2").arg(path, f.errorString());
        qCWarning(lcPackage, "%s", qPrintable(m_error));
        return false;
    }
    return openData(f.readAll());
}

bool Package::openData(const QByteArray &zipData) {
    m_parts.clear(); m_order.clear(); m_error.clear();
    if(zipData.isEmpty()) { m_error = QStringLiteral("empty archive"); return false; }

    struct archive *in = archive_read_new();
    archive_read_support_format_zip(in);
    int r = archive_read_open_memory(in, zipData.constData(), static_cast<size_t>(zipData.size()));
    if(r != ARCHIVE_OK && r != ARCHIVE_WARN) {
        m_error = archiveError(in);
        qCWarning(lcPackage, "Failed to open package: %s", qPrintable(m_error));
        archive_read_free(in);
        return false;
    }

    struct archive_entry *entry = nullptr;
    bool ok = true;
    while((r = archive_read_next_header(in, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const char *ename = archive_entry_pathname(entry);
        if(!ename || archive_entry_filetype(entry) == AE_IFDIR) { archive_read_data_skip(in); continue; }
        QByteArray data;
        const void *buff = nullptr; size_t size = 0; la_int64_t offset = 0;
        for(;;) {
            const int rb = archive_read_data_block(in, &buff, &size, &offset);
            if(rb == ARCHIVE_EOF) break;
            if(rb != ARCHIVE_OK && rb != ARCHIVE_WARN) {
                m_error = QStringLiteral("corrupt entry %1: %2").arg(QString::fromUtf8(ename), archiveError(in));
                ok = false;
                break;
            }
            data.append(static_cast<const char*>(buff), static_cast<qsizetype>(size));
        }
        if(!ok) break;
        writePart(QString::fromUtf8(ename), data);
    }
    if(ok && r != ARCHIVE_EOF) { m_error = archiveError(in); ok = false; }
    archive_read_close(in);
    archive_read_free(in);
    if(!ok) {
        qCWarning(lcPackage, "Package read failed: %s", qPrintable(m_error));
        m_parts.clear(); m_order.clear();
        return false;
    }
    qCDebug(lcPackage) << "Package opened with" << m_order.size() << "parts";
    return true;
}

std::optional<QByteArray> Package::readPart(const QString &name) const {
    auto it = m_parts.constFind(name);
    if(it == m_parts.constEnd()) return std::nullopt;
    return it.value();
}

void Package::writePart(const QString &name, const QByteArray &data) {
    if(!m_parts.contains(name)) m_order << name;
    m_parts.insert(name, data);
}

bool Package::removePart(const QString &name) {
    if(!m_parts.remove(name)) return false;
    m_order.removeAll(name);
    return true;
}

QString Package::addMedia(const QByteArray &data, const QString &extension) {
    int n = 1;
    QString name;
    do { name = QStringLiteral("ppt/media/image%1.%2").arg(n++).arg(extension); } while(m_parts.contains(name));
    writePart(name, data);
    return name;
}

std::optional<QByteArray> Package::save() const {
    QByteArray out;
    struct archive *a = archive_write_new();
    if(!a) { m_error = QStringLiteral("archive_write_new failed"); return std::nullopt; }
    auto fail = [&](const QString &what) -> std::optional<QByteArray> {
        m_error = what + QStringLiteral(": ") + archiveError(a);
        qCWarning(lcPackage, "Package write failed: %s", qPrintable(m_error));
        archive_write_free(a);
        return std::nullopt;
    };
    if(archive_write_set_format_zip(a) != ARCHIVE_OK) return fail(QStringLiteral("set_format_zip"));
    archive_write_set_options(a, "compression=deflate");
    archive_write_set_bytes_in_last_block(a, 1);
    if(archive_write_open(a, &out, nullptr, appendToByteArray, nullptr) != ARCHIVE_OK) return fail(QStringLiteral("open"));

    QStringList ordered;
    if(m_parts.contains(kContentTypesPart)) ordered << kContentTypesPart;
    for(const auto &n : m_order) if(n != QLatin1String(kContentTypesPart)) ordered << n;

    for(const auto &name : ordered) {
        const QByteArray &data = m_parts[name];
        struct archive_entry *entry = archive_entry_new();
        const QByteArray path = name.toUtf8();
        archive_entry_set_pathname(entry, path.constData());
        archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0644);
        archive_entry_set_mtime(entry, 0, 0);
        const int wh = archive_write_header(a, entry);
        archive_entry_free(entry);
        if(wh != ARCHIVE_OK && wh != ARCHIVE_WARN) return fail(QStringLiteral("header for %1").arg(name));
        if(!data.isEmpty() && archive_write_data(a, data.constData(), static_cast<size_t>(data.size())) < 0)
            return fail(QStringLiteral("data for %1").arg(name));
    }
    if(archive_write_close(a) != ARCHIVE_OK) return fail(QStringLiteral("close"));
    archive_write_free(a);
    return out;
}

}} // namespace QtPptxTemplate::opc
