/** \file ImageProvider.hpp
 *  Boundary to the external image lookup service, plus the cancellation token shared by
 *  all fetches of one render.
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include <QByteArray>
#include <QSize>
#include <QString>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace QtPptxTemplate {

/** Copyable handle to a shared flag. Cancelling any copy cancels them all. */
class QTPPTXTEMPLATE_EXPORT CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic_bool>(false)) {}
    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }
private:
    std::shared_ptr<std::atomic_bool> m_flag;
};

struct ImagePayload {
    QByteArray bytes;
    QString contentType;
};

/** Image lookup collaborator. Implementations must not throw and should honour the timeout;
 *  the resolver discards results that arrive after it regardless.
 *  fetch() is called concurrently from worker threads.
 */
class QTPPTXTEMPLATE_EXPORT ImageProvider {
public:
    virtual ~ImageProvider() = default;
    virtual std::optional<ImagePayload> fetch(const QString &query,
                                              std::chrono::milliseconds timeout,
                                              const CancellationToken &cancel) = 0;
};

/** Image bytes guaranteed to decode. */
struct DecodedImage {
    QByteArray bytes;
    QString extension; // "png", "jpeg", "gif", ...
    QSize size;
    bool isNull() const { return bytes.isEmpty() || size.isEmpty(); }
};

/** Decode-check bytes; returns a null image when they are not a readable image. */
QTPPTXTEMPLATE_EXPORT DecodedImage decodeImage(const QByteArray &bytes);
/** Load the fallback image; a neutral grey PNG is generated when the file is unusable. */
QTPPTXTEMPLATE_EXPORT DecodedImage loadFallbackImage(const QString &path);

} // namespace QtPptxTemplate
