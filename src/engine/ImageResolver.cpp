#include "engine/ImageResolver.hpp"
#include "util/Logging.hpp"
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QFuture>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>
#include <algorithm>
#include <exception>

namespace QtPptxTemplate { namespace engine {

ImageResolver::ImageResolver(std::shared_ptr<ImageProvider> provider, const RenderConfig &config,
                             DecodedImage fallback, CancellationToken cancel)
    : m_provider(std::move(provider)), m_timeout(std::max(1, config.imageTimeoutMs)),
      m_workers(std::max(1, config.imageWorkers)), m_fallback(std::move(fallback)), m_cancel(std::move(cancel)) {}

ResolvedImage ImageResolver::fallbackFor(const ImageDescriptor &descriptor) const {
    if(!descriptor.fallbackPath.isEmpty()) {
        QFile f(descriptor.fallbackPath);
        if(f.open(QIODevice::ReadOnly)) {
            DecodedImage img = decodeImage(f.readAll());
            if(!img.isNull()) return ResolvedImage{img, ImageSource::Fallback};
        }
        qCWarning(lcImage, "Fallback image '%s' unusable, using default", qPrintable(descriptor.fallbackPath));
    }
    return ResolvedImage{m_fallback, ImageSource::Fallback};
}

ResolvedImage ImageResolver::resolve(const ImageDescriptor &descriptor) const {
    if(m_cancel.isCancelled()) return fallbackFor(descriptor);

    const QFileInfo local(descriptor.query);
    if(local.isFile()) {
        QFile f(local.filePath());
        if(f.open(QIODevice::ReadOnly)) {
            DecodedImage img = decodeImage(f.readAll());
            if(!img.isNull()) return ResolvedImage{img, ImageSource::LocalFile};
        }
        qCWarning(lcImage, "Local image '%s' is not a readable image", qPrintable(descriptor.query));
        return fallbackFor(descriptor);
    }

    if(!m_provider) return fallbackFor(descriptor);

    QElapsedTimer timer;
    timer.start();
    std::optional<ImagePayload> payload;
    try {
        payload = m_provider->fetch(descriptor.query, m_timeout, m_cancel);
    } catch(const std::exception &e) {
        qCWarning(lcImage, "Image provider failed for '%s': %s", qPrintable(descriptor.query), e.what());
        return fallbackFor(descriptor);
    } catch(...) {
        qCWarning(lcImage, "Image provider failed for '%s' with a non-standard exception", qPrintable(descriptor.query));
        return fallbackFor(descriptor);
    }
    if(timer.elapsed() > m_timeout.count()) {
        qCWarning(lcImage, "Image fetch for '%s' exceeded %lld ms", qPrintable(descriptor.query),
                  static_cast<long long>(m_timeout.count()));
        return fallbackFor(descriptor);
    }
    if(m_cancel.isCancelled()) return fallbackFor(descriptor);
    if(!payload) {
        qCInfo(lcImage, "No image found for '%s'", qPrintable(descriptor.query));
        return fallbackFor(descriptor);
    }
    if(!payload->contentType.isEmpty() && !payload->contentType.startsWith(QLatin1String("image/"))) {
        qCWarning(lcImage, "Image fetch for '%s' returned '%s'", qPrintable(descriptor.query), qPrintable(payload->contentType));
        return fallbackFor(descriptor);
    }
    DecodedImage img = decodeImage(payload->bytes);
    if(img.isNull()) {
        qCWarning(lcImage, "Image fetch for '%s' returned undecodable data", qPrintable(descriptor.query));
        return fallbackFor(descriptor);
    }
    return ResolvedImage{img, ImageSource::Provider};
}

std::vector<std::optional<ResolvedImage>> ImageResolver::resolveAll(const SlideDeck &deck) const {
    std::vector<std::optional<ResolvedImage>> results(static_cast<size_t>(deck.slideCount()));
    QThreadPool pool;
    pool.setMaxThreadCount(m_workers);
    std::vector<std::pair<int, QFuture<ResolvedImage>>> pending;
    for(int i = 0; i < deck.slideCount(); ++i) {
        const Slide &slide = deck.slide(i);
        if(!isImageKind(slide.kind())) continue;
        const ImageDescriptor descriptor = static_cast<const ImageSlide &>(slide).image();
        pending.emplace_back(i, QtConcurrent::run(&pool, [this, descriptor]() { return resolve(descriptor); }));
    }
    for(auto &p : pending) {
        p.second.waitForFinished();
        results[static_cast<size_t>(p.first)] = p.second.result();
    }
    qCDebug(lcImage, "Resolved %d images with %d workers", static_cast<int>(pending.size()), m_workers);
    return results;
}

}} // namespace QtPptxTemplate::engine
