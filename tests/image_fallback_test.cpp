// Image resolution: provider failures, timeouts, non-image bytes and cancellation yield the fallback
#include "QtPptxTemplate/Builder.hpp"
#include "QtPptxTemplate/LocalImageProvider.hpp"
#include "QtPptxTemplate/Presentation.hpp"
#include "engine/ImageResolver.hpp"
#include "MockProviders.hpp"
#include <QFile>
#include <QTemporaryDir>
#include <cassert>
#include <iostream>

using namespace QtPptxTemplate; using namespace testpptx;

static RenderConfig fastConfig(){ RenderConfig c; c.imageTimeoutMs = 200; c.imageWorkers = 2; return c; }

static engine::ResolvedImage resolveWith(std::shared_ptr<ImageProvider> p, const ImageDescriptor &d, CancellationToken cancel = {}){
    const DecodedImage fallback = loadFallbackImage(QString());
    engine::ImageResolver resolver(std::move(p), fastConfig(), fallback, cancel);
    return resolver.resolve(d);
}

int main(){
    const DecodedImage grey = loadFallbackImage(QString());
    assert(!grey.isNull() && grey.extension == "png");

    // Successful fetch
    {
        auto r = resolveWith(pngProvider(80, 40), ImageDescriptor{"sunrise", {}});
        assert(r.source == ImageSource::Provider);
        assert(r.image.size == QSize(80, 40));
    }
    // Slower than the timeout
    {
        auto r = resolveWith(pngProvider(80, 40, 600), ImageDescriptor{"slow", {}});
        assert(r.source == ImageSource::Fallback);
        assert(r.image.bytes == grey.bytes);
    }
    // Provider throws
    {
        auto p = std::make_shared<ScriptedProvider>([](const QString &) -> std::optional<ImagePayload> { throw std::runtime_error("network down"); });
        assert(resolveWith(p, ImageDescriptor{"boom", {}}).source == ImageSource::Fallback);
        auto odd = std::make_shared<ScriptedProvider>([](const QString &) -> std::optional<ImagePayload> { throw 42; });
        auto r = resolveWith(odd, ImageDescriptor{"odd", {}});
        assert(r.source == ImageSource::Fallback);
        assert(r.image.bytes == grey.bytes);
        assert(odd->calls == 1);
    }
    // Non-image content type, undecodable image bytes, nothing found
    {
        auto html = std::make_shared<ScriptedProvider>([](const QString &) { return std::optional<ImagePayload>(ImagePayload{"<html></html>", "text/html"}); });
        assert(resolveWith(html, ImageDescriptor{"html", {}}).source == ImageSource::Fallback);
        auto garbage = std::make_shared<ScriptedProvider>([](const QString &) { return std::optional<ImagePayload>(ImagePayload{"\x89PNGgarbage", "image/png"}); });
        assert(resolveWith(garbage, ImageDescriptor{"garbage", {}}).source == ImageSource::Fallback);
        auto none = std::make_shared<ScriptedProvider>([](const QString &) { return std::optional<ImagePayload>(); });
        assert(resolveWith(none, ImageDescriptor{"none", {}}).source == ImageSource::Fallback);
    }
    // Per-slide fallback file and local file queries
    {
        QTemporaryDir dir; assert(dir.isValid());
        const QString slideFallback = dir.path() + "/slide_fallback.png";
        const QByteArray fallbackBytes = pngBytes(30, 30, 0xff00ff00);
        QFile f(slideFallback); assert(f.open(QIODevice::WriteOnly)); f.write(fallbackBytes); f.close();
        auto none = std::make_shared<ScriptedProvider>([](const QString &) { return std::optional<ImagePayload>(); });
        auto r = resolveWith(none, ImageDescriptor{"nothing", slideFallback});
        assert(r.source == ImageSource::Fallback);
        assert(r.image.bytes == fallbackBytes);

        r = resolveWith(none, ImageDescriptor{slideFallback, {}});
        assert(r.source == ImageSource::LocalFile);
        assert(none->calls == 1);

        // Unusable configured fallback falls back to the generated grey image
        assert(loadFallbackImage(dir.path() + "/missing.png").bytes == grey.bytes);

        // Offline directory provider
        QFile named(dir.path() + "/city_lights.png"); assert(named.open(QIODevice::WriteOnly)); named.write(pngBytes(20, 10)); named.close();
        auto local = std::make_shared<LocalImageProvider>(dir.path());
        r = resolveWith(local, ImageDescriptor{"City Lights", {}});
        assert(r.source == ImageSource::Provider);
        assert(r.image.size == QSize(20, 10));
    }
    // Cancelled token: no fetch is attempted
    {
        auto p = pngProvider();
        CancellationToken token;
        token.cancel();
        assert(resolveWith(p, ImageDescriptor{"cancelled", {}}, token).source == ImageSource::Fallback);
        assert(p->calls == 0);
    }
    // Render with a timing-out provider still succeeds, reporting the fallback
    {
        auto catalog = TemplateCatalog::fromData(minimalPptx());
        auto deck = SlideDeck::create(DeckProperties{"Images", {}, {}, {}, "en"}, {
            makeImageSlide(SlideKind::ImageRight, "Slow", "slow query", "Some text"),
            makeContentSlide("After", "still rendered") }, 2);
        assert(deck);
        Presentation pres(catalog, fastConfig());
        pres.setImageProvider(pngProvider(64, 48, 600));
        auto out = pres.render(*deck);
        assert(out);
        assert(out->images.size() == 1);
        assert(out->images[0].source == ImageSource::Fallback);
        assert(out->degradedSlides.empty());
        const QString xml = slideXml(out->package, 1);
        assert(xml.contains("<p:pic>"));
        assert(xml.contains("descr=\"slow query\""));
        assert(readPart(out->package, "[Content_Types].xml").contains("Extension=\"png\""));
        assert(readPart(out->package, "ppt/slides/_rels/slide1.xml.rels").contains("../media/image1.png"));
    }
    std::cout << "image_fallback_test passed" << std::endl; return 0;
}
