// Concurrent image fetches never change slide order and respect the worker bound
#include "QtPptxTemplate/Builder.hpp"
#include "QtPptxTemplate/Presentation.hpp"
#include "engine/ImageResolver.hpp"
#include "MockProviders.hpp"
#include <pugixml.hpp>
#include <cassert>
#include <iostream>

using namespace QtPptxTemplate; using namespace testpptx;

int main(){
    constexpr int kSlides = 8;
    // Query "slot-N" answers later the smaller N is, with an N-specific width
    auto provider = std::make_shared<ScriptedProvider>([](const QString &query) -> std::optional<ImagePayload> {
        const int n = query.mid(5).toInt();
        QThread::msleep(static_cast<unsigned long>((kSlides - n) * 15));
        return ImagePayload{pngBytes(100 + n, 50), QStringLiteral("image/png")};
    });

    std::vector<SlidePtr> slides;
    for(int i = 0; i < kSlides; ++i){
        if(i % 2 == 0) slides.push_back(makeImageSlide(SlideKind::ImageRight, QStringLiteral("Image %1").arg(i), QStringLiteral("slot-%1").arg(i)));
        else slides.push_back(makeContentSlide(QStringLiteral("Text %1").arg(i), "between images"));
    }
    auto deck = SlideDeck::create(DeckProperties{"Order", {}, {}, {}, "en"}, slides, kSlides);
    assert(deck);

    RenderConfig config; config.imageWorkers = 3; config.imageTimeoutMs = 2000;
    // Resolver results are indexed by slide
    {
        engine::ImageResolver resolver(provider, config, loadFallbackImage(QString()), CancellationToken());
        auto results = resolver.resolveAll(*deck);
        assert(static_cast<int>(results.size()) == kSlides);
        for(int i = 0; i < kSlides; ++i){
            if(i % 2 == 1){ assert(!results[static_cast<size_t>(i)]); continue; }
            assert(results[static_cast<size_t>(i)]->source == ImageSource::Provider);
            assert(results[static_cast<size_t>(i)]->image.size.width() == 100 + i);
        }
        assert(provider->maxActive <= 3);
        assert(provider->maxActive >= 2);
    }
    // Rendered slides keep their order and each embeds its own image
    {
        auto catalog = TemplateCatalog::fromData(minimalPptx());
        Presentation pres(catalog, config);
        pres.setImageProvider(provider);
        auto out = pres.render(*deck);
        assert(out);
        for(int i = 0; i < kSlides; ++i){
            const QString xml = slideXml(out->package, i + 1);
            assert(xml.contains(i % 2 == 0 ? QStringLiteral("Image %1").arg(i) : QStringLiteral("Text %1").arg(i)));
            if(i % 2 == 1) continue;
            pugi::xml_document rels; rels.load_string(readPart(out->package, QStringLiteral("ppt/slides/_rels/slide%1.xml.rels").arg(i + 1)).toUtf8().constData());
            QString media;
            for(auto r : rels.child("Relationships").children("Relationship"))
                if(QString::fromUtf8(r.attribute("Target").value()).startsWith("../media/")) media = QString::fromUtf8(r.attribute("Target").value()).mid(3);
            assert(!media.isEmpty());
            Package pkg; assert(pkg.openData(out->package));
            const QImage img = QImage::fromData(*pkg.readPart("ppt/" + media));
            assert(img.width() == 100 + i);
        }
        for(size_t k = 0; k < out->images.size(); ++k) assert(out->images[k].slideIndex == static_cast<int>(k) * 2);
    }
    std::cout << "image_order_test passed" << std::endl; return 0;
}
