// Many renders against one shared catalog do not interfere
#include "QtPptxTemplate/Builder.hpp"
#include "QtPptxTemplate/Presentation.hpp"
#include "MockProviders.hpp"
#include <QtConcurrent/QtConcurrentRun>
#include <QFuture>
#include <QThreadPool>
#include <cassert>
#include <iostream>

using namespace QtPptxTemplate; using namespace testpptx;

struct Outcome { bool ok{false}; QString firstTitle; QString tableCell; int slideCount{0}; bool sampleGone{false}; };

int main(){
    constexpr int kRequests = 20;
    auto catalog = TemplateCatalog::fromData(minimalPptx());
    assert(catalog);
    const QByteArray pristineSlide = *catalog->checkout()->readPart("ppt/slides/slide1.xml");
    auto provider = pngProvider(32, 32, 5);

    QThreadPool requests;
    requests.setMaxThreadCount(kRequests);
    std::vector<QFuture<Outcome>> futures;
    for(int i = 0; i < kRequests; ++i){
        futures.push_back(QtConcurrent::run(&requests, [catalog, provider, i]() {
            Outcome o;
            const QString tag = QStringLiteral("request-%1").arg(i);
            auto deck = SlideDeck::create(DeckProperties{tag, {}, {}, {}, "en"}, {
                makeTitleSlide(tag, "concurrent"),
                makeTableSlide("Data", {"id"}, {{tag + "-cell"}}),
                makeImageSlide(SlideKind::ImageRight, "Picture", tag),
                makeContentSlide("Body", QString(i + 1, QChar('z'))) }, 4);
            if(!deck) return o;
            Presentation pres(catalog);
            pres.setImageProvider(provider);
            auto out = pres.render(*deck);
            if(!out) return o;
            o.ok = true;
            o.slideCount = out->slideCount;
            o.firstTitle = slideXml(out->package, 1);
            o.tableCell = slideXml(out->package, 2);
            o.sampleGone = !slideXml(out->package, 1).contains("TEMPLATE SAMPLE SLIDE") && slideXml(out->package, 5).isEmpty();
            return o;
        }));
    }
    for(int i = 0; i < kRequests; ++i){
        const Outcome o = futures[static_cast<size_t>(i)].result();
        const QString tag = QStringLiteral("request-%1").arg(i);
        assert(o.ok);
        assert(o.slideCount == 4);
        assert(o.firstTitle.contains(">" + tag + "<"));
        assert(o.tableCell.contains(tag + "-cell"));
        // No other request's data leaked in
        for(int j = 0; j < kRequests; ++j){
            if(j == i) continue;
            assert(!o.tableCell.contains(QStringLiteral("request-%1-cell").arg(j)));
        }
        assert(o.sampleGone);
    }
    // The shared template is untouched
    assert(*catalog->checkout()->readPart("ppt/slides/slide1.xml") == pristineSlide);
    assert(!catalog->checkout()->hasPart("ppt/media/image1.png"));
    std::cout << "concurrent_render_test passed" << std::endl; return 0;
}
