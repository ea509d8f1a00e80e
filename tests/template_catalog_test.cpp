// Template layout classification and catalog failures
#include "QtPptxTemplate/TemplateCatalog.hpp"
#include "MinimalPptx.hpp"
#include <QFile>
#include <QTemporaryDir>
#include <cassert>
#include <iostream>

using namespace QtPptxTemplate; using namespace testpptx;

int main(){
    // Standard template: every served kind resolves with the expected roles
    {
        Error err;
        auto catalog = TemplateCatalog::fromData(minimalPptx(), &err);
        assert(catalog);
        assert(catalog->layoutNames().size() == 6);
        assert(catalog->slideSize().cx == 12192000);

        auto title = catalog->resolve(SlideKind::Title);
        assert(title && title->hasRole(PlaceholderRole::Title) && title->hasRole(PlaceholderRole::Body));
        auto content = catalog->resolve(SlideKind::ContentOnly);
        assert(content && content->partName() == "ppt/slideLayouts/slideLayout2.xml");
        assert(content->roles() == std::vector<PlaceholderRole>({PlaceholderRole::Title, PlaceholderRole::Body}));
        // Inherited from the master when the layout has no own xfrm
        assert(content->placeholder(PlaceholderRole::Body)->bounds.y == 1825625);
        auto image = catalog->resolve(SlideKind::ImageRight);
        assert(image && image->hasRole(PlaceholderRole::Picture));
        assert(catalog->resolve(SlideKind::Table)->hasRole(PlaceholderRole::Table));
        assert(catalog->resolve(SlideKind::Chart)->hasRole(PlaceholderRole::Chart));
        auto cols = catalog->resolve(SlideKind::TwoColumns);
        assert(cols->hasRole(PlaceholderRole::ColumnLeft) && cols->hasRole(PlaceholderRole::ColumnRight));
        assert(cols->placeholder(PlaceholderRole::ColumnLeft)->bounds.x < cols->placeholder(PlaceholderRole::ColumnRight)->bounds.x);
        assert(!catalog->resolve(SlideKind::ImageLeft));
        assert(!catalog->resolve(SlideKind::ImageFull));
    }
    // Names are matched case- and separator-insensitively; layout type covers unnamed layouts
    {
        auto catalog = TemplateCatalog::fromData(minimalPptx({
            {"content_only", "", titlePh() + bodyPh()},
            {"Custom Layout 7", "tbl", titlePh() + bodyPh()} }));
        assert(catalog);
        assert(catalog->resolve(SlideKind::ContentOnly)->name() == "content_only");
        auto table = catalog->resolve(SlideKind::Table);
        assert(table && table->name() == "Custom Layout 7");
        // Generic content placeholder promoted to the table role
        assert(table->hasRole(PlaceholderRole::Table));
    }
    // Fixed table grid is recorded
    {
        auto catalog = TemplateCatalog::fromData(minimalPptx({contentLayout(), {"Table", "tbl", titlePh() + tableGridPh(3, 1, 4, 3)}}));
        assert(catalog);
        const Placeholder *ph = catalog->resolve(SlideKind::Table)->placeholder(PlaceholderRole::Table);
        assert(ph && ph->gridRows == 4 && ph->gridColumns == 3);
    }
    // No Content Only layout is fatal
    {
        Error err;
        auto catalog = TemplateCatalog::fromData(minimalPptx({titleLayout(), tableLayout()}), &err);
        assert(!catalog);
        assert(err.code == ErrorCode::TemplateCatalog);
        assert(err.message.contains("Content Only"));
        assert(err.message.contains("Title Slide"));
    }
    // Unreadable packages
    {
        Error err;
        assert(!TemplateCatalog::fromData(QByteArray("definitely not a zip"), &err));
        assert(err.code == ErrorCode::TemplateOpenFailed);
        assert(!TemplateCatalog::load("/nonexistent/template.pptx", &err));
        assert(err.code == ErrorCode::TemplateOpenFailed);
        assert(err.message.contains("/nonexistent/template.pptx"));
    }
    // Loading from disk classifies the same layouts
    {
        QTemporaryDir dir; assert(dir.isValid());
        const QString path = dir.path() + "/corporate.pptx";
        QFile f(path); assert(f.open(QIODevice::WriteOnly)); f.write(minimalPptx()); f.close();
        Error err;
        auto catalog = TemplateCatalog::load(path, &err);
        assert(catalog);
        assert(catalog->layoutNames().size() == 6);
        assert(catalog->resolve(SlideKind::Table));
    }
    // Checkouts are independent copies
    {
        auto catalog = TemplateCatalog::fromData(minimalPptx());
        auto a = catalog->checkout();
        auto b = catalog->checkout();
        a->writePart("ppt/slides/slide1.xml", "changed");
        assert(*b->readPart("ppt/slides/slide1.xml") != QByteArray("changed"));
        assert(*catalog->checkout()->readPart("ppt/slides/slide1.xml") != QByteArray("changed"));
    }
    std::cout << "template_catalog_test passed" << std::endl; return 0;
}
