#include "QtPptxTemplate/TemplateCatalog.hpp"
#include "opc/Package.hpp"
#include "xml/XmlPart.hpp"
#include "util/Logging.hpp"
#include <QHash>
#include <QRegularExpression>
#include <algorithm>

namespace QtPptxTemplate {

namespace {

const char *kSlideMasterRelType = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/slideMaster";

/** Fallback when presentation.xml has no sldSz (16:9). */
constexpr qint64 kDefaultSlideCx = 12192000;
constexpr qint64 kDefaultSlideCy = 6858000;

bool isIgnoredType(const QString &t) {
    return t == QLatin1String("dt") || t == QLatin1String("ftr") || t == QLatin1String("sldNum") || t == QLatin1String("hdr");
}

Rect readXfrm(pugi::xml_node xfrm) {
    Rect r;
    if(!xfrm) return r;
    r.x = xfrm.child("a:off").attribute("x").as_llong();
    r.y = xfrm.child("a:off").attribute("y").as_llong();
    r.cx = xfrm.child("a:ext").attribute("cx").as_llong();
    r.cy = xfrm.child("a:ext").attribute("cy").as_llong();
    return r;
}

/** Non-visual properties container of any placeholder-capable shape. */
pugi::xml_node nvPrOf(pugi::xml_node shape) {
    const std::string n = shape.name();
    if(n == "p:sp") return shape.child("p:nvSpPr").child("p:nvPr");
    if(n == "p:pic") return shape.child("p:nvPicPr").child("p:nvPr");
    if(n == "p:graphicFrame") return shape.child("p:nvGraphicFramePr").child("p:nvPr");
    return {};
}

pugi::xml_node cNvPrOf(pugi::xml_node shape) {
    const std::string n = shape.name();
    if(n == "p:sp") return shape.child("p:nvSpPr").child("p:cNvPr");
    if(n == "p:pic") return shape.child("p:nvPicPr").child("p:cNvPr");
    if(n == "p:graphicFrame") return shape.child("p:nvGraphicFramePr").child("p:cNvPr");
    return {};
}

Rect boundsOf(pugi::xml_node shape) {
    if(std::string(shape.name()) == "p:graphicFrame") return readXfrm(shape.child("p:xfrm"));
    return readXfrm(shape.child("p:spPr").child("a:xfrm"));
}

/** Master placeholders grouped the way layouts inherit from them: title vs everything else. */
QString inheritanceKey(const QString &type) {
    if(type == QLatin1String("title") || type == QLatin1String("ctrTitle")) return QStringLiteral("title");
    if(isIgnoredType(type)) return type;
    return QStringLiteral("body");
}

QHash<QString, Rect> masterBounds(const opc::Package &pkg, const QString &layoutPart) {
    QHash<QString, Rect> out;
    auto relsData = pkg.readPart(xml::relsPartName(layoutPart));
    if(!relsData) return out;
    xml::XmlPart rels;
    if(!rels.load(*relsData)) return out;
    QString masterPart;
    for(auto r : rels.root().children("Relationship")) {
        if(QString::fromUtf8(r.attribute("Type").value()) == QLatin1String(kSlideMasterRelType)) {
            masterPart = xml::resolveTarget(layoutPart, QString::fromUtf8(r.attribute("Target").value()));
            break;
        }
    }
    if(masterPart.isEmpty()) return out;
    auto masterData = pkg.readPart(masterPart);
    if(!masterData) return out;
    xml::XmlPart master;
    if(!master.load(*masterData)) return out;
    for(auto shape : master.selectAll("/p:sldMaster/p:cSld/p:spTree/*")) {
        auto ph = nvPrOf(shape).child("p:ph");
        if(!ph) continue;
        const QString key = inheritanceKey(QString::fromUtf8(ph.attribute("type").as_string("obj")));
        if(!out.contains(key)) out.insert(key, boundsOf(shape));
    }
    return out;
}

std::optional<SlideKind> kindFromLayoutType(const QString &type) {
    if(type == QLatin1String("title")) return SlideKind::Title;
    if(type == QLatin1String("obj") || type == QLatin1String("txAndObj")) return SlideKind::ContentOnly;
    if(type == QLatin1String("twoObj") || type == QLatin1String("twoColTx")) return SlideKind::TwoColumns;
    if(type == QLatin1String("tbl")) return SlideKind::Table;
    if(type == QLatin1String("chart") || type == QLatin1String("txAndChart")) return SlideKind::Chart;
    if(type == QLatin1String("picTx")) return SlideKind::ImageRight;
    return std::nullopt;
}

bool verticallyOverlap(const Rect &a, const Rect &b) {
    return a.y < b.y + b.cy && b.y < a.y + a.cy;
}

/** Promote the largest generic content placeholder to the role the kind needs. */
void promoteContentPlaceholder(std::vector<Placeholder> &phs, PlaceholderRole role) {
    for(const auto &p : phs) if(p.role == role) return;
    Placeholder *best = nullptr;
    for(auto &p : phs) {
        if(p.role != PlaceholderRole::Body || p.type != QLatin1String("obj")) continue;
        if(!best || p.bounds.cx * p.bounds.cy > best->bounds.cx * best->bounds.cy) best = &p;
    }
    if(best) best->role = role;
}

void assignColumns(std::vector<Placeholder> &phs) {
    std::vector<Placeholder*> bodies;
    for(auto &p : phs) {
        if(p.role == PlaceholderRole::Body && p.type != QLatin1String("subTitle")) bodies.push_back(&p);
    }
    if(bodies.size() < 2) return;
    std::stable_sort(bodies.begin(), bodies.end(), [](const Placeholder *a, const Placeholder *b){ return a->bounds.x < b->bounds.x; });
    Placeholder *left = bodies[0];
    Placeholder *right = bodies[1];
    if(left->bounds.x == right->bounds.x || !verticallyOverlap(left->bounds, right->bounds)) return;
    left->role = PlaceholderRole::ColumnLeft;
    right->role = PlaceholderRole::ColumnRight;
}

struct ScannedLayout {
    QString part;
    QString name;
    QString type;
    std::vector<Placeholder> placeholders;
};

std::vector<Placeholder> scanPlaceholders(const xml::XmlPart &layout, const QHash<QString, Rect> &inherited, const Rect &slide) {
    std::vector<Placeholder> out;
    for(auto shape : layout.selectAll("/p:sldLayout/p:cSld/p:spTree/*")) {
        auto ph = nvPrOf(shape).child("p:ph");
        if(!ph) continue;
        Placeholder p;
        p.type = QString::fromUtf8(ph.attribute("type").as_string("obj"));
        if(isIgnoredType(p.type)) continue;
        p.idx = QString::fromUtf8(ph.attribute("idx").value());
        p.name = QString::fromUtf8(cNvPrOf(shape).attribute("name").value());
        p.bounds = boundsOf(shape);
        if(p.bounds.isEmpty()) p.bounds = inherited.value(inheritanceKey(p.type), slide);

        if(p.type == QLatin1String("title") || p.type == QLatin1String("ctrTitle")) p.role = PlaceholderRole::Title;
        else if(p.type == QLatin1String("pic")) p.role = PlaceholderRole::Picture;
        else if(p.type == QLatin1String("tbl")) p.role = PlaceholderRole::Table;
        else if(p.type == QLatin1String("chart")) p.role = PlaceholderRole::Chart;
        else p.role = PlaceholderRole::Body;

        auto tbl = shape.child("a:graphic").child("a:graphicData").child("a:tbl");
        if(tbl) {
            p.role = PlaceholderRole::Table;
            int cols = 0;
            for(auto gc : tbl.child("a:tblGrid").children("a:gridCol")) { (void)gc; ++cols; }
            int rows = 0;
            for(auto tr : tbl.children("a:tr")) { (void)tr; ++rows; }
            p.gridRows = rows;
            p.gridColumns = cols;
        }
        out.push_back(p);
    }
    return out;
}

} // namespace

TemplateCatalog::TemplateCatalog() : m_package(std::make_unique<opc::Package>()) {}
TemplateCatalog::~TemplateCatalog() = default;

std::shared_ptr<const TemplateCatalog> TemplateCatalog::load(const QString &path, Error *error) {
    std::shared_ptr<TemplateCatalog> catalog(new TemplateCatalog());
    if(!catalog->m_package->open(path)) {
        setError(error, ErrorCode::TemplateOpenFailed, QStringLiteral("cannot open template: %1").arg(catalog->m_package->errorString()));
        qCCritical(lcCatalog, "Template unusable: %s", qPrintable(path));
        return nullptr;
    }
    if(!catalog->build(error)) return nullptr;
    return catalog;
}

std::shared_ptr<const TemplateCatalog> TemplateCatalog::fromData(const QByteArray &pptx, Error *error) {
    std::shared_ptr<TemplateCatalog> catalog(new TemplateCatalog());
    if(!catalog->m_package->openData(pptx)) {
        setError(error, ErrorCode::TemplateOpenFailed, QStringLiteral("template is not a readable package: %1").arg(catalog->m_package->errorString()));
        return nullptr;
    }
    if(!catalog->build(error)) return nullptr;
    return catalog;
}

bool TemplateCatalog::build(Error *error) {
    const opc::Package &pkg = *m_package;
    m_slideSize = Rect{0, 0, kDefaultSlideCx, kDefaultSlideCy};
    if(auto pres = pkg.readPart(QStringLiteral("ppt/presentation.xml"))) {
        xml::XmlPart part;
        if(!part.load(*pres)) {
            setError(error, ErrorCode::TemplateCatalog, QStringLiteral("ppt/presentation.xml is not well-formed"));
            return false;
        }
        auto sz = part.selectOne("/p:presentation/p:sldSz");
        if(sz) m_slideSize = Rect{0, 0, sz.attribute("cx").as_llong(kDefaultSlideCx), sz.attribute("cy").as_llong(kDefaultSlideCy)};
    } else {
        setError(error, ErrorCode::TemplateCatalog, QStringLiteral("template has no ppt/presentation.xml"));
        return false;
    }

    static const QRegularExpression layoutRe(QStringLiteral("^ppt/slideLayouts/slideLayout(\\d+)\\.xml$"));
    std::vector<std::pair<int, QString>> parts;
    for(const auto &name : pkg.partNames()) {
        auto m = layoutRe.match(name);
        if(m.hasMatch()) parts.emplace_back(m.captured(1).toInt(), name);
    }
    std::sort(parts.begin(), parts.end());

    std::vector<ScannedLayout> scanned;
    for(const auto &entry : parts) {
        xml::XmlPart part;
        if(!part.load(*pkg.readPart(entry.second))) {
            qCWarning(lcCatalog, "Skipping malformed layout %s", qPrintable(entry.second));
            continue;
        }
        ScannedLayout sl;
        sl.part = entry.second;
        sl.name = QString::fromUtf8(part.root().child("p:cSld").attribute("name").value());
        sl.type = QString::fromUtf8(part.root().attribute("type").value());
        sl.placeholders = scanPlaceholders(part, masterBounds(pkg, entry.second), m_slideSize);
        m_layoutNames << sl.name;
        scanned.push_back(std::move(sl));
    }

    auto claim = [&](SlideKind kind, ScannedLayout &sl) {
        if(m_layouts.count(kind)) {
            qCDebug(lcCatalog) << "Layout" << sl.name << "ignored, kind already served by" << m_layouts[kind]->name();
            return;
        }
        switch(kind) {
        case SlideKind::Table: promoteContentPlaceholder(sl.placeholders, PlaceholderRole::Table); break;
        case SlideKind::Chart: promoteContentPlaceholder(sl.placeholders, PlaceholderRole::Chart); break;
        case SlideKind::ImageRight:
        case SlideKind::ImageLeft:
        case SlideKind::ImageFull: promoteContentPlaceholder(sl.placeholders, PlaceholderRole::Picture); break;
        default: break;
        }
        assignColumns(sl.placeholders);
        m_layouts[kind] = std::make_shared<Layout>(kind, sl.name, sl.part, sl.placeholders);
        QStringList roles;
        for(PlaceholderRole role : m_layouts[kind]->roles()) roles << placeholderRoleName(role);
        qCDebug(lcCatalog, "Layout '%s' -> %s [%s]", qPrintable(sl.name), qPrintable(slideKindKey(kind)), qPrintable(roles.join(',')));
    };

    // Names first, then layout types for kinds nobody claimed by name.
    std::vector<bool> used(scanned.size(), false);
    for(size_t i = 0; i < scanned.size(); ++i) {
        if(auto kind = slideKindFromString(scanned[i].name)) {
            if(!m_layouts.count(*kind)) used[i] = true;
            claim(*kind, scanned[i]);
        }
    }
    for(size_t i = 0; i < scanned.size(); ++i) {
        if(used[i]) continue;
        auto kind = kindFromLayoutType(scanned[i].type);
        if(kind && !m_layouts.count(*kind)) { used[i] = true; claim(*kind, scanned[i]); }
    }

    if(!m_layouts.count(SlideKind::ContentOnly)) {
        const QString msg = QStringLiteral("template has no '%1' layout (available: %2)")
                                .arg(slideKindName(SlideKind::ContentOnly), m_layoutNames.join(QStringLiteral(", ")));
        qCCritical(lcCatalog, "%s", qPrintable(msg));
        setError(error, ErrorCode::TemplateCatalog, msg);
        return false;
    }
    qCInfo(lcCatalog, "Template catalog ready: %zu of %d kinds served by %d layouts",
           m_layouts.size(), static_cast<int>(allSlideKinds().size()), static_cast<int>(m_layoutNames.size()));
    return true;
}

LayoutHandle TemplateCatalog::resolve(SlideKind kind) const {
    auto it = m_layouts.find(kind);
    return it == m_layouts.end() ? nullptr : it->second;
}

std::unique_ptr<opc::Package> TemplateCatalog::checkout() const {
    return std::make_unique<opc::Package>(*m_package);
}

} // namespace QtPptxTemplate
