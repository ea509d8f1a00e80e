#include "engine/DocumentAssembler.hpp"
#include "opc/Package.hpp"
#include "util/Logging.hpp"
#include "xml/XmlPart.hpp"
#include <QDateTime>
#include <algorithm>

namespace QtPptxTemplate { namespace engine {

namespace {

const QString kPresentation = QStringLiteral("ppt/presentation.xml");
const QString kContentTypes = QStringLiteral("[Content_Types].xml");
const QString kCoreProps = QStringLiteral("docProps/core.xml");
const QString kAppProps = QStringLiteral("docProps/app.xml");
const QString kPackageRels = QStringLiteral("_rels/.rels");

constexpr const char *kSlideContentType = "application/vnd.openxmlformats-officedocument.presentationml.slide+xml";
constexpr const char *kChartContentType = "application/vnd.openxmlformats-officedocument.drawingml.chart+xml";
constexpr const char *kCoreContentType = "application/vnd.openxmlformats-package.core-properties+xml";
constexpr const char *kCoreRelType = "http://schemas.openxmlformats.org/package/2006/relationships/metadata/core-properties";
constexpr const char *kCpNs = "http://schemas.openxmlformats.org/package/2006/metadata/core-properties";
constexpr const char *kDcNs = "http://purl.org/dc/elements/1.1/";
constexpr const char *kDcTermsNs = "http://purl.org/dc/terms/";
constexpr const char *kXsiNs = "http://www.w3.org/2001/XMLSchema-instance";

QString mimeForExtension(const QString &ext) {
    if(ext == QLatin1String("jpg") || ext == QLatin1String("jpeg")) return QStringLiteral("image/jpeg");
    if(ext == QLatin1String("tif") || ext == QLatin1String("tiff")) return QStringLiteral("image/tiff");
    return QStringLiteral("image/") + ext;
}

/** Loads a part, or an empty document with the given root when absent. */
bool loadOrCreate(const opc::Package &pkg, const QString &part, xml::XmlPart &out, const char *rootName, const char *rootNs) {
    if(auto data = pkg.readPart(part)) return out.load(*data);
    auto root = out.doc().append_child(rootName);
    root.append_attribute("xmlns") = rootNs;
    return true;
}

int nextRelNumber(const xml::XmlPart &rels) {
    int maxId = 0;
    for(auto r : rels.root().children("Relationship")) {
        const QString id = QString::fromUtf8(r.attribute("Id").value());
        if(id.startsWith(QLatin1String("rId"))) maxId = std::max(maxId, id.mid(3).toInt());
    }
    return maxId + 1;
}

void addRelationship(pugi::xml_node root, const QString &id, const char *type, const QString &target, bool external = false) {
    auto r = root.append_child("Relationship");
    r.append_attribute("Id") = id.toUtf8().constData();
    r.append_attribute("Type") = type;
    r.append_attribute("Target") = target.toUtf8().constData();
    if(external) r.append_attribute("TargetMode") = "External";
}

class ContentTypes {
public:
    bool load(const opc::Package &pkg) {
        auto data = pkg.readPart(kContentTypes);
        return data && m_part.load(*data);
    }
    void addOverride(const QString &part, const char *type) {
        const QByteArray name = (QStringLiteral("/") + part).toUtf8();
        for(auto o : m_part.root().children("Override"))
            if(name == o.attribute("PartName").value()) { o.attribute("ContentType") = type; return; }
        auto o = m_part.root().append_child("Override");
        o.append_attribute("PartName") = name.constData();
        o.append_attribute("ContentType") = type;
    }
    void removeOverride(const QString &part) {
        const QByteArray name = (QStringLiteral("/") + part).toUtf8();
        for(auto o : m_part.root().children("Override"))
            if(name == o.attribute("PartName").value()) { m_part.root().remove_child(o); return; }
    }
    void ensureDefault(const QString &extension) {
        for(auto d : m_part.root().children("Default"))
            if(QString::fromUtf8(d.attribute("Extension").value()).compare(extension, Qt::CaseInsensitive) == 0) return;
        // Defaults precede Overrides.
        const auto firstOverride = m_part.root().child("Override");
        auto d = firstOverride ? m_part.root().insert_child_before("Default", firstOverride) : m_part.root().append_child("Default");
        d.append_attribute("Extension") = extension.toUtf8().constData();
        d.append_attribute("ContentType") = mimeForExtension(extension).toUtf8().constData();
    }
    void store(opc::Package &pkg) const { pkg.writePart(kContentTypes, m_part.save()); }
private:
    xml::XmlPart m_part;
};

void setElementText(pugi::xml_node parent, const char *name, const QString &value) {
    auto e = parent.child(name);
    if(!e) e = parent.append_child(name);
    e.text().set(value.toUtf8().constData());
}

} // namespace

QString DocumentAssembler::freePartName(const QString &pattern) const {
    for(int i = 1;; ++i) {
        const QString name = pattern.arg(i);
        if(!m_package.hasPart(name)) return name;
    }
}

bool DocumentAssembler::removeTemplateSlides(Error *error) {
    const QString relsName = xml::relsPartName(kPresentation);
    auto presData = m_package.readPart(kPresentation);
    auto relsData = m_package.readPart(relsName);
    xml::XmlPart pres, rels;
    ContentTypes types;
    if(!presData || !pres.load(*presData) || !relsData || !rels.load(*relsData) || !types.load(m_package)) {
        setError(error, ErrorCode::DocumentAssembly, QStringLiteral("presentation part or its relationships are unreadable"));
        return false;
    }

    int removed = 0;
    std::vector<pugi::xml_node> doomed;
    for(auto r : rels.root().children("Relationship")) {
        if(QString::fromUtf8(r.attribute("Type").value()) != QLatin1String(reltype::slide)) continue;
        const QString slidePart = xml::resolveTarget(kPresentation, QString::fromUtf8(r.attribute("Target").value()));
        const QString slideRels = xml::relsPartName(slidePart);
        if(auto sr = m_package.readPart(slideRels)) {
            xml::XmlPart slideRelsXml;
            if(slideRelsXml.load(*sr)) {
                for(auto n : slideRelsXml.root().children("Relationship")) {
                    if(QString::fromUtf8(n.attribute("Type").value()) != QLatin1String(reltype::notesSlide)) continue;
                    const QString notes = xml::resolveTarget(slidePart, QString::fromUtf8(n.attribute("Target").value()));
                    m_package.removePart(notes);
                    m_package.removePart(xml::relsPartName(notes));
                    types.removeOverride(notes);
                }
            }
        }
        m_package.removePart(slidePart);
        m_package.removePart(slideRels);
        types.removeOverride(slidePart);
        doomed.push_back(r);
        ++removed;
    }
    for(auto r : doomed) rels.root().remove_child(r);
    if(auto list = pres.root().child("p:sldIdLst")) pres.root().remove_child(list);

    m_package.writePart(kPresentation, pres.save());
    m_package.writePart(relsName, rels.save());
    types.store(m_package);
    if(removed > 0) qCDebug(lcPackage, "Removed %d template slides", removed);
    return true;
}

bool DocumentAssembler::addSlides(const std::vector<SlideDraft> &drafts, Error *error) {
    const QString presRelsName = xml::relsPartName(kPresentation);
    auto presData = m_package.readPart(kPresentation);
    auto relsData = m_package.readPart(presRelsName);
    xml::XmlPart pres, presRels;
    ContentTypes types;
    if(!presData || !pres.load(*presData) || !relsData || !presRels.load(*relsData) || !types.load(m_package)) {
        setError(error, ErrorCode::DocumentAssembly, QStringLiteral("presentation part or its relationships are unreadable"));
        return false;
    }

    auto sldIdLst = pres.root().child("p:sldIdLst");
    if(!sldIdLst) {
        // Schema order: sldMasterIdLst, notesMasterIdLst, handoutMasterIdLst, sldIdLst, sldSz.
        pugi::xml_node anchor = pres.root().child("p:sldSz");
        if(!anchor) anchor = pres.root().child("p:notesSz");
        sldIdLst = anchor ? pres.root().insert_child_before("p:sldIdLst", anchor) : pres.root().append_child("p:sldIdLst");
    }
    unsigned nextSlideId = 256;
    for(auto s : sldIdLst.children("p:sldId")) nextSlideId = std::max(nextSlideId, s.attribute("id").as_uint() + 1);
    int nextRel = nextRelNumber(presRels);

    for(size_t i = 0; i < drafts.size(); ++i) {
        const SlideDraft &draft = drafts[i];
        const QString slidePart = freePartName(QStringLiteral("ppt/slides/slide%1.xml"));

        xml::XmlPart slideRels;
        auto relsRoot = slideRels.doc().append_child("Relationships");
        relsRoot.append_attribute("xmlns") = ns::rel;
        for(const auto &rel : draft.relationships()) {
            switch(rel.kind) {
            case DraftRelationship::Kind::Layout:
                addRelationship(relsRoot, rel.id, reltype::slideLayout, xml::relativeTarget(slidePart, rel.target));
                break;
            case DraftRelationship::Kind::Hyperlink:
                addRelationship(relsRoot, rel.id, reltype::hyperlink, rel.target, true);
                break;
            case DraftRelationship::Kind::Image: {
                const DecodedImage &img = draft.images().at(static_cast<size_t>(rel.payloadIndex));
                const QString media = m_package.addMedia(img.bytes, img.extension);
                types.ensureDefault(img.extension);
                addRelationship(relsRoot, rel.id, reltype::image, xml::relativeTarget(slidePart, media));
                break;
            }
            case DraftRelationship::Kind::Chart: {
                const QString chartPart = freePartName(QStringLiteral("ppt/charts/chart%1.xml"));
                m_package.writePart(chartPart, draft.charts().at(static_cast<size_t>(rel.payloadIndex)));
                types.addOverride(chartPart, kChartContentType);
                addRelationship(relsRoot, rel.id, reltype::chart, xml::relativeTarget(slidePart, chartPart));
                break;
            }
            }
        }
        m_package.writePart(slidePart, draft.xml());
        m_package.writePart(xml::relsPartName(slidePart), slideRels.save());
        types.addOverride(slidePart, kSlideContentType);

        const QString relId = QStringLiteral("rId%1").arg(nextRel++);
        addRelationship(presRels.root(), relId, reltype::slide, xml::relativeTarget(kPresentation, slidePart));
        auto sldId = sldIdLst.append_child("p:sldId");
        sldId.append_attribute("id") = nextSlideId++;
        sldId.append_attribute("r:id") = relId.toUtf8().constData();
    }

    m_package.writePart(kPresentation, pres.save());
    m_package.writePart(presRelsName, presRels.save());
    types.store(m_package);
    qCDebug(lcPackage, "Wrote %d slides", static_cast<int>(drafts.size()));
    return true;
}

bool DocumentAssembler::writeProperties(const DeckProperties &properties, int slideCount, Error *error) {
    xml::XmlPart core;
    const bool existed = m_package.hasPart(kCoreProps);
    if(existed) {
        if(!core.load(*m_package.readPart(kCoreProps))) {
            setError(error, ErrorCode::DocumentAssembly, QStringLiteral("docProps/core.xml is malformed"));
            return false;
        }
    } else {
        auto root = core.doc().append_child("cp:coreProperties");
        root.append_attribute("xmlns:cp") = kCpNs;
        root.append_attribute("xmlns:dc") = kDcNs;
        root.append_attribute("xmlns:dcterms") = kDcTermsNs;
        root.append_attribute("xmlns:xsi") = kXsiNs;
    }
    auto root = core.root();
    setElementText(root, "dc:title", properties.title);
    if(!properties.author.isEmpty()) setElementText(root, "dc:creator", properties.author);
    if(!properties.subject.isEmpty()) setElementText(root, "dc:subject", properties.subject);
    if(!properties.subtitle.isEmpty()) setElementText(root, "dc:description", properties.subtitle);
    setElementText(root, "dc:language", properties.language);
    auto modified = root.child("dcterms:modified");
    if(!modified && !existed) {
        modified = root.append_child("dcterms:modified");
        modified.append_attribute("xsi:type") = "dcterms:W3CDTF";
    }
    if(modified) modified.text().set(QDateTime::currentDateTimeUtc().toString(Qt::ISODate).toUtf8().constData());
    m_package.writePart(kCoreProps, core.save());

    if(!existed) {
        xml::XmlPart rels;
        if(!loadOrCreate(m_package, kPackageRels, rels, "Relationships", ns::rel)) {
            setError(error, ErrorCode::DocumentAssembly, QStringLiteral("_rels/.rels is malformed"));
            return false;
        }
        addRelationship(rels.root(), QStringLiteral("rId%1").arg(nextRelNumber(rels)), kCoreRelType, kCoreProps);
        m_package.writePart(kPackageRels, rels.save());
        ContentTypes types;
        if(!types.load(m_package)) {
            setError(error, ErrorCode::DocumentAssembly, QStringLiteral("[Content_Types].xml is unreadable"));
            return false;
        }
        types.addOverride(kCoreProps, kCoreContentType);
        types.store(m_package);
    }

    if(auto appData = m_package.readPart(kAppProps)) {
        xml::XmlPart app;
        if(app.load(*appData)) {
            if(auto slides = app.root().child("Slides")) {
                slides.text().set(slideCount);
                m_package.writePart(kAppProps, app.save());
            }
        } else {
            qCWarning(lcPackage, "docProps/app.xml is malformed, slide count not updated");
        }
    }
    return true;
}

std::optional<QByteArray> DocumentAssembler::serialize(Error *error) const {
    auto bytes = m_package.save();
    if(!bytes) {
        setError(error, ErrorCode::DocumentAssembly, QStringLiteral("cannot write package: %1").arg(m_package.errorString()));
        return std::nullopt;
    }
    return bytes;
}

}} // namespace QtPptxTemplate::engine
