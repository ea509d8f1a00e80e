/** \file TemplateCatalog.hpp
 *  Read-only index of a PPTX template: classified layouts, their placeholder roles and the
 *  pristine package. Built once; safe to share between threads. Every render checks out its
 *  own working copy of the package.
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include "QtPptxTemplate/Error.hpp"
#include "QtPptxTemplate/Layout.hpp"
#include <QByteArray>
#include <QStringList>
#include <map>
#include <memory>

namespace QtPptxTemplate {

namespace opc { class Package; }

class QTPPTXTEMPLATE_EXPORT TemplateCatalog {
public:
    /** Load and classify a .pptx template. nullptr with TemplateOpenFailed / TemplateCatalog on failure. */
    static std::shared_ptr<const TemplateCatalog> load(const QString &path, Error *error = nullptr);
    /** Same as load() for template bytes already in memory. */
    static std::shared_ptr<const TemplateCatalog> fromData(const QByteArray &pptx, Error *error = nullptr);

    ~TemplateCatalog();
    TemplateCatalog(const TemplateCatalog &) = delete;
    TemplateCatalog & operator=(const TemplateCatalog &) = delete;

    /** Layout serving the kind, nullptr when the template has none. */
    LayoutHandle resolve(SlideKind kind) const;
    /** Names of every layout found in the template, classified or not. */
    const QStringList & layoutNames() const { return m_layoutNames; }
    /** Slide size from presentation.xml (EMU). */
    Rect slideSize() const { return m_slideSize; }
    /** Private copy of the template package. Copies share storage until written. */
    std::unique_ptr<opc::Package> checkout() const;

private:
    TemplateCatalog();
    bool build(Error *error);

    std::unique_ptr<opc::Package> m_package;
    std::map<SlideKind, LayoutHandle> m_layouts;
    QStringList m_layoutNames;
    Rect m_slideSize;
};

} // namespace QtPptxTemplate
