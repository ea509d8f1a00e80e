/** \file Layout.hpp
 *  Classified slide layout: which kind it serves and which placeholder roles it exposes.
 *  Built once by TemplateCatalog; render-time code only queries by role.
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include "QtPptxTemplate/Slide.hpp"
#include <QString>
#include <memory>
#include <vector>

namespace QtPptxTemplate {

enum class PlaceholderRole { Title, Body, Picture, Table, Chart, ColumnLeft, ColumnRight };
QTPPTXTEMPLATE_EXPORT QString placeholderRoleName(PlaceholderRole role);

/** Shape bounds in EMU. */
struct Rect {
    qint64 x{0};
    qint64 y{0};
    qint64 cx{0};
    qint64 cy{0};
    bool isEmpty() const { return cx <= 0 || cy <= 0; }
};

struct Placeholder {
    PlaceholderRole role{PlaceholderRole::Body};
    QString type;     // <p:ph type>, "obj" when absent
    QString idx;      // <p:ph idx>, empty when absent
    QString name;     // <p:cNvPr name>
    Rect bounds;      // own xfrm, else inherited from the master
    int gridRows{0};  // > 0 when the layout carries a fixed table grid
    int gridColumns{0};
};

class QTPPTXTEMPLATE_EXPORT Layout {
public:
    Layout(SlideKind kind, QString name, QString partName, std::vector<Placeholder> placeholders)
        : m_kind(kind), m_name(std::move(name)), m_partName(std::move(partName)), m_placeholders(std::move(placeholders)) {}

    SlideKind kind() const { return m_kind; }
    /** Name as written in the template (<p:cSld name>). */
    const QString & name() const { return m_name; }
    /** Package part, e.g. "ppt/slideLayouts/slideLayout2.xml". */
    const QString & partName() const { return m_partName; }
    /** Placeholders in document order. */
    const std::vector<Placeholder> & placeholders() const { return m_placeholders; }
    /** First placeholder with the role, nullptr if none. */
    const Placeholder * placeholder(PlaceholderRole role) const;
    bool hasRole(PlaceholderRole role) const { return placeholder(role) != nullptr; }
    std::vector<PlaceholderRole> roles() const;

private:
    SlideKind m_kind;
    QString m_name;
    QString m_partName;
    std::vector<Placeholder> m_placeholders;
};
using LayoutHandle = std::shared_ptr<const Layout>;

} // namespace QtPptxTemplate
