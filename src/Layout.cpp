#include "QtPptxTemplate/Layout.hpp"

namespace QtPptxTemplate {

QString placeholderRoleName(PlaceholderRole role) {
    switch(role) {
    case PlaceholderRole::Title: return QStringLiteral("title");
    case PlaceholderRole::Body: return QStringLiteral("body");
    case PlaceholderRole::Picture: return QStringLiteral("picture");
    case PlaceholderRole::Table: return QStringLiteral("table");
    case PlaceholderRole::Chart: return QStringLiteral("chart");
    case PlaceholderRole::ColumnLeft: return QStringLiteral("column-left");
    case PlaceholderRole::ColumnRight: return QStringLiteral("column-right");
    }
    return {};
}

const Placeholder * Layout::placeholder(PlaceholderRole role) const {
    for(const auto &p : m_placeholders) if(p.role == role) return &p;
    return nullptr;
}

std::vector<PlaceholderRole> Layout::roles() const {
    std::vector<PlaceholderRole> out;
    out.reserve(m_placeholders.size());
    for(const auto &p : m_placeholders) out.push_back(p.role);
    return out;
}

} // namespace QtPptxTemplate
