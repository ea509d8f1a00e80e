/** \file SlideDeck.hpp
 *  Validated, ordered collection of slides. The only way to obtain a SlideDeck is through
 *  create() or fromJson(); both reject inconsistent input with an ErrorCode::SchemaValidation
 *  error, so everything downstream can assume row and series lengths agree.
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include "QtPptxTemplate/Error.hpp"
#include "QtPptxTemplate/Slide.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <optional>
#include <vector>

namespace QtPptxTemplate {

/** Document-level properties echoed into docProps/core.xml. */
struct DeckProperties {
    QString title;
    QString subtitle; // written as dc:description
    QString author;
    QString subject;
    QString language{QStringLiteral("en")};
};

class QTPPTXTEMPLATE_EXPORT SlideDeck {
public:
    /** Validate and build. declaredSlideCount must equal slides.size(); pass -1 to skip that check.
     *  Any other negative count is rejected. */
    static std::optional<SlideDeck> create(DeckProperties properties,
                                           std::vector<SlidePtr> slides,
                                           int declaredSlideCount,
                                           Error *error = nullptr);
    /** Parse the JSON input contract, detect slide kinds and validate. */
    static std::optional<SlideDeck> fromJson(const QByteArray &json, Error *error = nullptr,
                                             ChartType defaultChartType = ChartType::Bar);

    const DeckProperties & properties() const { return m_properties; }
    const QString & language() const { return m_properties.language; }
    int slideCount() const { return static_cast<int>(m_slides.size()); }
    const std::vector<SlidePtr> & slides() const { return m_slides; }
    const Slide & slide(int index) const { return *m_slides.at(static_cast<size_t>(index)); }

    /** Structure echo in the JSON input shape (explicit kinds, normalized fields). */
    QJsonObject toJson() const;

private:
    SlideDeck(DeckProperties properties, std::vector<SlidePtr> slides)
        : m_properties(std::move(properties)), m_slides(std::move(slides)) {}
    DeckProperties m_properties;
    std::vector<SlidePtr> m_slides;
};

} // namespace QtPptxTemplate
