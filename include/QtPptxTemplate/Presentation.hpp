/** \file Presentation.hpp
 *  Public façade for rendering one slide deck against a shared template catalog.
 *  Thread-safety: instances are not thread-safe. Use one instance per request; any number of
 *  instances may share one TemplateCatalog and one ImageProvider concurrently.
 */
#pragma once
#include "QtPptxTemplate/Export.hpp"
#include "QtPptxTemplate/Error.hpp"
#include "QtPptxTemplate/ImageProvider.hpp"
#include "QtPptxTemplate/RenderConfig.hpp"
#include "QtPptxTemplate/RenderedDeck.hpp"
#include "QtPptxTemplate/SlideDeck.hpp"
#include "QtPptxTemplate/TemplateCatalog.hpp"
#include <memory>
#include <optional>

namespace QtPptxTemplate {

class QTPPTXTEMPLATE_EXPORT Presentation {
public:
    explicit Presentation(std::shared_ptr<const TemplateCatalog> catalog, RenderConfig config = {});
    ~Presentation();

    /** Image lookup collaborator; without one every image slide gets the fallback image. */
    void setImageProvider(std::shared_ptr<ImageProvider> provider) { m_provider = std::move(provider); }
    /** Token observed by this render's image fetches. Cancel it when the caller goes away. */
    void setCancellationToken(const CancellationToken &token) { m_cancel = token; }
    const RenderConfig & config() const { return m_config; }

    /** Render a validated deck. std::nullopt on fatal errors (see lastError()). */
    std::optional<RenderedDeck> render(const SlideDeck &deck, const QString &filenameHint = QString());
    /** Parse, validate and render the JSON input contract. languageTag overrides the deck language when not empty. */
    std::optional<RenderedDeck> renderJson(const QByteArray &json, const QString &filenameHint = QString(),
                                           const QString &languageTag = QString());

    std::optional<Error> lastError() const { return m_lastError; }
    void clearError() { m_lastError.reset(); }

private:
    std::shared_ptr<const TemplateCatalog> m_catalog;
    RenderConfig m_config;
    std::shared_ptr<ImageProvider> m_provider;
    CancellationToken m_cancel;
    DecodedImage m_fallback;
    std::optional<Error> m_lastError;
    void fail(const Error &e) { m_lastError = e; }
};

} // namespace QtPptxTemplate
