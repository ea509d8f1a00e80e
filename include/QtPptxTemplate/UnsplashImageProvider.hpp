/** \file UnsplashImageProvider.hpp
 *  Qt Network image provider against the Unsplash search API: search for the query, then
 *  download the first result. Requires a QCoreApplication instance in the process.
 */
#pragma once
#include "QtPptxTemplate/ImageProvider.hpp"

namespace QtPptxTemplate {

class QTPPTXTEMPLATE_EXPORT UnsplashImageProvider : public ImageProvider {
public:
    explicit UnsplashImageProvider(QString accessKey, QString endpoint = QStringLiteral("https://api.unsplash.com"));
    std::optional<ImagePayload> fetch(const QString &query,
                                      std::chrono::milliseconds timeout,
                                      const CancellationToken &cancel) override;
private:
    QString m_accessKey;
    QString m_endpoint;
};

} // namespace QtPptxTemplate
