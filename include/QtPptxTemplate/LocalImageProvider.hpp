/** \file LocalImageProvider.hpp
 *  Offline ImageProvider serving files from a directory. A query matches a file whose base
 *  name equals the query with spaces replaced by '_' (case-insensitive).
 */
#pragma once
#include "QtPptxTemplate/ImageProvider.hpp"

namespace QtPptxTemplate {

class QTPPTXTEMPLATE_EXPORT LocalImageProvider : public ImageProvider {
public:
    explicit LocalImageProvider(QString directory) : m_directory(std::move(directory)) {}
    std::optional<ImagePayload> fetch(const QString &query, std::chrono::milliseconds timeout,
                                      const CancellationToken &cancel) override;
private:
    QString m_directory;
};

} // namespace QtPptxTemplate
