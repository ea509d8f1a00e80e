#include "QtPptxTemplate/UnsplashImageProvider.hpp"
#include "util/Logging.hpp"
#include <QDeadlineTimer>
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrlQuery>
#include <algorithm>
#include <memory>

namespace QtPptxTemplate {

namespace {

constexpr int kCancelPollMs = 50;

struct Response {
    QByteArray body;
    QString contentType;
};

/** GET with a deadline; aborts when the deadline passes or the token is cancelled. */
std::optional<Response> get(QNetworkAccessManager &nam, QNetworkRequest request, const QDeadlineTimer &deadline,
                            const CancellationToken &cancel) {
    if(deadline.hasExpired() || cancel.isCancelled()) return std::nullopt;
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    std::unique_ptr<QNetworkReply> reply(nam.get(request));
    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QTimer poll;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, reply.get(), &QNetworkReply::abort);
    QObject::connect(&poll, &QTimer::timeout, reply.get(), [&]() { if(cancel.isCancelled()) reply->abort(); });
    timeout.start(static_cast<int>(std::max<qint64>(1, deadline.remainingTime())));
    poll.start(kCancelPollMs);
    if(!reply->isFinished()) loop.exec();

    if(reply->error() != QNetworkReply::NoError) {
        qCInfo(lcImage, "Request %s failed: %s", qPrintable(request.url().toDisplayString()), qPrintable(reply->errorString()));
        return std::nullopt;
    }
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if(status < 200 || status >= 300) {
        qCInfo(lcImage, "Request %s returned HTTP %d", qPrintable(request.url().toDisplayString()), status);
        return std::nullopt;
    }
    return Response{reply->readAll(), reply->header(QNetworkRequest::ContentTypeHeader).toString()};
}

} // namespace

UnsplashImageProvider::UnsplashImageProvider(QString accessKey, QString endpoint)
    : m_accessKey(std::move(accessKey)), m_endpoint(std::move(endpoint)) {}

std::optional<ImagePayload> UnsplashImageProvider::fetch(const QString &query, std::chrono::milliseconds timeout,
                                                         const CancellationToken &cancel) {
    if(m_accessKey.isEmpty()) {
        qCDebug(lcImage, "No Unsplash access key, skipping '%s'", qPrintable(query));
        return std::nullopt;
    }
    const QDeadlineTimer deadline(timeout.count());
    QNetworkAccessManager nam;

    QUrl searchUrl(m_endpoint + QStringLiteral("/search/photos"));
    QUrlQuery params;
    params.addQueryItem(QStringLiteral("query"), query);
    params.addQueryItem(QStringLiteral("per_page"), QStringLiteral("1"));
    params.addQueryItem(QStringLiteral("orientation"), QStringLiteral("landscape"));
    searchUrl.setQuery(params);
    QNetworkRequest search(searchUrl);
    search.setRawHeader("Authorization", QByteArrayLiteral("Client-ID ") + m_accessKey.toUtf8());
    search.setRawHeader("Accept-Version", "v1");

    auto found = get(nam, search, deadline, cancel);
    if(!found) return std::nullopt;
    const auto results = QJsonDocument::fromJson(found->body).object().value(QLatin1String("results")).toArray();
    if(results.isEmpty()) {
        qCInfo(lcImage, "Unsplash has no result for '%s'", qPrintable(query));
        return std::nullopt;
    }
    const QString imageUrl = results.first().toObject().value(QLatin1String("urls")).toObject().value(QLatin1String("regular")).toString();
    if(imageUrl.isEmpty()) return std::nullopt;

    auto image = get(nam, QNetworkRequest(QUrl(imageUrl)), deadline, cancel);
    if(!image) return std::nullopt;
    return ImagePayload{image->body, image->contentType};
}

} // namespace QtPptxTemplate
