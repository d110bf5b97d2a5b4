#include "core/embedding/http_transport.h"
#include "core/shared/logging.h"

#include <curl/curl.h>

#include <mutex>

namespace hr {

namespace {

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    const size_t total = size * nmemb;
    auto* buffer = static_cast<QByteArray*>(userp);
    buffer->append(static_cast<const char*>(contents), static_cast<qsizetype>(total));
    return total;
}

std::once_flag g_curlInitOnce;

} // namespace

CurlHttpTransport::CurlHttpTransport()
{
    std::call_once(g_curlInitOnce, [] {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

CurlHttpTransport::~CurlHttpTransport() = default;

HttpResponse CurlHttpTransport::send(const HttpRequest& request)
{
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = QStringLiteral("curl_easy_init failed");
        return response;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
        const QByteArray line = header.first + ": " + header.second;
        headers = curl_slist_append(headers, line.constData());
    }

    const QByteArray url = request.url.toUtf8();
    curl_easy_setopt(curl, CURLOPT_URL, url.constData());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeoutMs));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (request.method == HttpRequest::Method::Post) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.constData());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }

    const CURLcode code = curl_easy_perform(curl);
    if (code != CURLE_OK) {
        response.timedOut = (code == CURLE_OPERATION_TIMEDOUT);
        response.error = QString::fromUtf8(curl_easy_strerror(code));
        LOG_DEBUG(hrEmbedding, "HTTP %s failed: %s",
                  qUtf8Printable(request.url), qUtf8Printable(response.error));
    } else {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        response.status = static_cast<int>(status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}

} // namespace hr
