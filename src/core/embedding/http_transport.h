#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>

namespace hr {

struct HttpRequest {
    enum class Method { Get, Post };

    Method method = Method::Get;
    QString url;
    QList<QPair<QByteArray, QByteArray>> headers;
    QByteArray body;
    int timeoutMs = 30000;
};

struct HttpResponse {
    int status = 0;          // 0 when no response was received
    QByteArray body;
    bool timedOut = false;
    QString error;           // Transport-level failure description

    bool isSuccess() const { return error.isEmpty() && status >= 200 && status < 300; }
};

// Blocking HTTP boundary used by the network embedding backends.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

// libcurl easy-handle implementation. One handle per request, so a single
// instance can be shared between threads.
class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport();
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    HttpResponse send(const HttpRequest& request) override;
};

} // namespace hr
