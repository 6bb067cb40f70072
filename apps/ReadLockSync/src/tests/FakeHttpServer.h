#ifndef FAKEHTTPSERVER_H
#define FAKEHTTPSERVER_H

#include <QTcpServer>
#include <QTcpSocket>
#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QMap>

// Minimal HTTP/1.1 responder on localhost. Each request gets the next queued
// reply; a reply with hang set is never answered.
class FakeHttpServer : public QTcpServer
{
    Q_OBJECT
public:
    struct Reply {
        int status = 200;
        QByteArray body;
        bool hang = false;
    };

    struct Request {
        QString method;
        QString path;
        QMap<QString, QString> headers;   // lower-case names
        QByteArray body;

        QJsonObject json() const { return QJsonDocument::fromJson(body).object(); }
    };

    explicit FakeHttpServer(QObject *parent = nullptr)
        : QTcpServer(parent)
    {
        connect(this, &QTcpServer::newConnection, this, &FakeHttpServer::onNewConnection);
    }

    bool start() { return listen(QHostAddress::LocalHost, 0); }
    QString baseUrl() const { return QString("http://127.0.0.1:%1/api/v1").arg(serverPort()); }

    void queueReply(int status, const QByteArray& body = QByteArray())
    {
        Reply reply;
        reply.status = status;
        reply.body = body;
        m_replies.append(reply);
    }

    void queueJson(int status, const QJsonObject& json)
    {
        queueReply(status, QJsonDocument(json).toJson(QJsonDocument::Compact));
    }

    void queueHang()
    {
        Reply reply;
        reply.hang = true;
        m_replies.append(reply);
    }

    QList<Request> requests() const { return m_requests; }
    Request lastRequest() const { return m_requests.isEmpty() ? Request() : m_requests.last(); }

private slots:
    void onNewConnection()
    {
        while (QTcpSocket *socket = nextPendingConnection()) {
            connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
            connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        }
    }

private:
    void onReadyRead(QTcpSocket *socket)
    {
        QByteArray &buffer = m_buffers[socket];
        buffer += socket->readAll();

        const int headerEnd = buffer.indexOf("\r\n\r\n");
        if (headerEnd < 0) {
            return;
        }

        Request request;
        const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
        const QList<QByteArray> requestLine = lines.first().trimmed().split(' ');
        request.method = QString::fromLatin1(requestLine.value(0));
        request.path = QString::fromLatin1(requestLine.value(1));
        for (int i = 1; i < lines.size(); ++i) {
            const int colon = lines.at(i).indexOf(':');
            if (colon > 0) {
                request.headers.insert(QString::fromLatin1(lines.at(i).left(colon)).trimmed().toLower(),
                                       QString::fromLatin1(lines.at(i).mid(colon + 1)).trimmed());
            }
        }

        const int contentLength = request.headers.value("content-length").toInt();
        if (buffer.size() < headerEnd + 4 + contentLength) {
            return;
        }
        request.body = buffer.mid(headerEnd + 4, contentLength);
        m_buffers.remove(socket);
        m_requests.append(request);

        Reply reply = m_replies.isEmpty() ? Reply() : m_replies.takeFirst();
        if (reply.hang) {
            return;
        }

        QByteArray response = "HTTP/1.1 " + QByteArray::number(reply.status) + " Status\r\n"
                              "Content-Type: application/json\r\n"
                              "Content-Length: " + QByteArray::number(reply.body.size()) + "\r\n"
                              "Connection: close\r\n\r\n" + reply.body;
        socket->write(response);
        socket->disconnectFromHost();
    }

    QList<Reply> m_replies;
    QList<Request> m_requests;
    QMap<QTcpSocket*, QByteArray> m_buffers;
};

#endif // FAKEHTTPSERVER_H
