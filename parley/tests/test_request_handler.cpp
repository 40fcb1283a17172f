#include <QtTest/QtTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <map>
#include <memory>
#include <string>

#include "rooms/connection_registry.hpp"
#include "rooms/media_state_table.hpp"
#include "security/rate_limiter.hpp"
#include "server/request_handler.hpp"
#include "signaling/peer_connection_tracker.hpp"

using namespace parley;

namespace {

const std::map<std::string, std::string> kHeaders = {{"X-Client-IP", "192.168.1.20"}};

bool hasStatus(const std::string& response, int code) {
    return response.rfind("HTTP/1.1 " + std::to_string(code) + " ", 0) == 0;
}

// Body of either a bare JSON answer or a full HTTP response.
QJsonObject bodyOf(const std::string& response) {
    std::string body = response;
    if (response.rfind("HTTP/1.1", 0) == 0) {
        size_t split = response.find("\r\n\r\n");
        body = split == std::string::npos ? std::string() : response.substr(split + 4);
    }
    return QJsonDocument::fromJson(QByteArray::fromStdString(body)).object();
}

}  // namespace

class RequestHandlerTests : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void rootAndHealth();
    void createRoomWithSettings();
    void createRoomWithEmptyBody();
    void createRoomRejectsInvalidFields();
    void getRoomReturnsInfoOrNotFound();
    void roomCreationIsRateLimited();
    void apiIsRateLimitedPerAddress();
    void optionsAnswersPreflight();
    void unknownRoutesAreNotFound();
    void webrtcEndpoints();
    void statsReflectRooms();

private:
    std::string get(const std::string& path) {
        return handler_->handleRequest("GET", path, kHeaders, "");
    }
    std::string post(const std::string& path, const std::string& body) {
        return handler_->handleRequest("POST", path, kHeaders, body);
    }

    std::unique_ptr<MediaStateTable> media_;
    std::unique_ptr<ConnectionRegistry> registry_;
    std::unique_ptr<PeerConnectionTracker> tracker_;
    std::unique_ptr<RateLimiter> api_limiter_;
    std::unique_ptr<RateLimiter> room_limiter_;
    std::unique_ptr<RequestHandler> handler_;
};

void RequestHandlerTests::init() {
    media_ = std::make_unique<MediaStateTable>();
    registry_ = std::make_unique<ConnectionRegistry>(*media_);
    tracker_ = std::make_unique<PeerConnectionTracker>(
        *media_, std::vector<IceServer>{IceServer{"stun:a.example.org:3478"}, IceServer{"stun:b.example.org:3478"}});
    api_limiter_ = std::make_unique<RateLimiter>(100, 900);
    room_limiter_ = std::make_unique<RateLimiter>(10, 3600);
    handler_ = std::make_unique<RequestHandler>(*registry_, *tracker_, *api_limiter_, *room_limiter_,
                                                "http://localhost:3000");
}

void RequestHandlerTests::cleanup() {
    handler_.reset();
    room_limiter_.reset();
    api_limiter_.reset();
    tracker_.reset();
    registry_.reset();
    media_.reset();
}

void RequestHandlerTests::rootAndHealth() {
    QJsonObject root = bodyOf(get("/"));
    QCOMPARE(root.value("status").toString(), QString("running"));
    QCOMPARE(root.value("message").toString(), QString("Video Conference Signaling API"));
    QVERIFY(root.value("timestamp").toString().endsWith("Z"));

    QJsonObject health = bodyOf(get("/health?check=1"));
    QCOMPARE(health.value("status").toString(), QString("healthy"));
    QVERIFY(health.value("uptime").isDouble());
}

void RequestHandlerTests::createRoomWithSettings() {
    std::string response = post("/api/rooms",
        "{\"createdBy\":\"alice\",\"settings\":{\"maxUsers\":4,\"allowChat\":false,"
        "\"requirePassword\":true,\"password\":\"pw\"}}");

    QVERIFY(response.rfind("HTTP/1.1", 0) != 0);
    QJsonObject body = bodyOf(response);
    QCOMPARE(body.value("message").toString(), QString("Room created successfully"));
    const std::string room_id = body.value("roomId").toString().toStdString();
    QVERIFY(!room_id.empty());

    QJsonObject info = body.value("roomInfo").toObject();
    QCOMPARE(info.value("maxUsers").toInt(), 4);
    QCOMPARE(info.value("createdBy").toString(), QString("alice"));
    QCOMPARE(info.value("settings").toObject().value("allowChat").toBool(), false);
    QCOMPARE(info.value("settings").toObject().value("requirePassword").toBool(), true);
    QVERIFY(!info.value("settings").toObject().contains("password"));

    auto room = registry_->getRoom(room_id);
    QVERIFY(room.has_value());
    QCOMPARE(int(room->capacity()), 4);
}

void RequestHandlerTests::createRoomWithEmptyBody() {
    QJsonObject body = bodyOf(post("/api/rooms", ""));
    QJsonObject info = body.value("roomInfo").toObject();
    QCOMPARE(info.value("maxUsers").toInt(), 10);
    QVERIFY(info.value("createdBy").isNull());
    QCOMPARE(info.value("userCount").toInt(), 0);
}

void RequestHandlerTests::createRoomRejectsInvalidFields() {
    QVERIFY(hasStatus(post("/api/rooms", "{\"settings\":{\"maxUsers\":0}}"), 400));
    QVERIFY(hasStatus(post("/api/rooms", "{\"settings\":{\"maxUsers\":51}}"), 400));
    QVERIFY(hasStatus(post("/api/rooms", "{\"settings\":{\"maxUsers\":\"5\"}}"), 400));
    QVERIFY(hasStatus(post("/api/rooms", "{\"createdBy\":42}"), 400));
    QVERIFY(hasStatus(post("/api/rooms", "{\"createdBy\":\"" + std::string(101, 'x') + "\"}"), 400));
    QVERIFY(hasStatus(post("/api/rooms", "{\"settings\":\"open\"}"), 400));

    std::string response = post("/api/rooms", "{\"settings\":{\"allowChat\":\"yes\"}}");
    QVERIFY(hasStatus(response, 400));
    QCOMPARE(bodyOf(response).value("error").toString(), QString("allowChat must be a boolean."));

    QCOMPARE(int(registry_->stats().total_rooms), 0);
}

void RequestHandlerTests::getRoomReturnsInfoOrNotFound() {
    Room room = registry_->createRoom(std::string("bob"));

    QJsonObject info = bodyOf(get("/api/rooms/" + room.id()));
    QCOMPARE(info.value("roomId").toString(), QString::fromStdString(room.id()));
    QCOMPARE(info.value("isActive").toBool(), true);
    QCOMPARE(info.value("users").toArray().size(), 0);

    std::string missing = get("/api/rooms/does-not-exist");
    QVERIFY(hasStatus(missing, 404));
    QCOMPARE(bodyOf(missing).value("error").toString(), QString("Room not found"));
}

void RequestHandlerTests::roomCreationIsRateLimited() {
    for (int i = 0; i < 10; i++) {
        QVERIFY(!hasStatus(post("/api/rooms", "{}"), 429));
    }
    std::string limited = post("/api/rooms", "{}");
    QVERIFY(hasStatus(limited, 429));
    QCOMPARE(bodyOf(limited).value("retryAfter").toString(), QString("1 hour"));
    QCOMPARE(int(registry_->stats().total_rooms), 10);

    // Reads are still served.
    QVERIFY(!hasStatus(get("/api/stats"), 429));
}

void RequestHandlerTests::apiIsRateLimitedPerAddress() {
    RateLimiter tight(2, 900);
    RequestHandler handler(*registry_, *tracker_, tight, *room_limiter_, "*");

    QVERIFY(!hasStatus(handler.handleRequest("GET", "/api/stats", kHeaders, ""), 429));
    QVERIFY(!hasStatus(handler.handleRequest("GET", "/api/stats", kHeaders, ""), 429));
    std::string limited = handler.handleRequest("GET", "/api/stats", kHeaders, "");
    QVERIFY(hasStatus(limited, 429));
    QCOMPARE(bodyOf(limited).value("retryAfter").toString(), QString("15 minutes"));

    std::map<std::string, std::string> other = {{"X-Client-IP", "192.168.1.21"}};
    QVERIFY(!hasStatus(handler.handleRequest("GET", "/api/stats", other, ""), 429));
    QVERIFY(!hasStatus(handler.handleRequest("GET", "/health", kHeaders, ""), 429));
}

void RequestHandlerTests::optionsAnswersPreflight() {
    std::string response = handler_->handleRequest("OPTIONS", "/api/rooms", kHeaders, "");
    QVERIFY(hasStatus(response, 204));
    QVERIFY(response.find("Access-Control-Allow-Origin: http://localhost:3000") != std::string::npos);
    QVERIFY(response.find("Access-Control-Allow-Methods: GET, POST, OPTIONS") != std::string::npos);
}

void RequestHandlerTests::unknownRoutesAreNotFound() {
    QVERIFY(hasStatus(get("/nope"), 404));
    QVERIFY(hasStatus(get("/api/rooms"), 404));
    QVERIFY(hasStatus(post("/api/stats", "{}"), 404));
    QVERIFY(hasStatus(handler_->handleRequest("DELETE", "/api/rooms/x", kHeaders, ""), 404));
}

void RequestHandlerTests::webrtcEndpoints() {
    QJsonObject ice = bodyOf(get("/api/webrtc/ice-servers"));
    QJsonArray servers = ice.value("iceServers").toArray();
    QCOMPARE(servers.size(), 2);
    QCOMPARE(servers.at(0).toObject().value("urls").toString(), QString("stun:a.example.org:3478"));

    std::string missing = get("/api/webrtc/rooms/none");
    QVERIFY(hasStatus(missing, 404));
    QCOMPARE(bodyOf(missing).value("error").toString(), QString("Room not found in WebRTC manager"));

    tracker_->addParticipant("r1", "a", "sa");
    tracker_->addParticipant("r1", "b", "sb");
    tracker_->handleOffer("r1", "a", "b", "{}");

    QJsonObject snapshot = bodyOf(get("/api/webrtc/rooms/r1"));
    QCOMPARE(snapshot.value("userCount").toInt(), 2);
    QCOMPARE(snapshot.value("totalConnections").toInt(), 1);
    QCOMPARE(snapshot.value("users").toObject().value("a").toObject().value("peerCount").toInt(), 1);

    QJsonObject stats = bodyOf(get("/api/webrtc/stats"));
    QCOMPARE(stats.value("totalRooms").toInt(), 1);
    QCOMPARE(stats.value("totalUsers").toInt(), 2);
    QCOMPARE(stats.value("pendingOffers").toInt(), 1);
}

void RequestHandlerTests::statsReflectRooms() {
    Room room = registry_->createRoom(std::nullopt);
    registry_->joinRoom(room.id(), "a", ParticipantInfo{"A", "sa"});

    QJsonObject stats = bodyOf(get("/api/stats"));
    QCOMPARE(stats.value("totalRooms").toInt(), 1);
    QCOMPARE(stats.value("totalUsers").toInt(), 1);
    QJsonArray details = stats.value("roomDetails").toArray();
    QCOMPARE(details.size(), 1);
    QCOMPARE(details.at(0).toObject().value("userCount").toInt(), 1);
}

QTEST_MAIN(RequestHandlerTests)
#include "test_request_handler.moc"
