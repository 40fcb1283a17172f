#include <QtTest/QtTest>
#include <QRegularExpression>

#include "rooms/connection_registry.hpp"
#include "rooms/media_state_table.hpp"
#include "signaling/signaling_error.hpp"

using namespace parley;

namespace {

template <typename Fn>
bool throwsCode(Fn&& fn, ErrorCode expected) {
    try {
        fn();
    } catch (const SignalingError& e) {
        return e.code() == expected;
    }
    return false;
}

ParticipantInfo info(const std::string& name) {
    return ParticipantInfo{name, "session-" + name};
}

RoomOptions capacity(size_t max_participants) {
    RoomOptions options;
    options.max_participants = max_participants;
    return options;
}

}  // namespace

class ConnectionRegistryTests : public QObject {
    Q_OBJECT

private slots:
    void createRoomDefaultsAndClamp();
    void firstJoinerBecomesHost();
    void roomFullRejectsThirdJoiner();
    void hostPassesToEarliestSurvivor();
    void emptyRoomDeletedOnLastLeave();
    void joiningAnotherRoomLeavesTheFirst();
    void rejoinSameRoomIsDuplicate();
    void fullTargetKeepsCurrentMembership();
    void passwordProtectedRoom();
    void inactiveRoomRejectsJoin();
    void unknownRoomRejectsJoin();
    void recordingIsHostOnly();
    void mediaUpdatesSharedTable();
    void blankNameGetsDefault();
    void cleanupRemovesNeverJoinedRooms();
    void statsCountRoomsAndUsers();
};

void ConnectionRegistryTests::createRoomDefaultsAndClamp() {
    MediaStateTable media;
    ConnectionRegistry registry(media);

    Room plain = registry.createRoom(std::nullopt);
    QCOMPARE(int(plain.capacity()), 10);
    QVERIFY(plain.isActive());
    QVERIFY(!plain.createdBy().has_value());

    Room big = registry.createRoom(std::string("alice"), capacity(80));
    QCOMPARE(int(big.capacity()), 50);
    QCOMPARE(QString::fromStdString(*big.createdBy()), QString("alice"));
    QVERIFY(plain.id() != big.id());
    QVERIFY(QRegularExpression("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$")
                .match(QString::fromStdString(plain.id())).hasMatch());
    QVERIFY(registry.getRoom(big.id()).has_value());
}

void ConnectionRegistryTests::firstJoinerBecomesHost() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room room = registry.createRoom(std::nullopt);

    JoinResult a = registry.joinRoom(room.id(), "a", info("Alice"));
    JoinResult b = registry.joinRoom(room.id(), "b", info("Bob"));

    QVERIFY(a.participant.role == ParticipantRole::Host);
    QVERIFY(b.participant.role == ParticipantRole::Participant);
    QCOMPARE(int(b.room.participantCount()), 2);
    QCOMPARE(QString::fromStdString(*b.room.hostId()), QString("a"));
}

void ConnectionRegistryTests::roomFullRejectsThirdJoiner() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room room = registry.createRoom(std::nullopt, capacity(2));

    registry.joinRoom(room.id(), "a", info("A"));
    registry.joinRoom(room.id(), "b", info("B"));
    QVERIFY(throwsCode([&]() { registry.joinRoom(room.id(), "c", info("C")); }, ErrorCode::RoomFull));

    auto after = registry.getRoom(room.id());
    QVERIFY(after.has_value());
    QCOMPARE(int(after->participantCount()), 2);
    QVERIFY(!registry.getUserRoom("c").has_value());
}

void ConnectionRegistryTests::hostPassesToEarliestSurvivor() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room room = registry.createRoom(std::nullopt);

    registry.joinRoom(room.id(), "a", info("A"));
    registry.joinRoom(room.id(), "b", info("B"));
    registry.joinRoom(room.id(), "c", info("C"));

    auto left = registry.leaveRoom("a");
    QVERIFY(left.has_value());
    QVERIFY(!left->room_deleted);
    QVERIFY(left->participant.role == ParticipantRole::Host);
    QCOMPARE(QString::fromStdString(*left->room.hostId()), QString("b"));

    auto current = registry.getRoom(room.id());
    int hosts = 0;
    for (const auto& participant : current->participants()) {
        if (participant.role == ParticipantRole::Host) hosts++;
    }
    QCOMPARE(hosts, 1);
    QVERIFY(current->isHost("b"));
    QCOMPARE(int(current->participantCount()), 2);
}

void ConnectionRegistryTests::emptyRoomDeletedOnLastLeave() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room room = registry.createRoom(std::nullopt);

    registry.joinRoom(room.id(), "a", info("A"));
    auto left = registry.leaveRoom("a");

    QVERIFY(left.has_value());
    QVERIFY(left->room_deleted);
    QVERIFY(!registry.getRoom(room.id()).has_value());
    QVERIFY(!registry.leaveRoom("a").has_value());
    QCOMPARE(int(media.size()), 0);
}

void ConnectionRegistryTests::joiningAnotherRoomLeavesTheFirst() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room first = registry.createRoom(std::nullopt);
    Room second = registry.createRoom(std::nullopt);

    registry.joinRoom(first.id(), "a", info("A"));
    registry.joinRoom(first.id(), "b", info("B"));
    registry.joinRoom(second.id(), "a", info("A"));

    QCOMPARE(QString::fromStdString(registry.getUserRoom("a")->id()), QString::fromStdString(second.id()));
    auto old_room = registry.getRoom(first.id());
    QVERIFY(old_room.has_value());
    QVERIFY(old_room->findParticipant("a") == nullptr);
    QVERIFY(old_room->isHost("b"));
}

void ConnectionRegistryTests::rejoinSameRoomIsDuplicate() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room room = registry.createRoom(std::nullopt);

    registry.joinRoom(room.id(), "a", info("A"));
    QVERIFY(throwsCode([&]() { registry.joinRoom(room.id(), "a", info("A")); },
                       ErrorCode::DuplicateParticipant));

    // The room was not torn down by the failed attempt.
    auto current = registry.getRoom(room.id());
    QVERIFY(current.has_value());
    QVERIFY(current->isHost("a"));
}

void ConnectionRegistryTests::fullTargetKeepsCurrentMembership() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room home = registry.createRoom(std::nullopt);
    Room full = registry.createRoom(std::nullopt, capacity(1));

    registry.joinRoom(home.id(), "a", info("A"));
    registry.joinRoom(full.id(), "z", info("Z"));

    QVERIFY(throwsCode([&]() { registry.joinRoom(full.id(), "a", info("A")); }, ErrorCode::RoomFull));
    QCOMPARE(QString::fromStdString(registry.getUserRoom("a")->id()), QString::fromStdString(home.id()));
}

void ConnectionRegistryTests::passwordProtectedRoom() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    RoomOptions options;
    options.require_password = true;
    options.password = "s3cret";
    Room room = registry.createRoom(std::nullopt, options);

    QVERIFY(room.settings().password_hash != "s3cret");
    QVERIFY(throwsCode([&]() { registry.joinRoom(room.id(), "a", info("A")); }, ErrorCode::InvalidPassword));
    QVERIFY(throwsCode([&]() { registry.joinRoom(room.id(), "a", info("A"), std::string("nope")); },
                       ErrorCode::InvalidPassword));

    JoinResult joined = registry.joinRoom(room.id(), "a", info("A"), std::string("s3cret"));
    QCOMPARE(int(joined.room.participantCount()), 1);
}

void ConnectionRegistryTests::inactiveRoomRejectsJoin() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room room = registry.createRoom(std::nullopt);

    QVERIFY(registry.deactivateRoom(room.id()));
    QVERIFY(throwsCode([&]() { registry.joinRoom(room.id(), "a", info("A")); }, ErrorCode::RoomInactive));
}

void ConnectionRegistryTests::unknownRoomRejectsJoin() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    QVERIFY(throwsCode([&]() { registry.joinRoom("missing", "a", info("A")); }, ErrorCode::RoomNotFound));
}

void ConnectionRegistryTests::recordingIsHostOnly() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room room = registry.createRoom(std::nullopt);
    registry.joinRoom(room.id(), "a", info("A"));
    registry.joinRoom(room.id(), "b", info("B"));

    QVERIFY(throwsCode([&]() { registry.setRecording("b", true); }, ErrorCode::PermissionDenied));
    QVERIFY(!registry.getRoom(room.id())->settings().recording_enabled);

    Room updated = registry.setRecording("a", true);
    QVERIFY(updated.settings().recording_enabled);
    QVERIFY(throwsCode([&]() { registry.setRecording("ghost", true); }, ErrorCode::NotInRoom));
}

void ConnectionRegistryTests::mediaUpdatesSharedTable() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room room = registry.createRoom(std::nullopt);
    registry.joinRoom(room.id(), "a", info("A"));

    auto defaults = media.get("a");
    QVERIFY(defaults.has_value());
    QVERIFY(defaults->audio);
    QVERIFY(defaults->video);
    QVERIFY(!defaults->screen);

    QVERIFY(registry.updateParticipantMedia("a", MediaKind::Video, false).has_value());
    QVERIFY(!media.get("a")->video);
    QVERIFY(!registry.updateParticipantMedia("ghost", MediaKind::Audio, false).has_value());
}

void ConnectionRegistryTests::blankNameGetsDefault() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room room = registry.createRoom(std::nullopt);

    JoinResult joined = registry.joinRoom(room.id(), "0123456789abcdef", ParticipantInfo{"", "s"});
    QCOMPARE(QString::fromStdString(joined.participant.name), QString("User 01234567"));
}

void ConnectionRegistryTests::cleanupRemovesNeverJoinedRooms() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room idle = registry.createRoom(std::nullopt);
    Room busy = registry.createRoom(std::nullopt);
    registry.joinRoom(busy.id(), "a", info("A"));

    QCOMPARE(int(registry.cleanupEmptyRooms()), 1);
    QVERIFY(!registry.getRoom(idle.id()).has_value());
    QVERIFY(registry.getRoom(busy.id()).has_value());
}

void ConnectionRegistryTests::statsCountRoomsAndUsers() {
    MediaStateTable media;
    ConnectionRegistry registry(media);
    Room first = registry.createRoom(std::nullopt);
    Room second = registry.createRoom(std::nullopt);
    registry.joinRoom(first.id(), "a", info("A"));
    registry.joinRoom(first.id(), "b", info("B"));
    registry.joinRoom(second.id(), "c", info("C"));

    RegistryStats stats = registry.stats();
    QCOMPARE(int(stats.total_rooms), 2);
    QCOMPARE(int(stats.total_users), 3);
    QCOMPARE(int(stats.room_details.size()), 2);
    QCOMPARE(int(registry.allRooms().size()), 2);
}

QTEST_MAIN(ConnectionRegistryTests)
#include "test_connection_registry.moc"
