#include <doctest/doctest.h>
#include <j1939tp/transport/session.hpp>

using namespace j1939tp;

static constexpr PGN PROPRIETARY_A = 0xEF00;

static dp::Vector<u8> make_message(usize size) {
    dp::Vector<u8> msg(size);
    for (usize i = 0; i < size; ++i)
        msg[i] = static_cast<u8>((i * 7 + 3) & 0xFF);
    return msg;
}

static ReassemblySession make_session(u16 size, dp::Optional<u8> burst,
                                      ReassemblyBuffer buffer = ReassemblyBuffer::growable(),
                                      SessionConfig config = {}) {
    auto rts = RequestToSend::create(size, burst, PROPRIETARY_A);
    REQUIRE(rts.is_ok());
    auto session = ReassemblySession::create(rts.value(), std::move(buffer), std::move(config));
    REQUIRE(session.is_ok());
    return std::move(session.value());
}

TEST_CASE("Reassembly of the three-packet transfer") {
    auto session = make_session(16, u8{2});
    CHECK(session.total_packets() == 3);

    DataTransfer dt1{1, {1, 2, 3, 4, 5, 6, 7}};
    auto r1 = session.next(dt1);
    REQUIRE(r1.is_ok());
    CHECK(!r1.value().has_value());
    CHECK(!session.payload().has_value());

    DataTransfer dt2{2, {1, 2, 3, 4, 5, 6, 7}};
    auto r2 = session.next(dt2);
    REQUIRE(r2.is_ok());
    REQUIRE(r2.value().has_value());
    REQUIRE(r2.value().value().is_cts());
    CHECK(r2.value().value().cts.next_sequence == 3);
    CHECK(r2.value().value().cts.max_packets_per_response.value() == 2);
    CHECK(r2.value().value().cts.pgn == PROPRIETARY_A);

    DataTransfer dt3{3, {1, 2, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}};
    auto r3 = session.next(dt3);
    REQUIRE(r3.is_ok());
    REQUIRE(r3.value().has_value());
    REQUIRE(r3.value().value().is_end());
    CHECK(r3.value().value().eoma.total_size == 16);
    CHECK(r3.value().value().eoma.total_packets == 3);
    CHECK(r3.value().value().encode()[0] == tp_cm::EOMA);

    CHECK(session.is_complete());
    auto payload = session.payload();
    REQUIRE(payload.has_value());
    dp::Vector<u8> expected = {1, 2, 3, 4, 5, 6, 7, 1, 2, 3, 4, 5, 6, 7, 1, 2};
    CHECK(payload.value().equals(expected));
}

static void feed_all(ReassemblySession &session, const dp::Vector<u8> &msg) {
    u8 total = session.total_packets();
    for (u8 seq = 1; seq <= total; ++seq) {
        CHECK(!session.payload().has_value());
        auto r = session.next(DataTransfer::from_message(seq, msg));
        REQUIRE(r.is_ok());
        if (seq == total) {
            REQUIRE(r.value().has_value());
            CHECK(r.value().value().is_end());
            break; // total may be 255
        }
    }
}

TEST_CASE("Happy path across the size range") {
    for (u16 size : {u16{9}, u16{14}, u16{15}, u16{100}, u16{700}, u16{1784}, u16{1785}}) {
        CAPTURE(size);
        auto msg = make_message(size);

        auto growable = make_session(size, dp::nullopt);
        feed_all(growable, msg);
        CHECK(growable.received_packets() == growable.total_packets());
        REQUIRE(growable.payload().has_value());
        CHECK(growable.payload().value().equals(msg));

        dp::Vector<u8> region(size, 0x00);
        auto fixed = make_session(size, u8{16}, ReassemblyBuffer::fixed(region));
        feed_all(fixed, msg);
        REQUIRE(fixed.payload().has_value());
        CHECK(fixed.payload().value().equals(msg));
        CHECK(DataSpan(region).equals(msg));
    }
}

TEST_CASE("Out-of-order segment aborts the session") {
    auto msg = make_message(50);
    auto session = make_session(50, u8{4});
    REQUIRE(session.next(DataTransfer::from_message(1, msg)).is_ok());

    SUBCASE("skipped sequence") {
        auto r = session.next(DataTransfer::from_message(3, msg));
        REQUIRE(r.is_err());
        CHECK(r.error().error.code == ErrorCode::Sequence);
        CHECK(r.error().abort.reason == AbortReason::BadSequenceNumber);
        CHECK(r.error().abort.sender_role == AbortSenderRole::Receiver);
        CHECK(r.error().abort.pgn == PROPRIETARY_A);
        CHECK(session.is_aborted());
    }

    SUBCASE("duplicate sequence") {
        auto r = session.next(DataTransfer::from_message(1, msg));
        REQUIRE(r.is_err());
        CHECK(r.error().error.code == ErrorCode::Sequence);
        CHECK(session.is_aborted());
    }

    SUBCASE("sequence zero") {
        auto r = session.next(DataTransfer::from_message(0, msg));
        REQUIRE(r.is_err());
        CHECK(r.error().error.code == ErrorCode::Sequence);
    }

    SUBCASE("every later input reports the previous abort") {
        REQUIRE(session.next(DataTransfer::from_message(5, msg)).is_err());
        u8 received = session.received_packets();
        for (u8 seq = 1; seq <= 8; ++seq) {
            auto r = session.next(DataTransfer::from_message(seq, msg));
            REQUIRE(r.is_err());
            CHECK(r.error().error.code == ErrorCode::PreviousAbort);
            CHECK(r.error().abort.reason == AbortReason::UnexpectedDataTransfer);
            CHECK(r.error().abort.sender_role == AbortSenderRole::Receiver);
        }
        CHECK(session.received_packets() == received);
        CHECK(!session.payload().has_value());
    }
}

TEST_CASE("Burst cadence") {
    SUBCASE("CTS exactly on multiples of the burst") {
        auto msg = make_message(100); // 15 packets
        auto session = make_session(100, u8{4});
        for (u8 seq = 1; seq <= 15; ++seq) {
            CAPTURE(seq);
            auto r = session.next(DataTransfer::from_message(seq, msg));
            REQUIRE(r.is_ok());
            if (seq == 15) {
                REQUIRE(r.value().has_value());
                CHECK(r.value().value().is_end());
            } else if (seq % 4 == 0) {
                REQUIRE(r.value().has_value());
                REQUIRE(r.value().value().is_cts());
                CHECK(r.value().value().cts.next_sequence == seq + 1);
            } else {
                CHECK(!r.value().has_value());
            }
        }
    }

    SUBCASE("final segment on a burst boundary still yields EoMA") {
        auto msg = make_message(28); // 4 packets
        auto session = make_session(28, u8{2});
        REQUIRE(session.next(DataTransfer::from_message(1, msg)).is_ok());
        auto r2 = session.next(DataTransfer::from_message(2, msg));
        REQUIRE(r2.is_ok());
        CHECK(r2.value().value().is_cts());
        REQUIRE(session.next(DataTransfer::from_message(3, msg)).is_ok());
        auto r4 = session.next(DataTransfer::from_message(4, msg));
        REQUIRE(r4.is_ok());
        REQUIRE(r4.value().has_value());
        CHECK(r4.value().value().is_end());
    }

    SUBCASE("burst of one acknowledges every segment") {
        auto msg = make_message(21);
        auto session = make_session(21, u8{1});
        for (u8 seq = 1; seq <= 2; ++seq) {
            auto r = session.next(DataTransfer::from_message(seq, msg));
            REQUIRE(r.is_ok());
            REQUIRE(r.value().has_value());
            CHECK(r.value().value().is_cts());
        }
    }

    SUBCASE("unlimited mode never sends CTS") {
        auto msg = make_message(1785);
        auto session = make_session(1785, dp::nullopt);
        for (u8 seq = 1; seq < 255; ++seq) {
            auto r = session.next(DataTransfer::from_message(seq, msg));
            REQUIRE(r.is_ok());
            CHECK(!r.value().has_value());
        }
        auto last = session.next(DataTransfer::from_message(255, msg));
        REQUIRE(last.is_ok());
        CHECK(last.value().value().is_end());
    }

    SUBCASE("receiver config caps the burst") {
        auto msg = make_message(70);
        auto session = make_session(70, dp::nullopt, ReassemblyBuffer::growable(),
                                    SessionConfig{}.set_max_packets_per_cts(3));
        REQUIRE(session.burst().has_value());
        CHECK(session.burst().value() == 3);
        REQUIRE(session.next(DataTransfer::from_message(1, msg)).is_ok());
        REQUIRE(session.next(DataTransfer::from_message(2, msg)).is_ok());
        auto r = session.next(DataTransfer::from_message(3, msg));
        REQUIRE(r.is_ok());
        REQUIRE(r.value().has_value());
        CHECK(r.value().value().cts.max_packets_per_response.value() == 3);
        CHECK(r.value().value().cts.next_sequence == 4);
    }

    SUBCASE("sender limit wins when it is smaller than the cap") {
        auto session = make_session(70, u8{2}, ReassemblyBuffer::growable(),
                                    SessionConfig{}.set_max_packets_per_cts(8));
        CHECK(session.burst().value() == 2);
    }
}

TEST_CASE("Fixed storage bound aborts the session") {
    auto msg = make_message(30); // 5 packets
    dp::Array<u8, 21> region = {};
    auto session = make_session(30, dp::nullopt, ReassemblyBuffer::fixed(region));
    CHECK(session.storage_kind() == StorageKind::Fixed);

    bool aborted = false;
    session.on_abort.subscribe([&](AbortReason reason) {
        aborted = true;
        CHECK(reason == AbortReason::Custom);
    });

    for (u8 seq = 1; seq <= 3; ++seq)
        REQUIRE(session.next(DataTransfer::from_message(seq, msg)).is_ok());

    auto r = session.next(DataTransfer::from_message(4, msg));
    REQUIRE(r.is_err());
    CHECK(r.error().error.code == ErrorCode::StorageTooSmall);
    CHECK(r.error().abort.reason == AbortReason::Custom);
    CHECK(r.error().abort.sender_role == AbortSenderRole::Receiver);
    CHECK(session.is_aborted());
    CHECK(session.received_packets() == 3);
    CHECK(aborted);

    auto again = session.next(DataTransfer::from_message(4, msg));
    REQUIRE(again.is_err());
    CHECK(again.error().error.code == ErrorCode::PreviousAbort);
}

TEST_CASE("Input after completion") {
    auto msg = make_message(9);
    auto session = make_session(9, dp::nullopt);
    REQUIRE(session.next(DataTransfer::from_message(1, msg)).is_ok());
    REQUIRE(session.next(DataTransfer::from_message(2, msg)).is_ok());
    REQUIRE(session.is_complete());

    auto r = session.next(DataTransfer::from_message(3, msg));
    REQUIRE(r.is_err());
    CHECK(r.error().error.code == ErrorCode::AlreadyComplete);
    CHECK(r.error().abort.reason == AbortReason::UnexpectedDataTransfer);

    // The finished transfer is untouched
    CHECK(session.is_complete());
    CHECK(!session.is_aborted());
    REQUIRE(session.payload().has_value());
    CHECK(session.payload().value().equals(msg));
}

TEST_CASE("External abort") {
    auto msg = make_message(40);
    auto session = make_session(40, u8{3});
    REQUIRE(session.next(DataTransfer::from_message(1, msg)).is_ok());

    AbortReason seen = AbortReason::Custom;
    session.on_abort.subscribe([&](AbortReason reason) { seen = reason; });

    auto frame = session.abort(AbortReason::Timeout);
    REQUIRE(frame.is_ok());
    CHECK(frame.value().reason == AbortReason::Timeout);
    CHECK(frame.value().sender_role == AbortSenderRole::Receiver);
    CHECK(frame.value().pgn == PROPRIETARY_A);
    CHECK(seen == AbortReason::Timeout);
    CHECK(session.is_aborted());

    SUBCASE("cannot abort twice") {
        auto again = session.abort(AbortReason::Timeout);
        REQUIRE(again.is_err());
        CHECK(again.error().code == ErrorCode::InvalidState);
    }

    SUBCASE("later data reports the previous abort") {
        auto r = session.next(DataTransfer::from_message(2, msg));
        REQUIRE(r.is_err());
        CHECK(r.error().error.code == ErrorCode::PreviousAbort);
    }
}

TEST_CASE("Session construction") {
    SUBCASE("rejects an inconsistent RTS off the wire") {
        Payload raw = {tp_cm::RTS, 16, 0, 2, 0xFF, 0x00, 0xEF, 0x00};
        auto rts = RequestToSend::decode(raw);
        REQUIRE(rts.is_ok());
        auto session = ReassemblySession::create(rts.value());
        REQUIRE(session.is_err());
        CHECK(session.error().code == ErrorCode::InvalidParameter);
    }

    SUBCASE("rejects an invalid config") {
        auto rts = RequestToSend::create(16, dp::nullopt, PROPRIETARY_A);
        REQUIRE(rts.is_ok());
        SessionConfig config;
        config.max_packets_per_cts = u8{0};
        auto session = ReassemblySession::create(rts.value(), ReassemblyBuffer::growable(), config);
        REQUIRE(session.is_err());
        CHECK(session.error().code == ErrorCode::InvalidParameter);
    }

    SUBCASE("starts active and empty") {
        auto session = make_session(16, u8{2});
        CHECK(session.state() == SessionState::Active);
        CHECK(session.received_packets() == 0);
        CHECK(session.progress() == doctest::Approx(0.0f));
        CHECK(session.request().total_size == 16);
        CHECK(!session.payload().has_value());
    }
}

TEST_CASE("Completion event carries the payload") {
    auto msg = make_message(20);
    auto session = make_session(20, dp::nullopt);

    dp::Vector<u8> received;
    session.on_complete.subscribe([&](DataSpan data) { received = data.to_vector(); });

    for (u8 seq = 1; seq <= 3; ++seq)
        REQUIRE(session.next(DataTransfer::from_message(seq, msg)).is_ok());

    CHECK(session.progress() == doctest::Approx(1.0f));
    CHECK(DataSpan(received).equals(msg));
}

// Feeds every segment in order and counts deviations from the expected responses
static usize replay_faults(ReassemblySession &session, const dp::Vector<u8> &msg, dp::Optional<u8> burst) {
    usize faults = 0;
    u8 total = session.total_packets();
    for (u8 seq = 1;; ++seq) {
        auto r = session.next(DataTransfer::from_message(seq, msg));
        if (r.is_err())
            return faults + 1;
        const auto &response = r.value();
        if (seq == total) {
            if (!response.has_value() || !response.value().is_end() || response.value().eoma.total_size != msg.size())
                ++faults;
            break;
        }
        bool cts_due = burst.has_value() && seq % burst.value() == 0;
        if (response.has_value() != cts_due)
            ++faults;
        else if (cts_due && response.value().cts.next_sequence != seq + 1)
            ++faults;
    }
    if (!session.payload().has_value() || !session.payload().value().equals(msg))
        ++faults;
    return faults;
}

TEST_CASE("Every message size reassembles with both storage kinds") {
    for (u16 size = TP_MIN_DATA_LENGTH; size <= TP_MAX_DATA_LENGTH; ++size) {
        CAPTURE(size);
        auto msg = make_message(size);
        dp::Optional<u8> burst = static_cast<u8>(1 + size % 32);

        auto growable_open = make_session(size, dp::nullopt);
        auto growable_burst = make_session(size, burst);

        dp::Vector<u8> region_a(size, 0x00);
        dp::Vector<u8> region_b(size, 0x00);
        auto fixed_open = make_session(size, dp::nullopt, ReassemblyBuffer::fixed(region_a));
        auto fixed_burst = make_session(size, burst, ReassemblyBuffer::fixed(region_b));

        usize faults = replay_faults(growable_open, msg, dp::nullopt) + replay_faults(growable_burst, msg, burst) +
                       replay_faults(fixed_open, msg, dp::nullopt) + replay_faults(fixed_burst, msg, burst);
        CHECK(faults == 0);
        CHECK(DataSpan(region_b).equals(msg));
    }
}

TEST_CASE("A moved session keeps logging and completing") {
    auto msg = make_message(30);
    auto first = make_session(30, u8{2});
    REQUIRE(first.next(DataTransfer::from_message(1, msg)).is_ok());

    ReassemblySession moved = std::move(first);
    for (u8 seq = 2; seq <= 5; ++seq)
        REQUIRE(moved.next(DataTransfer::from_message(seq, msg)).is_ok());
    REQUIRE(moved.payload().has_value());
    CHECK(moved.payload().value().equals(msg));

    auto late = moved.next(DataTransfer::from_message(6, msg));
    REQUIRE(late.is_err());
    CHECK(late.error().error.code == ErrorCode::AlreadyComplete);
}
