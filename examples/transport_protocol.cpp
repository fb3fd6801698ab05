#include <j1939tp.hpp>
#include <echo/echo.hpp>

using namespace j1939tp;

int main() {
    echo::info("=== TP Receiver Demo ===");
    echo::info("TP.CM on PGN ", PGN_TP_CM, ", TP.DT on PGN ", PGN_TP_DT);

    // RTS as received from the sender: 128 bytes, one packet per CTS
    auto rts = RequestToSend::create(128, u8{1}, 0xEF00);
    if (!rts.is_ok()) {
        echo::error("bad RTS: ", rts.error().message);
        return 1;
    }

    auto created = ReassemblySession::create(rts.value());
    if (!created.is_ok()) {
        echo::error("cannot start session: ", created.error().message);
        return 1;
    }
    auto &session = created.value();

    session.on_complete.subscribe(
        [](DataSpan payload) { echo::info("transfer complete: ", payload.size(), " bytes"); });

    // Data the sender wants to transfer, cut into padded 7-byte segments
    dp::Vector<u8> data(128, 0x00);
    for (usize i = 0; i < data.size(); ++i)
        data[i] = static_cast<u8>(i);

    u8 total = session.total_packets();
    for (u8 seq = 1; seq <= total; ++seq) {
        // Round-trip through the wire form, the way frames arrive off the bus
        auto wire = DataTransfer::from_message(seq, data).encode();
        auto dt = DataTransfer::decode(wire);
        if (!dt.is_ok()) {
            echo::error("malformed DT frame");
            return 1;
        }

        auto step = session.next(dt.value());
        if (step.is_err()) {
            auto frame = step.error().abort.encode();
            echo::warn("abort: ", step.error().error.message, " -> send reason=", static_cast<u32>(frame[1]));
            return 1;
        }

        auto &response = step.value();
        if (!response.has_value()) {
            echo::info("seq ", static_cast<u32>(seq), ": no message");
        } else if (response.value().is_cts()) {
            echo::info("seq ", static_cast<u32>(seq), ": CTS next=",
                       static_cast<u32>(response.value().cts.next_sequence));
        } else {
            echo::info("seq ", static_cast<u32>(seq), ": EoMA size=", response.value().eoma.total_size,
                       " packets=", static_cast<u32>(response.value().eoma.total_packets));
        }
    }

    auto payload = session.payload();
    bool match = payload.has_value() && payload.value().equals(data);
    echo::info("Data integrity: ", match ? "OK" : "FAIL");

    // A fixed region works without allocation; 14 bytes cannot hold a 16-byte transfer
    dp::Array<u8, 14> region = {};
    auto small = RequestToSend::create(16, dp::nullopt, 0xEF00);
    if (small.is_err()) {
        echo::error("bad RTS: ", small.error().message);
        return 1;
    }
    auto bounded = ReassemblySession::create(small.value(), ReassemblyBuffer::fixed(region));
    if (bounded.is_ok()) {
        dp::Vector<u8> msg(16, 0xAB);
        for (u8 seq = 1; seq <= 3; ++seq) {
            auto step = bounded.value().next(DataTransfer::from_message(seq, msg));
            if (step.is_err()) {
                echo::warn("fixed storage: ", step.error().error.message, " (abort reason ",
                           abort_reason_name(step.error().abort.reason), ")");
                break;
            }
        }
    }

    return match ? 0 : 1;
}
