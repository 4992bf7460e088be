#include <string>
#include <vector>

#include "fake_link.h"
#include "frame_transport.h"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

TEST_CASE("probe acknowledgment arriving in pieces forms one frame")
{
    FakeDevice dev = make_device(0);
    FakeLink link(dev.responder(), nullptr, -1, 3);
    FrameTransport transport(&link);

    ReadResult res = transport.exchange(build_probe_request(), 100);
    REQUIRE(res.ok());
    CHECK(res.frame.payload.size() == kAckFrameLen);
    CHECK(res.attempts == 1);
    CHECK(transport.buffered() == 0);
}

TEST_CASE("silence is a timeout and empty-memory bytes are garbage")
{
    FakeLink silent(silent_responder);
    FrameTransport t1(&silent);
    ReadResult res = t1.exchange(build_probe_request(), 20);
    CHECK(res.status == ReadStatus::Timeout);
    CHECK(res.bytes_received == 0);

    FakeLink idle([](const std::vector<uint8_t>&) { return std::vector<uint8_t>(16, 0xFF); });
    FrameTransport t2(&idle);
    res = t2.exchange(build_probe_request(), 20);
    CHECK(res.status == ReadStatus::Garbage);
    CHECK(res.bytes_received == 16);
}

TEST_CASE("short block is garbage, never a truncated frame")
{
    FakeLink link([](const std::vector<uint8_t>&) { return std::vector<uint8_t>(100, 0x01); });
    FrameTransport transport(&link);
    ReadResult res = transport.exchange(build_block_request(0), 20);
    CHECK(res.status == ReadStatus::Garbage);
    CHECK_FALSE(res.frame.valid);
    CHECK(res.detail.find("100/128") != std::string::npos);
}

TEST_CASE("header resynchronizes past leading noise")
{
    FakeDevice dev = make_device(5);
    dev.faults.push_back(Fault::NoisePrefix);
    FakeLink link(dev.responder());
    FrameTransport transport(&link);

    ReadResult res = transport.exchange(build_header_request(), 50);
    REQUIRE(res.ok());
    CHECK(res.frame.payload[0] == kHeaderMagic0);
    CHECK(res.frame.payload[1] == kHeaderMagic1);
    CHECK(res.frame.payload.size() == kHeaderFrameLen);

    DeviceInfo info;
    std::string err;
    REQUIRE(parse_header(res.frame.payload.data(), res.frame.payload.size(), info, err));
    CHECK(info.record_count == 5);
}

TEST_CASE("header without magic is garbage")
{
    FakeLink link([](const std::vector<uint8_t>&) { return std::vector<uint8_t>(64, 0x42); });
    FrameTransport transport(&link);
    ReadResult res = transport.exchange(build_header_request(), 20);
    CHECK(res.status == ReadStatus::Garbage);
    CHECK(res.detail == "header magic not found");
}

TEST_CASE("stale bytes from an earlier exchange are flushed")
{
    FakeDevice dev = make_device(1);
    FakeLink link(dev.responder());
    FrameTransport transport(&link);

    link.inject(std::vector<uint8_t>(40, 0x33));
    ReadResult res = transport.exchange(build_probe_request(), 20);
    REQUIRE(res.ok());
    CHECK(res.frame.payload[0] == 'T');
}

TEST_CASE("call retries once after garbage, then succeeds")
{
    FakeDevice dev = make_device(32);
    dev.faults.push_back(Fault::Garbage);
    FakeLink link(dev.responder());
    FrameTransport transport(&link);

    ReadResult res = transport.call(build_block_request(0), 20);
    CHECK(res.ok());
    CHECK(res.attempts == 2);
    CHECK(link.writes.size() == 2);
}

TEST_CASE("call gives up after the second timeout")
{
    FakeDevice dev = make_device(32);
    dev.faults.push_back(Fault::Silence);
    dev.faults.push_back(Fault::Silence);
    dev.faults.push_back(Fault::Silence);
    FakeLink link(dev.responder());
    FrameTransport transport(&link);

    ReadResult res = transport.call(build_block_request(0), 20);
    CHECK(res.status == ReadStatus::Timeout);
    CHECK(res.attempts == 2);
    CHECK(link.writes.size() == 2);
    CHECK(dev.faults.size() == 1);
}

TEST_CASE("write failure is a link error and is not retried")
{
    FakeDevice dev = make_device(1);
    FakeLink link(dev.responder(), nullptr, 0);
    FrameTransport transport(&link);

    ReadResult res = transport.call(build_probe_request(), 20);
    CHECK(res.status == ReadStatus::LinkError);
    CHECK(res.attempts == 1);
    CHECK(res.detail.find("device disconnected") != std::string::npos);
}

TEST_CASE("read on a closed link is a link error")
{
    FakeLink link(silent_responder);
    FrameTransport transport(&link);
    link.closePort();
    ReadResult res = transport.readFrame(Command::Probe, 20);
    CHECK(res.status == ReadStatus::LinkError);
}
