#include "doctest/doctest.h"

#include <memory>
#include <string>

#include "core/device/manager/device_registry.hpp"
#include "core/device/session/session_controller.hpp"
#include "test_support.hpp"

using namespace devgw::core::device;
using devgw::test::FakeConnection;
using devgw::test::FieldOf;
using devgw::test::ManualClock;
using devgw::test::MemoryMeasurementSink;
using devgw::test::RegisterFrame;

namespace {

struct Harness {
  ManualClock clock;
  manager::DeviceRegistry registry;
  std::shared_ptr<MemoryMeasurementSink> sink = std::make_shared<MemoryMeasurementSink>();
  session::SessionController controller{registry, sink, nullptr, clock.Fn()};
};

}  // namespace

DOCTEST_TEST_CASE("register frame creates an Idle device and acks") {
  Harness h;
  std::shared_ptr<transport::Connection> conn = std::make_shared<FakeConnection>();
  auto* fake = static_cast<FakeConnection*>(conn.get());

  h.controller.OnOpen(conn);
  h.controller.OnFrame(conn, RegisterFrame("esp32-001"));

  const auto d = h.registry.Lookup("esp32-001");
  DOCTEST_REQUIRE(d.has_value());
  DOCTEST_CHECK(d->status.state == model::DeviceState::Idle);
  DOCTEST_CHECK_EQ(conn->DeviceId(), "esp32-001");
  DOCTEST_CHECK_EQ(FieldOf(fake->LastFrame(), "$.type"), "registration_ack");
  DOCTEST_CHECK_EQ(FieldOf(fake->LastFrame(), "$.deviceId"), "esp32-001");
  DOCTEST_CHECK_EQ(FieldOf(fake->LastFrame(), "$.status"), "success");
}

DOCTEST_TEST_CASE("malformed frames get an error reply and the link stays open") {
  Harness h;
  auto fake = std::make_shared<FakeConnection>();
  std::shared_ptr<transport::Connection> conn = fake;

  h.controller.OnFrame(conn, "{not json");
  DOCTEST_CHECK_EQ(FieldOf(fake->LastFrame(), "$.type"), "error");
  DOCTEST_CHECK_EQ(FieldOf(fake->LastFrame(), "$.error"), "protocol_error");
  DOCTEST_CHECK(fake->IsOpen());
  DOCTEST_CHECK_EQ(h.controller.ProtocolErrorCount(), 1u);
  DOCTEST_CHECK_EQ(h.registry.Size(), 0u);
}

DOCTEST_TEST_CASE("frames before registration are refused") {
  Harness h;
  auto fake = std::make_shared<FakeConnection>();
  std::shared_ptr<transport::Connection> conn = fake;

  h.controller.OnFrame(conn, R"({"type":"heartbeat"})");
  DOCTEST_CHECK_EQ(FieldOf(fake->LastFrame(), "$.error"), "protocol_error");
  DOCTEST_CHECK(FieldOf(fake->LastFrame(), "$.detail").find("not_registered") == 0);
}

DOCTEST_TEST_CASE("heartbeat refreshes activity") {
  Harness h;
  std::shared_ptr<transport::Connection> conn = std::make_shared<FakeConnection>();
  h.controller.OnFrame(conn, RegisterFrame("D1"));
  const auto before = h.registry.Lookup("D1")->status.last_activity;

  h.clock.Advance(std::chrono::milliseconds(5000));
  h.controller.OnFrame(conn, R"({"type":"heartbeat"})");
  const auto after = h.registry.Lookup("D1")->status.last_activity;
  DOCTEST_CHECK(after - before == std::chrono::milliseconds(5000));
}

DOCTEST_TEST_CASE("a link cannot switch identity") {
  Harness h;
  auto fake = std::make_shared<FakeConnection>();
  std::shared_ptr<transport::Connection> conn = fake;
  h.controller.OnFrame(conn, RegisterFrame("D1"));
  h.controller.OnFrame(conn, RegisterFrame("D2"));

  DOCTEST_CHECK(h.registry.Has("D1"));
  DOCTEST_CHECK_FALSE(h.registry.Has("D2"));
  DOCTEST_CHECK_EQ(FieldOf(fake->LastFrame(), "$.error"), "protocol_error");
}

DOCTEST_TEST_CASE("reconnecting resets to Idle and drops the prior session") {
  Harness h;
  auto first = std::make_shared<FakeConnection>();
  std::shared_ptr<transport::Connection> c1 = first;
  h.controller.OnFrame(c1, RegisterFrame("D1"));
  DOCTEST_REQUIRE(h.registry.WithDevice("D1", [](model::DeviceEntity& d, transport::Connection&) {
    d.status.state = model::DeviceState::SessionActive;
    d.active_session_id = "S1";
  }));

  std::shared_ptr<transport::Connection> c2 = std::make_shared<FakeConnection>();
  h.controller.OnFrame(c2, RegisterFrame("D1"));
  const auto d = h.registry.Lookup("D1");
  DOCTEST_REQUIRE(d.has_value());
  DOCTEST_CHECK(d->status.state == model::DeviceState::Idle);
  DOCTEST_CHECK(d->active_session_id.empty());
  DOCTEST_CHECK_FALSE(first->IsOpen());

  // The old link's close arrives afterwards and must not evict the new one.
  h.controller.OnClose(c1);
  DOCTEST_CHECK(h.registry.Has("D1"));

  // Nor may late frames on it refresh the new record.
  h.clock.Advance(std::chrono::milliseconds(1000));
  c1->BindDevice("D1");
  h.controller.OnFrame(c1, R"({"type":"heartbeat"})");
  DOCTEST_CHECK(h.registry.Lookup("D1")->status.last_activity < h.clock.Now());
}

DOCTEST_TEST_CASE("closing the link removes the device") {
  Harness h;
  std::vector<manager::RegistryEvent> events;
  h.registry.AddObserver([&](const manager::RegistryEvent& ev) { events.push_back(ev); });
  std::shared_ptr<transport::Connection> conn = std::make_shared<FakeConnection>();
  h.controller.OnFrame(conn, RegisterFrame("D1"));

  h.controller.OnClose(conn);
  DOCTEST_CHECK_FALSE(h.registry.Has("D1"));
  DOCTEST_CHECK(conn->DeviceId().empty());
  DOCTEST_REQUIRE_FALSE(events.empty());
  DOCTEST_CHECK(events.back().reason == manager::RemovalReason::ConnectionClosed);
}

DOCTEST_TEST_CASE("sensor frames reach the sink tagged with the active session") {
  Harness h;
  std::shared_ptr<transport::Connection> conn = std::make_shared<FakeConnection>();
  h.controller.OnFrame(conn, RegisterFrame("D1"));
  DOCTEST_REQUIRE(h.registry.WithDevice("D1", [](model::DeviceEntity& d, transport::Connection&) {
    d.status.state = model::DeviceState::SessionActive;
    d.active_session_id = "S1";
  }));

  h.controller.OnFrame(conn, R"({"type":"sensor_frame","sensor":"pzem004t","timestamp":42,"data":{"w":3}})");
  h.controller.OnFrame(conn, R"({"type":"sensor_frame","sensor":"camera","data":"abc"})");

  const auto items = h.sink->Items();
  DOCTEST_REQUIRE_EQ(items.size(), 2u);
  DOCTEST_CHECK_EQ(items[0].device_id, "D1");
  DOCTEST_CHECK_EQ(items[0].session_id, "S1");
  DOCTEST_CHECK_EQ(items[0].timestamp_ms, 42);
  DOCTEST_CHECK_EQ(items[0].payload, R"({"w":3})");
  DOCTEST_CHECK(items[1].timestamp_ms > 0);
  DOCTEST_CHECK_EQ(h.controller.MeasurementCount(), 2u);
}

DOCTEST_TEST_CASE("gateway-only message types from a device are flagged") {
  Harness h;
  auto fake = std::make_shared<FakeConnection>();
  std::shared_ptr<transport::Connection> conn = fake;
  h.controller.OnFrame(conn, RegisterFrame("D1"));

  h.controller.OnFrame(conn, R"({"type":"session_start","sessionId":"S1"})");
  DOCTEST_CHECK(FieldOf(fake->LastFrame(), "$.detail").find("unexpected_message") == 0);
  DOCTEST_CHECK(h.registry.Lookup("D1")->status.state == model::DeviceState::Idle);
}

DOCTEST_TEST_CASE("oversized frames are rejected without closing the link") {
  Harness h;
  auto fake = std::make_shared<FakeConnection>();
  std::shared_ptr<transport::Connection> conn = fake;
  h.controller.RejectFrame(conn, "frame_too_large");
  DOCTEST_CHECK_EQ(FieldOf(fake->LastFrame(), "$.detail"), "frame_too_large");
  DOCTEST_CHECK(fake->IsOpen());
}

DOCTEST_TEST_CASE("heartbeat trace lines appear only at trace level") {
  ManualClock clock;
  manager::DeviceRegistry registry;
  auto log_sink = std::make_shared<devgw::test::MemoryLogSink>();
  auto logger = std::make_shared<devgw::core::common::log::Logger>(log_sink);
  session::SessionController controller{registry, nullptr, logger, clock.Fn()};
  std::shared_ptr<transport::Connection> conn = std::make_shared<FakeConnection>();
  controller.OnFrame(conn, RegisterFrame("D1"));

  const auto heartbeat_lines = [&] {
    std::size_t n = 0;
    for (const auto& line : log_sink->Lines()) {
      if (line.find("heartbeat D1") != std::string::npos) ++n;
    }
    return n;
  };

  logger->SetLevel(devgw::core::common::log::Level::Info);
  controller.OnFrame(conn, R"({"type":"heartbeat"})");
  DOCTEST_CHECK_EQ(heartbeat_lines(), 0u);

  logger->SetLevel(devgw::core::common::log::Level::Trace);
  controller.OnFrame(conn, R"({"type":"heartbeat"})");
  DOCTEST_CHECK_EQ(heartbeat_lines(), 1u);
}
