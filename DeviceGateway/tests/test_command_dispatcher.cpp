#include "doctest/doctest.h"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/device/dispatch/command_dispatcher.hpp"
#include "core/device/heartbeat/heartbeat_monitor.hpp"
#include "core/device/manager/device_registry.hpp"
#include "core/device/session/session_controller.hpp"
#include "test_support.hpp"

using namespace devgw::core::device;
using devgw::core::common::error::ErrorCode;
using devgw::test::FakeConnection;
using devgw::test::FieldOf;
using devgw::test::ManualClock;
using devgw::test::RegisterFrame;

namespace {

struct Harness {
  ManualClock clock;
  manager::DeviceRegistry registry;
  session::SessionController controller{registry, nullptr, nullptr, clock.Fn()};
  dispatch::CommandDispatcher dispatcher{registry};

  std::shared_ptr<FakeConnection> Connect(const std::string& id) {
    auto fake = std::make_shared<FakeConnection>();
    std::shared_ptr<transport::Connection> conn = fake;
    controller.OnFrame(conn, RegisterFrame(id));
    return fake;
  }
};

protocol::SessionStartMessage Start(const std::string& id) {
  protocol::SessionStartMessage m;
  m.session_id = id;
  return m;
}

protocol::SessionStopMessage Stop(const std::string& id) {
  protocol::SessionStopMessage m;
  m.session_id = id;
  return m;
}

protocol::ConfigUpdateMessage Config(const std::string& cap, const std::string& value) {
  protocol::ConfigUpdateMessage m;
  m.config.emplace_back(cap, value);
  return m;
}

}  // namespace

DOCTEST_TEST_CASE("start, repeat start, stop on one device") {
  Harness h;
  auto d1 = h.Connect("D1");

  DOCTEST_CHECK(h.dispatcher.Send("D1", Start("S1")).IsOk());
  DOCTEST_CHECK_EQ(FieldOf(d1->LastFrame(), "$.type"), "session_start");
  DOCTEST_CHECK_EQ(FieldOf(d1->LastFrame(), "$.sessionId"), "S1");
  DOCTEST_CHECK(h.registry.Lookup("D1")->status.state == model::DeviceState::SessionActive);

  const std::size_t frames = d1->FrameCount();
  const auto again = h.dispatcher.Send("D1", Start("S2"));
  DOCTEST_CHECK(again.Code() == ErrorCode::SessionAlreadyActive);
  DOCTEST_CHECK_EQ(d1->FrameCount(), frames);

  DOCTEST_CHECK(h.dispatcher.Send("D1", Stop("S1")).IsOk());
  DOCTEST_CHECK(h.registry.Lookup("D1")->status.state == model::DeviceState::Idle);
  DOCTEST_CHECK(h.dispatcher.Send("D1", Stop("S1")).Code() == ErrorCode::NoActiveSession);

  DOCTEST_CHECK_EQ(h.dispatcher.SentCount(), 2u);
  DOCTEST_CHECK_EQ(h.dispatcher.FailedCount(), 2u);
}

DOCTEST_TEST_CASE("stop without an id carries the active session id on the wire") {
  Harness h;
  auto d1 = h.Connect("D1");
  DOCTEST_REQUIRE(h.dispatcher.Send("D1", Start("S5")).IsOk());
  DOCTEST_REQUIRE(h.dispatcher.Send("D1", Stop("")).IsOk());
  DOCTEST_CHECK_EQ(FieldOf(d1->LastFrame(), "$.type"), "session_stop");
  DOCTEST_CHECK_EQ(FieldOf(d1->LastFrame(), "$.sessionId"), "S5");
}

DOCTEST_TEST_CASE("session start without an id gets a generated one") {
  Harness h;
  auto d1 = h.Connect("D1");
  DOCTEST_REQUIRE(h.dispatcher.Send("D1", Start("")).IsOk());
  const std::string sid = FieldOf(d1->LastFrame(), "$.sessionId");
  DOCTEST_CHECK_EQ(sid.size(), 36u);
  DOCTEST_CHECK_EQ(h.registry.Lookup("D1")->active_session_id, sid);
}

DOCTEST_TEST_CASE("config for a non-configurable sensor is refused") {
  Harness h;
  auto d1 = h.Connect("D1");
  const std::size_t frames = d1->FrameCount();

  const auto bad = h.dispatcher.Send("D1", Config("pzem004t", R"({"interval":1})"));
  DOCTEST_CHECK(bad.Code() == ErrorCode::UnsupportedCapability);
  DOCTEST_CHECK_EQ(d1->FrameCount(), frames);

  DOCTEST_CHECK(h.dispatcher.Send("D1", Config("camera", R"({"resolution":"1280x720"})")).IsOk());
  DOCTEST_CHECK_EQ(FieldOf(d1->LastFrame(), "$.type"), "config_update");
  DOCTEST_CHECK_EQ(FieldOf(d1->LastFrame(), "$.config.camera.resolution"), "1280x720");
  DOCTEST_CHECK_EQ(h.registry.Lookup("D1")->FindCapability("camera")->config,
                   R"({"resolution":"1280x720"})");
}

DOCTEST_TEST_CASE("commands to an absent device fail immediately") {
  Harness h;
  DOCTEST_CHECK(h.dispatcher.Send("ghost", Start("S1")).Code() == ErrorCode::DeviceNotConnected);

  auto d1 = h.Connect("D1");
  h.registry.Remove("D1", manager::RemovalReason::Explicit);
  DOCTEST_CHECK(h.dispatcher.Send("D1", Start("S1")).Code() == ErrorCode::DeviceNotConnected);
}

DOCTEST_TEST_CASE("a failed write leaves the state unchanged") {
  Harness h;
  auto d1 = h.Connect("D1");
  d1->SetFailSends(true);
  DOCTEST_CHECK(h.dispatcher.Send("D1", Start("S1")).Code() == ErrorCode::SendFailed);
  DOCTEST_CHECK(h.registry.Lookup("D1")->status.state == model::DeviceState::Idle);
}

DOCTEST_TEST_CASE("commands to one device are delivered in submission order") {
  Harness h;
  auto d1 = h.Connect("D1");
  const std::size_t base = d1->FrameCount();

  DOCTEST_REQUIRE(h.dispatcher.Send("D1", Config("camera", "1")).IsOk());
  DOCTEST_REQUIRE(h.dispatcher.Send("D1", Config("sd", "2")).IsOk());
  DOCTEST_REQUIRE(h.dispatcher.Send("D1", Start("S1")).IsOk());

  const auto frames = d1->Frames();
  DOCTEST_REQUIRE_EQ(frames.size(), base + 3);
  DOCTEST_CHECK(frames[base].find("\"camera\"") != std::string::npos);
  DOCTEST_CHECK(frames[base + 1].find("\"sd\"") != std::string::npos);
  DOCTEST_CHECK_EQ(FieldOf(frames[base + 2], "$.type"), "session_start");
}

DOCTEST_TEST_CASE("a stalled device does not block commands to another") {
  Harness h;
  auto slow = h.Connect("slow");
  auto fast = h.Connect("fast");

  slow->Gate();
  auto blocked = std::async(std::launch::async, [&] { return h.dispatcher.Send("slow", Start("S1")); });
  DOCTEST_REQUIRE(slow->WaitForBlockedSender(std::chrono::seconds(5)));

  auto other = std::async(std::launch::async, [&] { return h.dispatcher.Send("fast", Start("S2")); });
  DOCTEST_REQUIRE(other.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
  DOCTEST_CHECK(other.get().IsOk());
  DOCTEST_CHECK(h.registry.Has("fast"));

  slow->Release();
  DOCTEST_CHECK(blocked.get().IsOk());
  DOCTEST_CHECK_EQ(h.registry.Lookup("slow")->active_session_id, "S1");
}

DOCTEST_TEST_CASE("concurrent starts on one device admit exactly one session") {
  Harness h;
  auto d1 = h.Connect("D1");

  std::vector<std::future<devgw::core::common::error::Status>> results;
  for (int i = 0; i < 8; ++i) {
    results.push_back(std::async(std::launch::async, [&h, i] {
      return h.dispatcher.Send("D1", Start("S" + std::to_string(i)));
    }));
  }
  int ok = 0;
  int busy = 0;
  for (auto& f : results) {
    const auto st = f.get();
    if (st.IsOk()) ++ok;
    if (st.Code() == ErrorCode::SessionAlreadyActive) ++busy;
  }
  DOCTEST_CHECK_EQ(ok, 1);
  DOCTEST_CHECK_EQ(busy, 7);
}

DOCTEST_TEST_CASE("reference scenario: register, configure, session, timeout") {
  Harness h;
  heartbeat::HeartbeatMonitor::Options opt;
  opt.timeout = std::chrono::milliseconds(15000);
  auto d1 = h.Connect("D1");

  DOCTEST_CHECK(h.dispatcher.Send("D1", Config("camera", R"({"resolution":"1280x720"})")).IsOk());
  DOCTEST_CHECK(h.dispatcher.Send("D1", Start("S1")).IsOk());
  DOCTEST_CHECK(h.dispatcher.Send("D1", Start("S2")).Code() == ErrorCode::SessionAlreadyActive);
  DOCTEST_CHECK(h.dispatcher.Send("D1", Stop("S1")).IsOk());

  h.clock.Advance(std::chrono::milliseconds(16000));
  for (const auto& id : h.registry.IdleDeviceIds(h.clock.Now(), opt.timeout)) {
    h.registry.EvictIfIdle(id, h.clock.Now(), opt.timeout);
  }
  DOCTEST_CHECK_FALSE(h.registry.Has("D1"));
  DOCTEST_CHECK(h.dispatcher.Send("D1", Start("S3")).Code() == ErrorCode::DeviceNotConnected);
}
