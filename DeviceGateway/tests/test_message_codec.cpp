#include "doctest/doctest.h"

#include <string>
#include <variant>

#include "core/device/protocol/message.hpp"
#include "test_support.hpp"

using namespace devgw::core::device;
using devgw::core::common::error::ErrorCode;

DOCTEST_TEST_CASE("register frame decodes identity and capabilities") {
  protocol::Message msg;
  std::string error;
  DOCTEST_REQUIRE(protocol::Decode(devgw::test::RegisterFrame("esp32-001"), msg, error));
  DOCTEST_REQUIRE(protocol::TypeOf(msg) == protocol::MessageType::Register);

  const auto& d = std::get<protocol::RegisterMessage>(msg).device;
  DOCTEST_CHECK_EQ(d.id, "esp32-001");
  DOCTEST_CHECK_EQ(d.name, "ESP32 Test Node");
  DOCTEST_CHECK_EQ(d.sampling_rate, 500);
  DOCTEST_CHECK_EQ(d.camera_resolution, "640x480");
  DOCTEST_CHECK(d.compression_enabled);
  DOCTEST_CHECK(d.ota_enabled);
  DOCTEST_REQUIRE_EQ(d.capabilities.size(), 4u);
  DOCTEST_CHECK_EQ(d.capabilities[2].id, "pzem004t");
  DOCTEST_CHECK_FALSE(d.capabilities[2].configurable);
  DOCTEST_CHECK(d.capabilities[0].configurable);
}

DOCTEST_TEST_CASE("register fills defaults for optional fields") {
  protocol::Message msg;
  std::string error;
  DOCTEST_REQUIRE(protocol::Decode(
      R"({"type":"register","deviceId":"abcdef123456","capabilities":[{"id":"sd"}]})", msg, error));

  const auto& d = std::get<protocol::RegisterMessage>(msg).device;
  DOCTEST_CHECK_EQ(d.name, "ESP32-abcdef12");
  DOCTEST_CHECK_EQ(d.firmware_version, "1.0.0");
  DOCTEST_CHECK_EQ(d.sampling_rate, 1000);
  DOCTEST_REQUIRE_EQ(d.capabilities.size(), 1u);
  DOCTEST_CHECK_EQ(d.capabilities[0].label, "sd");
  DOCTEST_CHECK_FALSE(d.capabilities[0].configurable);
}

DOCTEST_TEST_CASE("malformed frames are rejected with a reason") {
  protocol::Message msg;
  std::string error;

  DOCTEST_CHECK_FALSE(protocol::Decode("not json", msg, error));
  DOCTEST_CHECK_FALSE(error.empty());

  DOCTEST_CHECK_FALSE(protocol::Decode(R"({"deviceId":"x"})", msg, error));
  DOCTEST_CHECK_EQ(error, "missing type");

  DOCTEST_CHECK_FALSE(protocol::Decode(R"({"type":"teleport"})", msg, error));
  DOCTEST_CHECK(error.find("teleport") != std::string::npos);

  DOCTEST_CHECK_FALSE(protocol::Decode(R"({"type":"register"})", msg, error));
  DOCTEST_CHECK_FALSE(protocol::Decode(R"({"type":"register","deviceId":""})", msg, error));
  DOCTEST_CHECK_FALSE(protocol::Decode(R"({"type":"register","deviceId":42})", msg, error));
  DOCTEST_CHECK_FALSE(
      protocol::Decode(R"({"type":"register","deviceId":"a","samplingRate":-5})", msg, error));
  DOCTEST_CHECK_FALSE(
      protocol::Decode(R"({"type":"register","deviceId":"a","samplingRate":1e30})", msg, error));
  DOCTEST_CHECK_EQ(error, "samplingRate must be a positive integer");
  DOCTEST_CHECK_FALSE(
      protocol::Decode(R"({"type":"session_start","sessionId":"s","duration":-1e30})", msg, error));
  DOCTEST_CHECK_EQ(error, "duration must be an integer");
  DOCTEST_CHECK_FALSE(
      protocol::Decode(R"({"type":"register","deviceId":"a","capabilities":"camera"})", msg, error));
  DOCTEST_CHECK_FALSE(protocol::Decode(
      R"({"type":"register","deviceId":"a","capabilities":[{"id":"x"},{"id":"x"}]})", msg, error));
  DOCTEST_CHECK(error.find("duplicate") != std::string::npos);

  DOCTEST_CHECK_FALSE(protocol::Decode(R"({"type":"config_update"})", msg, error));
}

DOCTEST_TEST_CASE("device originated frames decode") {
  protocol::Message msg;
  std::string error;

  DOCTEST_REQUIRE(protocol::Decode(R"({"type":"heartbeat"})", msg, error));
  DOCTEST_CHECK(protocol::TypeOf(msg) == protocol::MessageType::Heartbeat);

  DOCTEST_REQUIRE(protocol::Decode(
      R"({"type":"sensor_frame","sensor":"pzem004t","timestamp":1700000000000,"data":{"v":230.1}})",
      msg, error));
  const auto& f = std::get<protocol::SensorFrameMessage>(msg);
  DOCTEST_CHECK_EQ(f.sensor, "pzem004t");
  DOCTEST_CHECK_EQ(f.timestamp_ms, 1700000000000LL);
  DOCTEST_CHECK_EQ(f.payload, R"({"v":230.1})");

  DOCTEST_REQUIRE(protocol::Decode(R"({"type":"ai_log","event":"person_detected"})", msg, error));
  DOCTEST_CHECK_EQ(std::get<protocol::AiLogMessage>(msg).event, "person_detected");

  DOCTEST_CHECK(protocol::IsDeviceOriginated(protocol::MessageType::SensorFrame));
  DOCTEST_CHECK_FALSE(protocol::IsDeviceOriginated(protocol::MessageType::SessionStart));
}

DOCTEST_TEST_CASE("commands encode to the wire shape devices expect") {
  protocol::ConfigUpdateMessage cfg;
  cfg.config.emplace_back("camera", R"({"resolution":"1280x720"})");
  DOCTEST_CHECK_EQ(protocol::Encode(cfg),
                   R"({"type":"config_update","config":{"camera":{"resolution":"1280x720"}}})");

  protocol::SessionStartMessage start;
  start.session_id = "S1";
  DOCTEST_CHECK_EQ(protocol::Encode(start), R"({"type":"session_start","sessionId":"S1"})");

  start.session_token = "tok";
  start.sensors = {"camera", "microphone"};
  start.duration_s = 60;
  DOCTEST_CHECK_EQ(protocol::Encode(start),
                   R"({"type":"session_start","sessionId":"S1","sessionToken":"tok",)"
                   R"("sensors":["camera","microphone"],"duration":60})");

  protocol::SessionStopMessage stop;
  stop.session_id = "S1";
  DOCTEST_CHECK_EQ(protocol::Encode(stop), R"({"type":"session_stop","sessionId":"S1"})");
}

DOCTEST_TEST_CASE("gateway replies encode") {
  DOCTEST_CHECK_EQ(protocol::EncodeRegistrationAck("D1"),
                   R"({"type":"registration_ack","deviceId":"D1","status":"success"})");
  DOCTEST_CHECK_EQ(protocol::EncodeError(ErrorCode::ProtocolError, "bad \"frame\""),
                   R"({"type":"error","error":"protocol_error","detail":"bad \"frame\""})");
}

DOCTEST_TEST_CASE("gateway command frames round trip through the decoder") {
  protocol::SessionStartMessage start;
  start.session_id = "S9";
  start.sensors = {"camera"};

  protocol::Message msg;
  std::string error;
  DOCTEST_REQUIRE(protocol::Decode(protocol::Encode(start), msg, error));
  const auto& back = std::get<protocol::SessionStartMessage>(msg);
  DOCTEST_CHECK_EQ(back.session_id, "S9");
  DOCTEST_REQUIRE_EQ(back.sensors.size(), 1u);
  DOCTEST_CHECK_EQ(back.sensors[0], "camera");
}
