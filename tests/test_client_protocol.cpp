/**
 * test_client_protocol.cpp - Wire messages, response dispatch and ingress
 */

#include "app/Logger.h"
#include "protocol/ClientProtocol.h"
#include "relay/AudioIngress.h"
#include "relay/RelayErrors.h"
#include "relay/ResponseDispatcher.h"
#include "transcript/InMemoryTranscriptRepository.h"
#include <cassert>
#include <iostream>
#include <nlohmann/json.hpp>
#include <vector>

using json = nlohmann::json;
using scribe::speech::v1::StreamingRecognizeResponse;

static bool isMalformed(const std::string &text) {
  try {
    ClientProtocol::parseControl(text);
  } catch (const MalformedControlMessage &) {
    return true;
  }
  return false;
}

void test_parse_control() {
  assert(ClientProtocol::parseControl("{\"type\":\"stop\"}").type ==
         ControlType::STOP);
  assert(ClientProtocol::parseControl("{\"type\":\"pause\"}").type ==
         ControlType::PAUSE);
  assert(ClientProtocol::parseControl("{\"type\": \"resume\", \"x\": 1}").type ==
         ControlType::RESUME);

  assert(isMalformed("stop"));
  assert(isMalformed("[\"stop\"]"));
  assert(isMalformed("{}"));
  assert(isMalformed("{\"type\":1}"));
  assert(isMalformed("{\"type\":\"rewind\"}"));

  std::cout << "[PASS] test_parse_control" << std::endl;
}

void test_outbound_messages() {
  json connected = json::parse(ClientProtocol::connected("s-1"));
  assert(connected["type"] == "connected");
  assert(connected["session_id"] == "s-1");
  assert(connected["message"].is_string());

  json vad = json::parse(ClientProtocol::vadEvent(VadEvent::SPEECH_END));
  assert(vad["type"] == "vad_event");
  assert(vad["event"] == "speech_end");
  assert(vad["message"] == "Speech ended");

  TranscriptHypothesis hyp;
  hyp.text = "namaste";
  hyp.isFinal = true;
  hyp.confidence = 1.7f;
  json transcript = json::parse(ClientProtocol::transcript(hyp));
  assert(transcript["type"] == "transcript");
  assert(transcript["transcript"] == "namaste");
  assert(transcript["is_final"] == true);
  assert(transcript["confidence"].get<double>() == 1.0);
  assert(!transcript.contains("language_code"));

  json plainError = json::parse(ClientProtocol::error("boom"));
  assert(plainError["type"] == "error");
  assert(!plainError.contains("code"));
  json codedError =
      json::parse(ClientProtocol::error("no", "SESSION_NOT_FOUND"));
  assert(codedError["code"] == "SESSION_NOT_FOUND");

  json done = json::parse(ClientProtocol::completed(4, "hello world"));
  assert(done["type"] == "completed");
  assert(done["total_responses"] == 4);
  assert(done["full_transcript"] == "hello world");

  std::cout << "[PASS] test_outbound_messages" << std::endl;
}

void test_dispatch_order_and_finals() {
  InMemoryTranscriptRepository repo;
  TranscriptAccumulator accumulator(repo, "s-2");
  std::vector<json> sent;
  ResponseDispatcher dispatcher(
      "s-2", [&](const std::string &text) { sent.push_back(json::parse(text)); },
      accumulator);

  StreamingRecognizeResponse begin;
  begin.set_speech_event_type(StreamingRecognizeResponse::SPEECH_ACTIVITY_BEGIN);
  dispatcher.dispatch(begin);

  StreamingRecognizeResponse interim;
  auto *r1 = interim.add_results();
  r1->set_is_final(false);
  r1->add_alternatives()->set_transcript("hel");
  dispatcher.dispatch(interim);

  StreamingRecognizeResponse final;
  auto *r2 = final.add_results();
  r2->set_is_final(true);
  r2->set_language_code("hi-IN");
  auto *alt = r2->add_alternatives();
  alt->set_transcript(" hello ");
  alt->set_confidence(0.92f);
  r2->add_alternatives()->set_transcript("yellow");
  // A result without alternatives produces nothing.
  final.add_results()->set_is_final(true);
  dispatcher.dispatch(final);

  StreamingRecognizeResponse end;
  end.set_speech_event_type(StreamingRecognizeResponse::SPEECH_ACTIVITY_END);
  dispatcher.dispatch(end);

  assert(sent.size() == 4);
  assert(sent[0]["event"] == "speech_start");
  assert(sent[1]["transcript"] == "hel");
  assert(sent[1]["is_final"] == false);
  assert(sent[2]["transcript"] == " hello ");
  assert(sent[2]["is_final"] == true);
  assert(sent[2]["language_code"] == "hi-IN");
  assert(!sent[1].contains("language_code"));
  assert(sent[3]["event"] == "speech_end");

  assert(dispatcher.responses() == 4);
  assert(dispatcher.finals() == 1);
  assert(accumulator.get() == "hello");
  assert(repo.get("s-2") == "hello");

  std::cout << "[PASS] test_dispatch_order_and_finals" << std::endl;
}

void test_ingress_pause_resume_stop() {
  BridgeQueue queue(16, BackpressurePolicy::DROP_OLDEST);
  std::vector<StopReason> stops;
  std::vector<bool> pauses;
  AudioIngress ingress(
      queue, "s-3", [&](StopReason reason) { stops.push_back(reason); },
      [&](bool paused) { pauses.push_back(paused); });

  ingress.onBinary("one");
  ingress.onText("{\"type\":\"resume\"}");
  ingress.onText("{\"type\":\"pause\"}");
  ingress.onText("{\"type\":\"pause\"}");
  assert(ingress.paused());
  ingress.onBinary("dropped-while-paused");
  ingress.onText("{\"type\":\"resume\"}");
  ingress.onBinary("two");
  ingress.onBinary("");
  ingress.onText("not json");

  ingress.onText("{\"type\":\"stop\"}");
  ingress.onText("{\"type\":\"stop\"}");
  ingress.onBinary("after-stop");
  ingress.onDisconnect();

  assert(stops.size() == 1);
  assert(stops[0] == StopReason::CLIENT_STOP);
  // Only real state changes are reported.
  assert(pauses.size() == 2);
  assert(pauses[0] == true);
  assert(pauses[1] == false);
  assert(ingress.finished());
  assert(ingress.forwardedFrames() == 2);
  assert(ingress.discardedFrames() == 2);

  assert(queue.pop().payload() == "one");
  assert(queue.pop().payload() == "two");
  assert(queue.size() == 0);

  std::cout << "[PASS] test_ingress_pause_resume_stop" << std::endl;
}

void test_ingress_disconnect() {
  BridgeQueue queue(4, BackpressurePolicy::DROP_OLDEST);
  std::vector<StopReason> stops;
  AudioIngress ingress(queue, "s-4",
                       [&](StopReason reason) { stops.push_back(reason); });
  ingress.onBinary("frame");
  ingress.onDisconnect();
  ingress.onDisconnect();

  assert(stops.size() == 1);
  assert(stops[0] == StopReason::CLIENT_DISCONNECT);

  std::cout << "[PASS] test_ingress_disconnect" << std::endl;
}

int main() {
  std::cout << "=== ClientProtocol Tests ===" << std::endl;
  Logger::instance().setLevel(LogLevel::ERROR);

  test_parse_control();
  test_outbound_messages();
  test_dispatch_order_and_finals();
  test_ingress_pause_resume_stop();
  test_ingress_disconnect();

  std::cout << "\nAll tests passed!" << std::endl;
  return 0;
}
