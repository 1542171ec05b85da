#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

enum class BackpressurePolicy { DROP_OLDEST, BLOCK };

struct SpeechSettings {
  std::string target = "127.0.0.1:50051";
  bool useTls = false;
  std::string rootCertsPath;
  std::string recognizer = "projects/local/locations/global/recognizers/_";
  std::string model = "long";
  std::vector<std::string> languageCodes{"hi-IN", "mr-IN", "en-IN"};
  bool interimResults = true;
  bool voiceActivityEvents = true;
  int sampleRateHertz = 16000;
  int channelCount = 1;
};

struct RelaySettings {
  size_t queueCapacity = 512;
  BackpressurePolicy backpressure = BackpressurePolicy::DROP_OLDEST;
  int idleTimeoutSec = 20;
  int shutdownGraceSec = 5;
};

class Config {
public:
  static Config &instance();

  bool load(const std::string &path);
  // Same as load() but from an already parsed document.
  bool loadFromNode(const YAML::Node &config);

  std::string bindIp = "0.0.0.0";
  int wsPort = 8765;
  int ioThreads = 2;
  std::string pathPrefix = "/api/v1/stream/";
  size_t maxRelays = 200;
  std::string logLevel = "INFO";

  std::string jwtSecret;
  std::string jwtAlgorithm = "HS256";

  std::string sessionsFile = "./sessions.yaml";
  std::string transcriptsDir = "./transcripts";

  SpeechSettings speech;
  RelaySettings relay;

  static constexpr size_t kMaxLanguageCodes = 3;

private:
  bool validate() const;
};
