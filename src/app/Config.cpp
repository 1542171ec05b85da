#include "Config.h"
#include "Logger.h"

Config &Config::instance() {
  static Config instance;
  return instance;
}

bool Config::load(const std::string &path) {
  try {
    return loadFromNode(YAML::LoadFile(path));
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to load config " << path << ": " << e.what());
    return false;
  }
}

bool Config::loadFromNode(const YAML::Node &config) {
  try {
    bindIp = config["bind_ip"].as<std::string>("0.0.0.0");
    wsPort = config["ws_port"].as<int>(8765);
    ioThreads = config["io_threads"].as<int>(2);
    pathPrefix = config["path_prefix"].as<std::string>("/api/v1/stream/");
    maxRelays = config["max_relays"].as<size_t>(200);
    logLevel = config["log_level"].as<std::string>("INFO");

    if (auto auth = config["auth"]) {
      jwtSecret = auth["jwt_secret"].as<std::string>("");
      jwtAlgorithm = auth["jwt_algorithm"].as<std::string>("HS256");
    }

    sessionsFile = config["sessions_file"].as<std::string>("./sessions.yaml");
    transcriptsDir =
        config["transcripts_dir"].as<std::string>("./transcripts");

    if (auto sp = config["speech"]) {
      speech.target = sp["target"].as<std::string>(speech.target);
      speech.useTls = sp["use_tls"].as<bool>(false);
      speech.rootCertsPath = sp["root_certs"].as<std::string>("");
      speech.recognizer = sp["recognizer"].as<std::string>(speech.recognizer);
      speech.model = sp["model"].as<std::string>(speech.model);
      if (sp["language_codes"]) {
        speech.languageCodes =
            sp["language_codes"].as<std::vector<std::string>>();
      }
      speech.interimResults = sp["interim_results"].as<bool>(true);
      speech.voiceActivityEvents = sp["voice_activity_events"].as<bool>(true);
    }

    if (auto rl = config["relay"]) {
      relay.queueCapacity = rl["queue_capacity"].as<size_t>(512);
      std::string policy = rl["backpressure"].as<std::string>("drop_oldest");
      if (policy == "drop_oldest") {
        relay.backpressure = BackpressurePolicy::DROP_OLDEST;
      } else if (policy == "block") {
        relay.backpressure = BackpressurePolicy::BLOCK;
      } else {
        LOG_ERROR("Unknown relay.backpressure policy: " << policy);
        return false;
      }
      relay.idleTimeoutSec = rl["idle_timeout_sec"].as<int>(20);
      relay.shutdownGraceSec = rl["shutdown_grace_sec"].as<int>(5);
    }

    return validate();
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid config: " << e.what());
    return false;
  }
}

bool Config::validate() const {
  if (jwtSecret.empty()) {
    LOG_ERROR("auth.jwt_secret must be set");
    return false;
  }
  if (jwtAlgorithm != "HS256") {
    LOG_ERROR("Unsupported auth.jwt_algorithm: " << jwtAlgorithm);
    return false;
  }
  if (speech.languageCodes.empty() ||
      speech.languageCodes.size() > kMaxLanguageCodes) {
    LOG_ERROR("speech.language_codes needs between 1 and "
              << kMaxLanguageCodes << " entries");
    return false;
  }
  if (relay.queueCapacity == 0) {
    LOG_ERROR("relay.queue_capacity must be positive");
    return false;
  }
  if (ioThreads < 1 || wsPort <= 0 || wsPort > 65535) {
    LOG_ERROR("Invalid io_threads or ws_port");
    return false;
  }
  if (pathPrefix.empty() || pathPrefix.front() != '/') {
    LOG_ERROR("path_prefix must start with '/'");
    return false;
  }
  return true;
}
