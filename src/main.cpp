// VerdantWatch replay – spielt aufgezeichnete Ereignisse durch die Engine
//
//   verdant_replay <config.json> <events.jsonl> [--debug] [--all] [--status]
//
// Jede veröffentlichte Urteilsänderung und jedes Lichtplan-Ergebnis wird als
// eine JSON-Zeile auf stdout ausgegeben, Logzeilen gehen nach stderr.

#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "log_ctrl.h"
#include "engine_ctrl.h"
#include "json_ctrl.h"
#include "version.h"

using growspace_ctrl::GrowspaceConfig;

static bool PRINT_ALL = false;
static bool PRINT_STATUS = false;

static bool readFile(const char* path, std::string& out) {
  std::ifstream f(path, std::ios::in | std::ios::binary);
  if (!f) return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

static void usage(const char* argv0) {
  std::fprintf(stderr, "VerdantWatch %s\nusage: %s <config.json> <events.jsonl> [--debug] [--all] [--status]\n",
               VERDANT_VERSION, argv0);
}

int main(int argc, char** argv) {
  const char* cfgPath = nullptr;
  const char* eventsPath = nullptr;
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--debug") == 0) log_ctrl::enableDebug(true);
    else if (std::strcmp(argv[i], "--all") == 0) PRINT_ALL = true;
    else if (std::strcmp(argv[i], "--status") == 0) PRINT_STATUS = true;
    else if (!cfgPath) cfgPath = argv[i];
    else if (!eventsPath) eventsPath = argv[i];
    else { usage(argv[0]); return 2; }
  }
  if (!cfgPath || !eventsPath) { usage(argv[0]); return 2; }

  // Log nach stderr, stdout bleibt reines JSON
  log_ctrl::setSink([](const char* line) { std::fputs(line, stderr); std::fputc('\n', stderr); });

  std::string cfgText;
  if (!readFile(cfgPath, cfgText)) {
    log_ctrl::printf("REPLAY", "cannot read %s", cfgPath);
    return 1;
  }

  verdant::ConfigError err;
  std::vector<GrowspaceConfig> configs;
  if (!json_ctrl::loadGrowspaceConfigs(cfgText, configs, err)) {
    log_ctrl::printf("CFG", "%s: %s (%s)", cfgPath, err.message.c_str(), verdant::configErrorName(err.code));
    return 1;
  }

  engine_ctrl::InferenceEngine engine;
  engine.onVerdict([](const growspace_ctrl::VerdictUpdate& u) {
    if (!PRINT_ALL && !u.changed) return;
    std::printf("%s\n", json_ctrl::makeVerdictJson(u).c_str());
  });
  engine.onSchedule([](const growspace_ctrl::LightScheduleUpdate& u) {
    std::printf("%s\n", json_ctrl::makeScheduleJson(u).c_str());
  });

  int rejected = 0;
  for (const auto& c : configs) {
    verdant::ConfigError e;
    if (!engine.addGrowspace(c, e)) ++rejected;
  }
  if (engine.growspaceIds().empty()) {
    log_ctrl::printf("REPLAY", "no usable growspace, abort");
    return 1;
  }

  std::ifstream events(eventsPath);
  if (!events) {
    log_ctrl::printf("REPLAY", "cannot read %s", eventsPath);
    return 1;
  }

  std::string line;
  unsigned long lineNo = 0, posted = 0, skipped = 0;
  uint64_t lastTs = 0;
  while (std::getline(events, line)) {
    ++lineNo;
    if (line.empty() || line[0] == '#') continue;
    engine_ctrl::Event ev;
    verdant::ConfigError pe;
    if (!json_ctrl::parseEvent(line, ev, pe)) {
      log_ctrl::printf("REPLAY", "line %lu skipped: %s", lineNo, pe.message.c_str());
      ++skipped;
      continue;
    }
    if (!engine.post(ev)) { ++skipped; continue; }
    if (ev.ts > lastTs) lastTs = ev.ts;
    ++posted;
  }

  if (PRINT_STATUS) {
    for (const auto& id : engine.growspaceIds()) {
      engine.withGrowspace(id, [lastTs](const growspace_ctrl::GrowspaceCtrl& gs) {
        std::printf("%s\n", json_ctrl::makeGrowspaceStatusJson(gs, lastTs).c_str());
      });
    }
  }

  log_ctrl::printf("REPLAY", "%lu events posted, %lu skipped, %d growspace(s) rejected",
                   posted, skipped, rejected);
  return rejected ? 1 : 0;
}
