// ==============================
// Datei: lib/engine_ctrl/engine_ctrl.cpp
// ==============================

#include "engine_ctrl.h"
#include "log_ctrl.h"

using namespace engine_ctrl;
using verdant::ConfigError;
using verdant::ConfigErrorCode;

const char* engine_ctrl::eventTypeName(EventType t) {
  switch (t) {
    case EventType::Sensor: return "sensor";
    case EventType::Stage:  return "stage";
    case EventType::Light:  return "light";
    case EventType::Tick:   return "tick";
  }
  return "unknown";
}

// --- Event-Fabriken ---

Event Event::sensor(const std::string& id, profile_ctrl::Variable var, double value, uint64_t ts) {
  Event e;
  e.type = EventType::Sensor;
  e.growspaceId = id;
  e.ts = ts;
  e.variable = var;
  e.available = true;
  e.value = value;
  return e;
}

Event Event::sensorUnavailable(const std::string& id, profile_ctrl::Variable var, uint64_t ts) {
  Event e = sensor(id, var, 0.0, ts);
  e.available = false;
  return e;
}

Event Event::stageChange(const std::string& id, vpd_calc::GrowthStage stage, uint64_t stageStartMs,
                         uint64_t ts) {
  Event e;
  e.type = EventType::Stage;
  e.growspaceId = id;
  e.ts = ts;
  e.stage = stage;
  e.stageStartMs = stageStartMs;
  return e;
}

Event Event::light(const std::string& id, bool on, uint64_t ts) {
  Event e;
  e.type = EventType::Light;
  e.growspaceId = id;
  e.ts = ts;
  e.available = true;
  e.lightOn = on;
  return e;
}

Event Event::lightUnavailable(const std::string& id, uint64_t ts) {
  Event e = light(id, false, ts);
  e.available = false;
  return e;
}

Event Event::tick(const std::string& id, uint64_t ts) {
  Event e;
  e.type = EventType::Tick;
  e.growspaceId = id;
  e.ts = ts;
  return e;
}

// --- InferenceEngine ---

void InferenceEngine::onVerdict(VerdictCallback cb) {
  std::lock_guard<std::mutex> lk(cbMutex_);
  verdictCb_ = std::move(cb);
}

void InferenceEngine::onSchedule(ScheduleCallback cb) {
  std::lock_guard<std::mutex> lk(cbMutex_);
  scheduleCb_ = std::move(cb);
}

void InferenceEngine::emitVerdict(const growspace_ctrl::VerdictUpdate& u) {
  VerdictCallback cb;
  {
    std::lock_guard<std::mutex> lk(cbMutex_);
    cb = verdictCb_;
  }
  if (cb) cb(u);
}

void InferenceEngine::emitSchedule(const growspace_ctrl::LightScheduleUpdate& u) {
  ScheduleCallback cb;
  {
    std::lock_guard<std::mutex> lk(cbMutex_);
    cb = scheduleCb_;
  }
  if (cb) cb(u);
}

bool InferenceEngine::addGrowspace(const GrowspaceConfig& cfg, ConfigError& err) {
  {
    std::lock_guard<std::mutex> lk(mapMutex_);
    if (slots_.count(cfg.id)) {
      log_ctrl::printf("ENGINE", "growspace '%s' already registered", cfg.id.c_str());
      return err.fail(ConfigErrorCode::DuplicateGrowspace, "duplicate growspace id '" + cfg.id + "'");
    }
  }

  std::shared_ptr<Slot> slot = std::make_shared<Slot>();
  if (!slot->ctrl.begin(cfg, err)) return false;
  slot->ctrl.onVerdict([this](const growspace_ctrl::VerdictUpdate& u) { emitVerdict(u); });
  slot->ctrl.onSchedule([this](const growspace_ctrl::LightScheduleUpdate& u) { emitSchedule(u); });

  std::lock_guard<std::mutex> lk(mapMutex_);
  if (!slots_.emplace(cfg.id, slot).second) {
    return err.fail(ConfigErrorCode::DuplicateGrowspace, "duplicate growspace id '" + cfg.id + "'");
  }
  log_ctrl::printf("ENGINE", "growspace '%s' added (%u total)", cfg.id.c_str(),
                   static_cast<unsigned>(slots_.size()));
  return true;
}

bool InferenceEngine::removeGrowspace(const std::string& id) {
  std::lock_guard<std::mutex> lk(mapMutex_);
  if (slots_.erase(id) == 0) return false;
  // laufende Auswertung hält den Slot selbst am Leben (shared_ptr)
  log_ctrl::printf("ENGINE", "growspace '%s' removed", id.c_str());
  return true;
}

std::shared_ptr<InferenceEngine::Slot> InferenceEngine::find(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mapMutex_);
  auto it = slots_.find(id);
  return it == slots_.end() ? nullptr : it->second;
}

bool InferenceEngine::hasGrowspace(const std::string& id) const {
  return find(id) != nullptr;
}

std::vector<std::string> InferenceEngine::growspaceIds() const {
  std::lock_guard<std::mutex> lk(mapMutex_);
  std::vector<std::string> ids;
  ids.reserve(slots_.size());
  for (const auto& kv : slots_) ids.push_back(kv.first);
  return ids;
}

bool InferenceEngine::withGrowspace(const std::string& id,
                                    const std::function<void(const GrowspaceCtrl&)>& fn) const {
  std::shared_ptr<Slot> slot = find(id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lk(slot->evalMutex);
  fn(slot->ctrl);
  return true;
}

bool InferenceEngine::post(const Event& ev) {
  std::shared_ptr<Slot> slot = find(ev.growspaceId);
  if (!slot) {
    log_ctrl::printf("ENGINE", "%s event for unknown growspace '%s' rejected",
                     eventTypeName(ev.type), ev.growspaceId.c_str());
    return false;
  }

  {
    std::lock_guard<std::mutex> lk(slot->queueMutex);
    if (ev.type == EventType::Sensor) {
      for (auto it = slot->queue.begin(); it != slot->queue.end(); ++it) {
        if (it->type == EventType::Sensor && it->variable == ev.variable) {
          // alter Wert fällt weg, der neue reiht sich hinten ein
          slot->queue.erase(it);
          coalesced_.fetch_add(1);
          log_ctrl::debugf("ENGINE", "%s: %s update coalesced", ev.growspaceId.c_str(),
                           profile_ctrl::variableName(ev.variable));
          break;
        }
      }
    }
    slot->queue.push_back(ev);
    if (slot->busy) return true;
    slot->busy = true;
  }

  // Dieser Aufrufer arbeitet die Warteschlange ab
  try {
    for (;;) {
      Event cur;
      {
        std::lock_guard<std::mutex> lk(slot->queueMutex);
        if (slot->queue.empty()) {
          slot->busy = false;
          break;
        }
        cur = slot->queue.front();
        slot->queue.pop_front();
      }
      dispatch(*slot, cur);
    }
  } catch (...) {
    // Rest bleibt eingereiht und läuft beim nächsten post()
    size_t pending = 0;
    {
      std::lock_guard<std::mutex> lk(slot->queueMutex);
      slot->busy = false;
      pending = slot->queue.size();
    }
    log_ctrl::printf("ENGINE", "%s: callback failed, %u events pending", ev.growspaceId.c_str(),
                     static_cast<unsigned>(pending));
    throw;
  }
  return true;
}

void InferenceEngine::dispatch(Slot& slot, const Event& ev) {
  std::lock_guard<std::mutex> lk(slot.evalMutex);
  GrowspaceCtrl& gs = slot.ctrl;
  switch (ev.type) {
    case EventType::Sensor:
      gs.onSensor(ev.variable, ev.available, ev.value, ev.ts);
      break;
    case EventType::Stage:
      gs.onStage(ev.stage, ev.stageStartMs, ev.ts);
      break;
    case EventType::Light:
      gs.onLight(ev.available, ev.lightOn, ev.ts);
      break;
    case EventType::Tick:
      gs.tick(ev.ts);
      break;
  }
}
