/*
 * engine_ctrl.h | Ereignisverteilung auf mehrere Growspaces
 *
 * Jeder Growspace hat eine eigene Warteschlange. Ereignisse eines
 * Growspace werden strikt in Ankunftsreihenfolge und nie gleichzeitig
 * ausgewertet; verschiedene Growspaces laufen unabhängig (auch parallel
 * aus mehreren Threads).
 *
 * Wer post() aufruft und die Warteschlange leer/untätig vorfindet, arbeitet
 * sie selbst synchron ab. Läuft bereits eine Auswertung, wird das Ereignis
 * eingereiht; ein noch wartender Messwert derselben Größe wird dabei
 * verworfen und der neueste hinten angehängt (coalescing), so dass er nie
 * vor früher eingetroffene Stadien- oder Lichtereignisse rutscht.
 * Wirft ein Callback, kommt die Ausnahme bei post() an; der Growspace
 * bleibt benutzbar und der Rest der Warteschlange läuft beim nächsten
 * post(). Nichts blockiert dauerhaft, es gibt keinen Hintergrund-Thread.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "growspace_ctrl.h"

namespace engine_ctrl {

using growspace_ctrl::GrowspaceConfig;
using growspace_ctrl::GrowspaceCtrl;
using growspace_ctrl::ScheduleCallback;
using growspace_ctrl::VerdictCallback;

enum class EventType : uint8_t { Sensor = 0, Stage, Light, Tick };

const char* eventTypeName(EventType t);

struct Event {
  EventType type = EventType::Tick;
  std::string growspaceId;
  uint64_t ts = 0;

  // Sensor
  profile_ctrl::Variable variable = profile_ctrl::Variable::Temperature;
  bool available = false;   // Sensor- und Licht-Events
  double value = 0.0;

  // Stadium
  vpd_calc::GrowthStage stage = vpd_calc::GrowthStage::Seedling;
  uint64_t stageStartMs = 0;

  // Licht
  bool lightOn = false;

  static Event sensor(const std::string& id, profile_ctrl::Variable var, double value, uint64_t ts);
  static Event sensorUnavailable(const std::string& id, profile_ctrl::Variable var, uint64_t ts);
  static Event stageChange(const std::string& id, vpd_calc::GrowthStage stage, uint64_t stageStartMs,
                           uint64_t ts);
  static Event light(const std::string& id, bool on, uint64_t ts);
  static Event lightUnavailable(const std::string& id, uint64_t ts);
  static Event tick(const std::string& id, uint64_t ts);
};

class InferenceEngine {
public:
  InferenceEngine() = default;

  // Callbacks werden aus dem auswertenden Thread gerufen. post() darin ist
  // erlaubt (wird eingereiht), withGrowspace() für denselben Growspace nicht.
  void onVerdict(VerdictCallback cb);
  void onSchedule(ScheduleCallback cb);

  bool addGrowspace(const GrowspaceConfig& cfg, verdant::ConfigError& err);
  bool removeGrowspace(const std::string& id);

  // false: unbekannter Growspace
  bool post(const Event& ev);

  std::vector<std::string> growspaceIds() const;
  bool hasGrowspace(const std::string& id) const;
  // Lesender Zugriff, serialisiert mit laufender Auswertung
  bool withGrowspace(const std::string& id, const std::function<void(const GrowspaceCtrl&)>& fn) const;

  uint64_t coalescedCount() const { return coalesced_.load(); }

private:
  struct Slot {
    std::mutex queueMutex;
    std::deque<Event> queue;
    bool busy = false;
    mutable std::mutex evalMutex;
    GrowspaceCtrl ctrl;
  };

  std::shared_ptr<Slot> find(const std::string& id) const;
  void dispatch(Slot& slot, const Event& ev);
  void emitVerdict(const growspace_ctrl::VerdictUpdate& u);
  void emitSchedule(const growspace_ctrl::LightScheduleUpdate& u);

  mutable std::mutex mapMutex_;
  std::map<std::string, std::shared_ptr<Slot>> slots_;

  std::mutex cbMutex_;
  VerdictCallback verdictCb_;
  ScheduleCallback scheduleCb_;

  std::atomic<uint64_t> coalesced_{0};
};

} // namespace engine_ctrl
