#include <gtest/gtest.h>

#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "engine_ctrl.h"
#include "log_ctrl.h"

using namespace engine_ctrl;
using growspace_ctrl::Condition;
using growspace_ctrl::VerdictUpdate;
using profile_ctrl::Variable;
using verdant::ConfigError;
using verdant::ConfigErrorCode;

namespace {

constexpr uint64_t T0 = 1700000000000ull;

GrowspaceConfig makeConfig(const std::string& id) {
  GrowspaceConfig cfg;
  cfg.id = id;
  cfg.stage = vpd_calc::GrowthStage::Vegetative;
  cfg.deriveVpd = false;
  cfg.trendEnabled = false;
  return cfg;
}

class EngineTest : public ::testing::Test {
protected:
  void SetUp() override { log_ctrl::setSink([](const char*) {}); }
  void TearDown() override { log_ctrl::setSink(nullptr); }

  void add(const std::string& id) {
    ConfigError err;
    ASSERT_TRUE(engine.addGrowspace(makeConfig(id), err)) << err.message;
  }

  double temperature(const std::string& id) {
    double v = -1.0;
    engine.withGrowspace(id, [&v](const GrowspaceCtrl& gs) {
      v = gs.snapshot().get(Variable::Temperature).value;
    });
    return v;
  }

  InferenceEngine engine;
};

} // namespace

TEST_F(EngineTest, AddAndRemove) {
  add("b");
  add("a");
  EXPECT_TRUE(engine.hasGrowspace("a"));
  EXPECT_EQ(engine.growspaceIds(), (std::vector<std::string>{"a", "b"}));

  EXPECT_TRUE(engine.removeGrowspace("a"));
  EXPECT_FALSE(engine.removeGrowspace("a"));
  EXPECT_FALSE(engine.hasGrowspace("a"));
  EXPECT_FALSE(engine.post(Event::tick("a", T0)));
}

TEST_F(EngineTest, DuplicateIdIsRejected) {
  add("tent");
  ConfigError err;
  EXPECT_FALSE(engine.addGrowspace(makeConfig("tent"), err));
  EXPECT_EQ(err.code, ConfigErrorCode::DuplicateGrowspace);
}

TEST_F(EngineTest, InvalidConfigIsNotRegistered) {
  GrowspaceConfig cfg = makeConfig("bad");
  cfg.condition(Condition::Optimal).prior = 0.0;
  ConfigError err;
  EXPECT_FALSE(engine.addGrowspace(cfg, err));
  EXPECT_EQ(err.code, ConfigErrorCode::PriorOutOfRange);
  EXPECT_FALSE(engine.hasGrowspace("bad"));
}

TEST_F(EngineTest, UnknownGrowspace) {
  EXPECT_FALSE(engine.post(Event::sensor("nope", Variable::Temperature, 20.0, T0)));
  bool called = false;
  EXPECT_FALSE(engine.withGrowspace("nope", [&called](const GrowspaceCtrl&) { called = true; }));
  EXPECT_FALSE(called);
}

TEST_F(EngineTest, EventsReachTheGrowspace) {
  add("tent");
  std::vector<VerdictUpdate> seen;
  engine.onVerdict([&seen](const VerdictUpdate& u) { seen.push_back(u); });

  EXPECT_TRUE(engine.post(Event::sensor("tent", Variable::Temperature, 30.0, T0)));
  EXPECT_TRUE(engine.post(Event::sensor("tent", Variable::Humidity, 60.0, T0 + 1000)));
  ASSERT_EQ(seen.size(), 6u);
  EXPECT_EQ(seen.back().growspaceId, "tent");

  EXPECT_TRUE(engine.post(Event::stageChange("tent", vpd_calc::GrowthStage::Flowering, T0, T0 + 2000)));
  engine.withGrowspace("tent", [](const GrowspaceCtrl& gs) {
    EXPECT_EQ(gs.stage(), vpd_calc::GrowthStage::Flowering);
    EXPECT_EQ(gs.stageStartMs(), T0);
  });

  EXPECT_TRUE(engine.post(Event::sensorUnavailable("tent", Variable::Temperature, T0 + 3000)));
  engine.withGrowspace("tent", [](const GrowspaceCtrl& gs) {
    EXPECT_FALSE(gs.snapshot().get(Variable::Temperature).available);
  });
}

TEST_F(EngineTest, PostFromCallbackIsQueuedAndCoalesced) {
  add("tent");
  bool injected = false;
  engine.onVerdict([&](const VerdictUpdate&) {
    // läuft innerhalb der Auswertung: Events landen in der Warteschlange
    if (!injected) {
      injected = true;
      EXPECT_TRUE(engine.post(Event::sensor("tent", Variable::Temperature, 26.0, T0 + 1)));
      EXPECT_TRUE(engine.post(Event::sensor("tent", Variable::Humidity, 55.0, T0 + 2)));
      EXPECT_TRUE(engine.post(Event::sensor("tent", Variable::Temperature, 27.0, T0 + 3)));
    }
  });

  engine.post(Event::sensor("tent", Variable::Temperature, 25.0, T0));
  EXPECT_EQ(engine.coalescedCount(), 1u);
  EXPECT_DOUBLE_EQ(temperature("tent"), 27.0);
  engine.withGrowspace("tent", [](const GrowspaceCtrl& gs) {
    EXPECT_EQ(gs.snapshot().get(Variable::Temperature).ts, T0 + 3);
    EXPECT_DOUBLE_EQ(gs.snapshot().get(Variable::Humidity).value, 55.0);
  });
}

TEST_F(EngineTest, CoalescedReadingKeepsArrivalOrder) {
  add("tent");
  std::vector<VerdictUpdate> seen;
  bool injected = false;
  engine.onVerdict([&](const VerdictUpdate& u) {
    seen.push_back(u);
    if (!injected) {
      injected = true;
      engine.post(Event::sensor("tent", Variable::Temperature, 26.0, T0 + 1000));
      engine.post(Event::stageChange("tent", vpd_calc::GrowthStage::Flowering, T0, T0 + 2000));
      engine.post(Event::sensor("tent", Variable::Temperature, 30.0, T0 + 3000));
    }
  });

  engine.post(Event::sensor("tent", Variable::Temperature, 24.0, T0 + 500));
  EXPECT_EQ(engine.coalescedCount(), 1u);

  ASSERT_FALSE(seen.empty());
  for (size_t i = 1; i < seen.size(); ++i) {
    EXPECT_GE(seen[i].evaluatedAtMs, seen[i - 1].evaluatedAtMs) << i;
  }
  // 30 °C wird erst nach dem Stadienwechsel bewertet
  EXPECT_EQ(seen.back().evaluatedAtMs, T0 + 3000);
  EXPECT_EQ(seen.back().stage, vpd_calc::GrowthStage::Flowering);
  EXPECT_DOUBLE_EQ(temperature("tent"), 30.0);
}

TEST_F(EngineTest, ThrowingCallbackDoesNotBlockGrowspace) {
  add("tent");
  bool fail = true;
  int calls = 0;
  engine.onVerdict([&](const VerdictUpdate&) {
    ++calls;
    if (fail) {
      fail = false;
      engine.post(Event::sensor("tent", Variable::Humidity, 55.0, T0 + 1));
      throw std::runtime_error("sink down");
    }
  });

  EXPECT_THROW(engine.post(Event::sensor("tent", Variable::Temperature, 24.0, T0)), std::runtime_error);

  calls = 0;
  EXPECT_TRUE(engine.post(Event::sensor("tent", Variable::Temperature, 25.0, T0 + 2)));
  // liegengebliebene Feuchte plus neuer Messwert: je drei Bedingungen
  EXPECT_EQ(calls, 6);
  engine.withGrowspace("tent", [](const GrowspaceCtrl& gs) {
    EXPECT_DOUBLE_EQ(gs.snapshot().get(Variable::Humidity).value, 55.0);
    EXPECT_DOUBLE_EQ(gs.snapshot().get(Variable::Temperature).value, 25.0);
  });
}

TEST_F(EngineTest, ScheduleCallbackIsForwarded) {
  GrowspaceConfig cfg = makeConfig("tent");
  cfg.sensors.light = true;
  ConfigError err;
  ASSERT_TRUE(engine.addGrowspace(cfg, err));

  std::vector<growspace_ctrl::LightScheduleUpdate> seen;
  engine.onSchedule([&seen](const growspace_ctrl::LightScheduleUpdate& u) { seen.push_back(u); });
  constexpr uint64_t kHour = 60ull * 60ull * 1000ull;
  engine.post(Event::light("tent", true, T0));
  engine.post(Event::light("tent", false, T0 + 18 * kHour));
  engine.post(Event::tick("tent", T0 + 24 * kHour));
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].verdict, light_cycle::ScheduleVerdict::Correct);
}

TEST_F(EngineTest, GrowspacesRunInParallel) {
  add("a");
  add("b");
  std::mutex m;
  std::map<std::string, int> counts;
  engine.onVerdict([&](const VerdictUpdate& u) {
    std::lock_guard<std::mutex> lk(m);
    ++counts[u.growspaceId];
  });

  constexpr int kEvents = 200;
  auto feed = [this](const std::string& id) {
    for (int i = 0; i < kEvents; ++i) {
      engine.post(Event::sensor(id, Variable::Temperature, 20.0 + i * 0.01, T0 + i * 1000ull));
    }
  };
  std::thread ta(feed, "a");
  std::thread tb(feed, "b");
  ta.join();
  tb.join();

  // ein Poster je Growspace: nichts wird zusammengefasst
  EXPECT_EQ(engine.coalescedCount(), 0u);
  EXPECT_EQ(counts["a"], kEvents * 3);
  EXPECT_EQ(counts["b"], kEvents * 3);
  EXPECT_NEAR(temperature("a"), 20.0 + (kEvents - 1) * 0.01, 1e-9);
  EXPECT_NEAR(temperature("b"), 20.0 + (kEvents - 1) * 0.01, 1e-9);
}

TEST_F(EngineTest, ConcurrentPostersToOneGrowspaceKeepLatestValue) {
  add("tent");
  constexpr int kEvents = 300;
  auto feed = [this](Variable var, double base) {
    for (int i = 0; i < kEvents; ++i) {
      engine.post(Event::sensor("tent", var, base + i, T0 + i * 1000ull));
    }
  };
  std::thread t1(feed, Variable::Temperature, 0.0);
  std::thread t2(feed, Variable::Humidity, 1000.0);
  t1.join();
  t2.join();

  engine.withGrowspace("tent", [](const GrowspaceCtrl& gs) {
    EXPECT_DOUBLE_EQ(gs.snapshot().get(Variable::Temperature).value, kEvents - 1.0);
    EXPECT_DOUBLE_EQ(gs.snapshot().get(Variable::Humidity).value, 1000.0 + kEvents - 1);
  });
}

TEST(EngineEvent, Factories) {
  const Event s = Event::sensor("x", Variable::Co2, 900.0, 5);
  EXPECT_EQ(s.type, EventType::Sensor);
  EXPECT_TRUE(s.available);
  EXPECT_FALSE(Event::sensorUnavailable("x", Variable::Co2, 5).available);
  EXPECT_FALSE(Event::lightUnavailable("x", 5).available);
  EXPECT_TRUE(Event::light("x", true, 5).lightOn);
  EXPECT_STREQ(eventTypeName(EventType::Stage), "stage");
}
