// ==============================
// File: include/verdant_config.h
// ==============================
// VerdantWatch - Zentrale Projektkonfiguration
// Priors, Schaltschwellen, Schwellenprofile je Stadium & Tag/Nacht,
// Likelihood-Kurven, Lichtpläne

#pragma once

#include <cstdint>
#include "vpd_calc.h"
#include "profile_ctrl.h"
#include "bayes_calc.h"

namespace verdant
{

  // --- Stadien & Phasen ---
  using GrowthStage = vpd_calc::GrowthStage; // Seedling ... Curing
  using DayPhase = profile_ctrl::DayPhase;   // Day, Night

  // --- Schwellenprofile je Stadium & Tag/Nacht ---
  namespace profiles
  {
    using profile_ctrl::Band;
    using profile_ctrl::ThresholdProfile;

    constexpr Band NONE{false, 0.0f, 0.0f, 0.0f};

    // { Temperatur °C, rel. Feuchte %, VPD kPa, CO2 ppm, Lüfter }
    // je Band: { definiert, ideal_min, ideal_max, Toleranz }
    constexpr ThresholdProfile DAY[vpd_calc::kStageCount] = {
        // SEEDLING
        {{{true, 24.0f, 26.0f, 2.0f}, {true, 70.0f, 80.0f, 8.0f}, {true, 0.40f, 0.80f, 0.20f}, {true, 400.0f, 800.0f, 200.0f}, NONE}},
        // CLONE (kein eigenes Nachtprofil)
        {{{true, 24.0f, 26.0f, 2.0f}, {true, 70.0f, 85.0f, 8.0f}, {true, 0.40f, 0.80f, 0.20f}, {true, 400.0f, 800.0f, 200.0f}, NONE}},
        // MOTHER
        {{{true, 24.0f, 27.0f, 2.0f}, {true, 55.0f, 65.0f, 8.0f}, {true, 0.80f, 1.10f, 0.20f}, {true, 400.0f, 1000.0f, 250.0f}, NONE}},
        // VEGETATIVE (Idealpunkt 24 °C / 60 %)
        {{{true, 24.0f, 24.0f, 2.0f}, {true, 60.0f, 60.0f, 10.0f}, {true, 0.80f, 1.20f, 0.20f}, {true, 800.0f, 1200.0f, 300.0f}, NONE}},
        // FLOWERING
        {{{true, 24.0f, 26.0f, 2.0f}, {true, 40.0f, 55.0f, 8.0f}, {true, 1.10f, 1.40f, 0.20f}, {true, 800.0f, 1200.0f, 300.0f}, NONE}},
        // DRYING (nur Temperatur/Feuchte)
        {{{true, 15.0f, 21.0f, 2.0f}, {true, 45.0f, 55.0f, 5.0f}, NONE, NONE, NONE}},
        // CURING
        {{{true, 18.0f, 21.0f, 2.0f}, {true, 55.0f, 60.0f, 4.0f}, NONE, NONE, NONE}},
    };

    constexpr ThresholdProfile NIGHT[vpd_calc::kStageCount] = {
        {{{true, 21.0f, 22.0f, 2.0f}, {true, 70.0f, 80.0f, 8.0f}, {true, 0.40f, 0.80f, 0.20f}, {true, 400.0f, 800.0f, 200.0f}, NONE}},
        {{NONE, NONE, NONE, NONE, NONE}},
        {{{true, 20.0f, 23.0f, 2.0f}, {true, 55.0f, 65.0f, 8.0f}, {true, 0.60f, 0.90f, 0.20f}, {true, 400.0f, 1000.0f, 250.0f}, NONE}},
        {{{true, 21.0f, 23.0f, 2.0f}, {true, 55.0f, 65.0f, 10.0f}, {true, 0.50f, 0.80f, 0.20f}, {true, 400.0f, 1000.0f, 300.0f}, NONE}},
        {{{true, 20.0f, 22.0f, 2.0f}, {true, 40.0f, 55.0f, 8.0f}, {true, 0.80f, 1.10f, 0.20f}, {true, 400.0f, 800.0f, 300.0f}, NONE}},
        {{NONE, NONE, NONE, NONE, NONE}},
        {{NONE, NONE, NONE, NONE, NONE}},
    };

    // Stadien ohne Nachtprofil fallen auf das Tagesprofil zurück
    constexpr bool HAS_NIGHT[vpd_calc::kStageCount] = {true, false, true, true, true, false, false};

    // Späte Blüte: engere Feuchte, höheres VPD (Schimmelprävention)
    constexpr int LATE_FLOWER_DAYS = 42;
    constexpr ThresholdProfile LATE_FLOWER_DAY{
        {{true, 22.0f, 26.0f, 2.0f}, {true, 40.0f, 50.0f, 6.0f}, {true, 1.20f, 1.50f, 0.20f}, {true, 800.0f, 1200.0f, 300.0f}, NONE}};
    constexpr ThresholdProfile LATE_FLOWER_NIGHT{
        {{true, 20.0f, 22.0f, 2.0f}, {true, 40.0f, 50.0f, 6.0f}, {true, 0.90f, 1.20f, 0.20f}, {true, 400.0f, 800.0f, 300.0f}, NONE}};
  }

  // --- A-priori-Wahrscheinlichkeiten ---
  namespace priors
  {
    constexpr double STRESS = 0.15;
    constexpr double MOLD_RISK = 0.10;
    constexpr double OPTIMAL = 0.40;
  }

  // --- Schaltschwellen (Hysterese) ---
  namespace gate
  {
    struct Thresholds
    {
      float turnOn;         // Posterior >= turnOn -> wahr
      float turnOff;        // Posterior <= turnOff -> falsch
      uint32_t minDwellS;   // Mindestverweildauer der Rohklassifikation [s]
    };

    constexpr Thresholds STRESS{0.70f, 0.55f, 0};
    constexpr Thresholds MOLD_RISK{0.75f, 0.60f, 0};
    constexpr Thresholds OPTIMAL{0.80f, 0.65f, 0};
  }

  // --- Likelihood-Kurven ---
  namespace curves
  {
    using bayes_calc::CurveShape;
    using bayes_calc::LikelihoodCurve;

    // { Form, L(ideal), L(weit weg), Spanne [Toleranzen], L min, L max }
    constexpr LikelihoodCurve STRESS_TEMP{CurveShape::Linear, 1.0f, 8.0f, 3.0f, 0.02f, 50.0f};
    constexpr LikelihoodCurve STRESS_HUMIDITY{CurveShape::Linear, 1.0f, 5.0f, 3.0f, 0.02f, 50.0f};
    constexpr LikelihoodCurve STRESS_VPD{CurveShape::Linear, 1.0f, 6.0f, 3.0f, 0.02f, 50.0f};
    constexpr LikelihoodCurve STRESS_CO2{CurveShape::Linear, 1.0f, 3.0f, 3.0f, 0.02f, 50.0f};

    // Schimmel: nur Überschreitung Feuchte / Unterschreitung VPD
    constexpr LikelihoodCurve MOLD_HUMIDITY{CurveShape::Gaussian, 1.0f, 10.0f, 1.5f, 0.02f, 50.0f};
    constexpr LikelihoodCurve MOLD_VPD{CurveShape::Gaussian, 1.0f, 6.0f, 1.5f, 0.02f, 50.0f};
    constexpr float MOLD_NIGHT_WEIGHT = 1.5f;   // Licht aus: stärker gewichten
    constexpr float FAN_OFF_RATIO = 4.0f;       // stehende Luft
    constexpr float FAN_ON_RATIO = 1.0f;

    // Optimal: nahe am Ideal spricht FÜR den Zustand
    constexpr LikelihoodCurve OPTIMAL_TEMP{CurveShape::Linear, 3.0f, 0.25f, 2.0f, 0.02f, 50.0f};
    constexpr LikelihoodCurve OPTIMAL_HUMIDITY{CurveShape::Linear, 2.0f, 0.4f, 2.0f, 0.02f, 50.0f};
    constexpr LikelihoodCurve OPTIMAL_VPD{CurveShape::Linear, 3.0f, 0.3f, 2.0f, 0.02f, 50.0f};
    constexpr LikelihoodCurve OPTIMAL_CO2{CurveShape::Linear, 1.5f, 0.6f, 2.0f, 0.02f, 50.0f};

    constexpr float TREND_RATIO = 1.5f;         // ungünstiger Trend
  }

  // --- Lichtplan ---
  namespace light
  {
    // Erwartete Licht-an-Stunden je Stadium (Seedling ... Curing)
    constexpr float ON_HOURS[vpd_calc::kStageCount] = {18.0f, 18.0f, 18.0f, 18.0f, 12.0f, 0.0f, 0.0f};
    // Blüte nach Tagen im Stadium: früh < 21, mittel < 42, spät
    constexpr int FLOWER_MID_DAYS = 21;
    constexpr int FLOWER_LATE_DAYS = 42;
    constexpr float FLOWER_ON_HOURS[3] = {12.0f, 12.0f, 12.0f};
    constexpr uint32_t TOLERANCE_MIN = 15;
    constexpr int ROLLOVER_MINUTE = -1;   // -1: rollierend 24 h ab erstem Wechsel
    constexpr int TZ_OFFSET_MIN = 0;
  }

  // --- Trendanalyse ---
  namespace trend
  {
    constexpr bool ENABLED = true;
    constexpr uint32_t WINDOW_MIN = 30;
    // Mindeständerung je Größe { °C, %, kPa, ppm, Lüfter }
    constexpr double EPS[profile_ctrl::kVariableCount] = {0.2, 1.0, 0.03, 25.0, 0.5};
  }

} // namespace verdant
