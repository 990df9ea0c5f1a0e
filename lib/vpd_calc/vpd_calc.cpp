/*
 * vpd_calc.cpp
 *
 * Implementierung der VPD-Berechnungen und Stadien-Hilfsfunktionen.
 * Alle Gleitkommaberechnungen in double-Präzision.
 */

#include "vpd_calc.h"

#include <cmath>
#include <cstring>

namespace vpd_calc
{
    namespace
    {
        struct StageAlias
        {
            const char* name;
            GrowthStage stage;
        };

        constexpr StageAlias kAliases[] = {
            {"seedling", GrowthStage::Seedling},
            {"clone", GrowthStage::Clone},
            {"mother", GrowthStage::Mother},
            {"veg", GrowthStage::Vegetative},
            {"vegetative", GrowthStage::Vegetative},
            {"flower", GrowthStage::Flowering},
            {"flowering", GrowthStage::Flowering},
            {"dry", GrowthStage::Drying},
            {"drying", GrowthStage::Drying},
            {"cure", GrowthStage::Curing},
            {"curing", GrowthStage::Curing},
        };
    } // namespace

    const char* stageName(GrowthStage stage)
    {
        switch (stage)
        {
        case GrowthStage::Seedling:   return "seedling";
        case GrowthStage::Clone:      return "clone";
        case GrowthStage::Mother:     return "mother";
        case GrowthStage::Vegetative: return "veg";
        case GrowthStage::Flowering:  return "flower";
        case GrowthStage::Drying:     return "dry";
        case GrowthStage::Curing:     return "cure";
        }
        return "unknown";
    }

    bool parseStage(const char* name, GrowthStage& out)
    {
        if (!name) return false;
        for (const auto& a : kAliases)
        {
            if (std::strcmp(a.name, name) == 0)
            {
                out = a.stage;
                return true;
            }
        }
        return false;
    }

    // --- Feuchte / VPD ---

    namespace
    {
        // Tetens-Koeffizienten (über Wasser), Druck in kPa
        constexpr double kTetensA = 17.2694;
        constexpr double kTetensB = 237.3;
        constexpr double kSvp0Kpa = 0.61078;

        // Magnus-Koeffizienten für den Taupunkt
        constexpr double kMagnusA = 17.27;
        constexpr double kMagnusB = 237.7;

        double clampHumidity(double rh)
        {
            return rh < 0.0 ? 0.0 : (rh > 100.0 ? 100.0 : rh);
        }
    } // namespace

    double computeSaturationVapourPressure(double tempC)
    {
        return kSvp0Kpa * std::exp((kTetensA * tempC) / (tempC + kTetensB));
    }

    double computeVpd(double tempC, double relHumidity)
    {
        if (!std::isfinite(tempC) || !std::isfinite(relHumidity))
            return NAN;
        const double rh = clampHumidity(relHumidity);
        return computeSaturationVapourPressure(tempC) * (100.0 - rh) / 100.0;
    }

    double computeDewPoint(double tempC, double relHumidity)
    {
        if (!std::isfinite(tempC) || !std::isfinite(relHumidity))
            return NAN;
        const double rh = clampHumidity(relHumidity);
        // völlig trockene Luft hat keinen Taupunkt
        if (rh <= 0.0)
            return NAN;
        const double gamma = std::log(rh / 100.0) + (kMagnusA * tempC) / (kMagnusB + tempC);
        return (kMagnusB * gamma) / (kMagnusA - gamma);
    }
} // namespace vpd_calc
