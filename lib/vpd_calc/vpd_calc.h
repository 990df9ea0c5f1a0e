/*
 * vpd_calc.h
 *
 * Kleine Bibliothek rund um das Dampfdruckdefizit (VPD) und die
 * Wachstumsstadien. Stellt Sättigungsdampfdruck, VPD, Taupunkt sowie
 * Namen/Parser für die Stadien bereit. Die Stadien selbst werden extern
 * (Pflanzen-/Growspace-Datensatz) gesetzt und hier nur benannt.
 */

#pragma once

#include <cstdint>

namespace vpd_calc
{
    /**
     * Wachstumsstadien im Anbauzyklus. Bestimmen Schwellenprofil und
     * Lichtplan. Die Reihenfolge ist zugleich Tabellenindex (0..kStageCount-1).
     */
    enum class GrowthStage : std::uint8_t
    {
        Seedling = 0,
        Clone = 1,
        Mother = 2,
        Vegetative = 3,
        Flowering = 4,
        Drying = 5,
        Curing = 6
    };

    constexpr int kStageCount = 7;

    inline int stageIndex(GrowthStage s) { return static_cast<int>(s); }

    /**
     * Kurzname des Stadiums ("seedling", "clone", "mother", "veg", "flower",
     * "dry", "cure"). Gibt einen String-Literal zurück.
     */
    const char* stageName(GrowthStage stage);

    /**
     * Parst einen Stadiennamen. Akzeptiert die Kurznamen sowie die Langformen
     * "vegetative", "flowering", "drying", "curing". Gibt false zurück, wenn
     * der Name unbekannt ist; `out` bleibt dann unverändert.
     */
    bool parseStage(const char* name, GrowthStage& out);

    // --- VPD- und Feuchtigkeitsberechnungen ---

    /**
     * Sättigungsdampfdruck (SVP) in kPa für eine Lufttemperatur in °C
     * (Tetens-Form, gültig oberhalb des Gefrierpunkts).
     */
    double computeSaturationVapourPressure(double tempC);

    /**
     * VPD in kPa aus Lufttemperatur und relativer Luftfeuchte (%).
     * Feuchtewerte außerhalb 0–100 werden begrenzt, NaN-Eingaben liefern NaN.
     */
    double computeVpd(double tempC, double relHumidity);

    /**
     * Taupunkt in °C aus Lufttemperatur und relativer Luftfeuchte
     * (Magnus-Approximation). Bei 0 % Feuchte gibt es keinen Taupunkt: NaN.
     */
    double computeDewPoint(double tempC, double relHumidity);
} // namespace vpd_calc
