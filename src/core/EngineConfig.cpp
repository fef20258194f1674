/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/EngineConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <format>
#include <limits>

namespace GlyphFlow {

namespace {

bool readNumber(const JsonValue &category, const std::string &categoryName,
                const std::string &key, double &out) {
  if (!category.hasKey(key)) {
    return false;
  }
  auto value = category[key].tryAsNumber();
  if (!value) {
    CONFIG_WARN("Setting '" + categoryName + "." + key +
                "' is not a number, keeping default");
    return false;
  }
  out = *value;
  return true;
}

void readFloat(const JsonValue &category, const std::string &categoryName,
               const std::string &key, float &out) {
  double value = 0.0;
  if (readNumber(category, categoryName, key, value)) {
    out = static_cast<float>(value);
  }
}

void readBool(const JsonValue &category, const std::string &categoryName,
              const std::string &key, bool &out) {
  if (!category.hasKey(key)) {
    return;
  }
  auto value = category[key].tryAsBool();
  if (!value) {
    CONFIG_WARN("Setting '" + categoryName + "." + key +
                "' is not a boolean, keeping default");
    return;
  }
  out = *value;
}

void readString(const JsonValue &category, const std::string &categoryName,
                const std::string &key, std::string &out) {
  if (!category.hasKey(key)) {
    return;
  }
  auto value = category[key].tryAsString();
  if (!value) {
    CONFIG_WARN("Setting '" + categoryName + "." + key +
                "' is not a string, keeping default");
    return;
  }
  out = *value;
}

// Integer settings stored as JSON numbers; out-of-range values keep the default
template <typename T>
void readUnsigned(const JsonValue &category, const std::string &categoryName,
                  const std::string &key, double maxValue, T &out) {
  double value = 0.0;
  if (!readNumber(category, categoryName, key, value)) {
    return;
  }
  if (!(value >= 0.0 && value <= maxValue)) {
    CONFIG_WARN(std::format("Setting '{}.{}' = {} is out of range, keeping default",
                            categoryName, key, value));
    return;
  }
  out = static_cast<T>(value);
}

bool readMacroRows(const JsonValue &curve, std::vector<MacroPhaseRow> &rows) {
  const JsonArray *array = curve.tryAsArray();
  if (array == nullptr) {
    CONFIG_ERROR("macroCurve must be an array of rows");
    return false;
  }

  float previousEnd = -std::numeric_limits<float>::infinity();
  for (size_t i = 0; i < array->size(); ++i) {
    const JsonValue &row = (*array)[i];
    if (!row.isObject() || !row["end"].isNumber()) {
      CONFIG_ERROR(std::format("macroCurve row {} needs a numeric 'end'", i));
      return false;
    }

    MacroPhaseRow parsed;
    parsed.endTime = static_cast<float>(row["end"].asNumber());
    if (parsed.endTime <= previousEnd) {
      CONFIG_ERROR(std::format(
          "macroCurve row {} end time {} is not after the previous row", i,
          parsed.endTime));
      return false;
    }
    previousEnd = parsed.endTime;

    const std::string name = std::format("macroCurve[{}]", i);
    MacroParams &p = parsed.params;
    readFloat(row, name, "noiseStrength", p.noiseStrength);
    readFloat(row, name, "noiseScale", p.noiseScale);
    readFloat(row, name, "spring", p.springStrength);
    readFloat(row, name, "damping", p.damping);
    readFloat(row, name, "vortex", p.vortexStrength);
    readFloat(row, name, "wave", p.waveStrength);
    readFloat(row, name, "gravity", p.gravity);
    readFloat(row, name, "convUp", p.convergenceUpRate);
    readFloat(row, name, "convDn", p.convergenceDownRate);
    readFloat(row, name, "pointScale", p.pointScale);
    rows.push_back(parsed);
  }
  return true;
}

} // anonymous namespace

bool loadEngineConfig(const std::string &path, EngineConfig &config) {
  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    CONFIG_ERROR("Failed to load engine config from file: " + path + " - " +
                 reader.getLastError());
    return false;
  }

  const JsonValue &root = reader.getRoot();
  if (!root.isObject()) {
    CONFIG_ERROR("Engine config root is not a JSON object: " + path);
    return false;
  }

  // Work on a copy so a failed load leaves the caller's config intact
  EngineConfig loaded = config;

  const JsonValue &simulation = root["simulation"];
  if (simulation.isObject()) {
    double count = 0.0;
    if (readNumber(simulation, "simulation", "particleCount", count)) {
      if (!(count >= 1.0 && count <= static_cast<double>(MAX_PARTICLE_COUNT))) {
        CONFIG_ERROR(std::format("particleCount must be in [1, {}], got {}",
                                 MAX_PARTICLE_COUNT, count));
        return false;
      }
      loaded.particleCount = static_cast<size_t>(count);
    }
    readUnsigned(simulation, "simulation", "seed",
                 static_cast<double>(std::numeric_limits<uint32_t>::max()), loaded.seed);
    readFloat(simulation, "simulation", "textHoldDuration", loaded.textHoldDuration);
    readFloat(simulation, "simulation", "convUpScale", loaded.convUpScale);
    readFloat(simulation, "simulation", "convDnScale", loaded.convDnScale);
    readFloat(simulation, "simulation", "pointSize", loaded.pointSize);
  }

  const JsonValue &text = root["text"];
  if (text.isObject()) {
    readString(text, "text", "fontPath", loaded.fontPath);
    readFloat(text, "text", "fontSize", loaded.fontSize);
  }

  const JsonValue &threading = root["threading"];
  if (threading.isObject()) {
    readBool(threading, "threading", "enabled", loaded.threadingEnabled);
    readUnsigned(threading, "threading", "threshold",
                 static_cast<double>(MAX_PARTICLE_COUNT), loaded.threadingThreshold);
    readUnsigned(threading, "threading", "workerCount", 1024.0, loaded.workerCount);
  }

  if (root.hasKey("macroCurve")) {
    std::vector<MacroPhaseRow> rows;
    if (!readMacroRows(root["macroCurve"], rows)) {
      return false;
    }
    loaded.macroRows = std::move(rows);
  }

  config = std::move(loaded);
  CONFIG_INFO("Loaded engine config from file: " + path);
  return true;
}

} // namespace GlyphFlow
