#pragma once
#include <ArduinoJson.h>
#include <string.h>
#include <string>
#include "Types.h"

class ReplayCodec {
public:
    // Parses one recorded event object ({"type":"tick", ...}) into outEvent.
    // Returns true if valid. Writes explanation to errorMsg otherwise.
    static bool parseEvent(JsonVariantConst json, TimerEvent& outEvent, std::string& errorMsg);

    // Reads the optional "timeMs" replay clock field. Returns false if absent.
    static bool readTimestamp(JsonVariantConst json, unsigned long& outMillis);

    // Applies recognised display keys on top of settings.
    // Returns true if valid; settings are left untouched on failure.
    static bool parseDisplaySettings(JsonVariantConst json, DisplaySettings& settings, std::string& errorMsg);

    // "TICKS" / "Seconds" / "decimals" ...
    static bool parseFormat(const char* text, DisplayFormat& outFormat);

    // "#RRGGBB" (opaque) or "#RRGGBBAA" -> 0xRRGGBBAA
    static bool parseColor(const char* text, uint32_t& outColor);
};
