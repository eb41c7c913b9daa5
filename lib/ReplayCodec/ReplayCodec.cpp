#include "ReplayCodec.h"
#include <ctype.h>

static bool equalsIgnoreCase(const char* a, const char* b) {
    while (*a && *b) {
        if (tolower((unsigned char)*a) != tolower((unsigned char)*b)) return false;
        a++;
        b++;
    }
    return *a == '\0' && *b == '\0';
}

static bool copyText(JsonVariantConst value, const char* field, TimerEvent& outEvent, std::string& errorMsg) {
    if (!value.is<const char*>()) {
        errorMsg = std::string("Missing string field: ") + field;
        return false;
    }
    const char* text = value.as<const char*>();
    if (strlen(text) > MAX_EVENT_TEXT) {
        errorMsg = std::string("Field too long (max ") + std::to_string(MAX_EVENT_TEXT) + " chars): " + field;
        return false;
    }
    strncpy(outEvent.text, text, MAX_EVENT_TEXT);
    outEvent.text[MAX_EVENT_TEXT] = '\0';
    return true;
}

bool ReplayCodec::parseEvent(JsonVariantConst json, TimerEvent& outEvent, std::string& errorMsg) {
    memset(&outEvent, 0, sizeof(outEvent));
    outEvent.tickIndex = -1;
    outEvent.channel = CHAT_GAME;
    outEvent.npcId = -1;
    outEvent.location.regionId = NO_REGION;

    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Event must be a JSON object.";
        return false;
    }

    // 1. Type Mapping
    std::string typeStr = json["type"] | "";

    if (typeStr == "login") outEvent.type = EVT_SESSION_START;
    else if (typeStr == "logout") outEvent.type = EVT_SESSION_END;
    else if (typeStr == "tick") outEvent.type = EVT_TICK;
    else if (typeStr == "chat") outEvent.type = EVT_CHAT_MESSAGE;
    else if (typeStr == "equipment") outEvent.type = EVT_EQUIPMENT_CHANGED;
    else if (typeStr == "npc") outEvent.type = EVT_NPC_SPAWNED;
    else if (typeStr == "menu") outEvent.type = EVT_MENU_OPTION;
    else if (typeStr == "status") outEvent.type = EVT_ENCOUNTER_STATUS;
    else {
        errorMsg = "Invalid event type: " + typeStr;
        return false;
    }

    // 2. Per-type fields
    switch (outEvent.type) {
    case EVT_SESSION_START:
        outEvent.specEnergy = json["energy"] | MAX_SPEC_ENERGY;
        break;

    case EVT_SESSION_END:
        break;

    case EVT_TICK: {
        if (!json["tick"].is<int32_t>() || !json["energy"].is<int32_t>()) {
            errorMsg = "Tick events need integer 'tick' and 'energy'.";
            return false;
        }
        outEvent.tickIndex = json["tick"].as<int32_t>();
        outEvent.specEnergy = json["energy"].as<int32_t>();
        if (outEvent.tickIndex < 0) {
            errorMsg = "Tick index cannot be negative.";
            return false;
        }

        // Position is optional; a missing position means "unknown this tick"
        if (!json["region"].isNull()) {
            if (!json["region"].is<int32_t>() || !json["x"].is<int32_t>() || !json["y"].is<int32_t>()) {
                errorMsg = "Position needs integer 'region', 'x' and 'y'.";
                return false;
            }
            outEvent.location.valid = true;
            outEvent.location.regionId = json["region"].as<int32_t>();
            outEvent.location.x = json["x"].as<int32_t>();
            outEvent.location.y = json["y"].as<int32_t>();
        }
        break;
    }

    case EVT_CHAT_MESSAGE: {
        if (!copyText(json["text"], "text", outEvent, errorMsg)) return false;

        std::string channelStr = json["channel"] | "game";
        if (channelStr == "game") outEvent.channel = CHAT_GAME;
        else if (channelStr == "spam") outEvent.channel = CHAT_SPAM;
        else outEvent.channel = CHAT_OTHER;

        outEvent.tickIndex = json["tick"] | -1;
        break;
    }

    case EVT_EQUIPMENT_CHANGED:
        if (!json["lightbearer"].is<bool>()) {
            errorMsg = "Equipment events need boolean 'lightbearer'.";
            return false;
        }
        outEvent.accelerated = json["lightbearer"].as<bool>();
        break;

    case EVT_NPC_SPAWNED:
        // Some NPCs have no name; only the id is mandatory
        if (!json["id"].is<int32_t>()) {
            errorMsg = "NPC events need integer 'id'.";
            return false;
        }
        outEvent.npcId = json["id"].as<int32_t>();
        if (!json["name"].isNull() && !copyText(json["name"], "name", outEvent, errorMsg)) return false;
        break;

    case EVT_MENU_OPTION:
        if (!copyText(json["option"], "option", outEvent, errorMsg)) return false;
        break;

    case EVT_ENCOUNTER_STATUS:
        if (!json["value"].is<int32_t>()) {
            errorMsg = "Status events need integer 'value'.";
            return false;
        }
        outEvent.status = json["value"].as<int32_t>();
        break;
    }

    return true;
}

bool ReplayCodec::readTimestamp(JsonVariantConst json, unsigned long& outMillis) {
    if (!json["timeMs"].is<unsigned long>()) return false;
    outMillis = json["timeMs"].as<unsigned long>();
    return true;
}

// =================================================================================
// SECTION: DISPLAY SETTINGS
// =================================================================================

bool ReplayCodec::parseFormat(const char* text, DisplayFormat& outFormat) {
    if (text == nullptr) return false;
    if (equalsIgnoreCase(text, "TICKS")) outFormat = FORMAT_TICKS;
    else if (equalsIgnoreCase(text, "SECONDS")) outFormat = FORMAT_SECONDS;
    else if (equalsIgnoreCase(text, "DECIMALS")) outFormat = FORMAT_DECIMALS;
    else return false;
    return true;
}

bool ReplayCodec::parseColor(const char* text, uint32_t& outColor) {
    if (text == nullptr || text[0] != '#') return false;

    size_t len = strlen(text + 1);
    if (len != 6 && len != 8) return false;

    uint32_t value = 0;
    for (size_t i = 1; i <= len; i++) {
        char c = text[i];
        if (!isxdigit((unsigned char)c)) return false;
        int digit = isdigit((unsigned char)c) ? c - '0' : tolower((unsigned char)c) - 'a' + 10;
        value = (value << 4) | (uint32_t)digit;
    }
    if (len == 6) value = (value << 8) | 0xFF; // opaque

    outColor = value;
    return true;
}

bool ReplayCodec::parseDisplaySettings(JsonVariantConst json, DisplaySettings& settings, std::string& errorMsg) {
    if (!json.is<JsonObjectConst>()) {
        errorMsg = "Settings must be a JSON object.";
        return false;
    }

    DisplaySettings parsed = settings;

    // 1. Booleans
    parsed.showInfoBox = json["showInfoBox"] | parsed.showInfoBox;
    parsed.showCircularOverlay = json["showCircularOverlay"] | parsed.showCircularOverlay;
    parsed.showSurgeInfoBox = json["showSurgeInfoBox"] | parsed.showSurgeInfoBox;

    // 2. Formats
    struct { const char* key; DisplayFormat* target; } formats[] = {
        { "displayFormat", &parsed.displayFormat },
        { "surgeDisplayFormat", &parsed.surgeDisplayFormat },
    };
    for (size_t i = 0; i < sizeof(formats) / sizeof(formats[0]); i++) {
        JsonVariantConst v = json[formats[i].key];
        if (v.isNull()) continue;
        if (!parseFormat(v.as<const char*>(), *formats[i].target)) {
            errorMsg = std::string("Invalid ") + formats[i].key + " (expected TICKS, SECONDS or DECIMALS).";
            return false;
        }
    }

    // 3. Colours
    struct { const char* key; uint32_t* target; } colors[] = {
        { "activeColor", &parsed.activeColor },
        { "circleColor", &parsed.circleColor },
        { "surgeColor", &parsed.surgeColor },
        { "surgePausedColor", &parsed.surgePausedColor },
    };
    for (size_t i = 0; i < sizeof(colors) / sizeof(colors[0]); i++) {
        JsonVariantConst v = json[colors[i].key];
        if (v.isNull()) continue;
        if (!parseColor(v.as<const char*>(), *colors[i].target)) {
            errorMsg = std::string("Invalid ") + colors[i].key + " (expected #RRGGBB or #RRGGBBAA).";
            return false;
        }
    }

    settings = parsed;
    return true;
}
