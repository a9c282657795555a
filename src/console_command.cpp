#include "console_command.h"

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

// Next whitespace-separated token, lowercased in place
static char* nextToken(char*& cursor) {
    while (*cursor != '\0' && isspace((unsigned char)*cursor)) cursor++;
    if (*cursor == '\0') return nullptr;

    char* start = cursor;
    while (*cursor != '\0' && !isspace((unsigned char)*cursor)) {
        *cursor = (char)tolower((unsigned char)*cursor);
        cursor++;
    }
    if (*cursor != '\0') {
        *cursor++ = '\0';
    }
    return start;
}

static bool parseNumber(const char* token, unsigned long maxValue, unsigned long& out) {
    if (token == nullptr || *token == '\0') return false;
    char* end = nullptr;
    unsigned long value = strtoul(token, &end, 10);
    if (*end != '\0' || !isdigit((unsigned char)token[0]) || value > maxValue) {
        return false;
    }
    out = value;
    return true;
}

static ConsoleCommandType slotCommand(const char* word) {
    if (strcmp(word, "disconnect") == 0) return CONSOLE_DISCONNECT;
    if (strcmp(word, "retry") == 0)      return CONSOLE_RETRY;
    if (strcmp(word, "battery") == 0)    return CONSOLE_BATTERY;
    if (strcmp(word, "lights") == 0)     return CONSOLE_TOGGLE;
    if (strcmp(word, "turbo") == 0)      return CONSOLE_TOGGLE;
    if (strcmp(word, "donut") == 0)      return CONSOLE_TOGGLE;
    if (strcmp(word, "mode") == 0)       return CONSOLE_TOGGLE;
    return CONSOLE_UNKNOWN;
}

static ControlFlag toggleFlag(const char* word) {
    if (strcmp(word, "turbo") == 0) return FLAG_TURBO;
    if (strcmp(word, "donut") == 0) return FLAG_DONUT;
    if (strcmp(word, "mode") == 0)  return FLAG_SPORT_MODE;
    return FLAG_LIGHTS;
}

ConsoleCommand parseConsoleLine(const char* line) {
    ConsoleCommand cmd;
    if (line == nullptr) return cmd;

    char buffer[SLR_CONSOLE_LINE_MAX];
    strncpy(buffer, line, sizeof(buffer) - 1);
    buffer[sizeof(buffer) - 1] = '\0';

    char* cursor = buffer;
    char* word = nextToken(cursor);
    if (word == nullptr) return cmd;

    char* arg1 = nextToken(cursor);
    char* arg2 = nextToken(cursor);
    unsigned long value = 0;

    if (strcmp(word, "help") == 0 || strcmp(word, "?") == 0) {
        cmd.type = CONSOLE_HELP;
    } else if (strcmp(word, "models") == 0) {
        cmd.type = CONSOLE_MODELS;
    } else if (strcmp(word, "scan") == 0) {
        cmd.type = CONSOLE_SCAN;
        if (arg1 != nullptr) {
            if (!parseNumber(arg1, 600000UL, value)) {
                cmd.type = CONSOLE_BAD_ARGUMENTS;
            } else {
                cmd.durationMs = (uint32_t)value;
            }
        }
    } else if (strcmp(word, "stop") == 0) {
        cmd.type = CONSOLE_STOP;
    } else if (strcmp(word, "list") == 0) {
        cmd.type = CONSOLE_LIST;
    } else if (strcmp(word, "status") == 0) {
        cmd.type = CONSOLE_STATUS;
    } else if (strcmp(word, "quit") == 0) {
        cmd.type = CONSOLE_QUIT;
    } else if (strcmp(word, "connect") == 0) {
        cmd.type = CONSOLE_BAD_ARGUMENTS;
        if (!parseNumber(arg1, 255, value)) return cmd;
        cmd.slot = (uint8_t)value;

        unsigned long device = 0;
        if (arg2 != nullptr && strchr(arg2, ':') != nullptr) {
            char* modelName = nextToken(cursor);
            if (!parseAddress(arg2, cmd.address)) return cmd;
            if (modelName != nullptr) {
                cmd.model = findCarModel(modelName);
                if (cmd.model == nullptr) return cmd;
            }
            cmd.byAddress = true;
            cmd.type = CONSOLE_CONNECT;
        } else if (parseNumber(arg2, 255, device)) {
            cmd.device = (uint8_t)device;
            cmd.type = CONSOLE_CONNECT;
        }
    } else {
        cmd.type = slotCommand(word);
        if (cmd.type == CONSOLE_UNKNOWN) return cmd;

        if (!parseNumber(arg1, 255, value)) {
            cmd.type = CONSOLE_BAD_ARGUMENTS;
            return cmd;
        }
        cmd.slot = (uint8_t)value;
        if (cmd.type == CONSOLE_TOGGLE) {
            cmd.flag = toggleFlag(word);
        }
    }

    return cmd;
}
