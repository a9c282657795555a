/**
 * @file console_command.h
 * @brief Parser for the line-based serial console
 *
 * Commands (case-insensitive, slots and device numbers are 0-based):
 *   help | models | scan [ms] | stop | list | status | quit
 *   connect <slot> <n> | connect <slot> <AA:BB:CC:DD:EE:FF> [model]
 *   disconnect <slot> | retry <slot> | battery <slot>
 *   lights <slot> | turbo <slot> | donut <slot> | mode <slot>
 */

#ifndef CONSOLE_COMMAND_H
#define CONSOLE_COMMAND_H

#include <stdint.h>

#include "bridge_types.h"
#include "car_catalog.h"
#include "car_protocol.h"

#define SLR_CONSOLE_LINE_MAX  64

enum ConsoleCommandType : uint8_t {
    CONSOLE_EMPTY = 0,
    CONSOLE_HELP,
    CONSOLE_MODELS,
    CONSOLE_SCAN,
    CONSOLE_STOP,
    CONSOLE_LIST,
    CONSOLE_CONNECT,
    CONSOLE_DISCONNECT,
    CONSOLE_RETRY,
    CONSOLE_BATTERY,
    CONSOLE_TOGGLE,
    CONSOLE_STATUS,
    CONSOLE_QUIT,
    CONSOLE_UNKNOWN,
    CONSOLE_BAD_ARGUMENTS,   // Known command, missing or malformed number
};

struct ConsoleCommand {
    ConsoleCommandType type = CONSOLE_EMPTY;
    uint8_t            slot = 0;
    uint8_t            device = 0;
    bool               byAddress = false;   // connect: address instead of scan index
    BleAddress         address;
    const CarModel*    model = nullptr;     // connect by address: optional model
    uint32_t           durationMs = 0;   // scan: 0 = configured window
    ControlFlag        flag = FLAG_LIGHTS;
};

ConsoleCommand parseConsoleLine(const char* line);

#endif // CONSOLE_COMMAND_H
