#include "console_command.h"

#include <cassert>
#include <iostream>

int main()
{
    ConsoleCommand cmd;

    assert(parseConsoleLine(nullptr).type == CONSOLE_EMPTY);
    assert(parseConsoleLine("").type == CONSOLE_EMPTY);
    assert(parseConsoleLine("   \t ").type == CONSOLE_EMPTY);

    assert(parseConsoleLine("help").type == CONSOLE_HELP);
    assert(parseConsoleLine("?").type == CONSOLE_HELP);
    assert(parseConsoleLine("  HELP  ").type == CONSOLE_HELP);
    assert(parseConsoleLine("models").type == CONSOLE_MODELS);
    assert(parseConsoleLine("stop").type == CONSOLE_STOP);
    assert(parseConsoleLine("list").type == CONSOLE_LIST);
    assert(parseConsoleLine("Status").type == CONSOLE_STATUS);
    assert(parseConsoleLine("quit").type == CONSOLE_QUIT);
    assert(parseConsoleLine("launch").type == CONSOLE_UNKNOWN);

    // Scan window is optional
    cmd = parseConsoleLine("scan");
    assert(cmd.type == CONSOLE_SCAN);
    assert(cmd.durationMs == 0);
    cmd = parseConsoleLine("scan 5000");
    assert(cmd.type == CONSOLE_SCAN);
    assert(cmd.durationMs == 5000);
    assert(parseConsoleLine("scan 5s").type == CONSOLE_BAD_ARGUMENTS);
    assert(parseConsoleLine("scan -1").type == CONSOLE_BAD_ARGUMENTS);
    assert(parseConsoleLine("scan 600001").type == CONSOLE_BAD_ARGUMENTS);

    cmd = parseConsoleLine("connect 1 3");
    assert(cmd.type == CONSOLE_CONNECT);
    assert(cmd.slot == 1);
    assert(cmd.device == 3);
    assert(parseConsoleLine("connect 1").type == CONSOLE_BAD_ARGUMENTS);
    assert(parseConsoleLine("connect x 1").type == CONSOLE_BAD_ARGUMENTS);
    assert(parseConsoleLine("connect 1 256").type == CONSOLE_BAD_ARGUMENTS);
    assert(!cmd.byAddress);

    // Direct connect by address, skipping the scan
    cmd = parseConsoleLine("connect 2 C0:11:22:33:44:AB");
    assert(cmd.type == CONSOLE_CONNECT);
    assert(cmd.byAddress);
    assert(cmd.slot == 2);
    assert(cmd.address.bytes[0] == 0xC0);
    assert(cmd.address.bytes[5] == 0xAB);
    assert(cmd.model == nullptr);

    cmd = parseConsoleLine("connect 0 c0:11:22:33:44:ab 330P");
    assert(cmd.type == CONSOLE_CONNECT);
    assert(cmd.byAddress);
    assert(cmd.model == findCarModel("330P"));
    assert(cmd.address.bytes[5] == 0xAB);

    assert(parseConsoleLine("connect 0 C0:11:22:33:44:AB NOPE").type == CONSOLE_BAD_ARGUMENTS);
    assert(parseConsoleLine("connect 0 C0:11:22:33:44").type == CONSOLE_BAD_ARGUMENTS);
    assert(parseConsoleLine("connect x C0:11:22:33:44:AB").type == CONSOLE_BAD_ARGUMENTS);

    cmd = parseConsoleLine("disconnect 2");
    assert(cmd.type == CONSOLE_DISCONNECT);
    assert(cmd.slot == 2);
    cmd = parseConsoleLine("RETRY 0");
    assert(cmd.type == CONSOLE_RETRY);
    assert(cmd.slot == 0);
    cmd = parseConsoleLine("battery 3");
    assert(cmd.type == CONSOLE_BATTERY);
    assert(cmd.slot == 3);
    assert(parseConsoleLine("battery").type == CONSOLE_BAD_ARGUMENTS);

    // Slot range is checked by the bridge, not the parser
    cmd = parseConsoleLine("disconnect 9");
    assert(cmd.type == CONSOLE_DISCONNECT);
    assert(cmd.slot == 9);

    cmd = parseConsoleLine("lights 0");
    assert(cmd.type == CONSOLE_TOGGLE);
    assert(cmd.flag == FLAG_LIGHTS);
    cmd = parseConsoleLine("turbo 1");
    assert(cmd.type == CONSOLE_TOGGLE);
    assert(cmd.flag == FLAG_TURBO);
    assert(cmd.slot == 1);
    cmd = parseConsoleLine("donut 0");
    assert(cmd.flag == FLAG_DONUT);
    cmd = parseConsoleLine("Mode 2");
    assert(cmd.type == CONSOLE_TOGGLE);
    assert(cmd.flag == FLAG_SPORT_MODE);
    assert(cmd.slot == 2);
    assert(parseConsoleLine("mode").type == CONSOLE_BAD_ARGUMENTS);

    // Over-long input is cut, not overflowed
    cmd = parseConsoleLine("connect 0 1                                                                     extra");
    assert(cmd.type == CONSOLE_CONNECT);

    std::cout << "All tests passed\n";
    return 0;
}
