#include "btstack_radio.h"

#include <string.h>

#include <atomic>

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

#include "car_protocol.h"

// Low-level BTstack API (the stack itself is brought up by Bluepad32)
extern "C" {
    #include <btstack.h>
}

// ========================== Queue Items ==========================

enum RadioCommandType : uint8_t {
    CMD_REGISTER = 0,
    CMD_START_SCAN,
    CMD_STOP_SCAN,
    CMD_CONNECT,
    CMD_CANCEL_CONNECT,
    CMD_DISCONNECT,
    CMD_DISCOVER,
    CMD_SUBSCRIBE,
    CMD_READ_BATTERY,
};

struct RadioCommand {
    RadioCommandType type = CMD_REGISTER;
    BleAddress       address;
    uint16_t         connHandle = SLR_INVALID_CONN_HANDLE;
    uint16_t         valueHandle = 0;
};

enum RadioEventType : uint8_t {
    EVT_ADVERTISEMENT = 0,
    EVT_SCAN_STOPPED,
    EVT_CONNECTED,
    EVT_CONNECT_FAILED,
    EVT_CHARACTERISTICS,
    EVT_DISCONNECTED,
    EVT_WRITE_FAILED,
    EVT_BATTERY,
    EVT_STATUS,
};

struct RadioEvent {
    RadioEventType     type = EVT_ADVERTISEMENT;
    BleAddress         address;
    uint16_t           connHandle = SLR_INVALID_CONN_HANDLE;
    uint8_t            status = 0;     // HCI status / reason, or battery percent
    int8_t             rssi = 0;
    uint8_t            mailbox = 0;
    bool               ok = false;
    CarCharacteristics chars;
    uint16_t           length = 0;
    uint8_t            data[SLR_STATUS_RAW_MAX] = {};
    char               name[SLR_MAX_NAME_LENGTH] = {};
};

struct OutboundFrame {
    uint16_t connHandle;
    uint16_t valueHandle;
    uint16_t length;
    uint8_t  data[sizeof(CommandFrame)];
};

// ========================== BTstack Task State ==========================
// Everything below the queues is only touched on the BTstack task.

enum GattPhase : uint8_t {
    GATT_IDLE = 0,
    GATT_SERVICES,
    GATT_CAR_CHARS,
    GATT_BATTERY_CHARS,
    GATT_SUBSCRIBE,
    GATT_READ,
};

struct TaskLink {
    bool                          inUse = false;
    hci_con_handle_t              handle = HCI_CON_HANDLE_INVALID;
    GattPhase                     phase = GATT_IDLE;

    bool                          hasCarService = false;
    bool                          hasBatteryService = false;
    gatt_client_service_t         carService;
    gatt_client_service_t         batteryService;

    bool                          hasStatusChar = false;
    bool                          hasBatteryChar = false;
    gatt_client_characteristic_t  statusChar;
    gatt_client_characteristic_t  batteryChar;
    CarCharacteristics            chars;

    // CCCD writes and reads run one at a time per connection
    bool                          subscribeStatusPending = false;
    bool                          subscribeBatteryPending = false;
    bool                          readPending = false;

    bool                          statusListening = false;
    bool                          batteryListening = false;
    gatt_client_notification_t    statusNotification;
    gatt_client_notification_t    batteryNotification;
};

static QueueHandle_t s_eventQueue = nullptr;
static QueueHandle_t s_commandQueue = nullptr;
static QueueHandle_t s_mailboxes[SLR_MAX_SLOTS] = {};

static std::atomic<bool> s_poweredOn(false);
static std::atomic<bool> s_drainScheduled(false);
static std::atomic<unsigned long> s_droppedEvents(0);

static btstack_packet_callback_registration_t s_hciRegistration;
static btstack_context_callback_registration_t s_drainRegistration;

static TaskLink s_links[SLR_MAX_SLOTS];
static bool s_scanning = false;

// gap_connect() allows one outstanding connect, the rest wait here
static BleAddress s_pendingConnects[SLR_MAX_SLOTS];
static uint8_t s_pendingCount = 0;
static bool s_connecting = false;
static bool s_connectCancelled = false;
static BleAddress s_connectingAddr;

// ========================== Helpers ==========================

static void postEvent(const RadioEvent& ev) {
    if (xQueueSend(s_eventQueue, &ev, 0) != pdTRUE) {
        s_droppedEvents++;
    }
}

static void postConnectFailed(const BleAddress& address, uint8_t status) {
    RadioEvent ev;
    ev.type = EVT_CONNECT_FAILED;
    ev.address = address;
    ev.status = status;
    postEvent(ev);
}

static bool sameAddress(const uint8_t* a, const uint8_t* b) {
    return memcmp(a, b, 6) == 0;
}

static TaskLink* findLink(hci_con_handle_t handle) {
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        if (s_links[i].inUse && s_links[i].handle == handle) {
            return &s_links[i];
        }
    }
    return nullptr;
}

static int linkIndex(const TaskLink* link) {
    return (int)(link - s_links);
}

static int allocLink(hci_con_handle_t handle) {
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        if (!s_links[i].inUse) {
            s_links[i] = TaskLink();
            s_links[i].inUse = true;
            s_links[i].handle = handle;
            xQueueReset(s_mailboxes[i]);
            return i;
        }
    }
    return -1;
}

static void freeLink(TaskLink* link) {
    if (link->statusListening) {
        gatt_client_stop_listening_for_characteristic_value_updates(&link->statusNotification);
    }
    if (link->batteryListening) {
        gatt_client_stop_listening_for_characteristic_value_updates(&link->batteryNotification);
    }
    xQueueReset(s_mailboxes[linkIndex(link)]);
    *link = TaskLink();
}

static void gattHandler(uint8_t packetType, uint16_t channel, uint8_t* packet, uint16_t size);

// ========================== Connect Queue ==========================

static void startNextConnect() {
    while (!s_connecting && s_pendingCount > 0) {
        BleAddress next = s_pendingConnects[0];
        for (uint8_t i = 1; i < s_pendingCount; i++) {
            s_pendingConnects[i - 1] = s_pendingConnects[i];
        }
        s_pendingCount--;

        bd_addr_t addr;
        memcpy(addr, next.bytes, 6);
        uint8_t status = gap_connect(addr, (bd_addr_type_t)next.type);
        if (status == ERROR_CODE_SUCCESS) {
            s_connecting = true;
            s_connectCancelled = false;
            s_connectingAddr = next;
        } else {
            Serial.printf("[BLE] gap_connect refused, status=0x%02x\n", status);
            postConnectFailed(next, status);
        }
    }
}

static void queueConnect(const BleAddress& address) {
    if (s_pendingCount >= SLR_MAX_SLOTS) {
        postConnectFailed(address, ERROR_CODE_CONNECTION_LIMIT_EXCEEDED);
        return;
    }
    s_pendingConnects[s_pendingCount++] = address;
    startNextConnect();
}

static void cancelConnectTo(const BleAddress& address) {
    for (uint8_t i = 0; i < s_pendingCount; i++) {
        if (s_pendingConnects[i] == address) {
            for (uint8_t j = i + 1; j < s_pendingCount; j++) {
                s_pendingConnects[j - 1] = s_pendingConnects[j];
            }
            s_pendingCount--;
            return;
        }
    }
    if (s_connecting && s_connectingAddr == address && !s_connectCancelled) {
        // Completion still arrives (as a failure), it is not reported
        s_connectCancelled = true;
        uint8_t status = gap_connect_cancel();
        if (status != ERROR_CODE_SUCCESS) {
            Serial.printf("[BLE] gap_connect_cancel failed, status=0x%02x\n", status);
        }
    }
}

// ========================== GATT ==========================

static void finishDiscovery(TaskLink* link, bool ok);

// Listen and write the CCCD; true while the write is in flight
static bool subscribe(TaskLink* link, gatt_client_characteristic_t* characteristic,
                      gatt_client_notification_t* notification, bool& listening) {
    if ((characteristic->properties & ATT_PROPERTY_NOTIFY) == 0) {
        Serial.printf("[BLE] Characteristic 0x%04x does not notify\n", characteristic->uuid16);
        return false;
    }
    if (!listening) {
        gatt_client_listen_for_characteristic_value_updates(
            notification, gattHandler, link->handle, characteristic);
        listening = true;
    }
    uint8_t status = gatt_client_write_client_characteristic_configuration(
        gattHandler, link->handle, characteristic,
        GATT_CLIENT_CHARACTERISTICS_CONFIGURATION_NOTIFICATION);
    if (status != ERROR_CODE_SUCCESS) {
        Serial.printf("[BLE] CCCD write failed, status=0x%02x\n", status);
        return false;
    }
    link->phase = GATT_SUBSCRIBE;
    return true;
}

static void runPendingGatt(TaskLink* link) {
    if (link->phase != GATT_IDLE) return;

    if (link->subscribeStatusPending) {
        link->subscribeStatusPending = false;
        if (link->hasStatusChar &&
            subscribe(link, &link->statusChar, &link->statusNotification, link->statusListening)) {
            return;
        }
    }

    if (link->subscribeBatteryPending) {
        link->subscribeBatteryPending = false;
        if (link->hasBatteryChar &&
            subscribe(link, &link->batteryChar, &link->batteryNotification, link->batteryListening)) {
            return;
        }
    }

    if (link->readPending) {
        link->readPending = false;
        if (link->chars.batteryHandle != 0) {
            uint8_t status = gatt_client_read_value_of_characteristic_using_value_handle(
                gattHandler, link->handle, link->chars.batteryHandle);
            if (status == ERROR_CODE_SUCCESS) {
                link->phase = GATT_READ;
                return;
            }
        }
    }
}

static void startDiscovery(TaskLink* link) {
    link->phase = GATT_SERVICES;
    link->hasCarService = false;
    link->hasBatteryService = false;
    link->hasStatusChar = false;
    link->hasBatteryChar = false;
    link->chars = CarCharacteristics();

    uint8_t status = gatt_client_discover_primary_services(gattHandler, link->handle);
    if (status != ERROR_CODE_SUCCESS) {
        Serial.printf("[BLE] Service discovery refused, status=0x%02x\n", status);
        finishDiscovery(link, false);
    }
}

static void finishDiscovery(TaskLink* link, bool ok) {
    link->phase = GATT_IDLE;

    RadioEvent ev;
    ev.type = EVT_CHARACTERISTICS;
    ev.connHandle = link->handle;
    ev.ok = ok;
    ev.chars = link->chars;
    postEvent(ev);

    runPendingGatt(link);
}

static void queryComplete(TaskLink* link, uint8_t attStatus) {
    switch (link->phase) {
        case GATT_SERVICES:
            if (attStatus != ATT_ERROR_SUCCESS || !link->hasCarService) {
                finishDiscovery(link, false);
                return;
            }
            link->phase = GATT_CAR_CHARS;
            if (gatt_client_discover_characteristics_for_service(
                    gattHandler, link->handle, &link->carService) != ERROR_CODE_SUCCESS) {
                finishDiscovery(link, false);
            }
            return;

        case GATT_CAR_CHARS:
            if (attStatus != ATT_ERROR_SUCCESS) {
                finishDiscovery(link, false);
                return;
            }
            if (link->hasBatteryService) {
                link->phase = GATT_BATTERY_CHARS;
                if (gatt_client_discover_characteristics_for_service(
                        gattHandler, link->handle, &link->batteryService) == ERROR_CODE_SUCCESS) {
                    return;
                }
            }
            finishDiscovery(link, true);
            return;

        case GATT_BATTERY_CHARS:
            // Battery service is optional
            finishDiscovery(link, true);
            return;

        case GATT_SUBSCRIBE:
        case GATT_READ:
            link->phase = GATT_IDLE;
            runPendingGatt(link);
            return;

        default:
            return;
    }
}

static void gattHandler(uint8_t packetType, uint16_t channel, uint8_t* packet, uint16_t size) {
    (void)channel;
    (void)size;

    if (packetType != HCI_EVENT_PACKET) return;

    switch (hci_event_packet_get_type(packet)) {
        case GATT_EVENT_SERVICE_QUERY_RESULT: {
            TaskLink* link = findLink(gatt_event_service_query_result_get_handle(packet));
            if (link == nullptr) break;

            gatt_client_service_t service;
            gatt_event_service_query_result_get_service(packet, &service);
            if (service.uuid16 == SLR_SERVICE_UUID16) {
                link->carService = service;
                link->hasCarService = true;
            } else if (service.uuid16 == SLR_BATTERY_SERVICE_UUID16) {
                link->batteryService = service;
                link->hasBatteryService = true;
            }
            break;
        }

        case GATT_EVENT_CHARACTERISTIC_QUERY_RESULT: {
            TaskLink* link = findLink(gatt_event_characteristic_query_result_get_handle(packet));
            if (link == nullptr) break;

            gatt_client_characteristic_t characteristic;
            gatt_event_characteristic_query_result_get_characteristic(packet, &characteristic);
            switch (characteristic.uuid16) {
                case SLR_COMMAND_CHAR_UUID16:
                    link->chars.commandHandle = characteristic.value_handle;
                    break;
                case SLR_STATUS_CHAR_UUID16:
                    link->statusChar = characteristic;
                    link->hasStatusChar = true;
                    link->chars.statusHandle = characteristic.value_handle;
                    break;
                case SLR_BATTERY_CHAR_UUID16:
                    link->batteryChar = characteristic;
                    link->hasBatteryChar = true;
                    link->chars.batteryHandle = characteristic.value_handle;
                    break;
                default:
                    break;
            }
            break;
        }

        case GATT_EVENT_CHARACTERISTIC_VALUE_QUERY_RESULT: {
            hci_con_handle_t handle = gatt_event_characteristic_value_query_result_get_handle(packet);
            TaskLink* link = findLink(handle);
            if (link == nullptr) break;

            uint16_t valueHandle = gatt_event_characteristic_value_query_result_get_value_handle(packet);
            uint16_t length = gatt_event_characteristic_value_query_result_get_value_length(packet);
            const uint8_t* value = gatt_event_characteristic_value_query_result_get_value(packet);
            if (valueHandle == link->chars.batteryHandle && length >= 1) {
                RadioEvent ev;
                ev.type = EVT_BATTERY;
                ev.connHandle = handle;
                ev.status = value[0];
                postEvent(ev);
            }
            break;
        }

        case GATT_EVENT_NOTIFICATION: {
            hci_con_handle_t handle = gatt_event_notification_get_handle(packet);
            TaskLink* link = findLink(handle);
            if (link == nullptr) break;

            uint16_t valueHandle = gatt_event_notification_get_value_handle(packet);
            uint16_t length = gatt_event_notification_get_value_length(packet);
            const uint8_t* value = gatt_event_notification_get_value(packet);
            if (length == 0) break;

            if (valueHandle == link->chars.batteryHandle) {
                RadioEvent ev;
                ev.type = EVT_BATTERY;
                ev.connHandle = handle;
                ev.status = value[0];
                postEvent(ev);
                break;
            }
            if (valueHandle != link->chars.statusHandle) break;

            RadioEvent ev;
            ev.type = EVT_STATUS;
            ev.connHandle = handle;
            ev.length = length < SLR_STATUS_RAW_MAX ? length : SLR_STATUS_RAW_MAX;
            memcpy(ev.data, value, ev.length);
            postEvent(ev);
            break;
        }

        case GATT_EVENT_QUERY_COMPLETE: {
            TaskLink* link = findLink(gatt_event_query_complete_get_handle(packet));
            if (link == nullptr) break;
            queryComplete(link, gatt_event_query_complete_get_att_status(packet));
            break;
        }

        default:
            break;
    }
}

// ========================== HCI Events ==========================

static void handleAdvertisingReport(uint8_t* packet) {
    if (!s_scanning) return;

    RadioEvent ev;
    ev.type = EVT_ADVERTISEMENT;

    bd_addr_t addr;
    gap_event_advertising_report_get_address(packet, addr);
    memcpy(ev.address.bytes, addr, 6);
    ev.address.type = gap_event_advertising_report_get_address_type(packet);
    ev.rssi = gap_event_advertising_report_get_rssi(packet);

    uint8_t length = gap_event_advertising_report_get_data_length(packet);
    const uint8_t* data = gap_event_advertising_report_get_data(packet);

    ad_context_t context;
    for (ad_iterator_init(&context, length, data); ad_iterator_has_more(&context); ad_iterator_next(&context)) {
        uint8_t dataType = ad_iterator_get_data_type(&context);
        if (dataType != BLUETOOTH_DATA_TYPE_COMPLETE_LOCAL_NAME &&
            dataType != BLUETOOTH_DATA_TYPE_SHORTENED_LOCAL_NAME) {
            continue;
        }
        uint8_t nameLen = ad_iterator_get_data_len(&context);
        if (nameLen > SLR_MAX_NAME_LENGTH - 1) nameLen = SLR_MAX_NAME_LENGTH - 1;
        memcpy(ev.name, ad_iterator_get_data(&context), nameLen);
        ev.name[nameLen] = '\0';
    }

    // Nameless advertisers can never match a car
    if (ev.name[0] == '\0') return;
    postEvent(ev);
}

// Legacy and enhanced (BT 5) completions carry the same fields
static void handleConnectionComplete(uint8_t status, const uint8_t* peer, hci_con_handle_t handle) {
    // Bluepad32's own gamepad links show up here too
    if (!s_connecting) return;

    if (status == ERROR_CODE_SUCCESS) {
        if (!sameAddress(peer, s_connectingAddr.bytes)) return;

        s_connecting = false;

        if (s_connectCancelled) {
            // Cancel lost the race against the controller
            gap_disconnect(handle);
        } else {
            int idx = allocLink(handle);
            if (idx < 0) {
                gap_disconnect(handle);
                postConnectFailed(s_connectingAddr, ERROR_CODE_CONNECTION_LIMIT_EXCEEDED);
            } else {
                RadioEvent ev;
                ev.type = EVT_CONNECTED;
                ev.address = s_connectingAddr;
                ev.connHandle = handle;
                ev.mailbox = (uint8_t)idx;
                postEvent(ev);
            }
        }
    } else {
        // Peer address is not filled in on every failure
        static const uint8_t zero[6] = {0, 0, 0, 0, 0, 0};
        if (!sameAddress(peer, s_connectingAddr.bytes) && !sameAddress(peer, zero)) return;

        s_connecting = false;
        if (!s_connectCancelled) {
            postConnectFailed(s_connectingAddr, status);
        }
    }

    s_connectCancelled = false;
    startNextConnect();
}

static void handleDisconnectionComplete(uint8_t* packet) {
    hci_con_handle_t handle = hci_event_disconnection_complete_get_connection_handle(packet);
    TaskLink* link = findLink(handle);
    if (link == nullptr) return;

    RadioEvent ev;
    ev.type = EVT_DISCONNECTED;
    ev.connHandle = handle;
    ev.status = hci_event_disconnection_complete_get_reason(packet);
    freeLink(link);
    postEvent(ev);
}

// Stack went down: everything in flight is gone
static void handleRadioDown() {
    if (s_scanning) {
        s_scanning = false;
        RadioEvent ev;
        ev.type = EVT_SCAN_STOPPED;
        postEvent(ev);
    }

    if (s_connecting) {
        s_connecting = false;
        if (!s_connectCancelled) {
            postConnectFailed(s_connectingAddr, ERROR_CODE_CONNECTION_TERMINATED_BY_LOCAL_HOST);
        }
        s_connectCancelled = false;
    }
    for (uint8_t i = 0; i < s_pendingCount; i++) {
        postConnectFailed(s_pendingConnects[i], ERROR_CODE_CONNECTION_TERMINATED_BY_LOCAL_HOST);
    }
    s_pendingCount = 0;

    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        if (!s_links[i].inUse) continue;
        RadioEvent ev;
        ev.type = EVT_DISCONNECTED;
        ev.connHandle = s_links[i].handle;
        ev.status = ERROR_CODE_CONNECTION_TERMINATED_BY_LOCAL_HOST;
        freeLink(&s_links[i]);
        postEvent(ev);
    }
}

static void hciHandler(uint8_t packetType, uint16_t channel, uint8_t* packet, uint16_t size) {
    (void)channel;
    (void)size;

    if (packetType != HCI_EVENT_PACKET) return;

    switch (hci_event_packet_get_type(packet)) {
        case BTSTACK_EVENT_STATE: {
            bool working = btstack_event_state_get_state(packet) == HCI_STATE_WORKING;
            bool wasWorking = s_poweredOn.exchange(working);
            if (wasWorking && !working) {
                handleRadioDown();
            }
            break;
        }

        case GAP_EVENT_ADVERTISING_REPORT:
            handleAdvertisingReport(packet);
            break;

        case HCI_EVENT_LE_META: {
            bd_addr_t peer;
            switch (hci_event_le_meta_get_subevent_code(packet)) {
                case HCI_SUBEVENT_LE_CONNECTION_COMPLETE:
                    hci_subevent_le_connection_complete_get_peer_address(packet, peer);
                    handleConnectionComplete(
                        hci_subevent_le_connection_complete_get_status(packet), peer,
                        hci_subevent_le_connection_complete_get_connection_handle(packet));
                    break;
                case HCI_SUBEVENT_LE_ENHANCED_CONNECTION_COMPLETE_V1:
                    hci_subevent_le_enhanced_connection_complete_v1_get_peer_address(packet, peer);
                    handleConnectionComplete(
                        hci_subevent_le_enhanced_connection_complete_v1_get_status(packet), peer,
                        hci_subevent_le_enhanced_connection_complete_v1_get_connection_handle(packet));
                    break;
                default:
                    break;
            }
            break;
        }

        case HCI_EVENT_DISCONNECTION_COMPLETE:
            handleDisconnectionComplete(packet);
            break;

        default:
            break;
    }
}

// ========================== Command Execution ==========================

static void sendFrame(TaskLink* link, OutboundFrame& frame) {
    // Mailbox may still hold a frame for a connection that is gone
    if (frame.connHandle != link->handle) return;

    uint8_t status = gatt_client_write_value_of_characteristic_without_response(
        link->handle, frame.valueHandle, frame.length, frame.data);

    switch (status) {
        case ERROR_CODE_SUCCESS:
            break;
        case GATT_CLIENT_BUSY:
        case BTSTACK_ACL_BUFFERS_FULL:
            // Dropped, the next tick carries a fresher frame
            break;
        default: {
            RadioEvent ev;
            ev.type = EVT_WRITE_FAILED;
            ev.connHandle = link->handle;
            ev.status = status;
            postEvent(ev);
            break;
        }
    }
}

static void executeCommand(const RadioCommand& cmd) {
    switch (cmd.type) {
        case CMD_REGISTER:
            hci_add_event_handler(&s_hciRegistration);
            s_poweredOn = (hci_get_state() == HCI_STATE_WORKING);
            break;

        case CMD_START_SCAN:
            gap_set_scan_parameters(1, 0x0030, 0x0030);  // Active scan, 30ms interval/window
            gap_start_scan();
            s_scanning = true;
            break;

        case CMD_STOP_SCAN:
            if (s_scanning) {
                gap_stop_scan();
                s_scanning = false;
            }
            break;

        case CMD_CONNECT:
            queueConnect(cmd.address);
            break;

        case CMD_CANCEL_CONNECT:
            cancelConnectTo(cmd.address);
            break;

        case CMD_DISCONNECT: {
            TaskLink* link = findLink(cmd.connHandle);
            if (link == nullptr) break;

            // The stop frame written just before must not trail the disconnect
            OutboundFrame frame;
            if (xQueueReceive(s_mailboxes[linkIndex(link)], &frame, 0) == pdTRUE) {
                sendFrame(link, frame);
            }
            gap_disconnect(cmd.connHandle);
            break;
        }

        case CMD_DISCOVER: {
            TaskLink* link = findLink(cmd.connHandle);
            if (link == nullptr) {
                RadioEvent ev;
                ev.type = EVT_CHARACTERISTICS;
                ev.connHandle = cmd.connHandle;
                ev.ok = false;
                postEvent(ev);
                break;
            }
            startDiscovery(link);
            break;
        }

        case CMD_SUBSCRIBE: {
            TaskLink* link = findLink(cmd.connHandle);
            if (link == nullptr) break;
            if (cmd.valueHandle == link->chars.statusHandle) {
                link->subscribeStatusPending = true;
            } else if (cmd.valueHandle == link->chars.batteryHandle) {
                link->subscribeBatteryPending = true;
            } else {
                break;
            }
            runPendingGatt(link);
            break;
        }

        case CMD_READ_BATTERY: {
            TaskLink* link = findLink(cmd.connHandle);
            if (link == nullptr) break;
            link->readPending = true;
            runPendingGatt(link);
            break;
        }

        default:
            break;
    }
}

// Runs on the BTstack task
static void drainCommands(void* context) {
    (void)context;

    // Clear first: anything queued from now on schedules a new drain
    s_drainScheduled = false;

    RadioCommand cmd;
    while (xQueueReceive(s_commandQueue, &cmd, 0) == pdTRUE) {
        executeCommand(cmd);
    }

    OutboundFrame frame;
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        if (!s_links[i].inUse) continue;
        if (xQueueReceive(s_mailboxes[i], &frame, 0) == pdTRUE) {
            sendFrame(&s_links[i], frame);
        }
    }
}

static void scheduleDrain() {
    if (!s_drainScheduled.exchange(true)) {
        btstack_run_loop_execute_on_main_thread(&s_drainRegistration);
    }
}

static bool postCommand(const RadioCommand& cmd) {
    if (s_commandQueue == nullptr) return false;
    if (xQueueSend(s_commandQueue, &cmd, 0) != pdTRUE) {
        return false;
    }
    scheduleDrain();
    return true;
}

// ============================================================================
// Arduino task side
// ============================================================================

BtstackRadio::BtstackRadio() {
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        _mailboxHandles[i] = SLR_INVALID_CONN_HANDLE;
    }
}

bool BtstackRadio::begin() {
    if (_started) return true;

    s_eventQueue = xQueueCreate(SLR_RADIO_EVENT_QUEUE_LEN, sizeof(RadioEvent));
    s_commandQueue = xQueueCreate(SLR_RADIO_COMMAND_QUEUE_LEN, sizeof(RadioCommand));
    if (s_eventQueue == nullptr || s_commandQueue == nullptr) {
        Serial.println("[BLE] Queue allocation failed");
        return false;
    }
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        s_mailboxes[i] = xQueueCreate(1, sizeof(OutboundFrame));
        if (s_mailboxes[i] == nullptr) {
            Serial.println("[BLE] Mailbox allocation failed");
            return false;
        }
    }

    s_hciRegistration.callback = &hciHandler;
    s_drainRegistration.callback = &drainCommands;
    s_drainRegistration.context = nullptr;

    RadioCommand cmd;
    cmd.type = CMD_REGISTER;
    if (!postCommand(cmd)) {
        return false;
    }

    _started = true;
    return true;
}

bool BtstackRadio::isPoweredOn() const {
    return _started && s_poweredOn.load();
}

bool BtstackRadio::startScan() {
    RadioCommand cmd;
    cmd.type = CMD_START_SCAN;
    return postCommand(cmd);
}

void BtstackRadio::stopScan() {
    RadioCommand cmd;
    cmd.type = CMD_STOP_SCAN;
    if (!postCommand(cmd)) {
        Serial.println("[BLE] Command queue full, scan stop lost");
    }
}

bool BtstackRadio::connect(const BleAddress& address) {
    RadioCommand cmd;
    cmd.type = CMD_CONNECT;
    cmd.address = address;
    return postCommand(cmd);
}

void BtstackRadio::cancelConnect(const BleAddress& address) {
    RadioCommand cmd;
    cmd.type = CMD_CANCEL_CONNECT;
    cmd.address = address;
    if (!postCommand(cmd)) {
        Serial.println("[BLE] Command queue full, connect cancel lost");
    }
}

void BtstackRadio::disconnect(uint16_t connHandle) {
    RadioCommand cmd;
    cmd.type = CMD_DISCONNECT;
    cmd.connHandle = connHandle;
    if (!postCommand(cmd)) {
        Serial.println("[BLE] Command queue full, disconnect lost");
    }
}

bool BtstackRadio::discoverCharacteristics(uint16_t connHandle) {
    RadioCommand cmd;
    cmd.type = CMD_DISCOVER;
    cmd.connHandle = connHandle;
    return postCommand(cmd);
}

bool BtstackRadio::enableNotifications(uint16_t connHandle, uint16_t valueHandle) {
    // The BTstack task keeps the full characteristic, the handle selects it
    RadioCommand cmd;
    cmd.type = CMD_SUBSCRIBE;
    cmd.connHandle = connHandle;
    cmd.valueHandle = valueHandle;
    return postCommand(cmd);
}

bool BtstackRadio::readBattery(uint16_t connHandle, uint16_t batteryHandle) {
    (void)batteryHandle;
    RadioCommand cmd;
    cmd.type = CMD_READ_BATTERY;
    cmd.connHandle = connHandle;
    return postCommand(cmd);
}

RadioWriteResult BtstackRadio::writeCommand(uint16_t connHandle, uint16_t valueHandle,
                                            const uint8_t* data, uint16_t length) {
    int idx = mailboxFor(connHandle);
    if (idx < 0 || length > sizeof(CommandFrame)) {
        return RADIO_WRITE_FAILED;
    }

    OutboundFrame frame;
    frame.connHandle = connHandle;
    frame.valueHandle = valueHandle;
    frame.length = length;
    memcpy(frame.data, data, length);

    // Previous frame still waiting means the BTstack task is behind
    bool superseded = uxQueueMessagesWaiting(s_mailboxes[idx]) > 0;
    xQueueOverwrite(s_mailboxes[idx], &frame);
    scheduleDrain();

    return superseded ? RADIO_WRITE_BUSY : RADIO_WRITE_OK;
}

void BtstackRadio::poll() {
    if (!_started) return;

    RadioEvent ev;
    while (xQueueReceive(s_eventQueue, &ev, 0) == pdTRUE) {
        // Keep the mailbox map in step before anyone writes
        if (ev.type == EVT_CONNECTED && ev.mailbox < SLR_MAX_SLOTS) {
            _mailboxHandles[ev.mailbox] = ev.connHandle;
        } else if (ev.type == EVT_DISCONNECTED) {
            int idx = mailboxFor(ev.connHandle);
            if (idx >= 0) _mailboxHandles[idx] = SLR_INVALID_CONN_HANDLE;
        }

        if (_listener == nullptr) continue;

        switch (ev.type) {
            case EVT_ADVERTISEMENT:
                _listener->onAdvertisement(ev.address, ev.name, ev.rssi);
                break;
            case EVT_SCAN_STOPPED:
                _listener->onScanStopped();
                break;
            case EVT_CONNECTED:
                _listener->onConnected(ev.address, ev.connHandle);
                break;
            case EVT_CONNECT_FAILED:
                _listener->onConnectFailed(ev.address, ev.status);
                break;
            case EVT_CHARACTERISTICS:
                _listener->onCharacteristicsDiscovered(ev.connHandle, ev.ok, ev.chars);
                break;
            case EVT_DISCONNECTED:
                _listener->onDisconnected(ev.connHandle, ev.status);
                break;
            case EVT_WRITE_FAILED:
                _listener->onWriteFailed(ev.connHandle, ev.status);
                break;
            case EVT_BATTERY:
                _listener->onBatteryLevel(ev.connHandle, ev.status);
                break;
            case EVT_STATUS:
                _listener->onStatusNotification(ev.connHandle, ev.data, ev.length);
                break;
            default:
                break;
        }
    }

    unsigned long dropped = s_droppedEvents.load();
    if (dropped != _reportedDrops) {
        Serial.printf("[BLE] Event queue full, %lu events dropped\n", dropped - _reportedDrops);
        _reportedDrops = dropped;
    }
}

unsigned long BtstackRadio::getDroppedEvents() const {
    return s_droppedEvents.load();
}

int BtstackRadio::mailboxFor(uint16_t connHandle) const {
    if (connHandle == SLR_INVALID_CONN_HANDLE) return -1;
    for (int i = 0; i < SLR_MAX_SLOTS; i++) {
        if (_mailboxHandles[i] == connHandle) return i;
    }
    return -1;
}
