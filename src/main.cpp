#include <Arduino.h>
#include <NimBLEDevice.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "Config.h"
#include "EventCodec.h"
#include "GatewayController.h"
#include "NimBleTransport.h"
#include "PassiveListener.h"
#include "system/Log.h"
#include "proto/gateway.pb.h"

#include <esp_task_wdt.h>
#include <esp_timer.h>

using silverbp::AdvertisementContext;
using silverbp::GatewayConfig;
using silverbp::GatewayController;
using silverbp::NimBleTransport;
using silverbp::system::LogRecord;
using silverbp::system::Logger;

static NimBLEServer* g_server = nullptr;
static NimBLECharacteristic* g_tx = nullptr;
static NimBLECharacteristic* g_infoChar = nullptr;
static NimBLECharacteristic* g_commandChar = nullptr;
static std::unique_ptr<NimBleTransport> g_transport;
static std::unique_ptr<GatewayController> g_controller;
static constexpr const char* kFirmwareVersion = "0.1.0";
static bool g_clientConnected = false;
static uint64_t g_lastConnectionTime = 0;

// Scan results and GATT writes arrive on the NimBLE host task; loop() consumes them.
struct PendingAdvertisement {
    AdvertisementContext context;
    NimBLEAddress address;
};
static std::mutex g_pendingMutex;
static std::deque<PendingAdvertisement> g_pendingAdvertisements;
static std::deque<silverbp_gateway_GatewayCommand> g_pendingCommands;
static constexpr size_t kMaxPendingAdvertisements = 8;
static constexpr size_t kMaxPendingCommands = 4;

static uint32_t g_advertisementsSeen = 0;
static uint32_t g_advertisementsDropped = 0;

static void serialLogSink(const LogRecord& record) {
    Serial.printf("[%s] %s %s\n", record.tag.c_str(), silverbp::system::logLevelLabel(record.level),
                  record.message.c_str());
}

static Logger g_log(serialLogSink, "MAIN");

// 64-bit microsecond timer; unlike millis() it does not wrap after 49.7 days.
static uint64_t monotonicMs() {
    return static_cast<uint64_t>(esp_timer_get_time()) / 1000ULL;
}

static void logPacket(size_t len) {
    Serial.print("-> [");
    Serial.print(len);
    Serial.println(" bytes]");
}

static const char* sensorKindLabel(silverbp_gateway_SensorKind kind) {
    switch (kind) {
        case silverbp_gateway_SensorKind_SENSOR_KIND_SYSTOLIC: return "systolic";
        case silverbp_gateway_SensorKind_SENSOR_KIND_DIASTOLIC: return "diastolic";
        case silverbp_gateway_SensorKind_SENSOR_KIND_PULSE: return "pulse";
        case silverbp_gateway_SensorKind_SENSOR_KIND_SIGNAL_STRENGTH: return "signal_strength";
        case silverbp_gateway_SensorKind_SENSOR_KIND_TIMESTAMP: return "timestamp";
        default: return "unknown";
    }
}

static void logEventSummary(const silverbp_gateway_DeviceEvent& event) {
    Serial.print("[BLE] notify event=");
    Serial.print(silverbp::deviceEventLabel(event.which_event));
    Serial.print(" ts=");
    Serial.println(static_cast<unsigned long>(event.timestamp_ms));

    switch (event.which_event) {
        case silverbp_gateway_DeviceEvent_status_tag:
            Serial.print("  status=");
            Serial.println(event.event.status.status_label);
            break;
        case silverbp_gateway_DeviceEvent_boot_tag:
            Serial.print("  fw=");
            Serial.println(event.event.boot.firmware_version);
            break;
        case silverbp_gateway_DeviceEvent_reading_tag: {
            const auto& reading = event.event.reading;
            Serial.print("  address=");
            Serial.print(reading.address);
            Serial.print(" measurement=");
            Serial.print(reading.measurement_received ? "true" : "false");
            Serial.print(" errors=");
            Serial.println(reading.errors_count);
            for (pb_size_t i = 0; i < reading.readings_count; ++i) {
                const auto& r = reading.readings[i];
                Serial.print("  ");
                Serial.print(sensorKindLabel(r.kind));
                Serial.print("=");
                if (r.which_value == silverbp_gateway_SensorReading_timestamp_value_tag) {
                    const auto& t = r.value.timestamp_value;
                    Serial.printf("%04lu-%02lu-%02lu %02lu:%02lu\n",
                                  static_cast<unsigned long>(t.year), static_cast<unsigned long>(t.month),
                                  static_cast<unsigned long>(t.day), static_cast<unsigned long>(t.hour),
                                  static_cast<unsigned long>(t.minute));
                } else {
                    Serial.print(static_cast<long>(r.value.int_value));
                    Serial.print(" ");
                    Serial.println(r.unit);
                }
            }
            break;
        }
        default:
            break;
    }
}

static bool sendEvent(const silverbp_gateway_DeviceEvent& event) {
    if (!g_tx) {
        static bool warnedMissingTx = false;
        if (!warnedMissingTx) {
            Serial.println("[BLE] TX characteristic not ready");
            warnedMissingTx = true;
        }
        return false;
    }

    if (!g_clientConnected) {
        static uint32_t lastSkipLogMs = 0;
        uint32_t nowMs = millis();
        if (nowMs - lastSkipLogMs > 1000) {
            Serial.println("[BLE] skip notify (no client connected)");
            lastSkipLogMs = nowMs;
        }
        return false;
    }

    silverbp::FrameBuffer buffer{};
    size_t totalLen = 0;
    std::string error;
    if (!silverbp::encodeEvent(event, buffer, totalLen, &error)) {
        Serial.print("encode error: ");
        Serial.println(error.c_str());
        return false;
    }

    g_tx->setValue(buffer.data(), totalLen);
    if (!g_tx->notify()) {
        Serial.println("notify failed (client may have disconnected)");
        return false;
    }

    logPacket(totalLen);
    logEventSummary(event);
    return true;
}

static std::string buildInfoString() {
    std::string info = "name=";
    info += GATEWAY_NAME;
    info.push_back('\n');
    info += "fw=";
    info += kFirmwareVersion;
    info.push_back('\n');
    if (g_controller) {
        char intervalBuffer[16] = {0};
        std::snprintf(intervalBuffer, sizeof(intervalBuffer), "%lu",
                      static_cast<unsigned long>(g_controller->pollIntervalMs()));
        info += "interval_ms=";
        info += intervalBuffer;
        info.push_back('\n');
        const std::string target = g_controller->targetAddress();
        info += "target=";
        info += target.empty() ? "any" : target;
        info.push_back('\n');
        info += "sessions=";
        info += std::to_string(g_controller->sessionsRun());
    }
    return info;
}

class RxCallback : public NimBLECharacteristicCallbacks {
    void onWrite(NimBLECharacteristic* characteristic, NimBLEConnInfo& connInfo) override {
        std::string val = characteristic->getValue();

        silverbp_gateway_GatewayCommand cmd = silverbp_gateway_GatewayCommand_init_default;
        std::string error;
        if (!silverbp::decodeCommandFrame(reinterpret_cast<const uint8_t*>(val.data()), val.size(), cmd, &error)) {
            Serial.print("<- ");
            Serial.println(error.c_str());
            return;
        }

        std::lock_guard<std::mutex> lock(g_pendingMutex);
        if (g_pendingCommands.size() >= kMaxPendingCommands) {
            Serial.println("<- command queue full, dropping");
            return;
        }
        g_pendingCommands.push_back(cmd);
    }
};

class InfoCallback : public NimBLECharacteristicCallbacks {
    void onRead(NimBLECharacteristic* characteristic, NimBLEConnInfo&) override {
        characteristic->setValue(buildInfoString());
    }
};

class ServerCallback : public NimBLEServerCallbacks {
    void onConnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo) override {
        g_clientConnected = true;
        g_lastConnectionTime = monotonicMs();

        Serial.println("=== BLE CLIENT CONNECTED ===");
        Serial.print("Client address: ");
        Serial.println(connInfo.getAddress().toString().c_str());
    }

    void onDisconnect(NimBLEServer* pServer, NimBLEConnInfo& connInfo, int reason) override {
        g_clientConnected = false;
        uint64_t disconnectTime = monotonicMs();

        Serial.println("=== BLE CLIENT DISCONNECTED ===");
        Serial.print("Connection duration: ");
        Serial.print((disconnectTime - g_lastConnectionTime) / 1000);
        Serial.println(" seconds");
        Serial.print("Reason code: 0x");
        Serial.println(reason, HEX);

        if (!NimBLEDevice::startAdvertising()) {
            Serial.println("Advertising restart FAILED - retrying");
            NimBLEDevice::startAdvertising();
        }
    }
};

class ScanCallback : public NimBLEScanCallbacks {
    void onResult(const NimBLEAdvertisedDevice* device) override {
        ++g_advertisementsSeen;

        AdvertisementContext ctx;
        ctx.address = device->getAddress().toString();
        ctx.name = device->haveName() ? device->getName() : std::string();
        ctx.rssi = device->getRSSI();
        ctx.observedMs = monotonicMs();

        if (!g_controller || !g_controller->accepts(ctx)) {
            return;
        }

        std::lock_guard<std::mutex> lock(g_pendingMutex);
        // Keep only the newest advertisement per address.
        auto existing = std::find_if(g_pendingAdvertisements.begin(), g_pendingAdvertisements.end(),
                                     [&ctx](const PendingAdvertisement& p) { return p.context.address == ctx.address; });
        if (existing != g_pendingAdvertisements.end()) {
            existing->context = ctx;
            return;
        }
        if (g_pendingAdvertisements.size() >= kMaxPendingAdvertisements) {
            ++g_advertisementsDropped;
            return;
        }
        g_pendingAdvertisements.push_back(PendingAdvertisement{ctx, device->getAddress()});
    }

    void onScanEnd(const NimBLEScanResults&, int reason) override {
        Serial.print("[SCAN] ended reason=");
        Serial.println(reason);
    }
};

static void setupController() {
    GatewayConfig cfg;
    cfg.pollIntervalMs = BP_POLL_INTERVAL_MS;
    cfg.notificationTimeoutMs = BP_NOTIFICATION_TIMEOUT_MS;
    cfg.characteristicId = BP_CHARACTERISTIC_UUID;
    cfg.namePrefix = BP_CUFF_NAME_PREFIX;

    g_transport = std::make_unique<NimBleTransport>(Logger(serialLogSink, "BLE"));
    g_controller = std::make_unique<GatewayController>(cfg, *g_transport, serialLogSink,
                                                       [](const silverbp_gateway_DeviceEvent& evt) { sendEvent(evt); });
}

static void startScan() {
    NimBLEScan* scan = NimBLEDevice::getScan();
    if (scan->isScanning()) {
        return;
    }
    if (!scan->start(0, false, true)) {
        g_log.error("Scan start failed");
    }
}

static void setupBLE() {
    Serial.println("=== BLE INITIALIZATION ===");
    Serial.print("Device name: ");
    Serial.println(GATEWAY_NAME);

    NimBLEDevice::init(GATEWAY_NAME);
    NimBLEDevice::setPower(ESP_PWR_LVL_P3);
    NimBLEDevice::setMTU(247);

    g_server = NimBLEDevice::createServer();
    g_server->setCallbacks(new ServerCallback());
    NimBLEService* service = g_server->createService(SERVICE_UUID);

    g_commandChar = service->createCharacteristic(CHAR_RX_UUID,
        NIMBLE_PROPERTY::WRITE | NIMBLE_PROPERTY::WRITE_NR);
    g_commandChar->setCallbacks(new RxCallback());

    g_tx = service->createCharacteristic(CHAR_TX_UUID,
        NIMBLE_PROPERTY::NOTIFY | NIMBLE_PROPERTY::READ);

    g_infoChar = service->createCharacteristic(CHAR_INFO_UUID, NIMBLE_PROPERTY::READ);
    g_infoChar->setCallbacks(new InfoCallback());

    service->start();
    g_infoChar->setValue(buildInfoString());

    Serial.println("BLE Service created:");
    Serial.print("  - Service UUID: ");
    Serial.println(SERVICE_UUID);
    Serial.print("    * Command RX: ");
    Serial.println(CHAR_RX_UUID);
    Serial.print("    * Event TX: ");
    Serial.println(CHAR_TX_UUID);
    Serial.print("    * Info: ");
    Serial.println(CHAR_INFO_UUID);

    NimBLEAdvertising* adv = NimBLEDevice::getAdvertising();
    NimBLEAdvertisementData advData;
    advData.setName(GATEWAY_NAME);
    advData.addServiceUUID(SERVICE_UUID);
    adv->setAdvertisementData(advData);
    adv->setMinInterval(160);
    adv->setMaxInterval(320);

    if (!NimBLEDevice::startAdvertising()) {
        Serial.println("ERROR: Failed to start advertising!");
    } else {
        Serial.println("=== BLE ADVERTISING STARTED ===");
    }

    NimBLEScan* scan = NimBLEDevice::getScan();
    scan->setScanCallbacks(new ScanCallback(), true);
    scan->setActiveScan(true);
    scan->setInterval(BP_SCAN_INTERVAL);
    scan->setWindow(BP_SCAN_WINDOW);
    startScan();

    Serial.print("Scanning for cuff, prefix=");
    Serial.println(BP_CUFF_NAME_PREFIX);
}

static void processPendingCommands(uint64_t now) {
    while (true) {
        silverbp_gateway_GatewayCommand cmd = silverbp_gateway_GatewayCommand_init_default;
        {
            std::lock_guard<std::mutex> lock(g_pendingMutex);
            if (g_pendingCommands.empty()) {
                return;
            }
            cmd = g_pendingCommands.front();
            g_pendingCommands.pop_front();
        }
        Serial.print("<- command tag=");
        Serial.println(static_cast<unsigned>(cmd.which_command));
        g_controller->handleCommand(cmd, now);
        if (g_infoChar) {
            g_infoChar->setValue(buildInfoString());
        }
    }
}

static void processPendingAdvertisement() {
    PendingAdvertisement next;
    {
        std::lock_guard<std::mutex> lock(g_pendingMutex);
        if (g_pendingAdvertisements.empty()) {
            return;
        }
        next = g_pendingAdvertisements.front();
        g_pendingAdvertisements.pop_front();
    }

    g_transport->noteAdvertised(next.address);
    esp_task_wdt_reset();
    const bool polled = g_controller->handleAdvertisement(next.context, monotonicMs());
    esp_task_wdt_reset();

    if (polled) {
        // The transport stops scanning to connect.
        startScan();
    }
}

void setup() {
    Serial.begin(115200);
    delay(100);
    Serial.println();
    Serial.println("========================================");
    Serial.println("    SilverBP Gateway - Booting");
    Serial.println("========================================");
    Serial.print("Firmware version: ");
    Serial.println(kFirmwareVersion);
    Serial.print("Free heap: ");
    Serial.print(ESP.getFreeHeap());
    Serial.println(" bytes");
    Serial.println();

    // A full session is connect timeout + notification timeout; 30 s covers both.
    Serial.println("Initializing watchdog timer (30s timeout)...");
    esp_task_wdt_init(30, true);
    esp_task_wdt_add(NULL);

    setupController();
    setupBLE();

    uint64_t now = monotonicMs();
    g_controller->sendBoot(kFirmwareVersion, now);

    Serial.println();
    Serial.println("[BOOT] --------------------------------");
    Serial.println("[BOOT] System ready");
    Serial.print("[BOOT] poll_interval_ms=");
    Serial.println(static_cast<unsigned long>(g_controller->pollIntervalMs()));
    Serial.print("[BOOT] target=");
    const std::string target = g_controller->targetAddress();
    Serial.println(target.empty() ? "any" : target.c_str());
    Serial.println("[BOOT] --------------------------------");
    Serial.println();

    esp_task_wdt_reset();
}

void loop() {
    uint64_t now = monotonicMs();

    processPendingCommands(now);
    processPendingAdvertisement();

    static uint64_t lastHeartbeat = 0;
    if (now - lastHeartbeat > 10000) {
        Serial.println("[STATUS] --------------------------------");
        Serial.print("[STATUS] Uptime_s=");
        Serial.println(static_cast<unsigned long>(now / 1000));
        Serial.print("[STATUS] ble_client_connected=");
        Serial.println(g_clientConnected ? "true" : "false");
        Serial.print("[STATUS] scanning=");
        Serial.println(NimBLEDevice::getScan()->isScanning() ? "true" : "false");
        Serial.print("[STATUS] adverts_seen=");
        Serial.println(g_advertisementsSeen);
        Serial.print("[STATUS] adverts_dropped=");
        Serial.println(g_advertisementsDropped);
        Serial.print("[STATUS] sessions=");
        Serial.println(g_controller->sessionsRun());
        Serial.print("[STATUS] free_heap=");
        Serial.println(ESP.getFreeHeap());
        Serial.println("[STATUS] --------------------------------");
        lastHeartbeat = now;
        startScan();
    }

    static uint64_t lastWdtReset = 0;
    if (now - lastWdtReset > 5000) {
        esp_task_wdt_reset();
        lastWdtReset = now;
    }

    delay(5);
}
