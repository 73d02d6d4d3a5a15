#include <unity.h>

#include "EventCodec.h"
#include "FakeTransport.h"
#include "GatewayController.h"
#include "PersistentConfig.h"
#include "proto/gateway.pb.h"

#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

extern "C" void setUp(void) {
    silverbp::clearPersistentSettings();
}
extern "C" void tearDown(void) {}

using silverbp::AdvertisementContext;
using silverbp::GatewayConfig;
using silverbp::GatewayController;
using silverbp::system::LogRecord;
using silverbp::test::FakeTransport;
using silverbp::test::samplePayload;

namespace {
struct Sink {
    std::vector<silverbp_gateway_DeviceEvent> events;
    void operator()(const silverbp_gateway_DeviceEvent& evt) {
        events.push_back(evt);
    }
    void clear() { events.clear(); }

    std::vector<std::string> statuses() const {
        std::vector<std::string> out;
        for (const auto& evt : events) {
            if (evt.which_event == silverbp_gateway_DeviceEvent_status_tag) {
                out.emplace_back(evt.event.status.status_label);
            }
        }
        return out;
    }

    bool sawStatus(const char* label) const {
        for (const auto& s : statuses()) {
            if (s == label) {
                return true;
            }
        }
        return false;
    }

    const silverbp_gateway_ReadingEvent* lastReading() const {
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            if (it->which_event == silverbp_gateway_DeviceEvent_reading_tag) {
                return &it->event.reading;
            }
        }
        return nullptr;
    }
};

std::vector<LogRecord> g_logs;

void captureLog(const LogRecord& record) {
    g_logs.push_back(record);
}

GatewayConfig testConfig() {
    GatewayConfig cfg;
    cfg.pollIntervalMs = 60000;
    cfg.notificationTimeoutMs = 50;
    cfg.utcOffsetSeconds = 0;
    cfg.namePrefix = "BPM";
    return cfg;
}

AdvertisementContext cuffAdvert(const char* address = "aa:bb:cc:dd:ee:ff", const char* name = "BPM-SC") {
    AdvertisementContext ctx;
    ctx.address = address;
    ctx.name = name;
    ctx.rssi = -60;
    ctx.observedMs = 0;
    return ctx;
}
}  // namespace

static void test_first_advertisement_polls_and_publishes() {
    Sink sink;
    FakeTransport transport;
    transport.delivery = FakeTransport::Delivery::Inline;
    transport.payload = samplePayload();

    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 1000));
    TEST_ASSERT_EQUAL_INT(1, transport.connectCalls);
    TEST_ASSERT_EQUAL_STRING("aa:bb:cc:dd:ee:ff", transport.lastAddress.c_str());
    TEST_ASSERT_EQUAL_UINT32(1, controller.sessionsRun());

    auto statuses = sink.statuses();
    TEST_ASSERT_EQUAL_UINT(2, statuses.size());
    TEST_ASSERT_EQUAL_STRING("polling", statuses[0].c_str());
    TEST_ASSERT_EQUAL_STRING("pollComplete", statuses[1].c_str());

    const auto* reading = sink.lastReading();
    TEST_ASSERT_NOT_NULL(reading);
    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:FF", reading->address);
    TEST_ASSERT_EQUAL_STRING("BPM-SC EEFF", reading->device_name);
    TEST_ASSERT_EQUAL_STRING("Silvercrest", reading->manufacturer);
    TEST_ASSERT_EQUAL_STRING("Blood Pressure Measurement", reading->model);
    TEST_ASSERT_TRUE(reading->measurement_received);
    TEST_ASSERT_EQUAL_UINT(0, reading->errors_count);
    TEST_ASSERT_EQUAL_UINT(5, reading->readings_count);

    TEST_ASSERT_EQUAL_INT(silverbp_gateway_SensorKind_SENSOR_KIND_SIGNAL_STRENGTH, reading->readings[0].kind);
    TEST_ASSERT_EQUAL_INT32(-60, reading->readings[0].value.int_value);
    TEST_ASSERT_EQUAL_STRING("dBm", reading->readings[0].unit);

    TEST_ASSERT_EQUAL_INT(silverbp_gateway_SensorKind_SENSOR_KIND_TIMESTAMP, reading->readings[1].kind);
    TEST_ASSERT_EQUAL_UINT(silverbp_gateway_SensorReading_timestamp_value_tag, reading->readings[1].which_value);
    TEST_ASSERT_EQUAL_UINT32(2024, reading->readings[1].value.timestamp_value.year);
    TEST_ASSERT_EQUAL_UINT32(15, reading->readings[1].value.timestamp_value.day);

    TEST_ASSERT_EQUAL_INT(silverbp_gateway_SensorKind_SENSOR_KIND_SYSTOLIC, reading->readings[2].kind);
    TEST_ASSERT_EQUAL_INT32(120, reading->readings[2].value.int_value);
    TEST_ASSERT_EQUAL_STRING("mmHg", reading->readings[2].unit);
    TEST_ASSERT_EQUAL_INT32(80, reading->readings[3].value.int_value);
    TEST_ASSERT_EQUAL_INT32(72, reading->readings[4].value.int_value);

    auto lastPoll = controller.lastPollMs("AA:BB:CC:DD:EE:FF");
    TEST_ASSERT_TRUE(lastPoll.has_value());
    TEST_ASSERT_EQUAL_UINT32(1000, static_cast<uint32_t>(*lastPoll));
}

static void test_poll_interval_gates_sessions() {
    Sink sink;
    FakeTransport transport;
    transport.delivery = FakeTransport::Delivery::Inline;
    transport.payload = samplePayload();

    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 1000));
    TEST_ASSERT_FALSE(controller.handleAdvertisement(cuffAdvert(), 30000));
    TEST_ASSERT_FALSE(controller.handleAdvertisement(cuffAdvert(), 61000));
    TEST_ASSERT_EQUAL_INT(1, transport.connectCalls);

    // Skipped advertisements still refresh metadata.
    AdvertisementContext renamed = cuffAdvert("aa:bb:cc:dd:ee:ff", "BPM-NEW");
    TEST_ASSERT_FALSE(controller.handleAdvertisement(renamed, 61000));
    auto device = controller.device("AA:BB:CC:DD:EE:FF");
    TEST_ASSERT_TRUE(device.has_value());
    TEST_ASSERT_EQUAL_STRING("BPM-NEW EEFF", device->name.c_str());

    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 61001));
    TEST_ASSERT_EQUAL_INT(2, transport.connectCalls);
}

static void test_timeout_publishes_metadata_only_reading() {
    Sink sink;
    FakeTransport transport;

    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 5000));

    const auto* reading = sink.lastReading();
    TEST_ASSERT_NOT_NULL(reading);
    TEST_ASSERT_FALSE(reading->measurement_received);
    TEST_ASSERT_EQUAL_UINT(1, reading->readings_count);
    TEST_ASSERT_EQUAL_INT(silverbp_gateway_SensorKind_SENSOR_KIND_SIGNAL_STRENGTH, reading->readings[0].kind);
    TEST_ASSERT_EQUAL_UINT(1, reading->errors_count);
    TEST_ASSERT_EQUAL_INT(silverbp_gateway_SessionErrorKind_SESSION_ERROR_NOTIFICATION_TIMEOUT, reading->errors[0]);
    TEST_ASSERT_EQUAL_INT(1, transport.disconnectCalls);

    // A failed poll still counts toward the interval.
    TEST_ASSERT_FALSE(controller.handleAdvertisement(cuffAdvert(), 6000));
}

static void test_advertisement_during_session_does_not_start_another() {
    Sink sink;
    FakeTransport transport;
    transport.delivery = FakeTransport::Delivery::Inline;
    transport.payload = samplePayload();

    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    bool reentrantResult = true;
    bool activeDuringSession = false;
    transport.onSubscribe = [&]() {
        activeDuringSession = controller.sessionActive("AA:BB:CC:DD:EE:FF");
        reentrantResult = controller.handleAdvertisement(cuffAdvert(), 2000000);
    };

    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 1000));
    TEST_ASSERT_TRUE(activeDuringSession);
    TEST_ASSERT_FALSE(reentrantResult);
    TEST_ASSERT_EQUAL_INT(1, transport.connectCalls);
    TEST_ASSERT_FALSE(controller.sessionActive("AA:BB:CC:DD:EE:FF"));
}

static void test_name_prefix_and_target_filtering() {
    Sink sink;
    FakeTransport transport;
    transport.delivery = FakeTransport::Delivery::Inline;
    transport.payload = samplePayload();

    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    TEST_ASSERT_FALSE(controller.accepts(cuffAdvert("aa:bb:cc:dd:ee:ff", "Thermometer")));
    TEST_ASSERT_FALSE(controller.handleAdvertisement(cuffAdvert("aa:bb:cc:dd:ee:ff", "Thermometer"), 1000));
    TEST_ASSERT_EQUAL_INT(0, transport.connectCalls);
    TEST_ASSERT_FALSE(controller.device("aa:bb:cc:dd:ee:ff").has_value());

    controller.setTargetAddress("11-22-33-44-55-66", 1000);
    TEST_ASSERT_EQUAL_STRING("11:22:33:44:55:66", controller.targetAddress().c_str());
    TEST_ASSERT_TRUE(sink.sawStatus("targetUpdated"));

    TEST_ASSERT_FALSE(controller.accepts(cuffAdvert("aa:bb:cc:dd:ee:ff", "BPM-SC")));
    TEST_ASSERT_TRUE(controller.accepts(cuffAdvert("11:22:33:44:55:66", "unnamed")));
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert("11:22:33:44:55:66", ""), 2000));
    TEST_ASSERT_EQUAL_INT(1, transport.connectCalls);
}

static void test_empty_prefix_accepts_everyone() {
    FakeTransport transport;
    GatewayConfig cfg = testConfig();
    cfg.namePrefix = "";
    GatewayController controller(cfg, transport, captureLog, nullptr);
    TEST_ASSERT_TRUE(controller.accepts(cuffAdvert("aa:bb:cc:dd:ee:ff", "Anything")));
}

static void test_poll_interval_validation_and_persistence() {
    Sink sink;
    FakeTransport transport;
    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    TEST_ASSERT_FALSE(controller.setPollInterval(1000, 0));
    TEST_ASSERT_FALSE(controller.setPollInterval(BP_POLL_INTERVAL_MAX_MS + 1, 0));
    TEST_ASSERT_EQUAL_UINT32(60000, controller.pollIntervalMs());
    TEST_ASSERT_FALSE(sink.sawStatus("intervalUpdated"));

    TEST_ASSERT_TRUE(controller.setPollInterval(10000, 0));
    TEST_ASSERT_EQUAL_UINT32(10000, controller.pollIntervalMs());
    TEST_ASSERT_TRUE(sink.sawStatus("intervalUpdated"));

    GatewayController reloaded(testConfig(), transport, captureLog, nullptr);
    TEST_ASSERT_EQUAL_UINT32(10000, reloaded.pollIntervalMs());
}

static void test_interval_change_applies_to_known_devices() {
    FakeTransport transport;
    transport.delivery = FakeTransport::Delivery::Inline;
    transport.payload = samplePayload();
    GatewayController controller(testConfig(), transport, captureLog, nullptr);

    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 1000));
    TEST_ASSERT_TRUE(controller.setPollInterval(5000, 1000));
    TEST_ASSERT_FALSE(controller.handleAdvertisement(cuffAdvert(), 6000));
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 6001));
}

static void test_request_poll_overrides_interval() {
    Sink sink;
    FakeTransport transport;
    transport.delivery = FakeTransport::Delivery::Inline;
    transport.payload = samplePayload();
    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 1000));
    TEST_ASSERT_FALSE(controller.handleAdvertisement(cuffAdvert(), 2000));

    controller.requestPoll("aa-bb-cc-dd-ee-ff", 2500);
    TEST_ASSERT_TRUE(sink.sawStatus("pollRequested"));
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 3000));
    // The request is consumed by that poll.
    TEST_ASSERT_FALSE(controller.handleAdvertisement(cuffAdvert(), 4000));

    // No address and no target: every known cuff is flagged.
    controller.requestPoll("", 4500);
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 5000));
    TEST_ASSERT_EQUAL_INT(3, transport.connectCalls);
}

static void test_command_frames_drive_controller() {
    Sink sink;
    FakeTransport transport;
    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    silverbp_gateway_GatewayCommand cmd = silverbp_gateway_GatewayCommand_init_default;
    cmd.which_command = silverbp_gateway_GatewayCommand_set_poll_interval_tag;
    cmd.command.set_poll_interval.interval_ms = 20000;

    silverbp::FrameBuffer frame{};
    size_t frameLen = 0;
    TEST_ASSERT_TRUE(silverbp::encodeWithLength(silverbp_gateway_GatewayCommand_fields, &cmd, frame, frameLen));
    TEST_ASSERT_EQUAL_UINT(frameLen - silverbp::kLengthPrefixBytes, frame[0] | (frame[1] << 8));

    silverbp_gateway_GatewayCommand decoded = silverbp_gateway_GatewayCommand_init_default;
    std::string error;
    TEST_ASSERT_TRUE(silverbp::decodeCommandFrame(frame.data(), frameLen, decoded, &error));
    controller.handleCommand(decoded, 100);
    TEST_ASSERT_EQUAL_UINT32(20000, controller.pollIntervalMs());

    TEST_ASSERT_FALSE(silverbp::decodeCommandFrame(frame.data(), frameLen - 1, decoded, &error));
    TEST_ASSERT_EQUAL_STRING("length mismatch", error.c_str());
    TEST_ASSERT_FALSE(silverbp::decodeCommandFrame(frame.data(), 1, decoded, &error));
    TEST_ASSERT_EQUAL_STRING("command too short", error.c_str());

    silverbp_gateway_GatewayCommand target = silverbp_gateway_GatewayCommand_init_default;
    target.which_command = silverbp_gateway_GatewayCommand_set_target_address_tag;
    std::strncpy(target.command.set_target_address.address, "aa:bb:cc:dd:ee:ff",
                 sizeof(target.command.set_target_address.address) - 1);
    TEST_ASSERT_TRUE(silverbp::encodeWithLength(silverbp_gateway_GatewayCommand_fields, &target, frame, frameLen));
    TEST_ASSERT_TRUE(silverbp::decodeCommandFrame(frame.data(), frameLen, decoded, &error));
    controller.handleCommand(decoded, 200);
    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:FF", controller.targetAddress().c_str());
}

static void test_factory_reset_requires_confirmation() {
    Sink sink;
    FakeTransport transport;
    transport.delivery = FakeTransport::Delivery::Inline;
    transport.payload = samplePayload();
    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    TEST_ASSERT_TRUE(controller.setPollInterval(30000, 0));
    controller.setTargetAddress("aa:bb:cc:dd:ee:ff", 0);
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 1000));

    silverbp_gateway_GatewayCommand cmd = silverbp_gateway_GatewayCommand_init_default;
    cmd.which_command = silverbp_gateway_GatewayCommand_factory_reset_tag;
    cmd.command.factory_reset.confirm = false;
    controller.handleCommand(cmd, 2000);
    TEST_ASSERT_TRUE(sink.sawStatus("factoryResetCancel"));
    TEST_ASSERT_EQUAL_UINT32(30000, controller.pollIntervalMs());

    cmd.command.factory_reset.confirm = true;
    controller.handleCommand(cmd, 3000);
    TEST_ASSERT_TRUE(sink.sawStatus("settingsCleared"));
    TEST_ASSERT_EQUAL_UINT32(60000, controller.pollIntervalMs());
    TEST_ASSERT_EQUAL_STRING("", controller.targetAddress().c_str());
    TEST_ASSERT_FALSE(controller.device("AA:BB:CC:DD:EE:FF").has_value());
    TEST_ASSERT_FALSE(controller.lastOutcome().has_value());

    silverbp::PersistentSettings stored;
    TEST_ASSERT_FALSE(silverbp::loadPersistentSettings(stored));

    // Forgotten devices poll again on their next advertisement.
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(), 3500));
}

static void test_boot_event_reports_settings() {
    Sink sink;
    FakeTransport transport;
    GatewayController controller(testConfig(), transport, captureLog, [&](const silverbp_gateway_DeviceEvent& evt) { sink(evt); });

    controller.sendBoot("0.1.0", 42);
    TEST_ASSERT_EQUAL_UINT(1, sink.events.size());
    const auto& evt = sink.events[0];
    TEST_ASSERT_EQUAL_UINT(silverbp_gateway_DeviceEvent_boot_tag, evt.which_event);
    TEST_ASSERT_EQUAL_STRING("0.1.0", evt.event.boot.firmware_version);
    TEST_ASSERT_EQUAL_UINT32(60000, evt.event.boot.poll_interval_ms);
    TEST_ASSERT_EQUAL_UINT32(42, static_cast<uint32_t>(evt.timestamp_ms));

    silverbp::FrameBuffer frame{};
    size_t frameLen = 0;
    TEST_ASSERT_TRUE(silverbp::encodeEvent(evt, frame, frameLen));
    TEST_ASSERT_GREATER_THAN_UINT32(silverbp::kLengthPrefixBytes, frameLen);
    TEST_ASSERT_EQUAL_STRING("boot", silverbp::deviceEventLabel(evt.which_event));
}

static void test_silent_devices_are_forgotten() {
    FakeTransport transport;
    transport.connectResult = false;
    GatewayController controller(testConfig(), transport, captureLog, nullptr);

    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert("aa:aa:aa:aa:aa:01"), 1000));
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert("aa:aa:aa:aa:aa:02"), 100000));
    TEST_ASSERT_EQUAL_UINT(2, controller.trackedDeviceCount());

    // Three intervals of silence from the first cuff; the second was heard 81 s ago.
    const uint64_t later = 1000 + 3 * 60000 + 1;
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert("aa:aa:aa:aa:aa:03"), later));
    TEST_ASSERT_FALSE(controller.device("AA:AA:AA:AA:AA:01").has_value());
    TEST_ASSERT_TRUE(controller.device("AA:AA:AA:AA:AA:02").has_value());
    TEST_ASSERT_TRUE(controller.device("AA:AA:AA:AA:AA:03").has_value());
    TEST_ASSERT_EQUAL_UINT(2, controller.trackedDeviceCount());

    // A forgotten cuff polls straight away when it comes back.
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert("aa:aa:aa:aa:aa:01"), later + 10));
}

static void test_pending_poll_request_survives_silence() {
    FakeTransport transport;
    transport.connectResult = false;
    GatewayController controller(testConfig(), transport, captureLog, nullptr);

    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert("aa:aa:aa:aa:aa:01"), 1000));
    controller.requestPoll("aa:aa:aa:aa:aa:01", 2000);
    TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert("aa:aa:aa:aa:aa:02"), 500000));
    TEST_ASSERT_TRUE(controller.device("AA:AA:AA:AA:AA:01").has_value());
}

static void test_device_table_is_bounded() {
    FakeTransport transport;
    transport.connectResult = false;
    GatewayConfig cfg = testConfig();
    cfg.namePrefix = "";
    GatewayController controller(cfg, transport, captureLog, nullptr);

    char address[18];
    for (unsigned i = 0; i < 40; ++i) {
        std::snprintf(address, sizeof(address), "10:20:30:40:50:%02X", i);
        TEST_ASSERT_TRUE(controller.handleAdvertisement(cuffAdvert(address, "Beacon"), 1000 + i));
        TEST_ASSERT_TRUE(controller.trackedDeviceCount() <= GatewayController::kMaxTrackedDevices);
    }
    TEST_ASSERT_EQUAL_UINT(GatewayController::kMaxTrackedDevices, controller.trackedDeviceCount());

    // The least recently heard go first; the newest stay.
    TEST_ASSERT_FALSE(controller.device("10:20:30:40:50:00").has_value());
    TEST_ASSERT_TRUE(controller.device("10:20:30:40:50:27").has_value());
    TEST_ASSERT_TRUE(controller.device("10:20:30:40:50:18").has_value());
    TEST_ASSERT_FALSE(controller.device("10:20:30:40:50:17").has_value());
}

int main() {
    UNITY_BEGIN();
    RUN_TEST(test_first_advertisement_polls_and_publishes);
    RUN_TEST(test_poll_interval_gates_sessions);
    RUN_TEST(test_timeout_publishes_metadata_only_reading);
    RUN_TEST(test_advertisement_during_session_does_not_start_another);
    RUN_TEST(test_name_prefix_and_target_filtering);
    RUN_TEST(test_empty_prefix_accepts_everyone);
    RUN_TEST(test_poll_interval_validation_and_persistence);
    RUN_TEST(test_interval_change_applies_to_known_devices);
    RUN_TEST(test_request_poll_overrides_interval);
    RUN_TEST(test_command_frames_drive_controller);
    RUN_TEST(test_factory_reset_requires_confirmation);
    RUN_TEST(test_boot_event_reports_settings);
    RUN_TEST(test_silent_devices_are_forgotten);
    RUN_TEST(test_pending_poll_request_survives_silence);
    RUN_TEST(test_device_table_is_bounded);
    return UNITY_END();
}
