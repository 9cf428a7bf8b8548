#include <main/hardware/gps_receiver.hpp>
#include <main/utils/logger.hpp>

static const char* TAG = "GpsReceiver";

GpsReceiver::GpsReceiver(uart_port_t port_in)
    : port(port_in),
      parser(),
      last_fix(),
      last_fix_ms(0),
      has_fix(false),
      initialized(false),
      checksum_errors(0) {}

bool GpsReceiver::init() {
    uart_config_t cfg = {};
    cfg.baud_rate = Config::Hardware::Gps::baud;
    cfg.data_bits = UART_DATA_8_BITS;
    cfg.parity = UART_PARITY_DISABLE;
    cfg.stop_bits = UART_STOP_BITS_1;
    cfg.flow_ctrl = UART_HW_FLOWCTRL_DISABLE;
    cfg.source_clk = UART_SCLK_DEFAULT;

    esp_err_t err = uart_driver_install(port, Config::Hardware::Gps::rx_buffer_size, 0, 0, nullptr, 0);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "uart_driver_install failed: %d", static_cast<int>(err));
        return false;
    }
    err = uart_param_config(port, &cfg);
    if (err == ESP_OK) {
        err = uart_set_pin(port, Config::Hardware::Gps::tx, Config::Hardware::Gps::rx,
                           UART_PIN_NO_CHANGE, UART_PIN_NO_CHANGE);
    }
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "UART setup failed: %d", static_cast<int>(err));
        uart_driver_delete(port);
        return false;
    }
    initialized = true;
    LOG_INFO(TAG, "GPS on UART%d (RX %d, %d baud)", static_cast<int>(port),
             static_cast<int>(Config::Hardware::Gps::rx), Config::Hardware::Gps::baud);
    return true;
}

void GpsReceiver::poll(uint32_t now_ms) {
    if (!initialized) {
        return;
    }
    uint8_t chunk[64];
    for (;;) {
        int n = uart_read_bytes(port, chunk, sizeof(chunk), 0);
        if (n <= 0) {
            break;
        }
        for (int i = 0; i < n; ++i) {
            GpsFix fix;
            switch (parser.feed(static_cast<char>(chunk[i]), fix)) {
                case NmeaParser::Result::FIX:
                    last_fix = fix;
                    last_fix_ms = now_ms;
                    has_fix = true;
                    break;
                case NmeaParser::Result::NO_FIX:
                    has_fix = false;
                    break;
                case NmeaParser::Result::BAD_CHECKSUM:
                    if ((++checksum_errors % 50) == 1) {
                        LOG_DEBUG(TAG, "NMEA checksum errors: %lu", static_cast<unsigned long>(checksum_errors));
                    }
                    break;
                case NmeaParser::Result::NONE:
                    break;
            }
        }
    }
}

bool GpsReceiver::latestFix(uint32_t now_ms, GpsFix& out) const {
    if (!has_fix || (now_ms - last_fix_ms) > Config::Hardware::Gps::fix_max_age_ms) {
        return false;
    }
    out = last_fix;
    return true;
}
