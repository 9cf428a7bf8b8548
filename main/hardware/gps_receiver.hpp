#ifndef GPS_RECEIVER_HPP
#define GPS_RECEIVER_HPP

#include <cstdint>
#include <driver/uart.h>
#include <main/config/config.hpp>
#include <main/hardware/nmea_parser.hpp>

// NMEA GPS module on a UART. poll() drains whatever bytes are buffered
// without blocking; the last fix expires after fix_max_age_ms.
class GpsReceiver {
public:
    explicit GpsReceiver(uart_port_t port = Config::Hardware::Gps::uart);

    bool init();
    bool isReady() const { return initialized; }

    void poll(uint32_t now_ms);

    // True and out filled when a fix newer than the age limit exists
    bool latestFix(uint32_t now_ms, GpsFix& out) const;

private:
    uart_port_t port;
    NmeaParser parser;
    GpsFix last_fix;
    uint32_t last_fix_ms;
    bool has_fix;
    bool initialized;
    uint32_t checksum_errors;
};

#endif // GPS_RECEIVER_HPP
