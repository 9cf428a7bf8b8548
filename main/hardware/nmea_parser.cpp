#include <main/hardware/nmea_parser.hpp>
#include <cstdlib>
#include <cstring>

namespace {
    constexpr size_t kMaxFields = 16;

    int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    }

    // ddmm.mmmm / dddmm.mmmm to decimal degrees
    bool parseCoordinate(const char* field, size_t len, char hemisphere, int degree_digits, double& out) {
        if (len <= static_cast<size_t>(degree_digits)) return false;
        char buf[20];
        if (len >= sizeof(buf)) return false;
        std::memcpy(buf, field, len);
        buf[len] = '\0';

        char deg_buf[4] = {};
        std::memcpy(deg_buf, buf, degree_digits);
        char* end = nullptr;
        long degrees = std::strtol(deg_buf, &end, 10);
        if (end != deg_buf + degree_digits) return false;
        double minutes = std::strtod(buf + degree_digits, &end);
        if (end != buf + len || minutes < 0.0 || minutes >= 60.0) return false;

        double value = static_cast<double>(degrees) + minutes / 60.0;
        if (hemisphere == 'S' || hemisphere == 'W') {
            value = -value;
        } else if (hemisphere != 'N' && hemisphere != 'E') {
            return false;
        }
        out = value;
        return true;
    }
}

NmeaParser::NmeaParser() : line{}, length(0), in_sentence(false) {}

void NmeaParser::reset() {
    length = 0;
    in_sentence = false;
}

NmeaParser::Result NmeaParser::feed(char c, GpsFix& out) {
    if (c == '$') {
        in_sentence = true;
        length = 0;
        line[length++] = c;
        return Result::NONE;
    }
    if (!in_sentence) {
        return Result::NONE;
    }
    if (c == '\r' || c == '\n') {
        in_sentence = false;
        line[length] = '\0';
        return parseSentence(line, length, out);
    }
    if (length >= kMaxSentence) {
        // Overlong line: discard until the next '$'
        reset();
        return Result::NONE;
    }
    line[length++] = c;
    return Result::NONE;
}

NmeaParser::Result NmeaParser::parseSentence(const char* sentence, size_t len, GpsFix& out) {
    if (len < 7 || sentence[0] != '$') {
        return Result::NONE;
    }

    const char* star = static_cast<const char*>(std::memchr(sentence, '*', len));
    size_t body_end = star ? static_cast<size_t>(star - sentence) : len;
    if (star) {
        if (len - body_end < 3) return Result::BAD_CHECKSUM;
        uint8_t sum = 0;
        for (size_t i = 1; i < body_end; ++i) {
            sum ^= static_cast<uint8_t>(sentence[i]);
        }
        int hi = hexValue(star[1]);
        int lo = hexValue(star[2]);
        if (hi < 0 || lo < 0 || sum != static_cast<uint8_t>((hi << 4) | lo)) {
            return Result::BAD_CHECKSUM;
        }
    }

    // Talker id is two letters (GP, GN, GL, ...); only the type matters
    if (std::strncmp(sentence + 3, "GGA,", 4) != 0) {
        return Result::NONE;
    }

    const char* fields[kMaxFields] = {};
    size_t lengths[kMaxFields] = {};
    size_t count = 0;
    size_t start = 1;
    for (size_t i = 1; i <= body_end && count < kMaxFields; ++i) {
        if (i == body_end || sentence[i] == ',') {
            fields[count] = sentence + start;
            lengths[count] = i - start;
            ++count;
            start = i + 1;
        }
    }
    // $xxGGA,time,lat,N,lon,E,quality,sats,...
    if (count < 8) {
        return Result::NONE;
    }
    if (lengths[6] == 0 || fields[6][0] == '0') {
        return Result::NO_FIX;
    }

    GpsFix fix;
    if (lengths[3] != 1 || lengths[5] != 1 ||
        !parseCoordinate(fields[2], lengths[2], fields[3][0], 2, fix.latitude) ||
        !parseCoordinate(fields[4], lengths[4], fields[5][0], 3, fix.longitude)) {
        return Result::NO_FIX;
    }
    if (lengths[7] > 0 && lengths[7] < 4) {
        char sats[4] = {};
        std::memcpy(sats, fields[7], lengths[7]);
        fix.satellites = static_cast<uint8_t>(std::atoi(sats));
    }
    out = fix;
    return Result::FIX;
}
