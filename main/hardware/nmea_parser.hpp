#ifndef NMEA_PARSER_HPP
#define NMEA_PARSER_HPP

#include <cstddef>
#include <cstdint>

struct GpsFix {
    double latitude = 0.0;   // decimal degrees, south negative
    double longitude = 0.0;  // decimal degrees, west negative
    uint8_t satellites = 0;
};

// Byte-at-a-time NMEA 0183 reader. Only GGA sentences are decoded;
// everything else is skipped. Sentences with a bad checksum are dropped.
class NmeaParser {
public:
    static constexpr size_t kMaxSentence = 96;

    enum class Result : uint8_t {
        NONE,      // still accumulating or sentence ignored
        FIX,       // GGA with a valid fix, out updated
        NO_FIX,    // GGA reporting fix quality 0
        BAD_CHECKSUM
    };

    NmeaParser();

    Result feed(char c, GpsFix& out);
    void reset();

    // Parse one complete sentence starting at '$' (without CR/LF)
    static Result parseSentence(const char* sentence, size_t len, GpsFix& out);

private:
    char line[kMaxSentence + 1];
    size_t length;
    bool in_sentence;
};

#endif // NMEA_PARSER_HPP
