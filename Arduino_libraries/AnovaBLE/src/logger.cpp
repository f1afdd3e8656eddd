#include <stdarg.h>
#include <stdio.h>
#include "logger.h"

#if defined(ARDUINO)
  #include <Arduino.h>
#endif

int currentLogLevel = LOG_LEVEL_INFO; // Default log level

static void logWriteln(const char* text) {
#if defined(ARDUINO)
    Serial.println(text);
#else
    fputs(text, stdout);
    fputc('\n', stdout);
    fflush(stdout);
#endif
}

static void logFormat(char* buffer, size_t len, const char* format, va_list args) {
    int n = vsnprintf(buffer, len, format, args);
    if (n < 0) buffer[0] = '\0';  // encoding error, print nothing
}

void logPrintLevelln(const char* level, const char* format, ...) {
    char buffer[256];
    int  index = snprintf(buffer, sizeof(buffer), "[%s] ", level);
    if (index < 0) index = 0;

    va_list args;
    va_start(args, format);
    logFormat(buffer + index, sizeof(buffer) - index, format, args);
    va_end(args);

    logWriteln(buffer);
}

char* logEscape(char* out, size_t outLen, const char* text, size_t len) {
    if (!out || outLen == 0) return out;
    size_t index = 0;
    for (size_t i = 0; i < len && text; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        char esc[5];
        if      (c == '\r')            { esc[0] = '\\'; esc[1] = 'r'; esc[2] = '\0'; }
        else if (c == '\n')            { esc[0] = '\\'; esc[1] = 'n'; esc[2] = '\0'; }
        else if (c < 0x20 || c == 0x7F) snprintf(esc, sizeof(esc), "\\x%02X", c);
        else                           { esc[0] = static_cast<char>(c); esc[1] = '\0'; }

        for (const char* p = esc; *p; ++p) {
            if (index + 1 >= outLen) { out[index] = '\0'; return out; }  // truncate
            out[index++] = *p;
        }
    }
    out[index] = '\0';
    return out;
}
