#pragma once
/*
Console logging: one line per message, "[LEVEL] (scope) message".
Info goes to stdout and can be silenced; warnings and errors go to stderr.
*/

#include <iostream>
#include <string>

class ConsoleLogger {
    private:
        std::ostream* info_out = &std::cout;
        std::ostream* error_out = &std::cerr;
        bool quiet = false;

    public:
        void set_quiet(bool q) { quiet = q; }

        // Redirect both streams, e.g. to a string stream in tests.
        void set_streams(std::ostream& info, std::ostream& error) {
            info_out = &info;
            error_out = &error;
        }

        void write(const char* level, const std::string& scope, const std::string& msg, bool is_error) {
            if (!is_error && quiet) return;
            std::ostream& out = is_error ? *error_out : *info_out;
            out << "[" << level << "] (" << scope << ") " << msg << "\n";
        }
};

inline ConsoleLogger& console_logger() {
    static ConsoleLogger logger;
    return logger;
}

inline void log_info(const std::string& scope, const std::string& msg) {
    console_logger().write("INFO", scope, msg, false);
}

inline void log_warn(const std::string& scope, const std::string& msg) {
    console_logger().write("WARN", scope, msg, true);
}

inline void log_error(const std::string& scope, const std::string& msg) {
    console_logger().write("ERROR", scope, msg, true);
}
