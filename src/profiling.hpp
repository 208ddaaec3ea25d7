#pragma once
#include <chrono>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <string>
#include <utility>

// "850 ms", "12.34 s" below a minute, then "4m 5s" / "1h 2m 3s".
inline std::string format_duration(long long ms) {
    using namespace std::chrono;
    const milliseconds d(ms);
    if (d < seconds(1))
        return std::to_string(ms) + " ms";

    std::ostringstream oss;
    if (d < minutes(1)) {
        oss << std::fixed << std::setprecision(2) << duration<double>(d).count() << " s";
        return oss.str();
    }

    const auto h = duration_cast<hours>(d);
    const auto m = duration_cast<minutes>(d - h);
    const auto s = duration_cast<seconds>(d - h - m);
    if (h.count() > 0)
        oss << h.count() << "h ";
    oss << m.count() << "m " << s.count() << "s";
    return oss.str();
}


// Reports the wall-clock time of a named phase when it goes out of scope:
//   "  <label>: 12 ms"
class ScopedTimer {
    private:
        std::string label;
        std::ostream& out;
        std::chrono::steady_clock::time_point start;

    public:
        ScopedTimer(std::string label, std::ostream& out = std::cout)
            : label(std::move(label)), out(out), start(std::chrono::steady_clock::now()) {}

        long long elapsed_ms() const {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start).count();
        }

        ~ScopedTimer() {
            out << "  " << label << ": " << format_duration(elapsed_ms()) << "\n";
        }
};
