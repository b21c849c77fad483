#pragma once

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <string>
#include <stdexcept>

#include "../security/AuditLogger.hpp"

namespace utils {
    // The dump records where the audit log chain stood, so the last trusted
    // line can be located in the log afterwards.
    inline void write_crash_dump(const std::string& msg, const char* file, int line) {
        std::ofstream dump("crash.dump", std::ios::out | std::ios::trunc);
        time_t now = time(nullptr);
        auto& logger = security::AuditLogger::instance();
        dump << "Timestamp: " << std::ctime(&now);
        dump << "Panic at: " << file << ':' << line << '\n';
        dump << "Reason: " << msg << '\n';
        dump << "Log sequence: " << logger.sequence() << '\n';
        dump << "Log chain head: " << logger.last_hash() << '\n';
        dump.flush();
    }
} // namespace utils

#if defined(PANIC_THROWS_IN_TESTS)
#define PANIC(msg) do {                                                                \
    std::cerr << "[FATAL] " << msg << " at " << __FILE__ << ":" << __LINE__ << '\n';   \
    utils::write_crash_dump((msg), __FILE__, __LINE__);                                \
    throw std::runtime_error(std::string("PANIC: ") + (msg));                          \
} while (0)
#else
#define PANIC(msg) do {                                                                \
    std::cerr << "[FATAL] " << msg << " at " << __FILE__ << ":" << __LINE__ << '\n';   \
    std::cerr << ">> Simulation halted. Creating crash.dump...\n" << std::flush;       \
    utils::write_crash_dump((msg), __FILE__, __LINE__);                                \
    std::exit(EXIT_FAILURE);                                                           \
} while (0)
#endif
