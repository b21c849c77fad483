#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include <openssl/sha.h>

namespace security {

    class CryptoHasher {
        public:
            static std::string sha256(const std::string& input) {
                unsigned char hash[SHA256_DIGEST_LENGTH];
                SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
                std::ostringstream oss;
                for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
                    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
                }
                return oss.str();
            }
    };

    // Sequenced log whose lines are chained by SHA-256: each hash covers the
    // previous line's hash, so any edited or dropped line breaks the chain.
    class AuditLogger {
        public:
            enum class Level { Debug, Info, Warn, Error };

            static AuditLogger& instance() {
                static AuditLogger inst;
                return inst;
            }

            template <typename... Args>
            void log(Level level, const char* fmt, Args&&... args) {
                if (static_cast<int>(level) < static_cast<int>(min_level_.load(std::memory_order_relaxed)))
                    return;

                std::string message = std::vformat(fmt, std::make_format_args(args...));
                auto now = std::chrono::system_clock::now();
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

                std::lock_guard<std::mutex> lock(mutex_);
                std::uint64_t seq = sequence_++;

                std::ostringstream meta;
                meta << last_hash_ << '|' << seq << '|' << ms << '|' << std::this_thread::get_id() << '|'
                     << static_cast<int>(level) << '|' << message;
                last_hash_ = CryptoHasher::sha256(meta.str());

                *sink_ << '[' << level_to_string(level) << "] " << message
                       << " seq=" << seq << " hash=" << last_hash_.substr(0, 16) << '\n';
            }

            void set_min_level(Level level) { min_level_.store(level, std::memory_order_relaxed); }
            Level min_level() const { return min_level_.load(std::memory_order_relaxed); }

            // Redirects output; nullptr restores std::cerr. The stream must outlive its use.
            void set_sink(std::ostream* sink) {
                std::lock_guard<std::mutex> lock(mutex_);
                sink_ = sink ? sink : &std::cerr;
            }

            std::string last_hash() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return last_hash_;
            }

            std::uint64_t sequence() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return sequence_;
            }

            static const char* level_to_string(Level level) {
                switch (level) {
                case Level::Debug:
                    return "DEBUG";
                case Level::Info:
                    return "INFO";
                case Level::Warn:
                    return "WARN";
                case Level::Error:
                    return "ERROR";
                }
                return "INFO";
            }

        private:
            AuditLogger() = default;

            mutable std::mutex mutex_;
            std::atomic<Level> min_level_{Level::Info};
            std::ostream* sink_ = &std::cerr;
            std::uint64_t sequence_ = 0;
            std::string last_hash_ = std::string(64, '0');
        };

} // namespace security
