#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "../security/AuditLogger.hpp"

namespace observability {

    // Process-wide counters and timed spans. Counters are for dashboards only;
    // anything the engine relies on for correctness is kept on the instance.
    class Observability {
        public:
            static Observability& instance() {
                static Observability inst;
                return inst;
            }

            void increment_metric(const std::string& name, std::uint64_t by = 1) {
                std::lock_guard<std::mutex> lock(mutex_);
                metrics_[name] += by;
            }

            std::uint64_t get_metric(const std::string& name) const {
                std::lock_guard<std::mutex> lock(mutex_);
                auto it = metrics_.find(name);
                return it == metrics_.end() ? 0 : it->second;
            }

            std::map<std::string, std::uint64_t> snapshot() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return metrics_;
            }

            template <typename Fn>
            decltype(auto) trace(const std::string& span, Fn&& fn) {
                SpanTimer timer(span);
                return std::forward<Fn>(fn)();
            }

        private:
            struct SpanTimer {
                explicit SpanTimer(const std::string& s) : span(s), start(std::chrono::steady_clock::now()) {}
                ~SpanTimer() {
                    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                                  std::chrono::steady_clock::now() - start).count();
                    security::AuditLogger::instance().log(security::AuditLogger::Level::Debug,
                                                          "[Trace] {} took {}us", span, us);
                }
                std::string span;
                std::chrono::steady_clock::time_point start;
            };

            mutable std::mutex mutex_;
            std::map<std::string, std::uint64_t> metrics_;
        };

} // namespace observability
