/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <logger.pb.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <unordered_map>

#ifdef DEBUG_BUILD
#define PREDCOMB_DEBUG(logger, ...) logger->debug(__VA_ARGS__)
#define PREDCOMB_TRACE(logger, ...) logger->trace(__VA_ARGS__)
#else
#define PREDCOMB_DEBUG(logger, ...) (void)0
#define PREDCOMB_TRACE(logger, ...) (void)0
#endif

namespace predcomb::proto {
    namespace logger = predcomb::pb::logger_pb;
}

namespace predcomb::log {

// Callers share ownership, so a logger stays alive while in use even if it is replaced
using LoggerPtr = std::shared_ptr<spdlog::logger>;

constexpr auto ROOT_LOGGER = "root";
constexpr auto PREDICATE_LOGGER = "predicate";

class Loggers {
  public:
    Loggers();
    ~Loggers();

    static Loggers& instance();
    static void destroy_instance();

    /**
     * Replaces the unconfigured stderr logger with the loggers described by conf.
     * Later calls are ignored and return false unless force is set. An invalid conf
     * leaves the current loggers untouched.
     */
    bool configure(const proto::logger::LoggersConfig& conf, bool force = false);

    LoggerPtr root() const;
    LoggerPtr predicate() const;

    void flush_all() const;

  private:
    static void init();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

LoggerPtr root();
LoggerPtr predicate();

inline std::unordered_map<std::string, LoggerPtr> get_loggers_by_name() {
    return {
        {ROOT_LOGGER, root()},
        {PREDICATE_LOGGER, predicate()}
    };
}

} //namespace predcomb::log
