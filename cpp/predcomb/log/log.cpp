/* Copyright 2023 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software will be governed by the Apache License, version 2.0.
 */

#include <predcomb/log/log.hpp>
#include <predcomb/util/preconditions.hpp>

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace predcomb::log {

namespace {

constexpr auto DefaultPattern = "%Y%m%d %H:%M:%S.%f %t %L %n | %v";
constexpr auto DefaultLevel = spdlog::level::info;

std::shared_ptr<Loggers> loggers_instance_;
std::once_flag loggers_init_flag_;

using SinksById = std::unordered_map<std::string, spdlog::sink_ptr>;

spdlog::sink_ptr make_console_sink(const proto::logger::ConsoleSink& conf) {
    if (conf.color()) {
        if (conf.to_stderr())
            return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

        return std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }

    if (conf.to_stderr())
        return std::make_shared<spdlog::sinks::stderr_sink_mt>();

    return std::make_shared<spdlog::sinks::stdout_sink_mt>();
}

// UNSET keeps the default, the remaining enumerators are spdlog's levels shifted by one
spdlog::level::level_enum to_spdlog_level(proto::logger::LoggerConfig::Level level) {
    if (level == proto::logger::LoggerConfig::UNSET)
        return DefaultLevel;

    return static_cast<spdlog::level::level_enum>(static_cast<int>(level) - 1);
}

LoggerPtr make_logger(const std::string& name, const proto::logger::LoggerConfig& conf, const SinksById& sinks) {
    std::vector<spdlog::sink_ptr> logger_sinks;
    for (const auto& sink_id : conf.sink_ids()) {
        auto it = sinks.find(sink_id);
        user_input::check<ErrorCode::E_INVALID_LOGGER_CONFIG>(
            it != sinks.end(), "Logger {} refers to unknown sink {}", name, sink_id);
        logger_sinks.push_back(it->second);
    }

    auto logger = std::make_shared<spdlog::logger>(fmt::format("predcomb.{}", name), logger_sinks.begin(), logger_sinks.end());
    logger->set_pattern(conf.pattern().empty() ? std::string{DefaultPattern} : conf.pattern());
    logger->set_level(to_spdlog_level(conf.level()));
    return logger;
}

} // namespace

struct Loggers::Impl {
    mutable std::mutex mutex_;
    LoggerPtr unconfigured_;
    LoggerPtr root_;
    LoggerPtr predicate_;

    LoggerPtr get(const LoggerPtr& logger) const {
        std::lock_guard lock(mutex_);
        return logger ? logger : unconfigured_;
    }
};

Loggers::Loggers() :
    impl_(std::make_unique<Impl>()) {
    impl_->unconfigured_ = std::make_shared<spdlog::logger>("predcomb", std::make_shared<spdlog::sinks::stderr_sink_mt>());
    impl_->unconfigured_->set_level(DefaultLevel);
    impl_->unconfigured_->set_pattern(DefaultPattern);
}

Loggers::~Loggers() = default;

Loggers& Loggers::instance() {
    std::call_once(loggers_init_flag_, &Loggers::init);
    return *loggers_instance_;
}

void Loggers::init() {
    loggers_instance_ = std::make_shared<Loggers>();
}

void Loggers::destroy_instance() {
    loggers_instance_.reset();
}

LoggerPtr Loggers::root() const {
    return impl_->get(impl_->root_);
}

LoggerPtr Loggers::predicate() const {
    return impl_->get(impl_->predicate_);
}

void Loggers::flush_all() const {
    root()->flush();
    predicate()->flush();
}

bool Loggers::configure(const proto::logger::LoggersConfig& conf, bool force) {
    {
        std::lock_guard lock(impl_->mutex_);
        if (!force && impl_->root_)
            return false;
    }

    SinksById sinks;
    for (const auto& [sink_id, sink_conf] : conf.sinks())
        sinks.try_emplace(sink_id, make_console_sink(sink_conf));

    const auto& loggers = conf.loggers();
    for (const auto& entry : loggers) {
        user_input::check<ErrorCode::E_INVALID_LOGGER_CONFIG>(
            entry.first == ROOT_LOGGER || entry.first == PREDICATE_LOGGER, "Unknown logger {}", entry.first);
    }

    auto root_conf = loggers.find(std::string{ROOT_LOGGER});
    user_input::check<ErrorCode::E_INVALID_LOGGER_CONFIG>(root_conf != loggers.end(), "Missing configuration for the {} logger", ROOT_LOGGER);
    auto predicate_conf = loggers.find(std::string{PREDICATE_LOGGER});

    auto root = make_logger(ROOT_LOGGER, root_conf->second, sinks);
    auto predicate = make_logger(
        PREDICATE_LOGGER,
        predicate_conf != loggers.end() ? predicate_conf->second : root_conf->second,
        sinks);

    std::lock_guard lock(impl_->mutex_);
    if (!force && impl_->root_)
        return false;

    impl_->root_ = std::move(root);
    impl_->predicate_ = std::move(predicate);
    return true;
}

LoggerPtr root() {
    return Loggers::instance().root();
}

LoggerPtr predicate() {
    return Loggers::instance().predicate();
}

} //namespace predcomb::log
