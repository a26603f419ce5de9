#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"

class SafeLogger {
    inline static std::shared_ptr<spdlog::logger> instance = nullptr;
    inline static std::mutex mtx;

public:
    struct Config {
        std::string name = "ocp-kvm";
        std::string file_path = "logs/ocp-kvm.log";
        spdlog::level::level_enum console_level = spdlog::level::info;
        std::size_t rotation_size = 1024 * 1024 * 5;
        std::size_t max_files = 3;
        bool enable_file = true;
    };

    static void initialize() { initialize(Config()); }

    static void initialize(const Config& config) {
        std::lock_guard lock(mtx);
        if (instance) return;

        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_level(config.console_level);

        std::vector<spdlog::sink_ptr> sinks{console};
        if (config.enable_file) {
            try {
                auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.file_path, config.rotation_size, config.max_files);
                file->set_level(spdlog::level::trace);
                sinks.push_back(std::move(file));
            } catch (const spdlog::spdlog_ex& e) {
                console->log(spdlog::details::log_msg(config.name, spdlog::level::warn,
                    std::string("file sink disabled: ") + e.what()));
            }
        }

        instance = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        instance->set_level(spdlog::level::trace);
        instance->flush_on(spdlog::level::info);
        spdlog::set_default_logger(instance);
    }

    // Drops the current logger so initialize() can be called again with a new config.
    static void reset() {
        std::lock_guard lock(mtx);
        instance.reset();
    }

    static std::shared_ptr<spdlog::logger>& get() {
        if (!instance) initialize();
        return instance;
    }
};

#define VLOG_TRACE(...)   SafeLogger::get()->trace(__VA_ARGS__)
#define VLOG_DEBUG(...)   SafeLogger::get()->debug(__VA_ARGS__)
#define VLOG_INFO(...)    SafeLogger::get()->info(__VA_ARGS__)
#define VLOG_WARN(...)    SafeLogger::get()->warn(__VA_ARGS__)
#define VLOG_ERROR(...)   SafeLogger::get()->error(__VA_ARGS__)
#define VLOG_CRITICAL(...) SafeLogger::get()->critical(__VA_ARGS__)
