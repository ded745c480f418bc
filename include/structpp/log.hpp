#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>


namespace structpp {

    inline constexpr char const* logger_name = "structpp";


    // The logger used for Struct++ diagnostics.
    // If the application registers a logger named "structpp" with spdlog before first use, that one is used.
    // Otherwise one is created that writes to stderr at warning level, so the library is quiet by default.
    [[nodiscard]]
    inline spdlog::logger& logger() {
        static std::shared_ptr<spdlog::logger> const instance = [] {
            if (auto existing = spdlog::get(logger_name)) {
                return existing;
            }
            auto created = spdlog::stderr_color_mt(logger_name);
            created->set_level(spdlog::level::warn);
            return created;
        }();
        return *instance;
    }

}
