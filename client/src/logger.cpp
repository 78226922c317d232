#include "coursesync/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <vector>

namespace coursesync::client
{

    Logger::Logger(const LoggerOptions &options)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (options.console)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            }
            if (options.file)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file->string(), true));
            }
            if (sinks.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("coursesync", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
            logger_->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    Logger Logger::silent()
    {
        return Logger(LoggerOptions{.console = false, .verbose = false, .file = std::nullopt});
    }

    void Logger::flush()
    {
        if (logger_)
        {
            logger_->flush();
        }
    }

} // namespace coursesync::client
