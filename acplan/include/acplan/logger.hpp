#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace acplan::logger {

// Route library logging through the given logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

}  // namespace acplan::logger

#endif  // LOGGER_HPP
