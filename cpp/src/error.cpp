#include "error.hpp"
#include <spdlog/spdlog.h>

namespace siphon {

Error wrap_error(const Error& err, std::string_view context) {
  std::string msg(context);
  msg += ": ";
  msg += err.message;
  return Error{err.code, std::move(msg)};
}

Error missing_config_field(std::string_view field) {
  return Error{ErrorCode::MissingConfigField,
               "missing config field: " + std::string(field)};
}

Error missing_rate_limit_field(std::string_view field) {
  return Error{ErrorCode::MissingRateLimitField,
               "missing rate limit field: " + std::string(field)};
}

Error unable_to_parse(std::string_view name) {
  return Error{ErrorCode::UnableToParse, std::string(name) + " unable to parse"};
}

bool ErrorSlot::record(Error err) {
  if (parent_) parent_->record(err);
  std::lock_guard<std::mutex> lk(mutex_);
  if (error_) {
    dropped_.fetch_add(1);
    spdlog::debug("dropping secondary error ({}): {}",
                  error_category(err.code), err.message);
    return false;
  }
  error_ = std::move(err);
  return true;
}

MaybeError ErrorSlot::get() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return error_;
}

bool ErrorSlot::has_error() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return error_.has_value();
}

}  // namespace siphon
