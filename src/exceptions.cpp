#include "fieldguard/exceptions.hpp"
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>

namespace fieldguard {

std::string FieldGuardException::generateCorrelationId() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<> dis(0, 15);

  std::stringstream ss;
  ss << "FG-";
  for (int i = 0; i < 8; ++i) {
    ss << std::hex << dis(gen);
  }
  return ss.str();
}

FieldGuardException::FieldGuardException(ErrorCode code, std::string message,
                                         ErrorContext context)
    : errorCode_(code), message_(std::move(message)),
      context_(std::move(context)), correlationId_(generateCorrelationId()),
      timestamp_(std::chrono::system_clock::now()) {}

std::string FieldGuardException::toLogString() const {
  std::stringstream ss;
  ss << "[" << correlationId_ << "] "
     << "ErrorCode=" << errorCodeToString(errorCode_) << " "
     << "Message=\"" << message_ << "\"";

  if (!context_.empty()) {
    ss << " Context={";
    bool first = true;
    for (const auto &[key, value] : context_) {
      if (!first)
        ss << ", ";
      ss << key << "=\"" << value << "\"";
      first = false;
    }
    ss << "}";
  }

  return ss.str();
}

std::string FieldGuardException::toJsonString() const {
  nlohmann::json json;
  json["correlationId"] = correlationId_;
  json["errorCode"] = static_cast<int>(errorCode_);
  json["errorName"] = errorCodeToString(errorCode_);
  json["message"] = message_;
  json["timestamp"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                          timestamp_.time_since_epoch())
                          .count();
  if (!context_.empty()) {
    json["context"] = context_;
  }
  return json.dump();
}

void FieldGuardException::addContext(const std::string &key,
                                     const std::string &value) {
  context_[key] = value;
}

void FieldGuardException::setCorrelationId(const std::string &correlationId) {
  correlationId_ = correlationId;
}

ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field,
                                         ErrorContext context)
    : FieldGuardException(code, std::move(message), std::move(context)),
      field_(std::move(field)) {
  if (!field_.empty()) {
    addContext("field", field_);
  }
}

std::string ValidationException::toLogString() const {
  std::stringstream ss;
  ss << "[VALIDATION] " << FieldGuardException::toLogString();
  if (!field_.empty()) {
    ss << " Field=\"" << field_ << "\"";
  }
  return ss.str();
}

ConfigException::ConfigException(ErrorCode code, std::string message,
                                 std::string section, ErrorContext context)
    : FieldGuardException(code, std::move(message), std::move(context)),
      section_(std::move(section)) {
  if (!section_.empty()) {
    addContext("section", section_);
  }
}

std::string ConfigException::toLogString() const {
  std::stringstream ss;
  ss << "[CONFIG] " << FieldGuardException::toLogString();
  if (!section_.empty()) {
    ss << " Section=\"" << section_ << "\"";
  }
  return ss.str();
}

SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : FieldGuardException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {
  if (!component_.empty()) {
    addContext("component", component_);
  }
}

std::string SystemException::toLogString() const {
  std::stringstream ss;
  ss << "[SYSTEM] " << FieldGuardException::toLogString();
  if (!component_.empty()) {
    ss << " Component=\"" << component_ << "\"";
  }
  return ss.str();
}

bool isValidationError(const std::exception &ex) {
  return dynamic_cast<const ValidationException *>(&ex) != nullptr;
}

bool isConfigError(const std::exception &ex) {
  return dynamic_cast<const ConfigException *>(&ex) != nullptr;
}

bool isSystemError(const std::exception &ex) {
  return dynamic_cast<const SystemException *>(&ex) != nullptr;
}

} // namespace fieldguard
