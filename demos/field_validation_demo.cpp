#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "fieldguard/config_manager.hpp"
#include "fieldguard/exceptions.hpp"
#include "fieldguard/field_validator.hpp"
#include "fieldguard/logger.hpp"

using namespace fieldguard;

int main(int argc, char *argv[]) {
  try {
    auto &config = ConfigManager::getInstance();
    if (argc > 1 && !config.loadConfig(argv[1])) {
      std::cerr << "Failed to load configuration from " << argv[1]
                << std::endl;
      return 1;
    }

    Logger::getInstance().configure(config.getLoggingConfig());

    auto validationResult = config.validateConfiguration();
    for (const auto &warning : validationResult.warnings) {
      FG_LOG_WARN("Demo", warning);
    }
    if (!validationResult.isValid) {
      for (const auto &error : validationResult.errors) {
        FG_LOG_ERROR("Demo", error);
      }
      return 1;
    }

    auto registry =
        std::make_shared<const PatternRegistry>(config.getRegistryConfig());
    FieldValidator validator(registry);

    const std::vector<FieldInput> samples = {
        {FieldKind::Name, "my_test.name-v1 final", "Name"},
        {FieldKind::Name, "name<script>", "Name"},
        {FieldKind::Identifier, "my test id", "ID"},
        {FieldKind::ToolName, "1tool", "Tool name"},
        {FieldKind::ToolName, "my_tool.v1-beta", "Tool name"},
        {FieldKind::Uri, "https://example.com/docs?page=1", "Resource URI"},
        {FieldKind::Uri, "file:///srv/data/../secrets", "Resource URI"},
        {FieldKind::Url, "https://user@example.com/", "Callback URL"},
        {FieldKind::Uuid, "123e4567-e89b-12d3-a456-426614174000", "Request ID"},
        {FieldKind::MimeType, "application/json", "Content type"},
    };

    for (const auto &sample : samples) {
      auto outcome = validator.validate(sample.kind, sample.value, sample.label);
      std::cout << fieldKindToString(sample.kind) << ": "
                << outcome.toJson().dump() << std::endl;
    }

    auto report = validator.validateFields(samples);
    std::cout << "report: " << report.toJsonString() << std::endl;

    Logger::getInstance().flush();
    return 0;
  } catch (const FieldGuardException &e) {
    std::cerr << e.toLogString() << std::endl;
    return 1;
  }
}
