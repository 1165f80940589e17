#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include "internal/observability/spans.hpp"

namespace staging::observability {

inline opentelemetry::sdk::resource::Resource BuildOtlpResource(const OtlpConfig& config) {
  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", config.service_name},
      {"service.namespace", "staging"},
      {"service.version", config.service_version},
      {"staging.sql_dialect", config.sql_dialect},
  };
  if (!config.table_prefix.empty()) {
    attrs.SetAttribute("staging.table_prefix", config.table_prefix);
  }
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace staging::observability

#endif
