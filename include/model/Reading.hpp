#pragma once
#include <chrono>
#include <string>

namespace windwatch::model {

// Latest observation from the provider.
struct Reading {
  float value{0.0f};                                  // MW
  std::string end_time;                               // observation window end, verbatim from the API
  std::chrono::system_clock::time_point observed_at{}; // end_time parsed
};

} // namespace windwatch::model
